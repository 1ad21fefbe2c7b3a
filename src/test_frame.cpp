/*
Copyright (C) 2026  The egispp Authors

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU Affero General Public License as published
by the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU Affero General Public License for more details.

You should have received a copy of the GNU Affero General Public License
along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/
#include <gtest/gtest.h>

#include "drv_egis/errors.hpp"
#include "drv_egis/frame.hpp"
#include "drv_egis/profile.hpp"
#include "test_sensor.hpp"

using namespace egispp;

TEST(FrameCodec, EncodeLayout)
{
    CommandSpec command{0x63, {0x01, 0x02, 0x0f, 0x03}, ResponseSize::Small, 0, {}, {}, "configure"};

    auto bytes = codec::encode(command);
    Bytes expected{0x45, 0x47, 0x49, 0x53, 0x63, 0x01, 0x02, 0x0f, 0x03};
    EXPECT_EQ(bytes, expected);
}

TEST(FrameCodec, EncodeChecksum)
{
    CommandSpec command{0x61, {0x0a, 0xfd}, ResponseSize::Small, 0, 0x5a, {}, "register"};

    auto bytes = codec::encode(command);
    ASSERT_EQ(bytes.size(), 8);
    EXPECT_EQ(bytes.back(), 0x5a);
}

TEST(FrameCodec, LoopbackRoundTrip)
{
    auto profile = DeviceProfile::eh575();
    test::LoopbackDevice loopback{};

    for (const auto& command : profile._pre_init) {
        auto request = codec::encode(command);
        ASSERT_FALSE(loopback.send(request));

        Bytes response{};
        ASSERT_FALSE(loopback.receive(64, response));

        Frame frame{};
        ASSERT_FALSE(codec::decode(response, 0, frame)) << command._label;

        Bytes expected(request.begin() + codec::MagicSize, request.end());
        EXPECT_EQ(frame.payload(), expected) << command._label;
    }
}

TEST(FrameCodec, BadMagic)
{
    Frame frame{};
    auto ret = codec::decode(Bytes{0x00, 0x00, 0x00, 0x00, 0x01, 0x02}, 0, frame);
    EXPECT_EQ(ret, make_error_code(ProtocolError::BadMagic));
    EXPECT_EQ(ret.category(), category_protocol());

    // outbound magic is not accepted inbound
    ret = codec::decode(Bytes{0x45, 0x47, 0x49, 0x53}, 0, frame);
    EXPECT_EQ(ret, make_error_code(ProtocolError::BadMagic));
}

TEST(FrameCodec, Truncated)
{
    Frame frame{};
    EXPECT_EQ(codec::decode(Bytes{0x53, 0x49}, 0, frame), make_error_code(ProtocolError::Truncated));
    EXPECT_EQ(codec::decode(Bytes{}, 0, frame), make_error_code(ProtocolError::Truncated));
    EXPECT_EQ(codec::decode(Bytes{0x53, 0x49, 0x47, 0x45, 0x01, 0x02, 0x03}, 10, frame),
        make_error_code(ProtocolError::Truncated));
}

TEST(FrameCodec, BareMagicIsEmptyPayload)
{
    Frame frame{};
    ASSERT_FALSE(codec::decode(Bytes{0x53, 0x49, 0x47, 0x45}, 0, frame));
    EXPECT_EQ(frame.size(), 0);
    EXPECT_TRUE(frame._chunks.empty());
}

TEST(FrameCodec, ChunkedMagicAcrossChunks)
{
    std::vector<Bytes> chunks{
        Bytes{0x53, 0x49},
        Bytes{0x47, 0x45, 0x01, 0x02},
        Bytes{0x03}
    };

    Frame frame{};
    ASSERT_FALSE(codec::decode(std::move(chunks), 3, frame));
    ASSERT_EQ(frame._chunks.size(), 2);
    EXPECT_EQ(frame.payload(), (Bytes{0x01, 0x02, 0x03}));
}

TEST(FrameCodec, ChunkedBadMagicInSecondChunk)
{
    std::vector<Bytes> chunks{
        Bytes{0x53, 0x49},
        Bytes{0x00, 0x45, 0x01}
    };

    Frame frame{};
    EXPECT_EQ(codec::decode(std::move(chunks), 1, frame), make_error_code(ProtocolError::BadMagic));
}
