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

#include "drv_egis/quality.hpp"

using namespace egispp;

static PixelBuffer with_non_zero(int non_zero, const ImageGeometry& geometry = ImageGeometry{10, 10})
{
    auto buffer = PixelBuffer::zeros(geometry);
    for (int idx = 0; idx < non_zero; ++idx) {
        buffer.data()[idx] = 1;
    }
    return buffer;
}

static int rank(Classification classification)
{
    switch (classification) {
        case Classification::Clean:
            return 0;
        case Classification::Noisy:
            return 1;
        case Classification::Fingerprint:
            return 2;
        case Classification::Rejected:
            break;
    }
    return -1;
}

TEST(Quality, SeventeenPercentIsFingerprint)
{
    QualityThresholds thresholds{0.03F, 0.15F};

    auto verdict = quality::classify(with_non_zero(17), thresholds);
    EXPECT_NEAR(verdict._non_zero_ratio, 0.17F, 1e-6);
    EXPECT_EQ(verdict._classification, Classification::Fingerprint);
}

TEST(Quality, ZeroIsClean)
{
    auto verdict = quality::classify(PixelBuffer::zeros(ImageGeometry{}), QualityThresholds{});
    EXPECT_EQ(verdict._non_zero_ratio, 0.0F);
    EXPECT_EQ(verdict._classification, Classification::Clean);
}

TEST(Quality, Thresholds)
{
    QualityThresholds thresholds{};

    EXPECT_EQ(quality::classify(with_non_zero(2), thresholds)._classification, Classification::Clean);
    EXPECT_EQ(quality::classify(with_non_zero(3), thresholds)._classification, Classification::Noisy);
    EXPECT_EQ(quality::classify(with_non_zero(10), thresholds)._classification, Classification::Noisy);
    EXPECT_EQ(quality::classify(with_non_zero(15), thresholds)._classification, Classification::Noisy);
    EXPECT_EQ(quality::classify(with_non_zero(16), thresholds)._classification, Classification::Fingerprint);
    EXPECT_EQ(quality::classify(with_non_zero(100), thresholds)._classification, Classification::Fingerprint);
}

TEST(Quality, Monotonic)
{
    QualityThresholds thresholds{};

    int previous = 0;
    for (int non_zero = 0; non_zero <= 100; ++non_zero) {
        auto current = rank(quality::classify(with_non_zero(non_zero), thresholds)._classification);
        ASSERT_GE(current, previous) << non_zero;
        previous = current;
    }
    EXPECT_EQ(previous, 2);
}

TEST(Quality, Rejected)
{
    EXPECT_EQ(quality::classify(PixelBuffer{}, QualityThresholds{})._classification, Classification::Rejected);

    cv::Mat pixels = cv::Mat::zeros(4, 4, CV_16UC1);
    PixelBuffer wide{pixels};
    EXPECT_EQ(quality::classify(wide, QualityThresholds{})._classification, Classification::Rejected);
}
