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
#ifndef __frame_hpp__
#define __frame_hpp__

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace egispp {

typedef std::vector<unsigned char> Bytes;

enum class ResponseSize {
    Small,
    Chunked
};

struct CommandSpec
{
    unsigned char _opcode{};
    Bytes _params{};
    ResponseSize _response{ResponseSize::Small};

    // payload bytes expected after the magic, 0 accepts any length
    size_t _response_length{};

    std::optional<unsigned char> _checksum{};
    std::chrono::milliseconds _delay{};
    std::string _label{};
};

typedef std::vector<CommandSpec> CommandList;

// inbound frame, payload kept in the chunks it arrived in
struct Frame
{
    std::vector<Bytes> _chunks{};

    size_t size() const {
        size_t total = 0;
        for (const auto& chunk : _chunks) {
            total += chunk.size();
        }
        return total;
    }

    Bytes payload() const;
};

namespace codec {

constexpr size_t MagicSize = 4;

// "EGIS"
constexpr std::array<unsigned char, MagicSize> MagicOut{{0x45, 0x47, 0x49, 0x53}};

// "SIGE"
constexpr std::array<unsigned char, MagicSize> MagicIn{{0x53, 0x49, 0x47, 0x45}};

Bytes encode(const CommandSpec& command);

std::error_code decode(const Bytes& raw, size_t expected_payload, Frame& frame);
std::error_code decode(std::vector<Bytes>&& chunks, size_t expected_payload, Frame& frame);

}

}

#endif
