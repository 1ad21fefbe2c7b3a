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
#include <algorithm>

#include "errors.hpp"
#include "frame.hpp"

namespace egispp {

Bytes Frame::payload() const
{
    Bytes output{};
    output.reserve(size());
    for (const auto& chunk : _chunks) {
        output.insert(output.end(), chunk.begin(), chunk.end());
    }
    return output;
}

namespace codec {

Bytes encode(const CommandSpec& command)
{
    Bytes output{};
    output.reserve(MagicSize + 1 + command._params.size() + 1);
    output.insert(output.end(), MagicOut.begin(), MagicOut.end());
    output.push_back(command._opcode);
    output.insert(output.end(), command._params.begin(), command._params.end());
    if (command._checksum.has_value()) {
        output.push_back(*command._checksum);
    }
    return output;
}

std::error_code decode(const Bytes& raw, size_t expected_payload, Frame& frame)
{
    std::vector<Bytes> chunks{};
    chunks.emplace_back(raw);
    return decode(std::move(chunks), expected_payload, frame);
}

std::error_code decode(std::vector<Bytes>&& chunks, size_t expected_payload, Frame& frame)
{
    size_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.size();
    }

    if (total < MagicSize) {
        return ProtocolError::Truncated;
    }

    // the magic may straddle chunk boundaries
    size_t matched = 0;
    for (const auto& chunk : chunks) {
        for (size_t idx = 0; idx < chunk.size() and matched < MagicSize; ++idx, ++matched) {
            if (chunk[idx] != MagicIn[matched]) {
                return ProtocolError::BadMagic;
            }
        }
        if (matched == MagicSize) {
            break;
        }
    }

    if (expected_payload > total - MagicSize) {
        return ProtocolError::Truncated;
    }

    size_t skip = MagicSize;
    frame._chunks.clear();
    frame._chunks.reserve(chunks.size());
    for (auto& chunk : chunks) {
        auto size = std::min(chunk.size(), skip);
        if (size > 0) {
            chunk.erase(chunk.begin(), chunk.begin() + static_cast<long>(size));
            skip -= size;
        }
        if (chunk.empty()) {
            continue;
        }
        frame._chunks.emplace_back(std::move(chunk));
    }
    return {};
}

}

}
