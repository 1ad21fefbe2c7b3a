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
#include <cstring>
#include <iostream>

#include <jinx/logging.hpp>

#include "errors.hpp"
#include "image.hpp"

namespace egispp {

std::error_code ImageAssembler::assemble(const std::vector<Bytes>& chunks, PixelBuffer& buffer) const
{
    size_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.size();
    }

    if (total != _geometry.size()) {
        jinx_log_warning() << "image payload " << total << " bytes, expected " << _geometry.size() << std::endl;
        return ImageError::SizeMismatch;
    }

    cv::Mat pixels{cv::Size{_geometry._width, _geometry._height}, CV_8UC1};
    unsigned char* output = pixels.ptr<unsigned char>();
    for (const auto& chunk : chunks) {
        if (chunk.empty()) {
            continue;
        }
        memcpy(output, chunk.data(), chunk.size());
        output += chunk.size();
    }

    buffer._pixels = std::move(pixels);
    return {};
}

}
