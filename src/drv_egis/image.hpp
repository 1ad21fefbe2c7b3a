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
#ifndef __image_hpp__
#define __image_hpp__

#include <system_error>
#include <vector>

#include <opencv2/core.hpp>

#include "eh575.hpp"
#include "frame.hpp"

namespace egispp {

struct ImageGeometry
{
    int _width{SENSOR_WIDTH};
    int _height{SENSOR_HEIGHT};

    size_t size() const {
        return static_cast<size_t>(_width) * static_cast<size_t>(_height);
    }
};

// one sensor frame, CV_8UC1 of the sensor geometry
struct PixelBuffer
{
    cv::Mat _pixels{};

    static PixelBuffer zeros(const ImageGeometry& geometry) {
        cv::Mat pixels = cv::Mat::zeros(geometry._height, geometry._width, CV_8UC1);
        return PixelBuffer{pixels};
    }

    size_t size() const { return _pixels.total(); }
    bool empty() const { return _pixels.empty(); }

    const unsigned char* data() const { return _pixels.ptr<unsigned char>(); }
    unsigned char* data() { return _pixels.ptr<unsigned char>(); }

    Bytes bytes() const {
        return Bytes(data(), data() + size());
    }
};

class ImageAssembler {
    ImageGeometry _geometry;

public:
    explicit ImageAssembler(const ImageGeometry& geometry) : _geometry(geometry) { }

    const ImageGeometry& get_geometry() const { return _geometry; }

    std::error_code assemble(const std::vector<Bytes>& chunks, PixelBuffer& buffer) const;

    std::error_code assemble(const Frame& frame, PixelBuffer& buffer) const {
        return assemble(frame._chunks, buffer);
    }
};

}

#endif
