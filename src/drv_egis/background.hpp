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
#ifndef __background_hpp__
#define __background_hpp__

#include <memory>
#include <mutex>
#include <string>
#include <system_error>

#include <jinx/macros.hpp>

#include "image.hpp"

namespace egispp {

struct Baseline
{
    static constexpr int FormatVersion = 1;

    PixelBuffer _pixels{};
    size_t _samples{};
};

typedef std::shared_ptr<const Baseline> BaselineSnapshot;

// max(0, live - baseline) per pixel
std::error_code subtract(const Baseline& baseline, const PixelBuffer& live, PixelBuffer& output);

std::error_code write_baseline(const Baseline& baseline, const std::string& filename);
std::error_code read_baseline(const std::string& filename, const ImageGeometry& geometry, Baseline& baseline);

/*
    Owner of the background baseline.

    The running mean is kept in float so an average can be read after any
    number of samples. Once frozen the model only hands out immutable
    snapshots; accumulating again requires reset().
*/
class BackgroundModel {
    mutable std::mutex _lock{};
    ImageGeometry _geometry;

    cv::Mat _mean{};
    size_t _count{};
    bool _frozen{};
    BaselineSnapshot _snapshot{};

public:
    explicit BackgroundModel(const ImageGeometry& geometry) : _geometry(geometry) { }

    JINX_NO_COPY_NO_MOVE(BackgroundModel);

    const ImageGeometry& get_geometry() const { return _geometry; }

    std::error_code accumulate(const PixelBuffer& sample);

    // rounded running mean, empty before the first sample
    PixelBuffer average() const;

    size_t count() const;
    bool frozen() const;

    std::error_code freeze();
    void reset();

    // null until frozen
    BaselineSnapshot snapshot() const;

    std::error_code subtract(const PixelBuffer& live, PixelBuffer& output) const;

    std::error_code restore(const Baseline& baseline);

    std::error_code save(const std::string& filename) const;
    std::error_code load(const std::string& filename);

protected:
    PixelBuffer rounded_mean() const;
};

}

#endif
