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
#include <filesystem>
#include <iostream>

#include <opencv2/imgproc.hpp>

#include <jinx/logging.hpp>

#include "background.hpp"
#include "crypto.hpp"
#include "errors.hpp"

namespace egispp {

static cv::Mat shape_of(const cv::Mat& pixels, const ImageGeometry& geometry)
{
    // PixelBuffers are continuous, a flat buffer of the right length is accepted
    if (pixels.rows == geometry._height and pixels.cols == geometry._width) {
        return pixels;
    }
    return pixels.reshape(1, geometry._height);
}

std::error_code subtract(const Baseline& baseline, const PixelBuffer& live, PixelBuffer& output)
{
    if (baseline._pixels.empty() or live.size() != baseline._pixels.size() or live._pixels.type() != CV_8UC1) {
        return ImageError::SizeMismatch;
    }

    const auto& reference = baseline._pixels._pixels;
    ImageGeometry geometry{reference.cols, reference.rows};

    // saturating on CV_8U, so no wraparound below zero
    cv::Mat result{};
    cv::subtract(shape_of(live._pixels, geometry), reference, result);
    output._pixels = std::move(result);
    return {};
}

std::error_code write_baseline(const Baseline& baseline, const std::string& filename)
{
    if (baseline._pixels.empty()) {
        return CalibrationError::InvalidState;
    }

    auto digest = crypto::sha256_hex(baseline._pixels.data(), baseline._pixels.size());
    if (digest.empty()) {
        jinx_log_error() << "sha256 failed" << std::endl;
        return std::make_error_code(std::errc::io_error);
    }

    cv::FileStorage fstorage{filename, cv::FileStorage::WRITE | cv::FileStorage::FORMAT_JSON};
    if (not fstorage.isOpened()) {
        jinx_log_error() << "write " << filename << " failed" << std::endl;
        return std::make_error_code(std::errc::io_error);
    }

    fstorage << "version" << Baseline::FormatVersion;
    fstorage << "length" << static_cast<int>(baseline._pixels.size());
    fstorage << "samples" << static_cast<int>(baseline._samples);
    fstorage << "pixels" << baseline._pixels._pixels;
    fstorage << "sha256" << digest;
    fstorage.release();
    return {};
}

std::error_code read_baseline(const std::string& filename, const ImageGeometry& geometry, Baseline& baseline)
{
    if (not std::filesystem::exists(filename)) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }

    cv::FileStorage fstorage{filename, cv::FileStorage::READ};
    if (not fstorage.isOpened()) {
        jinx_log_error() << "read " << filename << " failed" << std::endl;
        return std::make_error_code(std::errc::io_error);
    }

    auto version = (int)fstorage["version"];
    if (version != Baseline::FormatVersion) {
        jinx_log_error() << filename << ": unsupported baseline version " << version << std::endl;
        return CalibrationError::BaselineMismatch;
    }

    auto length = (int)fstorage["length"];
    auto samples = (int)fstorage["samples"];
    cv::Mat pixels = fstorage["pixels"].mat();
    std::string digest = fstorage["sha256"].string();

    if (length < 0 or static_cast<size_t>(length) != geometry.size()
        or pixels.total() != geometry.size() or pixels.type() != CV_8UC1)
    {
        jinx_log_error() << filename << ": baseline length " << length
            << " does not match sensor size " << geometry.size() << std::endl;
        return CalibrationError::BaselineMismatch;
    }

    pixels = shape_of(pixels.isContinuous() ? pixels : pixels.clone(), geometry);

    if (crypto::sha256_hex(pixels.ptr<unsigned char>(), pixels.total()) != digest) {
        jinx_log_error() << filename << ": baseline digest mismatch" << std::endl;
        return CalibrationError::BaselineCorrupted;
    }

    baseline._pixels._pixels = pixels;
    baseline._samples = samples > 0 ? static_cast<size_t>(samples) : 0;
    return {};
}

std::error_code BackgroundModel::accumulate(const PixelBuffer& sample)
{
    if (sample.size() != _geometry.size() or sample._pixels.type() != CV_8UC1) {
        return ImageError::SizeMismatch;
    }

    std::lock_guard<std::mutex> lock{_lock};
    if (_frozen) {
        return CalibrationError::InvalidState;
    }

    if (_mean.empty()) {
        _mean = cv::Mat::zeros(_geometry._height, _geometry._width, CV_32FC1);
    }

    // mean += (sample - mean) / count
    _count += 1;
    cv::accumulateWeighted(shape_of(sample._pixels, _geometry), _mean, 1.0 / static_cast<double>(_count));
    return {};
}

PixelBuffer BackgroundModel::average() const
{
    std::lock_guard<std::mutex> lock{_lock};
    return rounded_mean();
}

PixelBuffer BackgroundModel::rounded_mean() const
{
    PixelBuffer output{};
    if (not _mean.empty()) {
        _mean.convertTo(output._pixels, CV_8U);
    }
    return output;
}

size_t BackgroundModel::count() const
{
    std::lock_guard<std::mutex> lock{_lock};
    return _count;
}

bool BackgroundModel::frozen() const
{
    std::lock_guard<std::mutex> lock{_lock};
    return _frozen;
}

std::error_code BackgroundModel::freeze()
{
    std::lock_guard<std::mutex> lock{_lock};
    if (_count == 0) {
        return CalibrationError::InvalidState;
    }
    if (not _frozen) {
        auto baseline = std::make_shared<Baseline>();
        baseline->_pixels = rounded_mean();
        baseline->_samples = _count;
        _snapshot = std::move(baseline);
        _frozen = true;
    }
    return {};
}

void BackgroundModel::reset()
{
    std::lock_guard<std::mutex> lock{_lock};
    _mean.release();
    _count = 0;
    _frozen = false;
    _snapshot.reset();
}

BaselineSnapshot BackgroundModel::snapshot() const
{
    std::lock_guard<std::mutex> lock{_lock};
    return _snapshot;
}

std::error_code BackgroundModel::subtract(const PixelBuffer& live, PixelBuffer& output) const
{
    auto baseline = snapshot();
    if (baseline == nullptr) {
        return CalibrationError::InvalidState;
    }
    return egispp::subtract(*baseline, live, output);
}

std::error_code BackgroundModel::restore(const Baseline& baseline)
{
    if (baseline._pixels.size() != _geometry.size() or baseline._pixels._pixels.type() != CV_8UC1) {
        return CalibrationError::BaselineMismatch;
    }

    auto restored = std::make_shared<Baseline>();
    restored->_pixels._pixels = shape_of(baseline._pixels._pixels, _geometry).clone();
    restored->_samples = baseline._samples;

    std::lock_guard<std::mutex> lock{_lock};
    restored->_pixels._pixels.convertTo(_mean, CV_32F);
    _count = baseline._samples;
    _frozen = true;
    _snapshot = std::move(restored);
    return {};
}

std::error_code BackgroundModel::save(const std::string& filename) const
{
    auto baseline = snapshot();
    if (baseline == nullptr) {
        return CalibrationError::InvalidState;
    }
    return write_baseline(*baseline, filename);
}

std::error_code BackgroundModel::load(const std::string& filename)
{
    Baseline baseline{};
    auto ret = read_baseline(filename, _geometry, baseline);
    if (ret) {
        return ret;
    }
    return restore(baseline);
}

}
