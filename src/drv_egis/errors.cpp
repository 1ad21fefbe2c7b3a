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
#include <string>

#include "errors.hpp"

namespace egispp {

class CategoryProtocol : public std::error_category {
public:
    const char* name() const noexcept override { return "egis.protocol"; }

    std::string message(int code) const override {
        switch (static_cast<ProtocolError>(code)) {
            case ProtocolError::BadMagic:
                return "bad magic";
            case ProtocolError::Truncated:
                return "truncated frame";
            case ProtocolError::IncompleteChunk:
                return "incomplete chunked response";
        }
        return "unknown protocol error";
    }
};

class CategoryTransport : public std::error_category {
public:
    const char* name() const noexcept override { return "egis.transport"; }

    std::string message(int code) const override {
        switch (static_cast<TransportError>(code)) {
            case TransportError::Timeout:
                return "transfer timed out";
            case TransportError::Disconnected:
                return "device disconnected";
            case TransportError::Io:
                return "transfer failed";
        }
        return "unknown transport error";
    }
};

class CategoryImage : public std::error_category {
public:
    const char* name() const noexcept override { return "egis.image"; }

    std::string message(int code) const override {
        switch (static_cast<ImageError>(code)) {
            case ImageError::SizeMismatch:
                return "image size mismatch";
        }
        return "unknown image error";
    }
};

class CategoryCalibration : public std::error_category {
public:
    const char* name() const noexcept override { return "egis.calibration"; }

    std::string message(int code) const override {
        switch (static_cast<CalibrationError>(code)) {
            case CalibrationError::NoisyBaseline:
                return "background baseline too noisy";
            case CalibrationError::InvalidState:
                return "invalid calibration state";
            case CalibrationError::BaselineMismatch:
                return "baseline does not match the sensor geometry";
            case CalibrationError::BaselineCorrupted:
                return "baseline digest mismatch";
        }
        return "unknown calibration error";
    }
};

const std::error_category& category_protocol() noexcept
{
    static CategoryProtocol category{};
    return category;
}

const std::error_category& category_transport() noexcept
{
    static CategoryTransport category{};
    return category;
}

const std::error_category& category_image() noexcept
{
    static CategoryImage category{};
    return category;
}

const std::error_category& category_calibration() noexcept
{
    static CategoryCalibration category{};
    return category;
}

}
