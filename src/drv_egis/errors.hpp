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
#ifndef __errors_hpp__
#define __errors_hpp__

#include <system_error>

namespace egispp {

enum class ProtocolError {
    BadMagic = 1,
    Truncated,
    IncompleteChunk
};

enum class TransportError {
    Timeout = 1,
    Disconnected,
    Io
};

enum class ImageError {
    SizeMismatch = 1
};

enum class CalibrationError {
    NoisyBaseline = 1,
    InvalidState,
    BaselineMismatch,
    BaselineCorrupted
};

const std::error_category& category_protocol() noexcept;
const std::error_category& category_transport() noexcept;
const std::error_category& category_image() noexcept;
const std::error_category& category_calibration() noexcept;

inline std::error_code make_error_code(ProtocolError error) noexcept {
    return {static_cast<int>(error), category_protocol()};
}

inline std::error_code make_error_code(TransportError error) noexcept {
    return {static_cast<int>(error), category_transport()};
}

inline std::error_code make_error_code(ImageError error) noexcept {
    return {static_cast<int>(error), category_image()};
}

inline std::error_code make_error_code(CalibrationError error) noexcept {
    return {static_cast<int>(error), category_calibration()};
}

}

namespace std {

template<> struct is_error_code_enum<egispp::ProtocolError> : true_type { };
template<> struct is_error_code_enum<egispp::TransportError> : true_type { };
template<> struct is_error_code_enum<egispp::ImageError> : true_type { };
template<> struct is_error_code_enum<egispp::CalibrationError> : true_type { };

}

#endif
