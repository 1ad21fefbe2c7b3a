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
#ifndef __profile_hpp__
#define __profile_hpp__

#include <cstdint>
#include <map>
#include <string>
#include <system_error>

#include "frame.hpp"
#include "image.hpp"

namespace egispp {

/*
    Device specific constants: command tables, trailing checksum bytes,
    image geometry and USB ids. The checksum algorithm of the firmware is
    unknown, so checksums are a constant per opcode.
*/
struct DeviceProfile
{
    std::string _name{};
    uint16_t _vendor{};
    uint16_t _product{};
    ImageGeometry _geometry{};

    CommandList _pre_init{};
    CommandList _post_init{};
    CommandSpec _background{};
    CommandList _repeat{};

    std::map<unsigned char, unsigned char> _checksums{};

    static DeviceProfile eh575();

    // stamp _checksums onto every command of a listed opcode
    void apply_checksums();

    // index of the command in _repeat whose response is the image
    bool find_capture(size_t& index) const;

    std::error_code validate() const;

    std::error_code load(const std::string& filename);
    std::error_code save(const std::string& filename) const;
};

}

#endif
