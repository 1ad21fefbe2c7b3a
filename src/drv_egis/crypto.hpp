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
#ifndef __crypto_hpp__
#define __crypto_hpp__

#include <cstddef>
#include <string>

#include <openssl/evp.h>

namespace crypto {

bool sha256(const void* data, size_t size, unsigned char* output);

// lowercase hex, empty on failure
std::string sha256_hex(const void* data, size_t size);

}

#endif
