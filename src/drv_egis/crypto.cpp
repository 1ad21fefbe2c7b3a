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
#include <openssl/sha.h>

#include "crypto.hpp"

namespace crypto {

bool sha256(const void* data, size_t size, unsigned char* output)
{
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        return false;
    }
    unsigned int osz = 0;
    int res = EVP_DigestInit_ex(ctx, EVP_sha256(), NULL);
    if (res != 0) {
        res = EVP_DigestUpdate(ctx, data, size);
    }
    if (res != 0) {
        res = EVP_DigestFinal_ex(ctx, output, &osz);
    }
    EVP_MD_CTX_free(ctx);
    return res != 0 and osz == SHA256_DIGEST_LENGTH;
}

std::string sha256_hex(const void* data, size_t size)
{
    static const char digits[] = "0123456789abcdef";

    unsigned char digest[SHA256_DIGEST_LENGTH];
    if (not sha256(data, size, digest)) {
        return {};
    }

    std::string output{};
    output.reserve(SHA256_DIGEST_LENGTH * 2);
    for (unsigned char byte : digest) {
        output.push_back(digits[byte >> 4]);
        output.push_back(digits[byte & 0x0f]);
    }
    return output;
}

}
