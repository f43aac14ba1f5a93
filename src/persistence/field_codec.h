/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace xlease {
    namespace persist {

        // Fixed width fields shared by the header and record encodings.
        // Names are printable ASCII, NUL padded; numbers are zero padded
        // decimal digits.
        namespace field {

            inline bool is_printable(char c) {
                return c >= 0x20 && c < 0x7f;
            }

            inline bool is_valid_name(const std::string& value, size_t width) {
                if (value.empty() || value.size() > width) {
                    return false;
                }
                for (char c : value) {
                    if (!is_printable(c)) {
                        return false;
                    }
                }
                return true;
            }

            inline void check_name(const char* what, const std::string& value, size_t width) {
                if (!is_valid_name(value, width)) {
                    throw std::invalid_argument(std::string("Invalid ") + what + " '" + value +
                                                "': expecting 1-" + std::to_string(width) +
                                                " printable ASCII characters");
                }
            }

            inline void encode_name(char* dst, const std::string& value, size_t width) {
                std::memset(dst, 0, width);
                std::memcpy(dst, value.data(), std::min(value.size(), width));
            }

            // False if the field holds a non printable byte or data after
            // the padding. An all NUL field decodes to an empty string.
            inline bool decode_name(const char* src, size_t width, std::string* out) {
                size_t len = 0;
                while (len < width && src[len] != '\0') {
                    if (!is_printable(src[len])) {
                        return false;
                    }
                    ++len;
                }
                for (size_t i = len; i < width; ++i) {
                    if (src[i] != '\0') {
                        return false;
                    }
                }
                out->assign(src, len);
                return true;
            }

            inline bool encode_decimal(char* dst, uint64_t value, size_t digits) {
                for (size_t i = digits; i > 0; --i) {
                    dst[i - 1] = static_cast<char>('0' + value % 10);
                    value /= 10;
                }
                return value == 0;
            }

            inline bool decode_decimal(const char* src, size_t digits, uint64_t* out) {
                uint64_t value = 0;
                for (size_t i = 0; i < digits; ++i) {
                    if (src[i] < '0' || src[i] > '9') {
                        return false;
                    }
                    value = value * 10 + static_cast<uint64_t>(src[i] - '0');
                }
                *out = value;
                return true;
            }

        } // namespace field
    } // namespace persist
} // namespace xlease
