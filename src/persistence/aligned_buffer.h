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
#include <cstdlib>
#include <cstring>
#include <new>
#include <utility>
#include "config.h"

namespace xlease {
    namespace persist {

        // Zero-filled heap buffer aligned for direct I/O. Move-only.
        class AlignedBuffer {
        public:
            AlignedBuffer() = default;

            explicit AlignedBuffer(size_t size, size_t alignment = layout::kBlockSize)
                : size_(size) {
                if (size == 0) return;
                void* p = nullptr;
                if (::posix_memalign(&p, alignment, size) != 0) {
                    throw std::bad_alloc();
                }
                std::memset(p, 0, size);
                data_ = static_cast<uint8_t*>(p);
            }

            ~AlignedBuffer() { std::free(data_); }

            AlignedBuffer(const AlignedBuffer&) = delete;
            AlignedBuffer& operator=(const AlignedBuffer&) = delete;

            AlignedBuffer(AlignedBuffer&& other) noexcept
                : data_(std::exchange(other.data_, nullptr)),
                  size_(std::exchange(other.size_, 0)) {}

            AlignedBuffer& operator=(AlignedBuffer&& other) noexcept {
                if (this != &other) {
                    std::free(data_);
                    data_ = std::exchange(other.data_, nullptr);
                    size_ = std::exchange(other.size_, 0);
                }
                return *this;
            }

            uint8_t* data() { return data_; }
            const uint8_t* data() const { return data_; }
            char* chars() { return reinterpret_cast<char*>(data_); }
            const char* chars() const { return reinterpret_cast<const char*>(data_); }
            size_t size() const { return size_; }
            bool empty() const { return data_ == nullptr; }

            // Release memory early; the buffer becomes empty
            void reset() {
                std::free(data_);
                data_ = nullptr;
                size_ = 0;
            }

        private:
            uint8_t* data_ = nullptr;
            size_t size_ = 0;
        };

    } // namespace persist
} // namespace xlease
