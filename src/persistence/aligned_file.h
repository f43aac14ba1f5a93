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
#include <memory>
#include <stdexcept>
#include <string>
#include "config.h"
#include "storage_config.h"

namespace xlease {
    namespace persist {

        /**
         * Positioned I/O on a leases volume. Offsets, lengths and buffer
         * addresses must be multiples of layout::kBlockSize. Implementations
         * never buffer, reorder or coalesce calls; failures raise IOError.
         */
        class AlignedFile {
        public:
            virtual ~AlignedFile() = default;

            virtual const std::string& name() const = 0;

            // Total length of the backing store in bytes
            virtual uint64_t size() = 0;

            // Returns the number of bytes read, short only at end of file
            virtual size_t pread(uint64_t offset, void* buf, size_t len) = 0;

            virtual void pwrite(uint64_t offset, const void* buf, size_t len) = 0;

            // Idempotent; the destructor closes as well
            virtual void close() = 0;
        };

        inline void check_aligned(uint64_t offset, const void* buf, size_t len) {
            if (offset % layout::kBlockSize != 0) {
                throw std::invalid_argument("Unaligned offset " + std::to_string(offset));
            }
            if (len % layout::kBlockSize != 0) {
                throw std::invalid_argument("Unaligned length " + std::to_string(len));
            }
            if (reinterpret_cast<uintptr_t>(buf) % layout::kBlockSize != 0) {
                throw std::invalid_argument("Unaligned buffer");
            }
        }

        // Opens path with the strategy selected by cfg.interruptible_io
        std::unique_ptr<AlignedFile> open_aligned_file(const std::string& path,
                                                       const VolumeConfig& cfg);

    } // namespace persist
} // namespace xlease
