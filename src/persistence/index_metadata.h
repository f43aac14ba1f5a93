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
#include <string>
#include "config.h"

namespace xlease {
    namespace persist {

        /**
         * Index header, stored in the first block of the index slot.
         *
         * Layout (72 bytes used, zero padded to one block):
         *   magic(4) : version(4) : lockspace(48) : mtime(10) : updating(1) \n
         *
         * The magic is big endian. updating is 'u' while format or rebuild
         * rewrites the index; a header left in this state is not trusted.
         */
        struct IndexMetadata {
            static constexpr size_t kMagicOffset     = 0;
            static constexpr size_t kVersionOffset   = 5;
            static constexpr size_t kVersionDigits   = 4;
            static constexpr size_t kLockspaceOffset = 10;
            static constexpr size_t kMtimeOffset     = 59;
            static constexpr size_t kUpdatingOffset  = 70;
            static constexpr size_t kEncodedSize     = 72;

            uint32_t version = index::kVersion;
            std::string lockspace;
            uint64_t mtime = 0;
            bool updating = false;

            IndexMetadata() = default;
            IndexMetadata(uint32_t version, const std::string& lockspace, uint64_t mtime = 0,
                          bool updating = false)
                : version(version), lockspace(lockspace), mtime(mtime), updating(updating) {}

            // One kMetadataSize block. Throws std::invalid_argument for a
            // lockspace, version or mtime that does not fit the layout.
            std::string bytes() const;

            // Strict parse used when opening a volume. Throws InvalidIndex,
            // including for an unsupported version or a set updating flag.
            static IndexMetadata from_bytes(const char* data, size_t len);

            // Parses the layout only, accepting any version and updating
            // state. Used for diagnostics.
            static IndexMetadata decode(const char* data, size_t len);

            bool operator==(const IndexMetadata& o) const {
                return version == o.version && lockspace == o.lockspace && mtime == o.mtime &&
                       updating == o.updating;
            }
            bool operator!=(const IndexMetadata& o) const { return !(*this == o); }
        };

    } // namespace persist
} // namespace xlease
