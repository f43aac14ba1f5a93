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
#include <cstdint>
#include <string>
#include "config.h"

namespace xlease {
    namespace persist {

        /**
         * One index record, describing the lock manager resource at
         * kUserResourceBase + recnum * kSlotSize.
         *
         * Layout (64 bytes): resource(48) : updating(1) : modified(10) : " \n"
         *
         * A free record is all zeros. The slot offset is implied by the
         * record position and never stored.
         */
        struct Record {
            static constexpr size_t kUpdatingOffset = 49;
            static constexpr size_t kModifiedOffset = 51;

            std::string resource;   // empty when free
            uint64_t modified = 0;
            bool updating = false;

            Record() = default;
            Record(const std::string& resource, uint64_t modified, bool updating = false)
                : resource(resource), modified(modified), updating(updating) {}

            bool free() const { return resource.empty(); }

            // kRecordSize bytes, all zeros for a free record
            std::string bytes() const;

            // Throws InvalidRecord for anything but a free or well formed record
            static Record from_bytes(const char* data);

            bool operator==(const Record& o) const {
                return resource == o.resource && modified == o.modified && updating == o.updating;
            }
            bool operator!=(const Record& o) const { return !(*this == o); }
        };

        inline uint64_t record_offset(size_t recnum) {
            return layout::kUserResourceBase + uint64_t(recnum) * layout::kSlotSize;
        }

    } // namespace persist
} // namespace xlease
