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
#include <vector>

namespace xlease {
    namespace persist {

        struct ResourceDisk {
            std::string path;
            uint64_t offset;
        };

        // Identity of a resource as recorded by the lock manager
        struct ResourceInfo {
            std::string lockspace;
            std::string resource;

            bool operator==(const ResourceInfo& o) const {
                return lockspace == o.lockspace && resource == o.resource;
            }
        };

        /**
         * The cluster lock manager's resource store. Implementations raise
         * LockManagerError on failure; reading a slot that holds no resource
         * raises it with kLeaderMagic.
         */
        class LockManager {
        public:
            // "not a valid resource header"
            static constexpr int kLeaderMagic = -223;

            virtual ~LockManager() = default;

            // Registers resource on disks, replacing any previous occupant.
            // Empty lockspace and resource invalidate the slot.
            virtual void write_resource(const std::string& lockspace, const std::string& resource,
                                        const std::vector<ResourceDisk>& disks) = 0;

            virtual ResourceInfo read_resource(const std::string& path, uint64_t offset) = 0;
        };

    } // namespace persist
} // namespace xlease
