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
#include <string>
#include "lock_manager.h"
#include "storage_config.h"

namespace xlease {
    namespace persist {

        /**
         * Resource store that keeps a one block leader at the start of each
         * resource slot, for volumes not managed by a cluster lock daemon.
         *
         * Leader layout: magic(4) : version(4) : lockspace(48) : resource(48) \n
         */
        class DiskResourceStore : public LockManager {
        public:
            explicit DiskResourceStore(const VolumeConfig& cfg = VolumeConfig()) : cfg_(cfg) {}

            void write_resource(const std::string& lockspace, const std::string& resource,
                                const std::vector<ResourceDisk>& disks) override;
            ResourceInfo read_resource(const std::string& path, uint64_t offset) override;

        private:
            VolumeConfig cfg_;
        };

    } // namespace persist
} // namespace xlease
