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
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include "lock_manager.h"

namespace xlease {
    namespace persist {

        // Resources kept in process memory, keyed by disk path and offset
        class MemoryLockManager : public LockManager {
        public:
            void write_resource(const std::string& lockspace, const std::string& resource,
                                const std::vector<ResourceDisk>& disks) override;
            ResourceInfo read_resource(const std::string& path, uint64_t offset) override;

            size_t size() const;
            void clear();

        private:
            mutable std::mutex mu_;
            std::map<std::pair<std::string, uint64_t>, ResourceInfo> resources_;
        };

    } // namespace persist
} // namespace xlease
