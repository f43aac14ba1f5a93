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

#include "memory_lock_manager.h"
#include "config.h"
#include "errors.h"

namespace xlease {
namespace persist {

void MemoryLockManager::write_resource(const std::string& lockspace, const std::string& resource,
                                       const std::vector<ResourceDisk>& disks) {
    if (disks.empty()) {
        throw LockManagerError(EINVAL, "No disks for resource " + resource);
    }
    for (const auto& disk : disks) {
        if (disk.offset % layout::kSlotSize != 0) {
            throw LockManagerError(EINVAL, "Unaligned resource offset " +
                                   std::to_string(disk.offset));
        }
    }
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& disk : disks) {
        resources_[{disk.path, disk.offset}] = ResourceInfo{lockspace, resource};
    }
}

ResourceInfo MemoryLockManager::read_resource(const std::string& path, uint64_t offset) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = resources_.find({path, offset});
    if (it == resources_.end()) {
        throw LockManagerError(kLeaderMagic, "No resource at " + path + ":" +
                               std::to_string(offset));
    }
    return it->second;
}

size_t MemoryLockManager::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return resources_.size();
}

void MemoryLockManager::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    resources_.clear();
}

} // namespace persist
} // namespace xlease
