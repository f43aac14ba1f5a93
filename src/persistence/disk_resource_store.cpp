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

#include "disk_resource_store.h"
#include "aligned_buffer.h"
#include "aligned_file.h"
#include "field_codec.h"
#include "errors.h"
#include "../util/log.h"

namespace xlease {
namespace persist {

namespace {

constexpr size_t kLockspaceOffset = 10;
constexpr size_t kResourceOffset  = 59;
constexpr size_t kEncodedSize     = 108;

void check_field(const char* what, const std::string& value) {
    // Empty names are how a slot is invalidated
    if (!value.empty() && !field::is_valid_name(value, index::kResourceSize)) {
        throw LockManagerError(EINVAL, std::string("Invalid ") + what + " '" + value + "'");
    }
}

void check_offset(uint64_t offset) {
    if (offset % layout::kSlotSize != 0) {
        throw LockManagerError(EINVAL, "Unaligned resource offset " + std::to_string(offset));
    }
}

} // namespace

void DiskResourceStore::write_resource(const std::string& lockspace, const std::string& resource,
                                       const std::vector<ResourceDisk>& disks) {
    check_field("lockspace", lockspace);
    check_field("resource", resource);
    if (disks.empty()) {
        throw LockManagerError(EINVAL, "No disks for resource " + resource);
    }

    AlignedBuffer leader(layout::kBlockSize);
    char* p = leader.chars();
    p[0] = static_cast<char>((leader::kMagic >> 24) & 0xff);
    p[1] = static_cast<char>((leader::kMagic >> 16) & 0xff);
    p[2] = static_cast<char>((leader::kMagic >> 8) & 0xff);
    p[3] = static_cast<char>(leader::kMagic & 0xff);
    p[4] = ':';
    if (!field::encode_decimal(p + 5, leader::kVersion, 4)) {
        throw std::logic_error("Leader version does not fit");
    }
    p[9] = ':';
    field::encode_name(p + kLockspaceOffset, lockspace, index::kLockspaceSize);
    p[58] = ':';
    field::encode_name(p + kResourceOffset, resource, index::kResourceSize);
    p[kEncodedSize - 1] = '\n';

    for (const auto& disk : disks) {
        check_offset(disk.offset);
        try {
            auto file = open_aligned_file(disk.path, cfg_);
            file->pwrite(disk.offset, leader.data(), leader.size());
            file->close();
        } catch (const IOError& e) {
            throw LockManagerError(e.err(), std::string("Cannot write resource: ") + e.what());
        }
        debug() << "Wrote resource " << lockspace << ":" << resource << " at " << disk.path << ":"
                << disk.offset;
    }
}

ResourceInfo DiskResourceStore::read_resource(const std::string& path, uint64_t offset) {
    check_offset(offset);

    AlignedBuffer leader(layout::kBlockSize);
    size_t n = 0;
    try {
        auto file = open_aligned_file(path, cfg_);
        n = file->pread(offset, leader.data(), leader.size());
        file->close();
    } catch (const IOError& e) {
        throw LockManagerError(e.err(), std::string("Cannot read resource: ") + e.what());
    }

    const auto* p = reinterpret_cast<const unsigned char*>(leader.chars());
    uint32_t magic = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) |
                     uint32_t(p[3]);
    if (n < kEncodedSize || magic != leader::kMagic) {
        throw LockManagerError(kLeaderMagic, "No resource leader at " + path + ":" +
                               std::to_string(offset));
    }

    ResourceInfo info;
    const char* data = leader.chars();
    if (!field::decode_name(data + kLockspaceOffset, index::kLockspaceSize, &info.lockspace) ||
        !field::decode_name(data + kResourceOffset, index::kResourceSize, &info.resource)) {
        throw LockManagerError(EINVAL, "Corrupted resource leader at " + path + ":" +
                               std::to_string(offset));
    }
    return info;
}

} // namespace persist
} // namespace xlease
