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

#include "leases_volume.h"
#include "field_codec.h"
#include "errors.h"
#include "../util/log.h"
#include <ctime>

namespace xlease {
namespace persist {

LeasesVolume::LeasesVolume(AlignedFile& file, LockManager& lock_manager)
    : file_(file), lock_manager_(lock_manager) {
    index_.load(file_);
    info() << "Loaded leases volume " << path() << " lockspace=" << lockspace();
}

LeasesVolume::LeasesVolume(std::unique_ptr<AlignedFile> file, LockManager& lock_manager)
    : owned_(std::move(file)), file_(*owned_), lock_manager_(lock_manager) {
    index_.load(file_);
    info() << "Loaded leases volume " << path() << " lockspace=" << lockspace();
}

LeasesVolume::~LeasesVolume() {
    close();
}

void LeasesVolume::check_open() const {
    if (closed_) {
        throw XleaseError("Leases volume " + file_.name() + " is closed");
    }
}

LeaseInfo LeasesVolume::lease_info(const std::string& lease_id, size_t recnum) const {
    return LeaseInfo{lockspace(), lease_id, path(), record_offset(recnum)};
}

LeaseInfo LeasesVolume::lookup(const std::string& lease_id) {
    field::check_name("lease id", lease_id, index::kResourceSize);
    check_open();

    auto recnum = index_.find_record(lease_id);
    if (!recnum) {
        throw NoSuchLease(lease_id);
    }
    Record record = index_.read_record(*recnum);
    if (record.updating) {
        throw LeaseUpdating(lease_id);
    }
    return lease_info(lease_id, *recnum);
}

std::map<std::string, LeaseState> LeasesVolume::leases() {
    check_open();
    std::map<std::string, LeaseState> result;
    for (const auto& entry : index_.records()) {
        const Record& record = entry.second;
        // Duplicates were already reported by the index, keep the first
        result.emplace(record.resource, LeaseState{record_offset(entry.first), record.updating});
    }
    return result;
}

LeaseInfo LeasesVolume::add(const std::string& lease_id) {
    field::check_name("lease id", lease_id, index::kResourceSize);
    check_open();

    if (auto existing = index_.find_record(lease_id)) {
        if (index_.read_record(*existing).updating) {
            throw LeaseUpdating(lease_id);
        }
        throw LeaseExists(lease_id);
    }

    auto recnum = index_.find_free_record();
    if (!recnum) {
        throw NoSpace(lease_id);
    }
    uint64_t offset = record_offset(*recnum);
    if (offset + layout::kSlotSize > file_.size()) {
        throw NoSpace(lease_id);
    }

    info() << "Adding lease " << lease_id << " in lockspace " << lockspace() << " at offset "
           << offset;

    uint64_t now = static_cast<uint64_t>(std::time(nullptr));
    write_record(*recnum, Record(lease_id, now, true));

    lock_manager_.write_resource(lockspace(), lease_id, {ResourceDisk{path(), offset}});

    write_record(*recnum, Record(lease_id, now, false));
    return lease_info(lease_id, *recnum);
}

void LeasesVolume::remove(const std::string& lease_id) {
    field::check_name("lease id", lease_id, index::kResourceSize);
    check_open();

    auto recnum = index_.find_record(lease_id);
    if (!recnum) {
        throw NoSuchLease(lease_id);
    }
    uint64_t offset = record_offset(*recnum);

    info() << "Removing lease " << lease_id << " in lockspace " << lockspace() << " at offset "
           << offset;

    uint64_t now = static_cast<uint64_t>(std::time(nullptr));
    write_record(*recnum, Record(lease_id, now, true));

    // The lock manager cannot delete a resource, write an invalid one
    lock_manager_.write_resource("", "", {ResourceDisk{path(), offset}});

    write_record(*recnum, Record());
}

void LeasesVolume::write_record(size_t recnum, const Record& record) {
    RecordBlock block = index_.copy_record_block(recnum);
    block.write_record(recnum, record);
    block.dump(file_);
    index_.update_block(block);
}

void LeasesVolume::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    index_.close();
    if (owned_) {
        owned_->close();
    }
    debug() << "Closed leases volume " << file_.name();
}

} // namespace persist
} // namespace xlease
