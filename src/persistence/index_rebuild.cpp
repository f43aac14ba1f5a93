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

#include "index_rebuild.h"
#include "aligned_buffer.h"
#include "field_codec.h"
#include "errors.h"
#include "../util/log.h"
#include <algorithm>
#include <cstring>
#include <ctime>

namespace xlease {
namespace persist {

namespace {

void write_metadata(AlignedFile& file, const IndexMetadata& md) {
    AlignedBuffer buf(layout::kMetadataSize);
    std::string data = md.bytes();
    std::memcpy(buf.chars(), data.data(), data.size());
    file.pwrite(layout::kIndexBase, buf.data(), buf.size());
}

// Header, record region, header; see format_index
void write_index(const std::string& lockspace, AlignedFile& file, const AlignedBuffer& records,
                 uint64_t mtime) {
    IndexMetadata md(index::kVersion, lockspace, mtime, true);
    write_metadata(file, md);

    file.pwrite(layout::kRecordBase, records.data(), records.size());

    md.updating = false;
    write_metadata(file, md);
}

uint64_t now_or(std::optional<uint64_t> mtime) {
    return mtime ? *mtime : static_cast<uint64_t>(std::time(nullptr));
}

} // namespace

void format_index(const std::string& lockspace, AlignedFile& file, std::optional<uint64_t> mtime) {
    field::check_name("lockspace", lockspace, index::kLockspaceSize);
    info() << "Formatting index for lockspace " << lockspace << " on " << file.name();

    AlignedBuffer records(layout::kIndexSize);
    write_index(lockspace, file, records, now_or(mtime));
}

void rebuild_index(const std::string& lockspace, AlignedFile& file, LockManager& lock_manager,
                   std::optional<uint64_t> mtime) {
    field::check_name("lockspace", lockspace, index::kLockspaceSize);
    uint64_t size = file.size();
    uint64_t now = now_or(mtime);
    info() << "Rebuilding index for lockspace " << lockspace << " on " << file.name();

    // Mark the index updating before reading the resources, so a crash
    // during the scan leaves an index that must be rebuilt again
    write_metadata(file, IndexMetadata(index::kVersion, lockspace, now, true));

    size_t slots = 0;
    if (size > layout::kUserResourceBase) {
        slots = static_cast<size_t>(std::min<uint64_t>(
            layout::kMaxRecords, (size - layout::kUserResourceBase) / layout::kSlotSize));
    }

    AlignedBuffer records(layout::kIndexSize);
    size_t found = 0;
    for (size_t recnum = 0; recnum < slots; ++recnum) {
        uint64_t offset = record_offset(recnum);
        ResourceInfo res;
        try {
            res = lock_manager.read_resource(file.name(), offset);
        } catch (const LockManagerError& e) {
            if (e.code() != LockManager::kLeaderMagic) {
                throw;
            }
            continue;
        }
        if (res.lockspace != lockspace || res.resource.empty()) {
            continue;
        }
        if (!field::is_valid_name(res.resource, index::kResourceSize)) {
            warning() << "Skipping resource with invalid name at offset " << offset;
            continue;
        }
        std::string data = Record(res.resource, now, false).bytes();
        std::memcpy(records.chars() + recnum * layout::kRecordSize, data.data(), data.size());
        ++found;
    }

    write_index(lockspace, file, records, now);
    info() << "Rebuilt index for lockspace " << lockspace << ": " << found << " leases in "
           << slots << " slots";
}

IndexDump dump_index(AlignedFile& file) {
    IndexDump dump;

    AlignedBuffer header(layout::kMetadataSize);
    size_t n = file.pread(layout::kIndexBase, header.data(), header.size());
    try {
        dump.metadata = IndexMetadata::decode(header.chars(), n);
    } catch (const InvalidIndex& e) {
        dump.error = e.what();
    }

    AlignedBuffer records(layout::kIndexSize);
    n = file.pread(layout::kRecordBase, records.data(), records.size());
    size_t count = n / layout::kRecordSize;
    static const char kZero[layout::kRecordSize] = {};
    for (size_t recnum = 0; recnum < count; ++recnum) {
        const char* data = records.chars() + recnum * layout::kRecordSize;
        if (std::memcmp(data, kZero, layout::kRecordSize) == 0) {
            continue;
        }
        DumpRecord entry{recnum, record_offset(recnum), std::nullopt, ""};
        try {
            entry.record = Record::from_bytes(data);
        } catch (const InvalidRecord& e) {
            entry.error = e.what();
        }
        dump.records.push_back(std::move(entry));
    }
    return dump;
}

} // namespace persist
} // namespace xlease
