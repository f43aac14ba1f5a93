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
#include <cstddef>

namespace xlease {
namespace persist {

// Volume layout - offsets from the start of the leases volume.
//
// The volume is split into slots of kSlotSize bytes, the size of one lock
// manager resource. Slot 0 holds the lock manager's lockspace, slot 1 the
// index (one metadata block followed by the records), slot 2 is reserved
// and user resources start at slot 3. Record N describes the resource at
// kUserResourceBase + N * kSlotSize.
namespace layout {
    constexpr size_t   kBlockSize        = 512;                       // direct I/O unit
    constexpr size_t   kSlotSize         = 1024 * 1024;               // 1MiB per resource
    constexpr uint64_t kLockspaceBase    = 0;
    constexpr uint64_t kIndexBase        = kSlotSize;
    constexpr size_t   kMetadataSize     = kBlockSize;
    constexpr uint64_t kRecordBase       = kIndexBase + kMetadataSize;
    constexpr size_t   kIndexSize        = kSlotSize - kMetadataSize; // record region
    constexpr size_t   kRecordSize       = 64;
    constexpr size_t   kRecordsPerBlock  = kBlockSize / kRecordSize;
    constexpr size_t   kIndexBlocks      = kIndexSize / kBlockSize;
    constexpr size_t   kMaxRecords       = kIndexSize / kRecordSize;
    constexpr uint64_t kUserResourceBase = 3 * kSlotSize;

    static_assert(kBlockSize % kRecordSize == 0, "records must not span blocks");
    static_assert(kIndexSize % kBlockSize == 0, "index region must be block aligned");
    static_assert(kRecordBase + kIndexSize <= kUserResourceBase, "index overlaps user resources");
}

// Index header configuration
namespace index {
    constexpr uint32_t kMagic         = 0x12152016;
    constexpr uint32_t kVersion       = 1;
    constexpr size_t   kLockspaceSize = 48;   // lock manager name limit
    constexpr size_t   kResourceSize  = 48;
    constexpr size_t   kMtimeDigits   = 10;
}

// Resource leader blocks written by DiskResourceStore
namespace leader {
    constexpr uint32_t kMagic   = 0x06152010;
    constexpr uint32_t kVersion = 1;
}

// Interruptible I/O worker configuration
namespace worker {
    constexpr size_t kMaxTransferSize    = layout::kSlotSize;  // larger requests are split
    constexpr uint64_t kDefaultTimeoutMs = 10000;
    constexpr uint64_t kReapTimeoutMs    = 5000;
}

// Volume creation defaults
namespace volume {
    constexpr uint64_t kDefaultSize = 1ULL << 30;              // 1GiB
    constexpr uint64_t kMinSize     = layout::kUserResourceBase + layout::kSlotSize;
}

} // namespace persist
} // namespace xlease
