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

#include "volume_index.h"
#include "errors.h"
#include "../util/log.h"
#include <cstring>

namespace xlease {
namespace persist {

RecordBlock::RecordBlock(size_t blocknum, const char* data)
    : blocknum_(blocknum), buf_(layout::kBlockSize) {
    std::memcpy(buf_.chars(), data, layout::kBlockSize);
}

size_t RecordBlock::record_index(size_t recnum) const {
    if (recnum / layout::kRecordsPerBlock != blocknum_) {
        throw std::out_of_range("Record " + std::to_string(recnum) + " is not in block " +
                                std::to_string(blocknum_));
    }
    return recnum % layout::kRecordsPerBlock;
}

void RecordBlock::write_record(size_t recnum, const Record& record) {
    std::string data = record.bytes();
    std::memcpy(buf_.chars() + record_index(recnum) * layout::kRecordSize, data.data(),
                layout::kRecordSize);
}

Record RecordBlock::read_record(size_t recnum) const {
    return Record::from_bytes(buf_.chars() + record_index(recnum) * layout::kRecordSize);
}

void RecordBlock::dump(AlignedFile& file) const {
    file.pwrite(offset(), buf_.data(), buf_.size());
}

void VolumeIndex::load(AlignedFile& file) {
    uint64_t size = file.size();
    if (size < layout::kRecordBase + layout::kIndexSize) {
        throw InvalidIndex("truncated volume " + file.name() + " (" + std::to_string(size) +
                           " bytes)");
    }

    AlignedBuffer header(layout::kMetadataSize);
    size_t n = file.pread(layout::kIndexBase, header.data(), header.size());
    IndexMetadata md = IndexMetadata::from_bytes(header.chars(), n);

    AlignedBuffer data(layout::kIndexSize);
    n = file.pread(layout::kRecordBase, data.data(), data.size());
    if (n < layout::kIndexSize) {
        throw InvalidIndex("short read of index records (" + std::to_string(n) + " bytes)");
    }

    metadata_ = md;
    data_ = std::move(data);
    blocks_.clear();
    debug() << "Loaded index of " << file.name() << " lockspace=" << metadata_.lockspace;
}

void VolumeIndex::check_recnum(size_t recnum) const {
    if (!loaded()) {
        throw std::logic_error("Index is not loaded");
    }
    if (recnum >= layout::kMaxRecords) {
        throw std::out_of_range("Record number " + std::to_string(recnum) + " out of range");
    }
}

const VolumeIndex::DecodedBlock& VolumeIndex::block(size_t blocknum) {
    auto it = blocks_.find(blocknum);
    if (it != blocks_.end()) {
        return it->second;
    }

    DecodedBlock records(layout::kRecordsPerBlock);
    const char* base = data_.chars() + blocknum * layout::kBlockSize;
    for (size_t i = 0; i < layout::kRecordsPerBlock; ++i) {
        try {
            records[i] = Record::from_bytes(base + i * layout::kRecordSize);
        } catch (const InvalidRecord& e) {
            warning() << "Ignoring record " << blocknum * layout::kRecordsPerBlock + i << ": "
                      << e.what();
        }
    }
    return blocks_.emplace(blocknum, std::move(records)).first->second;
}

std::optional<size_t> VolumeIndex::find_record(const std::string& resource) {
    check_recnum(0);
    std::optional<size_t> found;
    for (size_t b = 0; b < layout::kIndexBlocks; ++b) {
        const DecodedBlock& records = block(b);
        for (size_t i = 0; i < records.size(); ++i) {
            if (!records[i] || records[i]->resource != resource) {
                continue;
            }
            size_t recnum = b * layout::kRecordsPerBlock + i;
            if (!found) {
                found = recnum;
            } else {
                error() << "Resource " << resource << " found in records " << *found << " and "
                        << recnum;
            }
        }
    }
    return found;
}

std::optional<size_t> VolumeIndex::find_free_record() {
    check_recnum(0);
    for (size_t b = 0; b < layout::kIndexBlocks; ++b) {
        const DecodedBlock& records = block(b);
        for (size_t i = 0; i < records.size(); ++i) {
            if (records[i] && records[i]->free()) {
                return b * layout::kRecordsPerBlock + i;
            }
        }
    }
    return std::nullopt;
}

Record VolumeIndex::read_record(size_t recnum) {
    check_recnum(recnum);
    return Record::from_bytes(data_.chars() + recnum * layout::kRecordSize);
}

std::vector<std::pair<size_t, Record>> VolumeIndex::records() {
    check_recnum(0);
    std::vector<std::pair<size_t, Record>> result;
    for (size_t b = 0; b < layout::kIndexBlocks; ++b) {
        const DecodedBlock& records = block(b);
        for (size_t i = 0; i < records.size(); ++i) {
            if (records[i] && !records[i]->free()) {
                result.emplace_back(b * layout::kRecordsPerBlock + i, *records[i]);
            }
        }
    }
    return result;
}

RecordBlock VolumeIndex::copy_record_block(size_t recnum) const {
    check_recnum(recnum);
    size_t blocknum = recnum / layout::kRecordsPerBlock;
    return RecordBlock(blocknum, data_.chars() + blocknum * layout::kBlockSize);
}

void VolumeIndex::update_block(const RecordBlock& block) {
    check_recnum(block.blocknum() * layout::kRecordsPerBlock);
    std::memcpy(data_.chars() + block.blocknum() * layout::kBlockSize, block.data(),
                layout::kBlockSize);
    blocks_.erase(block.blocknum());
}

void VolumeIndex::close() {
    blocks_.clear();
    data_.reset();
}

} // namespace persist
} // namespace xlease
