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
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>
#include "aligned_buffer.h"
#include "aligned_file.h"
#include "index_metadata.h"
#include "record.h"

namespace xlease {
    namespace persist {

        /**
         * Private copy of one index block. Records are modified here and
         * written back with a single aligned write, so a failure never
         * leaves other records of the block half updated in memory.
         */
        class RecordBlock {
        public:
            RecordBlock(size_t blocknum, const char* data);

            RecordBlock(RecordBlock&&) = default;
            RecordBlock& operator=(RecordBlock&&) = default;

            size_t blocknum() const { return blocknum_; }

            // Volume offset of this block
            uint64_t offset() const {
                return layout::kRecordBase + uint64_t(blocknum_) * layout::kBlockSize;
            }

            // Throws std::out_of_range if recnum is not in this block
            void write_record(size_t recnum, const Record& record);
            Record read_record(size_t recnum) const;

            void dump(AlignedFile& file) const;

            const char* data() const { return buf_.chars(); }

            void close() { buf_.reset(); }

        private:
            size_t record_index(size_t recnum) const;

            size_t blocknum_;
            AlignedBuffer buf_;
        };

        /**
         * In-memory copy of the index region.
         *
         * load() reads the header and the whole record region with one read;
         * blocks are decoded on first use and cached by block number.
         * Records that fail to decode are logged once and treated as
         * neither free nor occupied.
         */
        class VolumeIndex {
        public:
            VolumeIndex() = default;

            VolumeIndex(const VolumeIndex&) = delete;
            VolumeIndex& operator=(const VolumeIndex&) = delete;

            // Throws InvalidIndex for a truncated volume or a bad header
            void load(AlignedFile& file);

            bool loaded() const { return !data_.empty(); }

            const IndexMetadata& metadata() const { return metadata_; }

            // First record for resource, in slot order
            std::optional<size_t> find_record(const std::string& resource);

            // Lowest free slot
            std::optional<size_t> find_free_record();

            // Throws InvalidRecord if the stored record is corrupt
            Record read_record(size_t recnum);

            // Every valid, non free record in slot order
            std::vector<std::pair<size_t, Record>> records();

            RecordBlock copy_record_block(size_t recnum) const;

            // Replace a block after it was dumped to storage
            void update_block(const RecordBlock& block);

            void close();

        private:
            using DecodedBlock = std::vector<std::optional<Record>>;

            const DecodedBlock& block(size_t blocknum);
            void check_recnum(size_t recnum) const;

            IndexMetadata metadata_;
            AlignedBuffer data_;
            std::map<size_t, DecodedBlock> blocks_;
        };

    } // namespace persist
} // namespace xlease
