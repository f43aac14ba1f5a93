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
#include <optional>
#include <string>
#include <vector>
#include "aligned_file.h"
#include "index_metadata.h"
#include "lock_manager.h"
#include "record.h"

namespace xlease {
    namespace persist {

        /**
         * Writes an empty index for lockspace. mtime defaults to now.
         *
         * The header is first written with the updating flag set, then the
         * records, then the final header, so an interrupted format leaves an
         * index that fails to load.
         */
        void format_index(const std::string& lockspace, AlignedFile& file,
                          std::optional<uint64_t> mtime = std::nullopt);

        /**
         * Rebuilds the index from the resources stored in the volume's user
         * resource area, ignoring the current index content. Uses the same
         * write protocol as format_index.
         */
        void rebuild_index(const std::string& lockspace, AlignedFile& file,
                           LockManager& lock_manager,
                           std::optional<uint64_t> mtime = std::nullopt);

        struct DumpRecord {
            size_t recnum;
            uint64_t offset;
            std::optional<Record> record;   // empty if the record is corrupt
            std::string error;
        };

        struct IndexDump {
            std::optional<IndexMetadata> metadata;   // empty if the header is unreadable
            std::string error;
            std::vector<DumpRecord> records;         // every non free record
        };

        // Reads the index without validating it, for inspecting broken volumes
        IndexDump dump_index(AlignedFile& file);

    } // namespace persist
} // namespace xlease
