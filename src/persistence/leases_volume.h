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
#include <map>
#include <memory>
#include <string>
#include "aligned_file.h"
#include "lock_manager.h"
#include "volume_index.h"

namespace xlease {
    namespace persist {

        struct LeaseInfo {
            std::string lockspace;
            std::string resource;
            std::string path;
            uint64_t offset = 0;

            bool operator==(const LeaseInfo& o) const {
                return lockspace == o.lockspace && resource == o.resource && path == o.path &&
                       offset == o.offset;
            }
            bool operator!=(const LeaseInfo& o) const { return !(*this == o); }
        };

        struct LeaseState {
            uint64_t offset = 0;
            bool updating = false;

            bool operator==(const LeaseState& o) const {
                return offset == o.offset && updating == o.updating;
            }
        };

        /**
         * Leases stored on a volume, indexed by lease id.
         *
         * Adding a lease marks a free record updating, creates the lock
         * manager resource, then clears the updating flag. Removing does the
         * same in reverse, invalidating the resource before freeing the
         * record. A failure after the first write leaves the record
         * updating until the index is rebuilt.
         *
         * Not thread safe; callers serialize operations on one volume.
         */
        class LeasesVolume {
        public:
            // Loads the index; throws InvalidIndex if it must be rebuilt
            LeasesVolume(AlignedFile& file, LockManager& lock_manager);

            // Takes ownership of file, closing it with the volume
            LeasesVolume(std::unique_ptr<AlignedFile> file, LockManager& lock_manager);

            ~LeasesVolume();

            LeasesVolume(const LeasesVolume&) = delete;
            LeasesVolume& operator=(const LeasesVolume&) = delete;

            const std::string& lockspace() const { return index_.metadata().lockspace; }
            uint32_t version() const { return index_.metadata().version; }
            uint64_t mtime() const { return index_.metadata().mtime; }
            const std::string& path() const { return file_.name(); }

            LeaseInfo lookup(const std::string& lease_id);
            std::map<std::string, LeaseState> leases();
            LeaseInfo add(const std::string& lease_id);
            void remove(const std::string& lease_id);

            void close();

        private:
            void check_open() const;
            void write_record(size_t recnum, const Record& record);
            LeaseInfo lease_info(const std::string& lease_id, size_t recnum) const;

            std::unique_ptr<AlignedFile> owned_;
            AlignedFile& file_;
            LockManager& lock_manager_;
            VolumeIndex index_;
            bool closed_ = false;
        };

    } // namespace persist
} // namespace xlease
