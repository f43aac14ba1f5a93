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
#include <string>
#include "aligned_file.h"

namespace xlease {
    namespace persist {

        // Direct I/O performed on the calling thread
        class DirectFile : public AlignedFile {
        public:
            explicit DirectFile(const std::string& path);
            ~DirectFile() override;

            DirectFile(const DirectFile&) = delete;
            DirectFile& operator=(const DirectFile&) = delete;

            const std::string& name() const override { return path_; }
            uint64_t size() override;
            size_t pread(uint64_t offset, void* buf, size_t len) override;
            void pwrite(uint64_t offset, const void* buf, size_t len) override;
            void close() override;

            // False when the filesystem refused O_DIRECT and O_DSYNC is used
            bool direct() const { return direct_; }

        private:
            int checked_fd() const;

            std::string path_;
            int fd_ = -1;
            bool direct_ = true;
        };

    } // namespace persist
} // namespace xlease
