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
#include <string>
#include <utility>

namespace xlease {
    namespace persist {

        struct FSResult {
            bool ok;
            int err;
        };

        // Thin POSIX layer used by the aligned file implementations. Every
        // call reports failure through FSResult and never allocates, so the
        // I/O worker process may use it after fork().
        class PlatformFS {
        public:
            // Opens with O_DIRECT. Filesystems that refuse O_DIRECT (tmpfs)
            // are reopened with O_DSYNC; *direct tells which one happened.
            static std::pair<FSResult, int> open_direct(const std::string& path, bool writable,
                                                        bool* direct);
            static FSResult close(int fd);

            // Loops over partial transfers; a short read means end of file.
            static std::pair<FSResult, size_t> pread_full(int fd, uint64_t offset, void* buf,
                                                          size_t len);
            static FSResult pwrite_full(int fd, uint64_t offset, const void* buf, size_t len);

            // Works for regular files and block devices
            static std::pair<FSResult, uint64_t> device_size(int fd);

            static std::pair<FSResult, size_t> file_size(const std::string& path);
            static FSResult create_sparse(const std::string& path, size_t size);
            static FSResult preallocate(const std::string& path, size_t len);
        };

    }
} // namespace xlease::persist
