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

#include "platform_fs.h"
#include "config.h"

#ifdef XLEASE_LINUX
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>

namespace xlease {
    namespace persist {

        std::pair<FSResult, int> PlatformFS::open_direct(const std::string& path, bool writable,
                                                         bool* direct) {
            int flags = (writable ? O_RDWR : O_RDONLY) | O_CLOEXEC;

            int fd = ::open(path.c_str(), flags | O_DIRECT);
            if (fd >= 0) {
                if (direct) *direct = true;
                return {{true, 0}, fd};
            }
            if (errno != EINVAL) {
                return {{false, errno}, -1};
            }

            // O_DIRECT not supported here, keep writes synchronous at least
            fd = ::open(path.c_str(), flags | O_DSYNC);
            if (fd < 0) {
                return {{false, errno}, -1};
            }
            if (direct) *direct = false;
            return {{true, 0}, fd};
        }

        FSResult PlatformFS::close(int fd) {
            int rc = ::close(fd);
            return { rc == 0, rc == 0 ? 0 : errno };
        }

        std::pair<FSResult, size_t> PlatformFS::pread_full(int fd, uint64_t offset, void* buf,
                                                           size_t len) {
            char* p = static_cast<char*>(buf);
            size_t done = 0;
            while (done < len) {
                ssize_t n = ::pread(fd, p + done, len - done, off_t(offset + done));
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return {{false, errno}, done};
                }
                if (n == 0) {
                    break; // EOF
                }
                done += size_t(n);
                if (done % layout::kBlockSize != 0) {
                    break; // EOF inside a block, the next direct read would be unaligned
                }
            }
            return {{true, 0}, done};
        }

        FSResult PlatformFS::pwrite_full(int fd, uint64_t offset, const void* buf, size_t len) {
            const char* p = static_cast<const char*>(buf);
            size_t done = 0;
            while (done < len) {
                ssize_t n = ::pwrite(fd, p + done, len - done, off_t(offset + done));
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return {false, errno};
                }
                if (n == 0) {
                    return {false, EIO};
                }
                done += size_t(n);
            }
            return {true, 0};
        }

        std::pair<FSResult, uint64_t> PlatformFS::device_size(int fd) {
            // lseek reports the size of block devices as well
            off_t end = ::lseek(fd, 0, SEEK_END);
            if (end < 0) {
                return {{false, errno}, 0};
            }
            return {{true, 0}, uint64_t(end)};
        }

        std::pair<FSResult, size_t> PlatformFS::file_size(const std::string& path) {
            struct stat st{};
            int rc = ::stat(path.c_str(), &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (size_t)st.st_size : 0 };
        }

        FSResult PlatformFS::create_sparse(const std::string& path, size_t size) {
            int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
            if (fd < 0) {
                return {false, errno};
            }
            if (::ftruncate(fd, off_t(size)) != 0) {
                int ec = errno;
                ::close(fd);
                return {false, ec};
            }
            ::close(fd);
            return {true, 0};
        }

        FSResult PlatformFS::preallocate(const std::string& path, size_t len) {
            int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
            if (fd < 0) {
                return {false, errno};
            }

            // posix_fallocate returns the error code directly, not via errno
            int rc = ::posix_fallocate(fd, 0, (off_t)len);
            if (rc != 0) {
                // Fall back to a sparse file on filesystems without fallocate
                if (::ftruncate(fd, (off_t)len) != 0) {
                    int ec = errno;
                    ::close(fd);
                    return {false, ec};
                }
            }

            ::close(fd);
            return {true, 0};
        }

    } // namespace persist
} // namespace xlease
#endif
