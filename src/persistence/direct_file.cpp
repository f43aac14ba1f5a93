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

#include "direct_file.h"
#include "interruptible_direct_file.h"
#include "platform_fs.h"
#include "errors.h"
#include "../util/log.h"
#include <cerrno>

namespace xlease {
namespace persist {

DirectFile::DirectFile(const std::string& path) : path_(path) {
    auto [res, fd] = PlatformFS::open_direct(path, true, &direct_);
    if (!res.ok) {
        throw IOError(res.err, "Failed to open " + path);
    }
    fd_ = fd;
    if (!direct_) {
        warning() << "O_DIRECT not supported for " << path << ", using synchronous I/O";
    }
    trace() << "Opened " << path << " fd=" << fd_;
}

DirectFile::~DirectFile() {
    close();
}

int DirectFile::checked_fd() const {
    if (fd_ < 0) {
        throw IOError(EBADF, "File " + path_ + " is closed");
    }
    return fd_;
}

uint64_t DirectFile::size() {
    auto [res, size] = PlatformFS::device_size(checked_fd());
    if (!res.ok) {
        throw IOError(res.err, "Failed to get size of " + path_);
    }
    return size;
}

size_t DirectFile::pread(uint64_t offset, void* buf, size_t len) {
    check_aligned(offset, buf, len);
    auto [res, n] = PlatformFS::pread_full(checked_fd(), offset, buf, len);
    if (!res.ok) {
        throw IOError(res.err, "Failed to read " + std::to_string(len) + " bytes at offset " +
                      std::to_string(offset) + " from " + path_);
    }
    return n;
}

void DirectFile::pwrite(uint64_t offset, const void* buf, size_t len) {
    check_aligned(offset, buf, len);
    FSResult res = PlatformFS::pwrite_full(checked_fd(), offset, buf, len);
    if (!res.ok) {
        throw IOError(res.err, "Failed to write " + std::to_string(len) + " bytes at offset " +
                      std::to_string(offset) + " to " + path_);
    }
}

void DirectFile::close() {
    if (fd_ < 0) {
        return;
    }
    FSResult res = PlatformFS::close(fd_);
    fd_ = -1;
    if (!res.ok) {
        warning() << "Error closing " << path_ << ": " << errnoWithDescription(res.err);
    }
}

std::unique_ptr<AlignedFile> open_aligned_file(const std::string& path, const VolumeConfig& cfg) {
    if (cfg.interruptible_io) {
        return std::make_unique<InterruptibleDirectFile>(
            path, std::chrono::milliseconds(cfg.io_timeout_ms));
    }
    return std::make_unique<DirectFile>(path);
}

} // namespace persist
} // namespace xlease
