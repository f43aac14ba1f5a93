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

#include "interruptible_direct_file.h"
#include "platform_fs.h"
#include "errors.h"
#include "../util/log.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <poll.h>
#include <signal.h>
#include <sys/mman.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace xlease {
namespace persist {

namespace {

enum : uint32_t {
    kOpRead  = 1,
    kOpWrite = 2,
    kOpSize  = 3,
    kOpExit  = 4
};

// Both helpers are used by the worker, only async-signal-safe calls here
bool write_all(int fd, const void* data, size_t size) {
    const auto* bytes = static_cast<const uint8_t*>(data);
    size_t written = 0;
    while (written < size) {
        ssize_t rc = ::send(fd, bytes + written, size - written, MSG_NOSIGNAL);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (rc == 0) return false;
        written += static_cast<size_t>(rc);
    }
    return true;
}

bool read_all(int fd, void* data, size_t size) {
    auto* bytes = static_cast<uint8_t*>(data);
    size_t done = 0;
    while (done < size) {
        ssize_t rc = ::recv(fd, bytes + done, size - done, 0);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (rc == 0) return false;
        done += static_cast<size_t>(rc);
    }
    return true;
}

enum class WaitResult { kReady, kTimeout, kClosed };

WaitResult read_with_deadline(int fd, void* data, size_t size,
                              std::chrono::steady_clock::time_point deadline) {
    auto* bytes = static_cast<uint8_t*>(data);
    size_t done = 0;
    while (done < size) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return WaitResult::kTimeout;
        }
        int remaining = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count()) + 1;
        struct pollfd pfd { fd, POLLIN, 0 };
        int rc = ::poll(&pfd, 1, remaining);
        if (rc == 0) {
            continue;
        }
        if (rc < 0) {
            if (errno == EINTR) continue;
            return WaitResult::kClosed;
        }
        ssize_t n = ::recv(fd, bytes + done, size - done, MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return WaitResult::kClosed;
        }
        if (n == 0) {
            return WaitResult::kClosed;
        }
        done += static_cast<size_t>(n);
    }
    return WaitResult::kReady;
}

// Returns true once pid is reaped, false if it is still alive at the deadline
bool reap(pid_t pid, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        pid_t rc = ::waitpid(pid, nullptr, WNOHANG);
        if (rc == pid) {
            return true;
        }
        if (rc < 0) {
            if (errno == EINTR) continue;
            return true; // not our child anymore
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace

InterruptibleDirectFile::InterruptibleDirectFile(const std::string& path,
                                                 std::chrono::milliseconds timeout)
    : path_(path), timeout_(timeout) {
    if (timeout_.count() <= 0) {
        throw std::invalid_argument("Timeout must be positive");
    }
    std::lock_guard<std::mutex> lock(mu_);
    start_worker();
}

InterruptibleDirectFile::~InterruptibleDirectFile() {
    close();
}

void InterruptibleDirectFile::start_worker() {
    // The previous worker may still be stuck in the kernel writing to its
    // mapping, so every worker gets a fresh one
    void* shared = ::mmap(nullptr, worker::kMaxTransferSize, PROT_READ | PROT_WRITE,
                          MAP_SHARED | MAP_ANONYMOUS, -1, 0);
    if (shared == MAP_FAILED) {
        throw IOError(errno, "Failed to map I/O buffer for " + path_);
    }

    int sv[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
        int err = errno;
        ::munmap(shared, worker::kMaxTransferSize);
        throw IOError(err, "Failed to create worker socket for " + path_);
    }

    shared_ = shared;
    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(sv[0]);
        ::close(sv[1]);
        ::munmap(shared_, worker::kMaxTransferSize);
        shared_ = nullptr;
        throw IOError(err, "Failed to start I/O worker for " + path_);
    }
    if (pid == 0) {
        ::close(sv[0]);
        worker_main(sv[1]);
    }

    ::close(sv[1]);
    sock_ = sv[0];
    {
        std::lock_guard<std::mutex> pid_lock(pid_mu_);
        worker_pid_.store(pid);
        cancelled_.store(false);
    }

    Response hello{};
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    WaitResult res = read_with_deadline(sock_, &hello, sizeof(hello), deadline);
    if (res != WaitResult::kReady) {
        stop_worker(false);
        if (res == WaitResult::kTimeout) {
            throw TimeoutError("Timeout opening " + path_);
        }
        throw IOError(EPIPE, "I/O worker for " + path_ + " exited during startup");
    }
    if (hello.err != 0) {
        stop_worker(false);
        throw IOError(hello.err, "Failed to open " + path_);
    }
    if (hello.count == 0) {
        warning() << "O_DIRECT not supported for " << path_ << ", using synchronous I/O";
    }
    debug() << "Started I/O worker " << pid << " for " << path_;
}

void InterruptibleDirectFile::worker_main(int sock) {
    // No parent death signal: it fires when the forking thread exits, not
    // the owner. The worker exits on EOF once the owner's end is closed.
    bool direct = false;
    auto [res, fd] = PlatformFS::open_direct(path_, true, &direct);
    Response resp{res.ok ? 0 : res.err, 0, direct ? 1u : 0u};
    if (!write_all(sock, &resp, sizeof(resp)) || !res.ok) {
        ::_exit(1);
    }

    char* buf = static_cast<char*>(shared_);
    for (;;) {
        Request req;
        if (!read_all(sock, &req, sizeof(req))) {
            ::_exit(0);
        }
        resp = Response{0, 0, 0};
        switch (req.op) {
        case kOpRead: {
            auto [r, n] = PlatformFS::pread_full(fd, req.offset, buf, req.len);
            resp.err = r.ok ? 0 : r.err;
            resp.count = n;
            break;
        }
        case kOpWrite: {
            FSResult r = PlatformFS::pwrite_full(fd, req.offset, buf, req.len);
            resp.err = r.ok ? 0 : r.err;
            resp.count = r.ok ? req.len : 0;
            break;
        }
        case kOpSize: {
            auto [r, size] = PlatformFS::device_size(fd);
            resp.err = r.ok ? 0 : r.err;
            resp.count = size;
            break;
        }
        case kOpExit:
            PlatformFS::close(fd);
            ::_exit(0);
        default:
            resp.err = EINVAL;
            break;
        }
        if (!write_all(sock, &resp, sizeof(resp))) {
            ::_exit(1);
        }
    }
}

void InterruptibleDirectFile::stop_worker(bool graceful) {
    // Held until the pid is cleared so cancel() never signals a reaped pid
    std::lock_guard<std::mutex> pid_lock(pid_mu_);
    pid_t pid = worker_pid_.load();
    if (pid > 0) {
        if (graceful) {
            Request req{kOpExit, 0, 0, 0};
            if (!write_all(sock_, &req, sizeof(req)) ||
                !reap(pid, std::chrono::milliseconds(worker::kReapTimeoutMs))) {
                ::kill(pid, SIGKILL);
                graceful = false;
            }
        } else {
            ::kill(pid, SIGKILL);
        }
        if (!graceful && !reap(pid, std::chrono::milliseconds(worker::kReapTimeoutMs))) {
            // Stuck in uninterruptible I/O, the kernel releases it eventually
            error() << "I/O worker " << pid << " for " << path_ << " did not exit";
        }
        worker_pid_.store(0);
    }
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
    if (shared_ != nullptr) {
        ::munmap(shared_, worker::kMaxTransferSize);
        shared_ = nullptr;
    }
}

InterruptibleDirectFile::Response InterruptibleDirectFile::call(uint32_t op, uint64_t offset,
                                                                uint64_t len) {
    if (worker_pid_.load() == 0) {
        start_worker();
    }

    Request req{op, 0, offset, len};
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    WaitResult res = WaitResult::kClosed;
    Response resp{};
    if (write_all(sock_, &req, sizeof(req))) {
        res = read_with_deadline(sock_, &resp, sizeof(resp), deadline);
    }
    if (res == WaitResult::kReady) {
        return resp;
    }

    bool cancelled = cancelled_.exchange(false);
    stop_worker(false);
    if (res == WaitResult::kTimeout) {
        warning() << "I/O on " << path_ << " timed out after " << timeout_.count() << "ms";
        throw TimeoutError("Timeout accessing " + path_);
    }
    if (cancelled) {
        throw IOError(ECANCELED, "I/O on " + path_ + " cancelled");
    }
    throw IOError(EPIPE, "I/O worker for " + path_ + " died");
}

uint64_t InterruptibleDirectFile::size() {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
        throw IOError(EBADF, "File " + path_ + " is closed");
    }
    Response resp = call(kOpSize, 0, 0);
    if (resp.err != 0) {
        throw IOError(resp.err, "Failed to get size of " + path_);
    }
    return resp.count;
}

size_t InterruptibleDirectFile::pread(uint64_t offset, void* buf, size_t len) {
    check_aligned(offset, buf, len);
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
        throw IOError(EBADF, "File " + path_ + " is closed");
    }
    char* out = static_cast<char*>(buf);
    size_t done = 0;
    while (done < len) {
        size_t chunk = std::min(len - done, worker::kMaxTransferSize);
        Response resp = call(kOpRead, offset + done, chunk);
        if (resp.err != 0) {
            throw IOError(resp.err, "Failed to read " + std::to_string(len) +
                          " bytes at offset " + std::to_string(offset) + " from " + path_);
        }
        std::memcpy(out + done, shared_, resp.count);
        done += resp.count;
        if (resp.count < chunk) {
            break;
        }
    }
    return done;
}

void InterruptibleDirectFile::pwrite(uint64_t offset, const void* buf, size_t len) {
    check_aligned(offset, buf, len);
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
        throw IOError(EBADF, "File " + path_ + " is closed");
    }
    const char* in = static_cast<const char*>(buf);
    size_t done = 0;
    while (done < len) {
        size_t chunk = std::min(len - done, worker::kMaxTransferSize);
        if (worker_pid_.load() == 0) {
            start_worker();
        }
        std::memcpy(shared_, in + done, chunk);
        Response resp = call(kOpWrite, offset + done, chunk);
        if (resp.err != 0) {
            throw IOError(resp.err, "Failed to write " + std::to_string(len) +
                          " bytes at offset " + std::to_string(offset) + " to " + path_);
        }
        done += chunk;
    }
}

void InterruptibleDirectFile::cancel() {
    std::lock_guard<std::mutex> pid_lock(pid_mu_);
    pid_t pid = worker_pid_.load();
    if (pid > 0) {
        cancelled_.store(true);
        ::kill(pid, SIGKILL);
    }
}

void InterruptibleDirectFile::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
        return;
    }
    closed_ = true;
    stop_worker(true);
    trace() << "Closed " << path_;
}

} // namespace persist
} // namespace xlease
