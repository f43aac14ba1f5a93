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
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <sys/types.h>
#include "aligned_file.h"
#include "config.h"

namespace xlease {
    namespace persist {

        /**
         * Direct I/O performed by a forked worker process.
         *
         * A read or write on a broken device may block forever in the kernel.
         * Running the syscall in a child lets the caller give up: when a call
         * exceeds the timeout, or cancel() is called from another thread, the
         * worker is killed and the call fails with TimeoutError or
         * IOError(ECANCELED). The next call starts a fresh worker.
         *
         * Data moves through a shared mapping created before fork(), so the
         * worker never allocates. Requests larger than the mapping are split.
         * Calls on one instance are serialized. The worker lives as long as
         * the instance, whichever thread started it.
         */
        class InterruptibleDirectFile : public AlignedFile {
        public:
            explicit InterruptibleDirectFile(
                const std::string& path,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(worker::kDefaultTimeoutMs));
            ~InterruptibleDirectFile() override;

            InterruptibleDirectFile(const InterruptibleDirectFile&) = delete;
            InterruptibleDirectFile& operator=(const InterruptibleDirectFile&) = delete;

            const std::string& name() const override { return path_; }
            uint64_t size() override;
            size_t pread(uint64_t offset, void* buf, size_t len) override;
            void pwrite(uint64_t offset, const void* buf, size_t len) override;
            void close() override;

            // Safe from any thread. Kills the worker; an in-flight call fails.
            void cancel();

            // 0 when no worker is running
            pid_t worker_pid() const { return worker_pid_.load(); }

            std::chrono::milliseconds timeout() const { return timeout_; }

            struct Request {
                uint32_t op;
                uint32_t pad;
                uint64_t offset;
                uint64_t len;
            };

            struct Response {
                int32_t err;
                uint32_t pad;
                uint64_t count;
            };

        private:
            void start_worker();
            void stop_worker(bool graceful);
            Response call(uint32_t op, uint64_t offset, uint64_t len);
            [[noreturn]] void worker_main(int sock);

            std::string path_;
            std::chrono::milliseconds timeout_;
            std::mutex mu_;
            // Guards signalling and reaping the worker; taken after mu_
            std::mutex pid_mu_;
            bool closed_ = false;
            int sock_ = -1;
            void* shared_ = nullptr;
            std::atomic<pid_t> worker_pid_{0};
            std::atomic<bool> cancelled_{false};
        };

    } // namespace persist
} // namespace xlease
