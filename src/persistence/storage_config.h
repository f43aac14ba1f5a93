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
#include <cctype>
#include <cstdlib>
#include <string>
#include "config.h"  // For defaults

namespace xlease {
namespace persist {

/**
 * Runtime configuration for opening a leases volume
 */
struct VolumeConfig {
    // Run I/O in a worker process so a stuck device can be abandoned
    bool interruptible_io = false;

    // Per-call deadline for interruptible I/O
    uint64_t io_timeout_ms = worker::kDefaultTimeoutMs;

    std::string log_level = "WARNING";

    /**
     * Create config with defaults, optionally reading from environment
     */
    static VolumeConfig defaults() {
        VolumeConfig cfg;

        if (const char* env = std::getenv("XLEASE_INTERRUPTIBLE_IO")) {
            cfg.interruptible_io = (std::string(env) != "0");
        }

        if (const char* env = std::getenv("XLEASE_IO_TIMEOUT_MS")) {
            cfg.io_timeout_ms = std::stoull(env);
        }

        if (const char* env = std::getenv("XLEASE_LOG_LEVEL")) {
            cfg.log_level = env;
        }

        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (io_timeout_ms == 0) {
            return false;
        }
        static const char* const kLevels[] = {
            "TRACE", "DEBUG", "INFO", "WARNING", "WARN", "ERROR", "SEVERE", "FATAL"
        };
        std::string upper;
        for (char c : log_level) {
            upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        for (const char* level : kLevels) {
            if (upper == level) {
                return true;
            }
        }
        return false;
    }
};

} // namespace persist
} // namespace xlease
