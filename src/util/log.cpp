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

#include "log.h"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <utility>

namespace xlease {

    boost::mutex Logger::sm;
    FILE* Logger::logfile = nullptr;
    boost::thread_specific_ptr<Logger> Logger::tsp;

    std::atomic<int> logLevel{LOG_WARNING};

    namespace {
        const std::pair<const char*, LogLevel> kLevelNames[] = {
            {"TRACE", LOG_TRACE},
            {"DEBUG", LOG_DEBUG},
            {"INFO", LOG_INFO},
            {"WARNING", LOG_WARNING},
            {"WARN", LOG_WARNING},
            {"ERROR", LOG_ERROR},
            {"SEVERE", LOG_SEVERE},
            {"FATAL", LOG_SEVERE},
        };
    }

    const char* logLevelToString(LogLevel l) {
        for (const auto& entry : kLevelNames) {
            if (entry.second == l)
                return entry.first;
        }
        return "UNKNOWN";
    }

    std::string Logger::timestamp() {
        char buf[26];
        time_t now = time(nullptr);
        ctime_r(&now, buf);
        buf[24] = 0;
        return buf;
    }

    void Logger::flush() {
        std::string msg = _ss.str();
        if (msg.empty()) {
            _reset();
            return;
        }
        if (msg.back() != '\n')
            msg += '\n';

        std::ostringstream line;
        line << timestamp() << " [" << _threadName << "] ["
             << logLevelToString(_level) << "] " << msg;
        const std::string out = line.str();

        boost::mutex::scoped_lock lk(sm);
        FILE* sink = logfile ? logfile : stderr;
        if (fputs(out.c_str(), sink) >= 0) {
            fflush(sink);
        } else {
            int x = errno;
            std::cerr << "Failed to write to logfile: " << errnoWithDescription(x)
                      << ": " << out;
        }
        _reset();
    }

    void Logger::setLogFile(FILE* f) {
        boost::mutex::scoped_lock lk(sm);
        logfile = f;
    }

    std::string errnoWithDescription(int x) {
        std::ostringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

    bool setLogLevelFromString(const std::string& level) {
        std::string upper = level;
        for (auto& c : upper)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        for (const auto& entry : kLevelNames) {
            if (upper == entry.first) {
                logLevel.store(entry.second, std::memory_order_relaxed);
                return true;
            }
        }
        return false;
    }

    void initLoggingFromEnv() {
        const char* env_level = std::getenv("LOG_LEVEL");
        if (env_level && !setLogLevelFromString(env_level)) {
            std::cerr << "Warning: Invalid LOG_LEVEL '" << env_level
                      << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
        }
    }

}
