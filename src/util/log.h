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
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

#include <boost/thread/mutex.hpp>
#include <boost/thread/tss.hpp>

namespace xlease {

    enum LogLevel {
        LOG_TRACE,    // per-record I/O
        LOG_DEBUG,    // worker lifecycle, lease resource writes
        LOG_INFO,     // index format, rebuild, volume open
        LOG_WARNING,  // degraded I/O, skipped records
        LOG_ERROR,    // duplicate leases, unreapable workers
        LOG_SEVERE
    };

    const char* logLevelToString(LogLevel l);

    /**
     * Per-thread message buffer. A message is built with operator<< and
     * written out as a single line by flush(), so lines from different
     * threads never interleave.
     */
    class Logger {
    public:

        static Logger& get() {
            Logger* p = tsp.get();
            if (p == nullptr)
                tsp.reset(p = new Logger());
            return *p;
        }

        /**
         * Redirect every thread's output to f. nullptr routes it back to
         * stderr. The caller keeps ownership of f.
         */
        static void setLogFile(FILE* f);

        void flush();

        const std::string& getThreadName() const { return _threadName; }
        void setThreadName(const std::string& name) { _threadName = name; }

        Logger& setLogLevel(LogLevel l) {
            _level = l;
            return *this;
        }

        template<typename T>
        Logger& operator<<(const T& x) {
            _ss << x;
            return *this;
        }

        Logger& operator<<(std::ostream& (*)(std::ostream&)) {
            flush();
            return *this;
        }

    private:
        Logger() : _threadName("xlease") { _reset(); }

        void _reset() {
            _ss.str("");
            _ss.clear();
            _level = LOG_INFO;
        }

        static std::string timestamp();

        static boost::mutex sm;
        static FILE* logfile;
        static boost::thread_specific_ptr<Logger> tsp;

        std::ostringstream _ss;
        LogLevel _level;
        std::string _threadName;
    };

    extern std::atomic<int> logLevel;

    // Flushes the pending message when the statement ends
    class LoggerWrapper {
        Logger* logger_;
    public:
        explicit LoggerWrapper(Logger* logger) : logger_(logger) {}

        LoggerWrapper(LoggerWrapper&& other) : logger_(other.logger_) {
            other.logger_ = nullptr;
        }

        LoggerWrapper(const LoggerWrapper&) = delete;
        LoggerWrapper& operator=(const LoggerWrapper&) = delete;

        ~LoggerWrapper() {
            if (logger_)
                logger_->flush();
        }

        template<typename T>
        LoggerWrapper& operator<<(const T& value) {
            if (logger_)
                (*logger_) << value;
            return *this;
        }
    };

    inline LoggerWrapper log(LogLevel l) {
        if (l < logLevel.load(std::memory_order_relaxed))
            return LoggerWrapper(nullptr);
        return LoggerWrapper(&Logger::get().setLogLevel(l));
    }

    inline LoggerWrapper trace()   { return log(LOG_TRACE); }
    inline LoggerWrapper debug()   { return log(LOG_DEBUG); }
    inline LoggerWrapper info()    { return log(LOG_INFO); }
    inline LoggerWrapper warning() { return log(LOG_WARNING); }
    inline LoggerWrapper error()   { return log(LOG_ERROR); }
    inline LoggerWrapper severe()  { return log(LOG_SEVERE); }

    std::string errnoWithDescription(int x = errno);

    /**
     * Parse a level name, case-insensitive. WARN and FATAL are accepted
     * as aliases. Returns false and leaves the level unchanged otherwise.
     */
    bool setLogLevelFromString(const std::string& level);

    // Applies $LOG_LEVEL if set; an unknown name is reported on stderr
    void initLoggingFromEnv();

}
