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

#include "log.h"

#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>

#include <boost/filesystem.hpp>

namespace xlease {

    /**
     * Routes the logger into <logdir>/xlease.log for the lifetime of the
     * manager. Output returns to stderr on destruction.
     */
    class LogManager {
    public:
        explicit LogManager(const std::string& logdir, bool append = true)
            : _append(append) {
            boost::filesystem::path dir(logdir);
            if (!boost::filesystem::exists(dir))
                boost::filesystem::create_directories(dir);

            _path = (dir / "xlease.log").string();
            if (boost::filesystem::is_directory(_path))
                throw std::runtime_error("logpath [" + _path + "] should be a file name not a directory");
            rotate();
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if (_file)
                fclose(_file);
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const std::string& path() const { return _path; }

        /**
         * Moves the current file aside as xlease.log.<UTC time> and
         * continues in a fresh xlease.log.
         */
        void rotate() {
            if (_file) {
                const std::string rotated = _path + "." + utcStamp();
                if (rename(_path.c_str(), rotated.c_str()) != 0)
                    warning() << "failed to rotate " << _path << ": " << errnoWithDescription();
            }

            FILE* next = fopen(_path.c_str(), _append ? "a" : "w");
            if (!next)
                throw std::runtime_error("can't open [" + _path + "] for log file: " + errnoWithDescription());

            // No thread writes to the old file once this returns
            Logger::setLogFile(next);
            if (_file)
                fclose(_file);
            _file = next;
        }

    private:
        static std::string utcStamp() {
            struct tm t;
            time_t now = time(nullptr);
            gmtime_r(&now, &t);
            char buf[32];
            strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &t);
            return buf;
        }

        std::string _path;
        bool _append;
        FILE* _file = nullptr;
    };
}
