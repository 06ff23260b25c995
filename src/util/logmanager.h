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
#include <filesystem>
#include <stdexcept>
#include <string>

namespace duodb {

    /**
     * Routes the logger into <logdir>/duodb.log for the lifetime of the
     * object. Output goes back to stderr on destruction.
     */
    class LogManager {
    public:

        explicit LogManager(const std::string& logdir, bool append = true) : _file(nullptr) {
            if (logdir.empty()) {
                throw std::invalid_argument("LogManager: log directory cannot be empty");
            }
            std::error_code ec;
            std::filesystem::create_directories(logdir, ec);
            if (ec) {
                throw std::runtime_error("LogManager: can't create log directory [" + logdir + "]: " + ec.message());
            }
            start((std::filesystem::path(logdir) / "duodb.log").string(), append);
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if (_file) {
                std::fclose(_file);
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const std::string& path() const { return _path; }

    private:
        void start(const std::string& lp, bool append) {
            bool exists = std::filesystem::exists(lp);

            FILE* f = std::fopen(lp.c_str(), append ? "a" : "w");
            if (!f) {
                if (std::filesystem::is_directory(lp)) {
                    throw std::runtime_error("logpath [" + lp + "] should be a file name not a directory");
                }
                throw std::runtime_error("can't open [" + lp + "] for log file: " + errnoWithDescription());
            }

            if (append && exists) {
                // two blank lines before and after
                const std::string msg = "\n\n***** PROCESS RESTARTED *****\n\n\n";
                std::fwrite(msg.data(), 1, msg.size(), f);
                std::fflush(f);
            }

            _path = lp;
            _file = f;
            Logger::setLogFile(_file);
        }

        std::string _path;
        FILE* _file;
    };

} // namespace duodb
