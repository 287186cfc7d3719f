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
#include <stdexcept>
#include <boost/filesystem.hpp>

namespace tsbtreedb {

    /**
     * Routes all Logger output to an append-mode log file for the
     * lifetime of the manager. Output reverts to stderr on destruction.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logpath) : _file(0) {
            start(logpath);
        }

        ~LogManager() {
            if ( _file ) {
                Logger::setLogFile(nullptr);
                fclose( _file );
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

    private:
        void start( const string& lp ) {
            if (boost::filesystem::is_directory(lp)) {
                throw std::invalid_argument("logpath [" + lp + "] should be a file name not a directory");
            }

            boost::filesystem::path parent = boost::filesystem::path(lp).parent_path();
            if (!parent.empty() && !boost::filesystem::exists(parent)) {
                boost::system::error_code ec;
                boost::filesystem::create_directories(parent, ec);
                if (ec) {
                    throw std::runtime_error("can't create log directory [" + parent.string() + "]: " + ec.message());
                }
            }

            bool exists = boost::filesystem::exists(lp);

            FILE* f = fopen( lp.c_str(), "a" );
            if ( ! f ) {
                throw std::runtime_error("can't open [" + lp + "] for log file: " + errnoWithDescription());
            }

            if (exists) {
                const string msg = "\n***** LOG REOPENED *****\n\n";
                fwrite(msg.data(), 1, msg.size(), f);
            }

            _path = lp;
            _file = f;
            Logger::setLogFile(_file);
        }

        string _path;
        FILE *_file;
    };
}
