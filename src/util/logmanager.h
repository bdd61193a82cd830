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

namespace recset {

    /**
     * Sends all log output to <logdir>/recset.log. Output falls back to
     * stderr when the manager is destroyed.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logdir, bool append = true) : _enabled(false), _file(0) {
            string lp = logdir.empty() ? string("recset.log") : logdir + "/recset.log";
            start(lp, append);
        }

        ~LogManager() {
            if ( _file ) {
                Logger::setLogFile(0);
                fclose( _file );
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

        string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            strftime(buf, sizeof(buf), fmt, &t);
            return buf;
        }

        void start( const string& lp, bool append) {
            _append = append;

            if (boost::filesystem::is_directory(lp)) {
                throw std::runtime_error("logpath [" + lp + "] should be a file name not a directory");
            }
            bool exists = boost::filesystem::exists(lp);

            FILE * test = fopen( lp.c_str() , _append ? "a" : "w" );
            if ( ! test ) {
                throw std::runtime_error("can't open [" + lp + "] for log file: " + errnoWithDescription());
            }

            if (append && exists){
                // two blank lines before and after
                const string msg = "\n\n***** LOG REOPENED *****\n\n\n";
                if (fwrite(msg.data(), 1, msg.size(), test) != msg.size()) {
                    int x = errno;
                    fclose( test );
                    throw std::runtime_error("can't write to [" + lp + "]: " + errnoWithDescription(x));
                }
            }

            fclose( test );

            _path = lp;
            _enabled = true;
            rotate();
        }

        // Moves the current file aside under a timestamped name and reopens
        void rotate() {
            if( !_enabled ) {
                throw std::runtime_error("LogManager not enabled");
            }

            FILE* old = _file;
            if ( old ) {
                stringstream ss;
                ss << _path << "." << terseCurrentTime( false );
                string s = ss.str();
                if (rename( _path.c_str() , s.c_str() ) != 0) {
                    throw std::runtime_error("can't rotate [" + _path + "]: " + errnoWithDescription());
                }
            }

            FILE* tmp = fopen(_path.c_str(), _append || old ? "a" : "w");
            if ( !tmp ) {
                throw std::runtime_error("can't open: " + _path + " for log file: " + errnoWithDescription());
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if ( old )
                fclose( old );

            _file = tmp;    // Save new file for next rotation
        }

    private:
        bool _enabled;
        string _path;
        bool _append;
        FILE *_file;
    };
}
