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

#include "../pch.h"
#include <cctype>
#include <cstdlib>
#include <atomic>

namespace tsbtreedb {

    enum LogLevel {
        LOG_TRACE,    // Support engineering: detailed tracing
        LOG_DEBUG,    // Developer: debug information
        LOG_INFO,     // Production: normal operation
        LOG_WARNING,  // Production: warning conditions
        LOG_ERROR,    // Production: error conditions
        LOG_SEVERE    // Production: fatal errors
    };

    const char* logLevelToString(LogLevel l);

    /**
     * Per-thread line buffer. A line is assembled without locking and
     * written to the shared sink (stderr or the installed log file) in one
     * piece under the sink mutex.
     */
    class Logger {
    public:
        static Logger& get() {
            Logger *p = tsp.get();
            if( p == 0 )
                tsp.reset( p = new Logger() );
            return *p;
        }

        /**
         * set the log file, nullptr reverts to stderr
         */
        static void setLogFile(FILE* f);

        Logger& begin(LogLevel l) {
            ss.str("");
            level = l;
            return *this;
        }

        template <typename T>
        Logger& operator<<(const T& x) { ss << x; return *this; }

        // Writes "<time> [LEVEL] <message>" and clears the buffer
        void flush();

    private:
        Logger() : level(LOG_INFO) {}

        static boost::mutex sm;
        static FILE* logfile;
        static boost::thread_specific_ptr<Logger> tsp;

        stringstream ss;
        LogLevel level;
    };

    extern std::atomic<int> logLevel;

    // Collects one message and flushes it as a line when destroyed
    class LoggerWrapper {
        Logger* logger_;
    public:
        explicit LoggerWrapper(Logger* logger) : logger_(logger) {}
        LoggerWrapper(LoggerWrapper&& o) noexcept : logger_(o.logger_) { o.logger_ = nullptr; }
        LoggerWrapper(const LoggerWrapper&) = delete;
        LoggerWrapper& operator=(const LoggerWrapper&) = delete;

        ~LoggerWrapper() {
            // Filtered messages have no logger
            if (logger_) {
                (*logger_) << '\n';
                logger_->flush();
            }
        }

        template<typename T>
        LoggerWrapper& operator<<(const T& value) {
            if (logger_) {
                (*logger_) << value;
            }
            return *this;
        }
    };

    inline bool logEnabled(LogLevel l) {
        return !(l < logLevel.load(std::memory_order_relaxed));
    }

    inline LoggerWrapper log( LogLevel l ) {
        if ( !logEnabled(l) )
            return LoggerWrapper(nullptr);
        return LoggerWrapper(&Logger::get().begin(l));
    }

    inline LoggerWrapper trace()   { return log(LOG_TRACE); }
    inline LoggerWrapper debug()   { return log(LOG_DEBUG); }
    inline LoggerWrapper info()    { return log(LOG_INFO); }
    inline LoggerWrapper warning() { return log(LOG_WARNING); }
    inline LoggerWrapper error()   { return log(LOG_ERROR); }
    inline LoggerWrapper severe()  { return log(LOG_SEVERE); }

    inline string errnoWithDescription(int x = errno) {
        stringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

    // Accepts level names in any case, plus WARN and FATAL
    inline bool setLogLevelFromString(const std::string& level) {
        std::string upper = level;
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        int l;
        if (upper == "TRACE")                        l = LOG_TRACE;
        else if (upper == "DEBUG")                   l = LOG_DEBUG;
        else if (upper == "INFO")                    l = LOG_INFO;
        else if (upper == "WARNING" || upper == "WARN") l = LOG_WARNING;
        else if (upper == "ERROR")                   l = LOG_ERROR;
        else if (upper == "SEVERE" || upper == "FATAL") l = LOG_SEVERE;
        else return false;

        logLevel.store(l, std::memory_order_relaxed);
        return true;
    }

    // Reads LOG_LEVEL; an unknown value keeps the current level
    inline void initLoggingFromEnv() {
        const char* env_level = std::getenv("LOG_LEVEL");
        if (env_level && !setLogLevelFromString(env_level)) {
            std::cerr << "Warning: Invalid LOG_LEVEL '" << env_level
                      << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
        }
    }

}
