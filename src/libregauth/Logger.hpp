/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libregauth_Logger_hpp
#define libregauth_Logger_hpp

#include <string>
#include <iostream>
#include <mutex>

#include <boost/format.hpp>

#include "libregauth/LogLevel.hpp"
#include "libregauth/Error.hpp"

namespace libregauth {

class Logger {
public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& sysName, const libregauth::LogLevel& logLevel,
            std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void log(const boost::format& message, const std::string& sysName, const libregauth::LogLevel& logLevel,
            std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void logErrorTrace(const libregauth::Error& error, const std::string& sysName, std::ostream& errStream = std::cerr);
    void setLevel(libregauth::LogLevel logLevel) { level = logLevel; };
    libregauth::LogLevel getLevel() { return level; };

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    std::string makeSubmessageWithTimestamp(libregauth::LogLevel logLevel) const;
    std::string makeSubmessageWithInstanceID(libregauth::LogLevel logLevel) const;
    std::string makeSubmessageWithSystemName(   libregauth::LogLevel logLevel,
                                                const std::string& systemName) const;
    std::string makeSubmessageWithLogLevel(libregauth::LogLevel logLevel) const;

private:
    libregauth::LogLevel level;
    // task continuations may log from pplx worker threads
    std::mutex outputMutex;
};

}

#endif
