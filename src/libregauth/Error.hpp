/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libregauth_Error_hpp
#define libregauth_Error_hpp

#include <type_traits>
#include <exception>
#include <string>
#include <vector>
#include <cstring>
#include <cassert>

#include <boost/filesystem.hpp>

#include "libregauth/LogLevel.hpp"

namespace libregauth {

/**
 * This class encapsulates error trace information to be propagated as an exception.
 *
 * An error trace entry encapsulates information about file, line and function name
 * where the error trace entry was created.
 *
 * The first error trace entry is created by the macro REGAUTH_THROW_ERROR.
 * Additional error trace entries are created by the macro REGAUTH_RETHROW_ERROR.
 *
 * Note: this class should be instantiated and thrown through the REGAUTH_THROW_ERROR macro
 * (or through a macro of a derived error class, e.g. REGAUTH_THROW_AUTH_ERROR).
 * Caught instances of this class should be rethrown through the REGAUTH_RETHROW_ERROR macro.
 * The user is not supposed to instantiate and throw this class "manually".
 */
class Error : public std::exception {
public:
    struct ErrorTraceEntry {
        std::string errorMessage;
        boost::filesystem::path fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(LogLevel logLevel, const ErrorTraceEntry& entry)
        : logLevel{ logLevel }
        , errorTrace{ entry }
    {}

    virtual ~Error() = default;

    const char* what() const noexcept override {
        // Return the 'what()' of the original exception that generated this error trace
        // as if the original exception was propagated directly up to the current
        // stack frame, i.e. without intermediate catch-rethrows.
        return errorTrace.front().errorMessage.c_str();
    }

    void appendErrorTraceEntry(const ErrorTraceEntry& entry) {
        errorTrace.push_back(entry);
    }

    const std::vector<ErrorTraceEntry>& getErrorTrace() const {
        return errorTrace;
    }

    LogLevel getLogLevel() const {
        return logLevel;
    }

    void setLogLevel(LogLevel value) {
        logLevel = value;
    }

private:
    LogLevel logLevel = LogLevel::ERROR;
    std::vector<ErrorTraceEntry> errorTrace;
};

inline bool operator==(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

std::string getExceptionTypeString(const std::exception& e);

}


// REGAUTH_THROW_ERROR macros
#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define REGAUTH_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define REGAUTH_THROW_ERROR_2(errorMessage, logLevel) { \
    auto stackTraceEntry = libregauth::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw libregauth::Error{logLevel, stackTraceEntry}; \
}

#define REGAUTH_THROW_ERROR_1(errorMessage) REGAUTH_THROW_ERROR_2(errorMessage, libregauth::LogLevel::ERROR)

#define REGAUTH_THROW_ERROR(...) REGAUTH_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, REGAUTH_THROW_ERROR_2, REGAUTH_THROW_ERROR_1)(__VA_ARGS__)


// REGAUTH_RETHROW_ERROR macros
#define REGAUTH_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define REGAUTH_RETHROW_ERROR_3(exception, errorMessage, logLevel) { \
    auto errorTraceEntry = libregauth::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    const auto* cp = dynamic_cast<const libregauth::Error*>(&exception); \
    if(cp) { /* check if dynamic type is libregauth::Error */ \
        assert(!std::is_const<decltype(exception)>{}); /* a libregauth::Error object must be caught as non-const reference because we need to modify its internal error trace */ \
        auto* p = const_cast<libregauth::Error*>(cp); \
        p->setLogLevel(logLevel); \
        p->appendErrorTraceEntry(errorTraceEntry); \
        throw; \
    } \
    else { \
        auto previousErrorTraceEntry = libregauth::Error::ErrorTraceEntry{exception.what(), "unspecified location", -1, \
                                                                          libregauth::getExceptionTypeString(exception)}; \
        auto error = libregauth::Error{logLevel, previousErrorTraceEntry}; \
        error.appendErrorTraceEntry(errorTraceEntry); \
        throw error; \
    } \
}

#define REGAUTH_RETHROW_ERROR_2(exception, errorMessage) { \
    const auto* cp = dynamic_cast<const libregauth::Error*>(&exception); \
    if(cp) { \
        /* get log level if dynamic type is libregauth::Error */ \
        REGAUTH_RETHROW_ERROR_3(exception, errorMessage, cp->getLogLevel()) \
    } \
    else { \
        REGAUTH_RETHROW_ERROR_3(exception, errorMessage, libregauth::LogLevel::ERROR) \
    } \
}

#define REGAUTH_RETHROW_ERROR(...) REGAUTH_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, REGAUTH_RETHROW_ERROR_3, REGAUTH_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
