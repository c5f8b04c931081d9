/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <sstream>
#include <string>

#include <boost/regex.hpp>

#include "test_utility/unittest_main_function.hpp"
#include "libregauth/Error.hpp"
#include "libregauth/Logger.hpp"


namespace libregauth {
namespace test {

TEST_GROUP(LoggerTestGroup) {
    void teardown() {
        libregauth::Logger::getInstance().setLevel(libregauth::LogLevel::WARN);
    }
};

class LoggerChecker {
public:
    LoggerChecker& log(libregauth::LogLevel logLevel, const std::string& message) {
        libregauth::Logger::getInstance().log(message, "subsystem", logLevel, stdoutStream, stderrStream);
        return *this;
    }

    LoggerChecker& expectGeneralMessageInStdout(const std::string& message) {
        expectedPatternInStdout += message + "\n";
        return *this;
    }

    LoggerChecker& expectMessageInStdout(const std::string& logLevel, const std::string& message) {
        expectedPatternInStdout += makeMessagePattern(logLevel, message);
        return *this;
    }

    LoggerChecker& expectMessageInStderr(const std::string& logLevel, const std::string& message) {
        expectedPatternInStderr += makeMessagePattern(logLevel, message);
        return *this;
    }

    ~LoggerChecker() {
        check(stdoutStream, expectedPatternInStdout);
        check(stderrStream, expectedPatternInStderr);
    }

private:
    std::string makeMessagePattern(const std::string& logLevel, const std::string& message) const {
        return "\\[[0-9]+\\.[0-9]{9}\\] \\[.*-[0-9]+\\] \\[subsystem\\] \\[" + logLevel + "\\] " + message + "\n";
    }

    void check(const std::ostringstream& stream, const std::string& expectedPattern) const {
        auto regex = boost::regex(expectedPattern);
        CHECK(boost::regex_match(stream.str(), regex));
    }

private:
    std::ostringstream stdoutStream;
    std::ostringstream stderrStream;

    std::string expectedPatternInStdout;
    std::string expectedPatternInStderr;
};

TEST(LoggerTestGroup, debugLevel) {
    libregauth::Logger::getInstance().setLevel(libregauth::LogLevel::DEBUG);
    LoggerChecker{}
        .log(libregauth::LogLevel::GENERAL, "GENERAL message")
        .log(libregauth::LogLevel::DEBUG, "DEBUG message")
        .log(libregauth::LogLevel::INFO, "INFO message")
        .log(libregauth::LogLevel::WARN, "WARN message")
        .log(libregauth::LogLevel::ERROR, "ERROR message")
        .expectGeneralMessageInStdout("GENERAL message")
        .expectMessageInStdout("DEBUG", "DEBUG message")
        .expectMessageInStdout("INFO", "INFO message")
        .expectMessageInStderr("WARN", "WARN message")
        .expectMessageInStderr("ERROR", "ERROR message");
}

TEST(LoggerTestGroup, defaultLevelFiltersDebugAndInfo) {
    CHECK(libregauth::Logger::getInstance().getLevel() == libregauth::LogLevel::WARN);
    LoggerChecker{}
        .log(libregauth::LogLevel::DEBUG, "DEBUG message")
        .log(libregauth::LogLevel::INFO, "INFO message")
        .log(libregauth::LogLevel::WARN, "WARN message")
        .expectMessageInStderr("WARN", "WARN message");
}

TEST(LoggerTestGroup, errorLevel) {
    libregauth::Logger::getInstance().setLevel(libregauth::LogLevel::ERROR);
    LoggerChecker{}
        .log(libregauth::LogLevel::GENERAL, "GENERAL message")
        .log(libregauth::LogLevel::WARN, "WARN message")
        .log(libregauth::LogLevel::ERROR, "ERROR message")
        .expectGeneralMessageInStdout("GENERAL message")
        .expectMessageInStderr("ERROR", "ERROR message");
}

TEST(LoggerTestGroup, errorTrace) {
    auto errStream = std::ostringstream{};
    try {
        try {
            REGAUTH_THROW_ERROR("inner message");
        }
        catch(libregauth::Error& e) {
            REGAUTH_RETHROW_ERROR(e, "outer message");
        }
    }
    catch(const libregauth::Error& e) {
        libregauth::Logger::getInstance().logErrorTrace(e, "subsystem", errStream);
    }

    auto trace = errStream.str();
    CHECK(trace.find("Error trace (most nested error last):") != std::string::npos);
    CHECK(boost::regex_search(trace, boost::regex{"#0 +.* at test_Logger.cpp:[0-9]+ outer message\n"}));
    CHECK(boost::regex_search(trace, boost::regex{"#1 +.* at test_Logger.cpp:[0-9]+ inner message\n"}));
}

}}

REGAUTH_UNITTEST_MAIN_FUNCTION();
