/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <exception>
#include <stdexcept>
#include <system_error>

#include "test_utility/unittest_main_function.hpp"
#include "libregauth/Error.hpp"


namespace libregauth {
namespace test {

TEST_GROUP(ErrorTestGroup) {
};

void functionThatThrows() {
    REGAUTH_THROW_ERROR("first error message");
}

void functionThatRethrows() {
    try {
        functionThatThrows();
    }
    catch(libregauth::Error& error) {
        REGAUTH_RETHROW_ERROR(error, "second error message");
    }
}

void functionThatThrowsFromStdException() {
    auto stdException = std::runtime_error("first error message");
    const auto& ref = stdException;
    REGAUTH_RETHROW_ERROR(ref, "second error message");
}

void functionThatRethrowsWithLogLevelDebug() {
    try {
        functionThatThrows();
    }
    catch(libregauth::Error& error) {
        REGAUTH_RETHROW_ERROR(error, "second error message", libregauth::LogLevel::DEBUG);
    }
}

TEST(ErrorTestGroup, oneStackTraceEntry) {
    try {
        functionThatThrows();
        FAIL("expected exception");
    }
    catch(const libregauth::Error& error) {
        auto expectedFirstEntry = libregauth::Error::ErrorTraceEntry{"first error message", "test_Error.cpp", 26, "functionThatThrows"};

        CHECK_EQUAL(error.getErrorTrace().size(), 1);
        CHECK(error.getErrorTrace()[0] == expectedFirstEntry);
        CHECK(error.getLogLevel() == libregauth::LogLevel::ERROR);
        STRCMP_EQUAL(error.what(), "first error message");
    }
}

TEST(ErrorTestGroup, twoStackTraceEntries) {
    try {
        functionThatRethrows();
        FAIL("expected exception");
    }
    catch (const libregauth::Error& error) {
        auto expectedFirstEntry = libregauth::Error::ErrorTraceEntry{"first error message", "test_Error.cpp", 26, "functionThatThrows"};
        auto expectedSecondEntry = libregauth::Error::ErrorTraceEntry{"second error message", "test_Error.cpp", 34, "functionThatRethrows"};

        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK(error.getErrorTrace()[0] == expectedFirstEntry);
        CHECK(error.getErrorTrace()[1] == expectedSecondEntry);
        CHECK(error.getLogLevel() == libregauth::LogLevel::ERROR);
        // what() reports the original error
        STRCMP_EQUAL(error.what(), "first error message");
    }
}

TEST(ErrorTestGroup, fromStdException) {
    try {
        functionThatThrowsFromStdException();
        FAIL("expected exception");
    }
    catch(const libregauth::Error& error) {
        auto expectedFirstEntry = libregauth::Error::ErrorTraceEntry{"first error message", "unspecified location", -1, "runtime error"};
        auto expectedSecondEntry = libregauth::Error::ErrorTraceEntry{"second error message", "test_Error.cpp", 41, "functionThatThrowsFromStdException"};

        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK(error.getErrorTrace()[0] == expectedFirstEntry);
        CHECK(error.getErrorTrace()[1] == expectedSecondEntry);
        CHECK(error.getLogLevel() == libregauth::LogLevel::ERROR);
    }
}

TEST(ErrorTestGroup, twoStackTraceEntries_rethrowWithLogLevelDebug) {
    try {
        functionThatRethrowsWithLogLevelDebug();
        FAIL("expected exception");
    }
    catch (const libregauth::Error& error) {
        auto expectedSecondEntry = libregauth::Error::ErrorTraceEntry{"second error message", "test_Error.cpp", 49, "functionThatRethrowsWithLogLevelDebug"};

        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK(error.getErrorTrace()[1] == expectedSecondEntry);
        CHECK(error.getLogLevel() == libregauth::LogLevel::DEBUG);
    }
}

TEST(ErrorTestGroup, exceptionTypeString) {
    CHECK_EQUAL(libregauth::getExceptionTypeString(std::invalid_argument("")), std::string{"logic error"});
    CHECK_EQUAL(libregauth::getExceptionTypeString(std::runtime_error("")), std::string{"runtime error"});
    CHECK_EQUAL(libregauth::getExceptionTypeString(std::system_error(std::make_error_code(std::errc::io_error))),
                std::string{"system error"});
}

}}

REGAUTH_UNITTEST_MAIN_FUNCTION();
