/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef regauth_test_utility_unittest_main_function_hpp
#define regauth_test_utility_unittest_main_function_hpp

#include "libregauth/Error.hpp"
#include "libregauth/Logger.hpp"

// WATCH OUT!
// boost and cpprestsdk headers must be included before CppUTest (its memory leak
// detection redefines 'new'), so include this file as the last header file in the test code
#include <CppUTest/CommandLineTestRunner.h>


// pplx worker threads allocate (and cache) memory outside of the scope of
// the single tests, hence CppUTest's leak detection is turned off
#define REGAUTH_UNITTEST_MAIN_FUNCTION() \
int main(int argc, char **argv) { \
    MemoryLeakWarningPlugin::turnOffNewDeleteOverloads(); \
    try { \
        return CommandLineTestRunner::RunAllTests(argc, argv); \
    } \
    catch(const libregauth::Error& e) { \
        libregauth::Logger::getInstance().logErrorTrace(e, "test"); \
        throw; \
    } \
}

#endif
