/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libregauth_utility_process_hpp
#define libregauth_utility_process_hpp

#include <string>

/**
 * Utility functions for process operations
 */

namespace libregauth {
namespace process {

std::string getHostname();
void setStdinEcho(bool);

}}

#endif
