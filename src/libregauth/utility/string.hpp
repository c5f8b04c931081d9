/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libregauth_utility_string_hpp
#define libregauth_utility_string_hpp

#include <string>
#include <tuple>
#include <vector>

/**
 * Utility functions for string manipulation
 */

namespace libregauth {
namespace string {

std::string removeWhitespaces(const std::string&);
std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator = '=');
std::vector<std::string> splitList(const std::string& input, const char separator = ',');

}}

#endif
