/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "string.hpp"

#include <algorithm>
#include <cwctype>

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>

#include "libregauth/Error.hpp"

/**
 * Utility functions for string manipulation
 */

namespace libregauth {
namespace string {

std::string removeWhitespaces(const std::string& s) {
    auto result = s;
    auto newEnd = std::remove_if(result.begin(), result.end(), iswspace);
    result.erase(newEnd, result.end());
    return result;
}

std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator) {
    auto keyEnd = std::find(pairString.cbegin(), pairString.cend(), separator);
    auto key = std::string(pairString.cbegin(), keyEnd);
    auto value = keyEnd != pairString.cend() ? std::string(keyEnd+1, pairString.cend()) : std::string{};
    if(key.empty()) {
        auto message = boost::format("Failed to parse key-value pair '%s': key is empty") % pairString;
        REGAUTH_THROW_ERROR(message.str())
    }
    return std::pair<std::string, std::string>{key, value};
}

/**
 * Splits a separator-delimited list into its elements.
 * Whitespaces are removed from each element and empty elements are dropped,
 * e.g. " a.com, ,b.com" => {"a.com", "b.com"}.
 */
std::vector<std::string> splitList(const std::string& input, const char separator) {
    auto elements = std::vector<std::string>{};
    boost::split(elements, input, boost::is_any_of(std::string{separator}));

    auto result = std::vector<std::string>{};
    for(const auto& element : elements) {
        auto trimmed = removeWhitespaces(element);
        if(!trimmed.empty()) {
            result.push_back(trimmed);
        }
    }
    return result;
}

}}
