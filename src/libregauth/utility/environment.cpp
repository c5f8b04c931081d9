/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "environment.hpp"

#include <boost/format.hpp>

#include "libregauth/Error.hpp"
#include "libregauth/utility/string.hpp"

/**
 * Utility functions for environment variables
 */

namespace libregauth {
namespace environment {

std::unordered_map<std::string, std::string> parseVariables(char** env) {
    auto map = std::unordered_map<std::string, std::string>{};
    for(size_t i=0; env[i] != nullptr; ++i) {
        std::string key, value;
        std::tie(key, value) = parseVariable(env[i]);
        map[key] = value;
    }
    return map;
}

std::pair<std::string, std::string> parseVariable(const std::string& variable) {
    std::pair<std::string, std::string> kvPair;
    try {
        kvPair = string::parseKeyValuePair(variable);
    }
    catch(libregauth::Error& e) {
        auto message = boost::format("Failed to parse environment variable: %s") % e.what();
        REGAUTH_RETHROW_ERROR(e, message.str());
    }
    return kvPair;
}

}}
