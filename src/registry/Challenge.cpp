/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Challenge.hpp"

#include <set>
#include <unordered_map>

#include <boost/format.hpp>
#include <boost/regex.hpp>
#include <boost/algorithm/string/join.hpp>
#include <cpprest/asyncrt_utils.h>

#include "libregauth/Logger.hpp"
#include "registry/AuthError.hpp"


namespace regauth {
namespace registry {

namespace {

/**
 * Each match of this regex carries one key="value" pair.
 * Only the first match of a well-formed header also carries the method (e.g. "Bearer").
 * Separators between pairs (commas) are skipped by the search.
 */
const boost::regex challengeRegex{
    R"re(\s*(?:(?<method>[A-Z][a-z]+)\s*)?\s*(?<key>[a-z]+)\s*=\s*"(?<value>[^"]+)"\s*)re"
};

const std::string sysname = "ChallengeParser";

void printLog(const boost::format& message, libregauth::LogLevel logLevel) {
    libregauth::Logger::getInstance().log(message, sysname, logLevel);
}

void validateEncoding(const std::string& headerValue) {
    try {
        utility::conversions::utf8_to_utf16(headerValue);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to decode WWW-Authenticate header as UTF-8 text: %s") % e.what();
        REGAUTH_THROW_AUTH_ERROR(ErrorCode::InvalidEncoding, message.str());
    }
}

using ParameterMap = std::unordered_map<std::string, std::string>;

ParameterMap makeParameterMap(const Challenge::Parameters& parameters) {
    auto map = ParameterMap{};
    for(const auto& parameter : parameters) {
        if(map.find(parameter.first) != map.cend()) {
            printLog(boost::format("Parameter '%s' repeated in authentication header, using last value")
                     % parameter.first, libregauth::LogLevel::DEBUG);
        }
        map[parameter.first] = parameter.second;
    }
    return map;
}

void reportUnsupportedKeys(const ParameterMap& parameters, const std::set<std::string>& supportedKeys) {
    auto unsupportedKeys = std::set<std::string>{};
    for(const auto& parameter : parameters) {
        if(supportedKeys.find(parameter.first) == supportedKeys.cend()) {
            unsupportedKeys.insert(parameter.first);
        }
    }
    if(!unsupportedKeys.empty()) {
        printLog(boost::format("skipping unrecognized keys in authentication header: %s")
                 % boost::algorithm::join(unsupportedKeys, ", "), libregauth::LogLevel::WARN);
    }
}

std::string getRequiredParameter(const ParameterMap& parameters, const std::string& key, const std::string& method) {
    auto it = parameters.find(key);
    if(it == parameters.cend()) {
        auto message = boost::format("Invalid %s authentication header: missing required key '%s'") % method % key;
        REGAUTH_THROW_AUTH_ERROR(ErrorCode::InvalidValue, message.str());
    }
    return it->second;
}

boost::optional<std::string> getOptionalParameter(const ParameterMap& parameters, const std::string& key) {
    auto it = parameters.find(key);
    if(it == parameters.cend()) {
        return {};
    }
    return it->second;
}

} // namespace

ChallengeTokens tokenizeChallenge(const std::string& headerValue) {
    auto tokens = ChallengeTokens{};

    auto begin = boost::sregex_iterator(headerValue.cbegin(), headerValue.cend(), challengeRegex);
    auto end = boost::sregex_iterator{};

    if(begin == end) {
        auto message = boost::format("Invalid authentication header '%s': expected <Method> key=\"value\", ...") % headerValue;
        REGAUTH_THROW_AUTH_ERROR(ErrorCode::InvalidValue, message.str());
    }

    if(!(*begin)["method"].matched) {
        auto message = boost::format("Invalid authentication header '%s': 'method' field missing") % headerValue;
        REGAUTH_THROW_AUTH_ERROR(ErrorCode::FieldMethodMissing, message.str());
    }
    tokens.method = (*begin)["method"].str();

    for(auto it = begin; it != end; ++it) {
        const auto& match = *it;
        tokens.parameters.emplace_back(match["key"].str(), match["value"].str());
    }

    return tokens;
}

Challenge Challenge::parse(const std::string& headerValue) {
    printLog(boost::format("Parsing WWW-Authenticate header: %s") % headerValue, libregauth::LogLevel::DEBUG);

    validateEncoding(headerValue);
    auto tokens = tokenizeChallenge(headerValue);

    if(tokens.method == "Basic") {
        return makeBasic(tokens.parameters);
    }
    else if(tokens.method == "Bearer") {
        return makeBearer(tokens.parameters);
    }

    auto message = boost::format("Unsupported authentication method '%s' (expected Basic or Bearer)") % tokens.method;
    REGAUTH_THROW_AUTH_ERROR(ErrorCode::InvalidValue, message.str());
}

Challenge Challenge::makeBasic(const Parameters& parameters) {
    auto map = makeParameterMap(parameters);
    reportUnsupportedKeys(map, {"realm"});
    auto realm = getRequiredParameter(map, "realm", "Basic");
    return Challenge{Scheme::Basic, std::move(realm), {}, {}};
}

Challenge Challenge::makeBearer(const Parameters& parameters) {
    auto map = makeParameterMap(parameters);
    reportUnsupportedKeys(map, {"realm", "service", "scope"});
    auto realm = getRequiredParameter(map, "realm", "Bearer");
    return Challenge{ Scheme::Bearer,
                      std::move(realm),
                      getOptionalParameter(map, "service"),
                      getOptionalParameter(map, "scope") };
}

Challenge::Challenge(Scheme scheme,
                     std::string realm,
                     boost::optional<std::string> service,
                     boost::optional<std::string> scope)
    : scheme{scheme}
    , realm{std::move(realm)}
    , service{std::move(service)}
    , scope{std::move(scope)}
{}

bool operator==(const Challenge& lhs, const Challenge& rhs) {
    return lhs.getScheme() == rhs.getScheme()
        && lhs.getRealm() == rhs.getRealm()
        && lhs.getService() == rhs.getService()
        && lhs.getScope() == rhs.getScope();
}

bool operator!=(const Challenge& lhs, const Challenge& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, Challenge::Scheme scheme) {
    os << (scheme == Challenge::Scheme::Basic ? "Basic" : "Bearer");
    return os;
}

std::ostream& operator<<(std::ostream& os, const Challenge& challenge) {
    os << challenge.getScheme() << " realm=\"" << challenge.getRealm() << "\"";
    if(challenge.getService()) {
        os << ", service=\"" << *challenge.getService() << "\"";
    }
    if(challenge.getScope()) {
        os << ", scope=\"" << *challenge.getScope() << "\"";
    }
    return os;
}

}
}
