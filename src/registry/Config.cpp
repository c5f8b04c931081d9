/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/Config.hpp"

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libregauth/Error.hpp"
#include "libregauth/utility/json.hpp"
#include "libregauth/utility/logging.hpp"


namespace regauth {
namespace registry {

Config::Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename)
{
    libregauth::logMessage(boost::format("Reading configuration from %s") % configFilename, libregauth::LogLevel::DEBUG);

    auto json = rapidjson::Document{};
    try {
        json = libregauth::json::readAndValidate(configFilename, configSchemaFilename);
    }
    catch(libregauth::Error& e) {
        auto message = boost::format("Failed to load configuration file %s") % configFilename;
        REGAUTH_RETHROW_ERROR(e, message.str());
    }

    // the schema guarantees the presence and the type of the required fields
    registry.server = json["registry"].GetString();

    if(json.HasMember("insecureRegistry")) {
        registry.insecure = json["insecureRegistry"].GetBool();
    }
    if(json.HasMember("acceptInvalidCertificates")) {
        registry.acceptInvalidCertificates = json["acceptInvalidCertificates"].GetBool();
    }
    if(json.HasMember("userAgent")) {
        userAgent = json["userAgent"].GetString();
    }
    if(json.HasMember("requestTimeoutSeconds")) {
        transport.requestTimeout = std::chrono::seconds{json["requestTimeoutSeconds"].GetUint()};
    }
}

std::string Config::getServerUri() const {
    return registry.insecure ? "http://" + registry.server : "https://" + registry.server;
}

boost::optional<UserCredentials> Config::getUserCredentials() const {
    if(!authentication.isAuthenticationNeeded) {
        return {};
    }
    return UserCredentials{authentication.username, authentication.password};
}

std::string Config::getDefaultUserAgent() {
    return std::string{"regauth/"} + REGAUTH_VERSION;
}

}
}
