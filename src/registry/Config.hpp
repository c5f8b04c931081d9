/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef registry_Config_hpp
#define registry_Config_hpp

#include <string>
#include <unordered_map>
#include <chrono>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "registry/Credential.hpp"


namespace regauth {
namespace registry {

class Config {
    public:
        Config() = default;
        Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename);

        struct Registry {
            std::string server;
            bool insecure = false;
            bool acceptInvalidCertificates = false;
        };

        struct Authentication {
            bool isAuthenticationNeeded = false;
            std::string username;
            std::string password;
        };

        struct Transport {
            std::chrono::seconds requestTimeout{30};
            std::unordered_map<std::string, std::string> hostEnvironment;
        };

        std::string getServerUri() const;
        boost::optional<UserCredentials> getUserCredentials() const;

        static std::string getDefaultUserAgent();

        Registry registry;
        Authentication authentication;
        Transport transport;
        std::string userAgent = getDefaultUserAgent();
};

}
}

#endif
