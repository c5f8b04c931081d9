/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef registry_BearerHandshake_hpp
#define registry_BearerHandshake_hpp

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <pplx/pplxtasks.h>

#include "libregauth/Logger.hpp"
#include "registry/Challenge.hpp"
#include "registry/Credential.hpp"
#include "registry/HttpTransport.hpp"


namespace regauth {
namespace registry {

/**
 * Fields of a token endpoint response, as found in the JSON body.
 *
 * For compatibility with OAuth 2.0 the token may appear under the name 'token',
 * 'access_token' or both, hence every field is optional at this stage.
 * See https://docs.docker.com/registry/spec/auth/token/
 */
struct BearerTokenFields {
    boost::optional<std::string> token;
    boost::optional<std::string> accessToken;
    boost::optional<std::uint32_t> expiresIn;
    boost::optional<std::string> issuedAt;
    boost::optional<std::string> refreshToken;

    static BearerTokenFields parse(const std::string& responseBody);
};

/**
 * Resolves the token ('token' preferred over 'access_token') and validates it.
 */
std::shared_ptr<const BearerCredential> makeBearerCredential(const BearerTokenFields& fields);

class BearerHandshake {
public:
    BearerHandshake(std::shared_ptr<HttpTransport> transport, std::string userAgent);

    /**
     * Requests a token for the given scopes from the endpoint advertised by the challenge.
     * If credentials are given, they are sent to the token endpoint with Basic authentication.
     * Throws AuthError(MalformedUrl) before issuing any request if the endpoint URL is not valid.
     */
    pplx::task<std::shared_ptr<const BearerCredential>> obtainToken(
        const Challenge& challenge,
        const std::vector<std::string>& scopes,
        const boost::optional<UserCredentials>& credentials) const;

    static std::string makeTokenEndpointUrl(const Challenge& challenge, const std::vector<std::string>& scopes);
    static void validateTokenEndpointUrl(const std::string& url);

private:
    HttpRequest makeTokenRequest(const std::string& url, const boost::optional<UserCredentials>& credentials) const;
    void printLog(const boost::format& message, libregauth::LogLevel logLevel) const;

private:
    std::shared_ptr<HttpTransport> transport;
    std::string userAgent;

    /** system name for logger */
    const std::string sysname = "BearerHandshake";
};

}
}

#endif
