/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef registry_Credential_hpp
#define registry_Credential_hpp

#include <cstdint>
#include <string>

#include <boost/optional.hpp>

#include "registry/HttpTransport.hpp"


namespace regauth {
namespace registry {

/**
 * Username and password supplied by the user up front (CLI or API).
 * Used either against the registry itself (Basic challenge) or against
 * the token endpoint (Bearer challenge).
 */
struct UserCredentials {
    std::string username;
    std::string password;
};

/**
 * Authentication resolved by the negotiation, attached to subsequent registry requests.
 * Objects are immutable: re-authenticating produces a new object.
 */
class Credential {
public:
    enum class Type {Basic, Bearer};

public:
    virtual ~Credential() = default;
    virtual Type getType() const = 0;
    virtual std::string getAuthorizationHeaderValue() const = 0;
    // printable form without secrets
    virtual std::string describe() const = 0;

    /**
     * Returns a copy of the request carrying the Authorization header of this credential.
     * An Authorization header already present in the request is replaced.
     */
    HttpRequest attach(HttpRequest request) const;
};

class BasicCredential : public Credential {
public:
    BasicCredential(std::string user, boost::optional<std::string> password);
    Type getType() const override { return Type::Basic; }
    std::string getAuthorizationHeaderValue() const override;
    std::string describe() const override;

    const std::string& getUser() const { return user; }
    const boost::optional<std::string>& getPassword() const { return password; }

private:
    std::string user;
    boost::optional<std::string> password;
};

class BearerCredential : public Credential {
public:
    /**
     * Throws AuthError(InvalidAuthToken) if the token is empty or "unauthenticated".
     */
    BearerCredential(std::string token,
                     boost::optional<std::uint32_t> expiresIn = {},
                     boost::optional<std::string> issuedAt = {},
                     boost::optional<std::string> refreshToken = {});
    Type getType() const override { return Type::Bearer; }
    std::string getAuthorizationHeaderValue() const override;
    std::string describe() const override;

    const std::string& getToken() const { return token; }
    const boost::optional<std::uint32_t>& getExpiresIn() const { return expiresIn; }
    const boost::optional<std::string>& getIssuedAt() const { return issuedAt; }
    const boost::optional<std::string>& getRefreshToken() const { return refreshToken; }

    static bool isValidToken(const std::string& token);

private:
    std::string token;
    boost::optional<std::uint32_t> expiresIn;
    boost::optional<std::string> issuedAt;
    boost::optional<std::string> refreshToken;
};

/**
 * Masks a token for diagnostics: at most the first and the last character
 * (UTF-8 code point) stay visible, each masked character becomes a '*'.
 * E.g. "abcdef" => "a****f", "ab" => "ab", "a" => "*".
 */
std::string maskToken(const std::string& token);

}
}

#endif
