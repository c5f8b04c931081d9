/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Credential.hpp"

#include <algorithm>
#include <vector>

#include <boost/format.hpp>
#include <cpprest/asyncrt_utils.h>

#include "registry/AuthError.hpp"


namespace regauth {
namespace registry {

HttpRequest Credential::attach(HttpRequest request) const {
    request.headers[web::http::header_names::authorization] = getAuthorizationHeaderValue();
    return request;
}

BasicCredential::BasicCredential(std::string user, boost::optional<std::string> password)
    : user{std::move(user)}
    , password{std::move(password)}
{}

std::string BasicCredential::getAuthorizationHeaderValue() const {
    auto userPass = user + ":" + password.value_or(std::string{});
    auto bytes = std::vector<unsigned char>(userPass.cbegin(), userPass.cend());
    return "Basic " + utility::conversions::to_base64(bytes);
}

std::string BasicCredential::describe() const {
    return (boost::format("Basic (user=%s)") % user).str();
}

BearerCredential::BearerCredential( std::string token,
                                    boost::optional<std::uint32_t> expiresIn,
                                    boost::optional<std::string> issuedAt,
                                    boost::optional<std::string> refreshToken)
    : token{std::move(token)}
    , expiresIn{std::move(expiresIn)}
    , issuedAt{std::move(issuedAt)}
    , refreshToken{std::move(refreshToken)}
{
    if(!isValidToken(this->token)) {
        auto message = boost::format("Invalid authentication token '%s'") % this->token;
        REGAUTH_THROW_AUTH_ERROR(ErrorCode::InvalidAuthToken, message.str());
    }
}

std::string BearerCredential::getAuthorizationHeaderValue() const {
    return "Bearer " + token;
}

std::string BearerCredential::describe() const {
    auto description = boost::format("Bearer (token=%s") % maskToken(token);
    if(expiresIn) {
        description = boost::format("%s, expires_in=%d") % description % *expiresIn;
    }
    if(issuedAt) {
        description = boost::format("%s, issued_at=%s") % description % *issuedAt;
    }
    return description.str() + ")";
}

bool BearerCredential::isValidToken(const std::string& token) {
    return !token.empty() && token != "unauthenticated";
}

std::string maskToken(const std::string& token) {
    // byte offsets of the code points, plus the end of the string
    auto offsets = std::vector<std::size_t>{};
    for(std::size_t i=0; i<token.size(); ++i) {
        if((static_cast<unsigned char>(token[i]) & 0xC0) != 0x80) {
            offsets.push_back(i);
        }
    }
    auto length = offsets.size();
    offsets.push_back(token.size());

    if(length == 0) {
        return token;
    }

    auto maskStart = std::min<std::size_t>(1, length-1);
    auto maskEnd = std::max<std::size_t>(length-1, 1);

    return token.substr(0, offsets[maskStart])
        + std::string(maskEnd - maskStart, '*')
        + token.substr(offsets[maskEnd]);
}

}
}
