/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/BearerHandshake.hpp"

#include <boost/format.hpp>
#include <cpprest/base_uri.h>
#include <cpprest/http_msg.h>
#include <rapidjson/document.h>

#include "libregauth/Error.hpp"
#include "libregauth/utility/json.hpp"
#include "libregauth/utility/logging.hpp"
#include "registry/AuthError.hpp"


namespace regauth {
namespace registry {

namespace {

boost::optional<std::string> getOptionalString(const rapidjson::Value& json, const char* key) {
    auto it = json.FindMember(key);
    if(it == json.MemberEnd() || it->value.IsNull()) {
        return {};
    }
    if(!it->value.IsString()) {
        auto message = boost::format("Invalid token response: field '%s' is not a string") % key;
        REGAUTH_THROW_AUTH_ERROR(ErrorCode::MalformedTokenResponse, message.str());
    }
    return std::string{it->value.GetString(), it->value.GetStringLength()};
}

boost::optional<std::uint32_t> getOptionalUint(const rapidjson::Value& json, const char* key) {
    auto it = json.FindMember(key);
    if(it == json.MemberEnd() || it->value.IsNull()) {
        return {};
    }
    if(!it->value.IsUint()) {
        auto message = boost::format("Invalid token response: field '%s' is not an unsigned 32-bit integer") % key;
        REGAUTH_THROW_AUTH_ERROR(ErrorCode::MalformedTokenResponse, message.str());
    }
    return static_cast<std::uint32_t>(it->value.GetUint());
}

} // namespace

BearerTokenFields BearerTokenFields::parse(const std::string& responseBody) {
    auto json = rapidjson::Document{};
    try {
        json = libregauth::json::parse(responseBody);
    }
    catch(const libregauth::Error& e) {
        auto message = boost::format("Failed to parse token response: %s") % e.what();
        REGAUTH_THROW_AUTH_ERROR(ErrorCode::MalformedTokenResponse, message.str());
    }

    if(!json.IsObject()) {
        REGAUTH_THROW_AUTH_ERROR(ErrorCode::MalformedTokenResponse, "Invalid token response: expected a JSON object");
    }

    auto fields = BearerTokenFields{};
    fields.token = getOptionalString(json, "token");
    fields.accessToken = getOptionalString(json, "access_token");
    fields.expiresIn = getOptionalUint(json, "expires_in");
    fields.issuedAt = getOptionalString(json, "issued_at");
    fields.refreshToken = getOptionalString(json, "refresh_token");
    return fields;
}

std::shared_ptr<const BearerCredential> makeBearerCredential(const BearerTokenFields& fields) {
    if(!fields.token && !fields.accessToken) {
        REGAUTH_THROW_AUTH_ERROR(ErrorCode::MissingTokenField, "Missing 'token' field in token response");
    }

    // if both are specified they should be equivalent, otherwise the client's choice is undefined
    if(fields.token && fields.accessToken && *fields.token != *fields.accessToken) {
        libregauth::logMessage("Token response contains different 'token' and 'access_token' values, using 'token'",
                               libregauth::LogLevel::WARN);
    }

    auto token = fields.token ? *fields.token : *fields.accessToken;
    return std::make_shared<const BearerCredential>(
        std::move(token), fields.expiresIn, fields.issuedAt, fields.refreshToken);
}

BearerHandshake::BearerHandshake(std::shared_ptr<HttpTransport> transport, std::string userAgent)
    : transport{std::move(transport)}
    , userAgent{std::move(userAgent)}
{}

pplx::task<std::shared_ptr<const BearerCredential>> BearerHandshake::obtainToken(
    const Challenge& challenge,
    const std::vector<std::string>& scopes,
    const boost::optional<UserCredentials>& credentials) const
{
    if(challenge.getScheme() != Challenge::Scheme::Bearer) {
        auto message = boost::format("Cannot obtain a bearer token from a %s challenge") % challenge.getScheme();
        REGAUTH_THROW_ERROR(message.str());
    }

    auto url = makeTokenEndpointUrl(challenge, scopes);
    printLog(boost::format("token endpoint: %s") % url, libregauth::LogLevel::DEBUG);
    validateTokenEndpointUrl(url);

    auto request = makeTokenRequest(url, credentials);
    auto sysname = this->sysname;

    return transport->send(request)
        .then([url, sysname](const HttpResponse& response) {
            auto& logger = libregauth::Logger::getInstance();
            logger.log(boost::format("GET '%s' status: %d") % url % response.status, sysname, libregauth::LogLevel::DEBUG);

            if(response.status != web::http::status_codes::OK) {
                auto message = boost::format("Failed to get token. Received HTTP response status code (%d) from %s")
                    % response.status % url;
                REGAUTH_THROW_HTTP_STATUS_ERROR(response.status, message.str());
            }

            auto credential = makeBearerCredential(BearerTokenFields::parse(response.body));

            logger.log(boost::format("got token: %s") % maskToken(credential->getToken()),
                       sysname, libregauth::LogLevel::DEBUG);
            return credential;
        });
}

/**
 * The endpoint is the realm, followed by the service (if any) and by one
 * 'scope' query parameter per requested scope, e.g.
 * https://auth.docker.io/token?service=registry.docker.io&scope=repository:library/alpine:pull
 *
 * Scopes are expected to be already URL-encoded.
 */
std::string BearerHandshake::makeTokenEndpointUrl(const Challenge& challenge, const std::vector<std::string>& scopes) {
    auto url = challenge.getRealm();
    auto hasQuery = false;

    if(challenge.getService()) {
        url += "?service=" + *challenge.getService();
        hasQuery = true;
    }

    for(const auto& scope : scopes) {
        url += (hasQuery ? "&" : "?");
        url += "scope=" + scope;
        hasQuery = true;
    }

    return url;
}

void BearerHandshake::validateTokenEndpointUrl(const std::string& url) {
    auto uri = web::uri{};
    try {
        uri = web::uri{url};
    }
    catch(const web::uri_exception& e) {
        auto message = boost::format("Invalid token endpoint URL '%s': %s") % url % e.what();
        REGAUTH_THROW_AUTH_ERROR(ErrorCode::MalformedUrl, message.str());
    }

    if((uri.scheme() != "https" && uri.scheme() != "http") || uri.host().empty()) {
        auto message = boost::format("Invalid token endpoint URL '%s': expected an absolute http(s) URL") % url;
        REGAUTH_THROW_AUTH_ERROR(ErrorCode::MalformedUrl, message.str());
    }
}

HttpRequest BearerHandshake::makeTokenRequest(const std::string& url, const boost::optional<UserCredentials>& credentials) const {
    auto request = HttpRequest{};
    request.method = web::http::methods::GET;
    request.url = url;
    request.headers[web::http::header_names::user_agent] = userAgent;

    if(credentials) {
        printLog(boost::format("using Basic authentication of user '%s' against token endpoint") % credentials->username,
                 libregauth::LogLevel::DEBUG);
        request = BasicCredential{credentials->username, credentials->password}.attach(std::move(request));
    }

    return request;
}

void BearerHandshake::printLog(const boost::format& message, libregauth::LogLevel logLevel) const {
    libregauth::Logger::getInstance().log(message.str(), sysname, logLevel);
}

}
}
