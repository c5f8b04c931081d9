/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/Client.hpp"

#include <boost/format.hpp>

#include "libregauth/Error.hpp"
#include "libregauth/Logger.hpp"
#include "registry/AuthError.hpp"
#include "registry/BearerHandshake.hpp"
#include "registry/Challenge.hpp"


namespace regauth {
namespace registry {

namespace {

void printLog(const boost::format& message, libregauth::LogLevel logLevel) {
    libregauth::Logger::getInstance().log(message.str(), "RegistryClient", logLevel);
}

} // namespace

Client::Client(std::shared_ptr<const Config> config, std::shared_ptr<HttpTransport> transport)
    : config{std::move(config)}
    , transport{std::move(transport)}
{}

pplx::task<Client> Client::authenticate(const std::vector<std::string>& scopes) const {
    // never send a previously resolved credential to the probed endpoint
    auto probeClient = withoutCredential();
    auto url = probeClient.getDiscoveryEndpoint();
    auto request = probeClient.makeRequest(web::http::methods::GET, url);

    printLog(boost::format("authenticate: Unauthenticated, probing %s") % url, libregauth::LogLevel::DEBUG);

    return transport->send(request)
        .then([probeClient, scopes](const HttpResponse& response) {
            return probeClient.resolveChallenge(response, scopes);
        })
        .then([probeClient](std::shared_ptr<const Credential> credential) {
            printLog(boost::format("authenticate: Authenticated with %s") % credential->describe(),
                     libregauth::LogLevel::DEBUG);
            return probeClient.withCredential(std::move(credential));
        });
}

pplx::task<std::shared_ptr<const Credential>> Client::resolveChallenge(const HttpResponse& probeResponse,
                                                                       const std::vector<std::string>& scopes) const {
    auto header = probeResponse.headers.find(web::http::header_names::www_authenticate);
    if(header == probeResponse.headers.end()) {
        auto message = boost::format("Missing 'WWW-Authenticate' header in response of %s (status %d)")
            % getDiscoveryEndpoint() % probeResponse.status;
        REGAUTH_THROW_AUTH_ERROR(ErrorCode::MissingAuthHeader, message.str());
    }

    auto challenge = Challenge::parse(header->second);
    printLog(boost::format("authenticate: ChallengeReceived %s") % challenge, libregauth::LogLevel::DEBUG);

    auto userCredentials = config->getUserCredentials();

    if(challenge.getScheme() == Challenge::Scheme::Basic) {
        if(!userCredentials) {
            auto message = boost::format("Registry %s requires Basic authentication but no credentials were provided")
                % config->registry.server;
            REGAUTH_THROW_AUTH_ERROR(ErrorCode::NoCredentials, message.str());
        }
        auto credential = std::shared_ptr<const Credential>{
            std::make_shared<const BasicCredential>(userCredentials->username, userCredentials->password)};
        return pplx::task_from_result(credential);
    }

    auto handshake = BearerHandshake{transport, config->userAgent};
    return handshake.obtainToken(challenge, scopes, userCredentials)
        .then([](std::shared_ptr<const BearerCredential> credential) {
            return std::shared_ptr<const Credential>{std::move(credential)};
        });
}

pplx::task<bool> Client::isAuthenticated() const {
    auto url = getDiscoveryEndpoint();
    auto request = makeRequest(web::http::methods::GET, url);

    return transport->send(request)
        .then([url](const HttpResponse& response) {
            printLog(boost::format("isAuthenticated: GET %s status: %d") % url % response.status,
                     libregauth::LogLevel::DEBUG);

            if(response.status == web::http::status_codes::OK) {
                return true;
            }
            else if(response.status == web::http::status_codes::Unauthorized) {
                return false;
            }
            auto message = boost::format("Unexpected HTTP response status code (%d) from %s")
                % response.status % url;
            REGAUTH_THROW_HTTP_STATUS_ERROR(response.status, message.str());
        });
}

HttpRequest Client::makeRequest(const web::http::method& method, const std::string& url) const {
    checkInitialized();

    auto request = HttpRequest{};
    request.method = method;
    request.url = url;
    request.headers[web::http::header_names::user_agent] = config->userAgent;
    if(credential) {
        request = credential->attach(std::move(request));
    }
    return request;
}

std::string Client::getDiscoveryEndpoint() const {
    checkInitialized();
    return config->getServerUri() + "/v2/";
}

void Client::checkInitialized() const {
    if(!config || !transport) {
        REGAUTH_THROW_ERROR("Registry client has no configuration or transport"
                            " (default-constructed placeholder)");
    }
}

Client Client::withCredential(std::shared_ptr<const Credential> credential) const {
    auto client = *this;
    client.credential = std::move(credential);
    return client;
}

Client Client::withoutCredential() const {
    return withCredential(nullptr);
}

}
}
