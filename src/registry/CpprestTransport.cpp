/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * HTTP transport for the authentication negotiation using CPPRESTSDK
 */

#include "registry/CpprestTransport.hpp"

#include <string>
#include <vector>

#include <boost/format.hpp>
#include <cpprest/http_client.h>

#include "libregauth/Error.hpp"
#include "libregauth/utility/string.hpp"
#include "registry/AuthError.hpp"

using namespace web;                        // Common features like URIs.
using namespace web::http;                  // Common HTTP functionality


namespace regauth {
namespace registry {

    CpprestTransport::CpprestTransport(std::shared_ptr<const Config> config)
        : config{std::move(config)}
    {}

    pplx::task<HttpResponse> CpprestTransport::send(const HttpRequest& request) {
        auto target = web::uri{};
        try {
            target = web::uri{request.url};
        }
        catch(const web::uri_exception& e) {
            auto message = boost::format("Failed to parse URL '%s': %s") % request.url % e.what();
            REGAUTH_THROW_AUTH_ERROR(ErrorCode::MalformedUrl, message.str());
        }
        if(target.scheme().empty() || target.host().empty()) {
            auto message = boost::format("Failed to send request: URL '%s' is not absolute") % request.url;
            REGAUTH_THROW_AUTH_ERROR(ErrorCode::MalformedUrl, message.str());
        }

        // shared with the continuations: the client must outlive the pending request
        auto client = std::shared_ptr<web::http::client::http_client>{ setupHttpClient(target) };

        auto httpRequest = http_request{request.method};
        httpRequest.set_request_uri(target.resource());
        for(const auto& header : request.headers) {
            httpRequest.headers()[header.first] = header.second;
        }

        printLog(boost::format("httpclient: %s %s") % request.method % request.url, libregauth::LogLevel::DEBUG);

        auto url = request.url;
        return client->request(httpRequest)
            .then([client](http_response response) {
                return response.extract_string(true)
                    .then([response](const std::string& body) {
                        auto result = HttpResponse{};
                        result.status = response.status_code();
                        result.headers = response.headers();
                        result.body = body;
                        return result;
                    });
            })
            .then([client, url](pplx::task<HttpResponse> responseTask) {
                try {
                    return responseTask.get();
                }
                catch(const pplx::task_canceled&) {
                    throw;
                }
                catch(const std::exception& e) {
                    auto message = boost::format("Error while sending request to %s: %s") % url % e.what();
                    REGAUTH_THROW_AUTH_ERROR(ErrorCode::NetworkFailure, message.str());
                }
            });
    }

    std::unique_ptr<web::http::client::http_client> CpprestTransport::setupHttpClient(const web::uri& target) const {
        web::http::client::http_client_config clientConfig;
        clientConfig.set_validate_certificates(!config->registry.acceptInvalidCertificates);
        clientConfig.set_timeout(config->transport.requestTimeout);
        setProxyIfNecessary(clientConfig, target);

        return std::unique_ptr<web::http::client::http_client>( new web::http::client::http_client( target.authority(), clientConfig ));
    }

    void CpprestTransport::setProxyIfNecessary(web::http::client::http_client_config& clientConfig, const web::uri& target) const {
        auto proxyURI = getProxy(target);
        if (!proxyURI.empty()) {
            printLog( boost::format("Setting proxy for HTTP client: %s") % proxyURI, libregauth::LogLevel::DEBUG);
            clientConfig.set_proxy(web::web_proxy(proxyURI));
        }
    }

    std::string CpprestTransport::getProxy(const web::uri& target) const {
        const auto& hostEnvironment = config->transport.hostEnvironment;
        const auto& host = target.host();

        // Prefer lower case variable name like Python's urllib
        auto noProxyVar = hostEnvironment.find("no_proxy");
        if (noProxyVar != hostEnvironment.end() && !noProxyVar->second.empty()) {
            if (isHostInNoProxyList(noProxyVar->second, host)) {
                return std::string{};
            }
        }
        else {
            noProxyVar = hostEnvironment.find("NO_PROXY");
            if (noProxyVar != hostEnvironment.end() && !noProxyVar->second.empty()) {
                if (isHostInNoProxyList(noProxyVar->second, host)) {
                    return std::string{};
                }
            }
        }

        auto proxyVar = hostEnvironment.find("ALL_PROXY");
        if (proxyVar != hostEnvironment.end() && !proxyVar->second.empty()) {
            return proxyVar->second;
        }

        if (target.scheme() == "https") {
            // Prefer lower case like curl and Python's urllib
            auto proxyVar = hostEnvironment.find("https_proxy");
            if (proxyVar != hostEnvironment.end() && !proxyVar->second.empty()) {
                return proxyVar->second;
            }
            proxyVar = hostEnvironment.find("HTTPS_PROXY");
            if (proxyVar != hostEnvironment.end() && !proxyVar->second.empty()) {
                return proxyVar->second;
            }
        }
        else {
            // Only check lower case to avoid security issues with upper case version in CGI environments
            auto proxyVar = hostEnvironment.find("http_proxy");
            if (proxyVar != hostEnvironment.end() && !proxyVar->second.empty()) {
                return proxyVar->second;
            }
        }

        return std::string{};
    }

    bool CpprestTransport::isHostInNoProxyList(const std::string& noProxyList, const std::string& host) const {
        if (noProxyList == "*") {
            return true;
        }
        for (const auto& noProxyHost : libregauth::string::splitList(noProxyList)) {
            if (noProxyHost == host) {
                return true;
            }
        }
        return false;
    }

    void CpprestTransport::printLog(const boost::format& message, libregauth::LogLevel logLevel) const {
        libregauth::Logger::getInstance().log(message.str(), sysname, logLevel);
    }

} // namespace
} // namespace
