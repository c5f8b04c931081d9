/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef registry_CpprestTransport_hpp
#define registry_CpprestTransport_hpp

#include <memory>
#include <string>

#include <boost/format.hpp>
#include <cpprest/http_client.h>

#include "libregauth/Logger.hpp"
#include "registry/Config.hpp"
#include "registry/HttpTransport.hpp"


namespace regauth {
namespace registry {

class CpprestTransport : public HttpTransport {
public:
    CpprestTransport(std::shared_ptr<const Config> config);
    pplx::task<HttpResponse> send(const HttpRequest& request) override;
    std::string getProxy(const web::uri& target) const;

private:
    std::unique_ptr<web::http::client::http_client> setupHttpClient(const web::uri& target) const;
    void setProxyIfNecessary(web::http::client::http_client_config& clientConfig, const web::uri& target) const;
    bool isHostInNoProxyList(const std::string& noProxyList, const std::string& host) const;
    void printLog(const boost::format& message, libregauth::LogLevel logLevel) const;

private:
    std::shared_ptr<const Config> config;

    /** system name for logger */
    const std::string sysname = "CpprestTransport";
};

}
}

#endif
