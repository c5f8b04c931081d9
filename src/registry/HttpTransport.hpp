/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef registry_HttpTransport_hpp
#define registry_HttpTransport_hpp

#include <string>

#include <cpprest/http_msg.h>
#include <pplx/pplxtasks.h>


namespace regauth {
namespace registry {

struct HttpRequest {
    web::http::method method = web::http::methods::GET;
    std::string url;
    web::http::http_headers headers;
};

struct HttpResponse {
    web::http::status_code status = 0;
    web::http::http_headers headers;
    std::string body;
};

/**
 * Collaborator issuing HTTP requests on behalf of the authentication negotiation.
 *
 * Implementations perform exactly one round-trip per call (no retries) and
 * report network failures as AuthError with ErrorCode::NetworkFailure.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual pplx::task<HttpResponse> send(const HttpRequest& request) = 0;
};

}
}

#endif
