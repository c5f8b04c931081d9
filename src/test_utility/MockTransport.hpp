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
 * @brief In-memory transport to be used in the tests.
 *
 * Replays scripted responses in FIFO order and records every request it receives.
 */

#ifndef regauth_test_utility_MockTransport_hpp
#define regauth_test_utility_MockTransport_hpp

#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <cpprest/http_msg.h>
#include <pplx/pplxtasks.h>

#include "libregauth/Error.hpp"
#include "registry/AuthError.hpp"
#include "registry/HttpTransport.hpp"

namespace test_utility {

class MockTransport : public regauth::registry::HttpTransport {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    MockTransport& expectResponse(web::http::status_code status, const Headers& headers = {}, const std::string& body = "") {
        auto response = regauth::registry::HttpResponse{};
        response.status = status;
        for(const auto& header : headers) {
            response.headers[header.first] = header.second;
        }
        response.body = body;
        script.push_back(Step{response, false});
        return *this;
    }

    MockTransport& expectNetworkFailure() {
        script.push_back(Step{regauth::registry::HttpResponse{}, true});
        return *this;
    }

    pplx::task<regauth::registry::HttpResponse> send(const regauth::registry::HttpRequest& request) override {
        requests.push_back(request);

        if(script.empty()) {
            auto message = boost::format("MockTransport: unexpected request %s %s") % request.method % request.url;
            REGAUTH_THROW_ERROR(message.str());
        }

        auto step = script.front();
        script.pop_front();

        if(step.isNetworkFailure) {
            auto entry = libregauth::Error::ErrorTraceEntry{"connection refused", __FILENAME__, __LINE__, __func__};
            auto error = regauth::registry::AuthError{regauth::registry::ErrorCode::NetworkFailure,
                                                      libregauth::LogLevel::ERROR, entry};
            return pplx::task_from_exception<regauth::registry::HttpResponse>(error);
        }
        return pplx::task_from_result(step.response);
    }

    const std::vector<regauth::registry::HttpRequest>& getRequests() const {
        return requests;
    }

    boost::optional<std::string> getRequestHeader(std::size_t requestIndex, const std::string& name) const {
        const auto& headers = requests.at(requestIndex).headers;
        auto it = headers.find(name);
        if(it == headers.end()) {
            return {};
        }
        return it->second;
    }

    bool isScriptConsumed() const {
        return script.empty();
    }

private:
    struct Step {
        regauth::registry::HttpResponse response;
        bool isNetworkFailure;
    };

    std::deque<Step> script;
    std::vector<regauth::registry::HttpRequest> requests;
};

}

#endif
