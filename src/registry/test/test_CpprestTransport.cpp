/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <memory>
#include <string>

#include <cpprest/base_uri.h>

#include "registry/AuthError.hpp"
#include "registry/Config.hpp"
#include "registry/CpprestTransport.hpp"
#include "test_utility/authError.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace regauth;

TEST_GROUP(CpprestTransportTestGroup) {
};

TEST(CpprestTransportTestGroup, getProxy) {
    auto config = std::make_shared<registry::Config>();
    auto transport = registry::CpprestTransport{config};
    auto& environment = config->transport.hostEnvironment;

    auto secureTarget = web::uri{"https://index.docker.io/v2/"};
    auto insecureTarget = web::uri{"http://index.docker.io/v2/"};

    // Test no variable set
    CHECK(transport.getProxy(secureTarget).empty());
    CHECK(transport.getProxy(insecureTarget).empty());

    // Test http_proxy
    environment["http_proxy"] = std::string("http://proxy.test.com:3128");
    CHECK_EQUAL(transport.getProxy(insecureTarget), std::string{"http://proxy.test.com:3128"});
    CHECK(transport.getProxy(secureTarget).empty());

    // Test HTTP_PROXY is ignored
    environment.erase("http_proxy");
    environment["HTTP_PROXY"] = std::string("http://uppercase.proxy.test.com:3128");
    CHECK(transport.getProxy(insecureTarget).empty());
    environment["http_proxy"] = std::string("http://proxy.test.com:3128");

    // Test HTTPS_PROXY
    // Notice that from this point on we don't remove env vars set for previous cases,
    // so we check that variable priority is actually enforced
    environment["HTTPS_PROXY"] = std::string("https://uppercase.proxy.com");
    CHECK_EQUAL(transport.getProxy(secureTarget), std::string{"https://uppercase.proxy.com"});

    // Test https_proxy
    environment["https_proxy"] = std::string("https://lowercase.proxy.com");
    CHECK_EQUAL(transport.getProxy(secureTarget), std::string{"https://lowercase.proxy.com"});
    CHECK_EQUAL(transport.getProxy(insecureTarget), std::string{"http://proxy.test.com:3128"});

    // Test ALL_PROXY
    environment["ALL_PROXY"] = std::string("https://all.proxy.com");
    CHECK_EQUAL(transport.getProxy(secureTarget), std::string{"https://all.proxy.com"});
    CHECK_EQUAL(transport.getProxy(insecureTarget), std::string{"https://all.proxy.com"});

    // Test NO_PROXY
    {
        environment["NO_PROXY"] = std::string("test.domain.com");
        CHECK_EQUAL(transport.getProxy(secureTarget), std::string{"https://all.proxy.com"});

        environment["NO_PROXY"] = std::string("test.domain.com, index.docker.io");
        CHECK(transport.getProxy(secureTarget).empty());

        environment["NO_PROXY"] = std::string("*");
        CHECK(transport.getProxy(secureTarget).empty());
    }

    // Test no_proxy
    {
        environment["no_proxy"] = std::string("test.domain.com");
        CHECK_EQUAL(transport.getProxy(secureTarget), std::string{"https://all.proxy.com"});

        // Reset upper case variable to keep it different from lower case
        environment["NO_PROXY"] = std::string("test.domain.com");
        environment["no_proxy"] = std::string("test.domain.com,index.docker.io");
        CHECK(transport.getProxy(secureTarget).empty());

        environment["no_proxy"] = std::string("*");
        CHECK(transport.getProxy(secureTarget).empty());
    }
}

TEST(CpprestTransportTestGroup, malformedUrl) {
    auto transport = registry::CpprestTransport{std::make_shared<registry::Config>()};

    for(const auto& url : {"not a url", "/v2/", "registry.example.com/v2/"}) {
        auto request = registry::HttpRequest{};
        request.url = url;
        auto code = test_utility::auth_error::getCode([&transport, &request]() {
            transport.send(request).get();
        });
        CHECK(code == registry::ErrorCode::MalformedUrl);
    }
}

REGAUTH_UNITTEST_MAIN_FUNCTION();
