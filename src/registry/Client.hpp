/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef registry_Client_hpp
#define registry_Client_hpp

#include <memory>
#include <string>
#include <vector>

#include <cpprest/http_msg.h>
#include <pplx/pplxtasks.h>

#include "registry/Config.hpp"
#include "registry/Credential.hpp"
#include "registry/HttpTransport.hpp"


namespace regauth {
namespace registry {

/**
 * Registry client state: configuration, transport and (optionally) the credential
 * resolved by a previous authentication.
 *
 * A client is an immutable value. Authenticating returns a new client carrying the
 * resolved credential and leaves the original untouched, so copies can be used
 * independently from different tasks.
 */
class Client {
public:
    // Placeholder value, required by pplx::task<Client>. It is only meant to be
    // assigned to: every operation on it throws libregauth::Error.
    Client() = default;
    Client(std::shared_ptr<const Config> config, std::shared_ptr<HttpTransport> transport);

    /**
     * Probes the discovery endpoint without credentials, parses the challenge of the
     * registry and resolves a credential for it (Basic, or Bearer for the given scopes).
     */
    pplx::task<Client> authenticate(const std::vector<std::string>& scopes) const;

    /**
     * Probes the discovery endpoint with the current credential (if any):
     * true on 200, false on 401, AuthError(UnexpectedHttpStatus) otherwise.
     */
    pplx::task<bool> isAuthenticated() const;

    HttpRequest makeRequest(const web::http::method& method, const std::string& url) const;
    std::string getDiscoveryEndpoint() const;

    const std::shared_ptr<const Credential>& getCredential() const { return credential; }
    Client withCredential(std::shared_ptr<const Credential> credential) const;
    Client withoutCredential() const;

private:
    void checkInitialized() const;
    pplx::task<std::shared_ptr<const Credential>> resolveChallenge(const HttpResponse& probeResponse,
                                                                   const std::vector<std::string>& scopes) const;

private:
    std::shared_ptr<const Config> config;
    std::shared_ptr<HttpTransport> transport;
    std::shared_ptr<const Credential> credential;
};

}
}

#endif
