/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef registry_Challenge_hpp
#define registry_Challenge_hpp

#include <string>
#include <vector>
#include <utility>
#include <ostream>

#include <boost/optional.hpp>


namespace regauth {
namespace registry {

/**
 * Authentication challenge advertised by a registry through the WWW-Authenticate header.
 *
 * A challenge is either Basic (realm only) or Bearer (realm of the token endpoint plus
 * optional service and scope). Instances are only created through the validating
 * factories, so a Challenge object always satisfies the required keys of its scheme.
 */
class Challenge {
public:
    enum class Scheme {Basic, Bearer};
    using Parameters = std::vector<std::pair<std::string, std::string>>;

public:
    static Challenge parse(const std::string& headerValue);
    static Challenge makeBasic(const Parameters& parameters);
    static Challenge makeBearer(const Parameters& parameters);

    Scheme getScheme() const { return scheme; }
    const std::string& getRealm() const { return realm; }
    const boost::optional<std::string>& getService() const { return service; }
    const boost::optional<std::string>& getScope() const { return scope; }

private:
    Challenge(Scheme scheme,
              std::string realm,
              boost::optional<std::string> service,
              boost::optional<std::string> scope);

private:
    Scheme scheme;
    std::string realm;
    boost::optional<std::string> service;
    boost::optional<std::string> scope;
};

bool operator==(const Challenge&, const Challenge&);
bool operator!=(const Challenge&, const Challenge&);
std::ostream& operator<<(std::ostream&, const Challenge&);
std::ostream& operator<<(std::ostream&, Challenge::Scheme);

/**
 * Raw content of a WWW-Authenticate header: the scheme token followed by the
 * key/value pairs in the order they appear in the header.
 */
struct ChallengeTokens {
    std::string method;
    Challenge::Parameters parameters;
};

ChallengeTokens tokenizeChallenge(const std::string& headerValue);

}
}

#endif
