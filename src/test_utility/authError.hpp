/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef regauth_test_utility_authError_hpp
#define regauth_test_utility_authError_hpp

#include <boost/optional.hpp>

#include "registry/AuthError.hpp"

namespace test_utility {
namespace auth_error {

/**
 * Runs the function and returns the code of the AuthError it throws, if any.
 * Other exceptions are propagated.
 */
template<class Function>
boost::optional<regauth::registry::ErrorCode> getCode(Function&& function) {
    try {
        function();
    }
    catch(const regauth::registry::AuthError& e) {
        return e.getCode();
    }
    return {};
}

}
}

#endif
