/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef registry_AuthError_hpp
#define registry_AuthError_hpp

#include <string>
#include <ostream>

#include <boost/optional.hpp>

#include "libregauth/Error.hpp"


namespace regauth {
namespace registry {

enum class ErrorCode {
    // malformed or incomplete challenge header
    InvalidValue,
    FieldMethodMissing,
    InvalidEncoding,
    // credential resolution
    NoCredentials,
    MissingTokenField,
    InvalidAuthToken,
    MalformedTokenResponse,
    // transport
    MalformedUrl,
    UnexpectedHttpStatus,
    NetworkFailure,
    // protocol
    MissingAuthHeader
};

enum class ErrorCategory {ParseError, CredentialError, TransportError, ProtocolError};

ErrorCategory getCategory(ErrorCode code);
std::string toString(ErrorCode code);
std::string toString(ErrorCategory category);
std::ostream& operator<<(std::ostream&, ErrorCode);

/**
 * Error raised by the authentication negotiation.
 *
 * Carries an error code on top of the error trace of libregauth::Error, so that
 * callers can discriminate the failure (e.g. retry on a network failure, prompt
 * for credentials on NoCredentials).
 *
 * Instances should be thrown through REGAUTH_THROW_AUTH_ERROR or
 * REGAUTH_THROW_HTTP_STATUS_ERROR and rethrown through REGAUTH_RETHROW_ERROR,
 * which preserves the dynamic type.
 */
class AuthError : public libregauth::Error {
public:
    AuthError(ErrorCode code, libregauth::LogLevel logLevel, const ErrorTraceEntry& entry,
              boost::optional<unsigned short> httpStatus = {})
        : libregauth::Error{logLevel, entry}
        , code{code}
        , httpStatus{httpStatus}
    {}

    ErrorCode getCode() const {
        return code;
    }

    ErrorCategory getCategory() const {
        return registry::getCategory(code);
    }

    // only set for ErrorCode::UnexpectedHttpStatus
    const boost::optional<unsigned short>& getHttpStatus() const {
        return httpStatus;
    }

private:
    ErrorCode code;
    boost::optional<unsigned short> httpStatus;
};

}
}


#define REGAUTH_THROW_AUTH_ERROR(code, errorMessage) { \
    auto errorTraceEntry = libregauth::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw regauth::registry::AuthError{code, libregauth::LogLevel::ERROR, errorTraceEntry}; \
}

#define REGAUTH_THROW_HTTP_STATUS_ERROR(status, errorMessage) { \
    auto errorTraceEntry = libregauth::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw regauth::registry::AuthError{regauth::registry::ErrorCode::UnexpectedHttpStatus, \
                                       libregauth::LogLevel::ERROR, errorTraceEntry, status}; \
}

#endif
