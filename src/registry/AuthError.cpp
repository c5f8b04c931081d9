/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "AuthError.hpp"


namespace regauth {
namespace registry {

ErrorCategory getCategory(ErrorCode code) {
    switch(code) {
        case ErrorCode::InvalidValue:
        case ErrorCode::FieldMethodMissing:
        case ErrorCode::InvalidEncoding:
            return ErrorCategory::ParseError;
        case ErrorCode::NoCredentials:
        case ErrorCode::MissingTokenField:
        case ErrorCode::InvalidAuthToken:
        case ErrorCode::MalformedTokenResponse:
            return ErrorCategory::CredentialError;
        case ErrorCode::MalformedUrl:
        case ErrorCode::UnexpectedHttpStatus:
        case ErrorCode::NetworkFailure:
            return ErrorCategory::TransportError;
        case ErrorCode::MissingAuthHeader:
            return ErrorCategory::ProtocolError;
    }
    REGAUTH_THROW_ERROR("failed to determine category of unknown error code");
}

std::string toString(ErrorCode code) {
    switch(code) {
        case ErrorCode::InvalidValue:           return "InvalidValue";
        case ErrorCode::FieldMethodMissing:     return "FieldMethodMissing";
        case ErrorCode::InvalidEncoding:        return "InvalidEncoding";
        case ErrorCode::NoCredentials:          return "NoCredentials";
        case ErrorCode::MissingTokenField:      return "MissingTokenField";
        case ErrorCode::InvalidAuthToken:       return "InvalidAuthToken";
        case ErrorCode::MalformedTokenResponse: return "MalformedTokenResponse";
        case ErrorCode::MalformedUrl:           return "MalformedUrl";
        case ErrorCode::UnexpectedHttpStatus:   return "UnexpectedHttpStatus";
        case ErrorCode::NetworkFailure:         return "NetworkFailure";
        case ErrorCode::MissingAuthHeader:      return "MissingAuthHeader";
    }
    REGAUTH_THROW_ERROR("failed to convert unknown error code to string");
}

std::string toString(ErrorCategory category) {
    switch(category) {
        case ErrorCategory::ParseError:      return "ParseError";
        case ErrorCategory::CredentialError: return "CredentialError";
        case ErrorCategory::TransportError:  return "TransportError";
        case ErrorCategory::ProtocolError:   return "ProtocolError";
    }
    REGAUTH_THROW_ERROR("failed to convert unknown error category to string");
}

std::ostream& operator<<(std::ostream& os, ErrorCode code) {
    os << toString(code);
    return os;
}

}
}
