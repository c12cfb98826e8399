/*
 * ChatRelay - error taxonomy implementation
 */

#include "errors.hpp"

namespace chatrelay {

ErrorCategory error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::UsernameTaken:
        case ErrorCode::SelfMessage:
            return ErrorCategory::Conflict;
        case ErrorCode::RecipientOffline:
        case ErrorCode::UnknownTarget:
            return ErrorCategory::NotFound;
        case ErrorCode::IntegrityFailure:
        case ErrorCode::KeyUnwrapFailure:
            return ErrorCategory::IntegrityFailure;
        case ErrorCode::TransportFailure:
            return ErrorCategory::TransportFailure;
        default:
            return ErrorCategory::InvalidInput;
    }
}

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidUsername:
            return "InvalidUsername";
        case ErrorCode::InvalidRecipient:
            return "InvalidRecipient";
        case ErrorCode::EmptyPayload:
            return "EmptyPayload";
        case ErrorCode::InvalidFile:
            return "InvalidFile";
        case ErrorCode::InvalidChunk:
            return "InvalidChunk";
        case ErrorCode::InvalidKeyExchange:
            return "InvalidKeyExchange";
        case ErrorCode::UsernameTaken:
            return "UsernameTaken";
        case ErrorCode::SelfMessage:
            return "SelfMessage";
        case ErrorCode::RecipientOffline:
            return "RecipientOffline";
        case ErrorCode::UnknownTarget:
            return "UnknownTarget";
        case ErrorCode::IntegrityFailure:
            return "IntegrityFailure";
        case ErrorCode::KeyUnwrapFailure:
            return "KeyUnwrapFailure";
        case ErrorCode::TransportFailure:
            return "TransportFailure";
    }
    return "Unknown";
}

} // namespace chatrelay
