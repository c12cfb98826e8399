/*
 * ChatRelay - error taxonomy
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace chatrelay {

enum class ErrorCategory {
    InvalidInput,
    Conflict,
    NotFound,
    IntegrityFailure,
    TransportFailure
};

enum class ErrorCode {
    None,
    InvalidUsername,
    InvalidRecipient,
    EmptyPayload,
    InvalidFile,
    InvalidChunk,
    InvalidKeyExchange,
    UsernameTaken,
    SelfMessage,
    RecipientOffline,
    UnknownTarget,
    IntegrityFailure,
    KeyUnwrapFailure,
    TransportFailure
};

ErrorCategory error_category(ErrorCode code);

const char* error_code_name(ErrorCode code);

// Filled by component operations that report failure through a bool return.
struct RelayError {
    ErrorCode code = ErrorCode::None;
    std::string message;

    void set(ErrorCode error_code, std::string text) {
        code = error_code;
        message = std::move(text);
    }
};

// Raised by the file transfer codec; never carries plaintext.
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace chatrelay
