#pragma once

#include "mload/core/result.hpp"

#include <string>

namespace mload {

/**
 * @brief Closed error taxonomy for the upload and initialization protocol
 *
 * Validation errors (InvalidMetadata, NoSession, IndexOutOfRange, HashMismatch)
 * are raised before any write. DecodeFailure is the only error that moves the
 * initialization state machine into Failed.
 */
enum class ErrorCode {
    InvalidMetadata,
    NoSession,
    IndexOutOfRange,
    HashMismatch,
    UploadIncomplete,
    NotStarted,
    AlreadyStreaming,
    AlreadyCompleted,
    AlreadyFailed,
    DecodeFailure,
    IntegrityMismatch,
    StorageFailure
};

struct Error {
    ErrorCode code = ErrorCode::StorageFailure;
    std::string message;

    /// "CodeName: message"
    std::string to_string() const;
};

const char* error_code_name(ErrorCode code) noexcept;

inline Error make_error(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

} // namespace mload
