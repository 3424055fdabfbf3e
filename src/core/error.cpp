#include "mload/core/error.hpp"

namespace mload {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidMetadata: return "InvalidMetadata";
        case ErrorCode::NoSession: return "NoSession";
        case ErrorCode::IndexOutOfRange: return "IndexOutOfRange";
        case ErrorCode::HashMismatch: return "HashMismatch";
        case ErrorCode::UploadIncomplete: return "UploadIncomplete";
        case ErrorCode::NotStarted: return "NotStarted";
        case ErrorCode::AlreadyStreaming: return "AlreadyStreaming";
        case ErrorCode::AlreadyCompleted: return "AlreadyCompleted";
        case ErrorCode::AlreadyFailed: return "AlreadyFailed";
        case ErrorCode::DecodeFailure: return "DecodeFailure";
        case ErrorCode::IntegrityMismatch: return "IntegrityMismatch";
        case ErrorCode::StorageFailure: return "StorageFailure";
    }
    return "Unknown";
}

std::string Error::to_string() const {
    std::string text = error_code_name(code);
    if (!message.empty()) {
        text += ": ";
        text += message;
    }
    return text;
}

} // namespace mload
