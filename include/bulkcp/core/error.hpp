#pragma once

#include <string>
#include <utility>

namespace bulkcp {

/// Shared failure taxonomy. Backend-specific failures are normalized into
/// these codes before they reach the planner or the scheduler.
enum class ErrorCode {
    None,
    NotFound,
    PermissionDenied,
    TransientIO,
    UnsupportedBackend,
    PartSizeMismatch,
    IsADirectory,
    NotADirectory,
    FileAndDirectory,
    InvalidTransfer,
    Cancelled,
    Unknown
};

const char* error_code_name(ErrorCode code);

/// Map an HTTP status (or a network-level failure) onto the taxonomy.
ErrorCode error_from_http_status(int status, bool network_error);

/// Map a POSIX errno value onto the taxonomy.
ErrorCode error_from_errno(int err);

/// Base of every result struct: success flag plus the normalized cause.
struct Status {
    bool success = true;
    ErrorCode error = ErrorCode::None;
    std::string error_message;

    static Status ok() { return {}; }
    static Status failure(ErrorCode code, std::string message) {
        return {false, code, std::move(message)};
    }

    void fail(ErrorCode code, std::string message) {
        success = false;
        error = code;
        error_message = std::move(message);
    }

    /// Copy the failure of another status into this one.
    void fail_from(const Status& other) {
        fail(other.error, other.error_message);
    }

    /// "NotFound: source not found: a.txt"
    std::string describe() const;
};

}  // namespace bulkcp
