#include "bulkcp/core/error.hpp"

#include <cerrno>

namespace bulkcp {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::TransientIO: return "TransientIOError";
        case ErrorCode::UnsupportedBackend: return "UnsupportedBackend";
        case ErrorCode::PartSizeMismatch: return "PartSizeMismatch";
        case ErrorCode::IsADirectory: return "IsADirectory";
        case ErrorCode::NotADirectory: return "NotADirectory";
        case ErrorCode::FileAndDirectory: return "FileAndDirectory";
        case ErrorCode::InvalidTransfer: return "InvalidTransfer";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

ErrorCode error_from_http_status(int status, bool network_error) {
    if (network_error) return ErrorCode::TransientIO;
    if (status >= 200 && status < 300) return ErrorCode::None;
    switch (status) {
        case 404:
            return ErrorCode::NotFound;
        case 401:
        case 403:
            return ErrorCode::PermissionDenied;
        case 408:
        case 429:
        case 500:
        case 502:
        case 503:
        case 504:
            return ErrorCode::TransientIO;
        default:
            return ErrorCode::Unknown;
    }
}

ErrorCode error_from_errno(int err) {
    switch (err) {
        case 0:
            return ErrorCode::None;
        case ENOENT:
            return ErrorCode::NotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        case EISDIR:
            return ErrorCode::IsADirectory;
        case ENOTDIR:
            return ErrorCode::NotADirectory;
        case EIO:
        case EAGAIN:
        case EINTR:
        case ENOSPC:
        case EMFILE:
        case ENFILE:
            return ErrorCode::TransientIO;
        default:
            return ErrorCode::Unknown;
    }
}

std::string Status::describe() const {
    if (success) return "ok";
    std::string out = error_code_name(error);
    if (!error_message.empty()) {
        out += ": ";
        out += error_message;
    }
    return out;
}

}  // namespace bulkcp
