#include "chunkvault/core/errors.hpp"

namespace chunkvault::core {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::INTEGRITY: return "integrity";
        case ErrorKind::NOT_FOUND: return "not_found";
        case ErrorKind::OWNERSHIP: return "ownership";
        case ErrorKind::INVALID_STATE: return "invalid_state";
        case ErrorKind::TRANSIENT_IO: return "transient_io";
        case ErrorKind::PARTIAL_COMMIT: return "partial_commit";
    }
    return "unknown";
}

std::string user_message(ErrorKind kind, const std::string& detail) {
    switch (kind) {
        case ErrorKind::VALIDATION:
            return "Invalid upload request: " + detail;
        case ErrorKind::INTEGRITY:
            return "Upload data is corrupted, please upload the file again: " + detail;
        case ErrorKind::NOT_FOUND:
            return "Upload not found: " + detail;
        case ErrorKind::OWNERSHIP:
            return "Access denied: upload does not belong to you";
        case ErrorKind::INVALID_STATE:
            return "Upload is not ready for this operation: " + detail;
        case ErrorKind::TRANSIENT_IO:
        case ErrorKind::PARTIAL_COMMIT:
            return "The server could not store the file right now, please retry later";
    }
    return "Unexpected error";
}

}
