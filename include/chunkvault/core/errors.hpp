#pragma once

#include <stdexcept>
#include <string>

namespace chunkvault::core {

enum class ErrorKind {
    VALIDATION,
    INTEGRITY,
    NOT_FOUND,
    OWNERSHIP,
    INVALID_STATE,
    TRANSIENT_IO,
    PARTIAL_COMMIT
};

const char* to_string(ErrorKind kind);

// Message safe to show to the caller. Transient and partial-commit failures
// collapse into a generic retry message; details stay in the server log.
std::string user_message(ErrorKind kind, const std::string& detail);

class UploadError : public std::runtime_error {
public:
    UploadError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    
    ErrorKind kind() const { return kind_; }
    
    // True when re-sending the same request later may succeed.
    bool retryable() const {
        return kind_ == ErrorKind::TRANSIENT_IO || kind_ == ErrorKind::PARTIAL_COMMIT;
    }

private:
    ErrorKind kind_;
};

class ValidationError : public UploadError {
public:
    explicit ValidationError(const std::string& message)
        : UploadError(ErrorKind::VALIDATION, message) {}
};

class IntegrityError : public UploadError {
public:
    explicit IntegrityError(const std::string& message)
        : UploadError(ErrorKind::INTEGRITY, message) {}
};

class ResourceNotFound : public UploadError {
public:
    explicit ResourceNotFound(const std::string& message)
        : UploadError(ErrorKind::NOT_FOUND, message) {}
};

class OwnershipError : public UploadError {
public:
    explicit OwnershipError(const std::string& message)
        : UploadError(ErrorKind::OWNERSHIP, message) {}
};

class InvalidStateError : public UploadError {
public:
    explicit InvalidStateError(const std::string& message)
        : UploadError(ErrorKind::INVALID_STATE, message) {}
};

class TransientIOError : public UploadError {
public:
    explicit TransientIOError(const std::string& message)
        : UploadError(ErrorKind::TRANSIENT_IO, message) {}
};

// The record is durably committed but its file still sits at the staging
// path. record_id() identifies the row a reconciliation pass has to finish.
class PartialCommitInconsistency : public UploadError {
public:
    PartialCommitInconsistency(const std::string& record_id, const std::string& message)
        : UploadError(ErrorKind::PARTIAL_COMMIT, message), record_id_(record_id) {}
    
    const std::string& record_id() const { return record_id_; }

private:
    std::string record_id_;
};

}
