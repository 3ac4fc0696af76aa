#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace objxfer {

/// Failure classes surfaced by the transfer engine.
enum class ErrorKind {
    Transient,        // network failure, 5xx, 429, malformed response
    SessionExpired,   // 404/410 on a known resumable session
    FatalCaller,      // bad arguments, manual-URI expiry, content mismatch on resume
    BudgetExhausted,  // retry attempts or total time budget used up
    PartialBatch,     // one or more jobs in a parallel batch failed
    Integrity,        // checksum mismatch after transfer
    Cancelled         // caller aborted the operation
};

const char* error_kind_to_string(ErrorKind kind);

/// Base error for all transfer failures.
/// Carries enough context (status code, attempt count) for the caller to
/// decide whether to resume manually.
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message,
                  int status_code = 0, int attempts = 0)
        : std::runtime_error(message)
        , kind_(kind)
        , status_code_(status_code)
        , attempts_(attempts) {}

    ErrorKind kind() const { return kind_; }
    int status_code() const { return status_code_; }
    int attempts() const { return attempts_; }

private:
    ErrorKind kind_;
    int status_code_;
    int attempts_;
};

/// Raised once the retry attempt cap or the total time budget is exceeded.
class RetryLimitExceeded : public TransferError {
public:
    RetryLimitExceeded(const std::string& message, int status_code, int attempts,
                       std::string last_message)
        : TransferError(ErrorKind::BudgetExhausted, message, status_code, attempts)
        , last_message_(std::move(last_message)) {}

    const std::string& last_message() const { return last_message_; }

private:
    std::string last_message_;
};

/// Raised by a failed multipart upload. The upload id and the parts that
/// did land are kept so the transfer can be resumed.
class MultipartUploadError : public TransferError {
public:
    MultipartUploadError(const std::string& message, std::string upload_id,
                         std::map<int, std::string> parts_map)
        : TransferError(ErrorKind::Transient, message)
        , upload_id_(std::move(upload_id))
        , parts_map_(std::move(parts_map)) {}

    const std::string& upload_id() const { return upload_id_; }
    const std::map<int, std::string>& parts_map() const { return parts_map_; }

private:
    std::string upload_id_;
    std::map<int, std::string> parts_map_;
};

}  // namespace objxfer
