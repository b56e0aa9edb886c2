#pragma once

#include <string>

#include <arrow/status.h>

namespace strata {

enum class StatusCode {
    kOk = 0,
    kNotFound = 1,
    kCorruption = 2,
    kIoError = 3,
    kInvalidArgument = 4,
    kConflict = 5,
    kOutOfRetention = 6,
    kCastError = 7,
    kCycle = 8,
    kPrivilegeDenied = 9,
    kNotImplemented = 10,
    kAlreadyExists = 11,
    kInternalError = 12,
};

class Status {
public:
    Status() : code_(StatusCode::kOk) {}
    Status(StatusCode code) : code_(code) {}
    Status(StatusCode code, const std::string& message)
        : code_(code), message_(message) {}

    static Status OK() { return Status(); }
    static Status NotFound(const std::string& message = "") {
        return Status(StatusCode::kNotFound, message);
    }
    static Status Corruption(const std::string& message = "") {
        return Status(StatusCode::kCorruption, message);
    }
    static Status IOError(const std::string& message = "") {
        return Status(StatusCode::kIoError, message);
    }
    static Status InvalidArgument(const std::string& message = "") {
        return Status(StatusCode::kInvalidArgument, message);
    }

    // Append raced against a newer head; recoverable by re-reading the head.
    static Status Conflict(const std::string& message = "") {
        return Status(StatusCode::kConflict, message);
    }

    static Status OutOfRetention(const std::string& message = "") {
        return Status(StatusCode::kOutOfRetention, message);
    }
    static Status CastError(const std::string& message = "") {
        return Status(StatusCode::kCastError, message);
    }
    static Status Cycle(const std::string& message = "") {
        return Status(StatusCode::kCycle, message);
    }
    static Status PrivilegeDenied(const std::string& message = "") {
        return Status(StatusCode::kPrivilegeDenied, message);
    }
    static Status NotImplemented(const std::string& message = "") {
        return Status(StatusCode::kNotImplemented, message);
    }
    static Status AlreadyExists(const std::string& message = "") {
        return Status(StatusCode::kAlreadyExists, message);
    }
    static Status InternalError(const std::string& message = "") {
        return Status(StatusCode::kInternalError, message);
    }

    // Arrow failures surface as IO errors unless Arrow says the input was bad.
    static Status FromArrowStatus(const arrow::Status& status) {
        if (status.ok()) return Status::OK();
        if (status.IsInvalid() || status.IsTypeError() || status.IsIndexError()) {
            return Status::InvalidArgument(status.ToString());
        }
        if (status.IsKeyError()) return Status::NotFound(status.ToString());
        if (status.IsNotImplemented()) return Status::NotImplemented(status.ToString());
        return Status::IOError(status.ToString());
    }

    bool ok() const { return code_ == StatusCode::kOk; }
    bool IsNotFound() const { return code_ == StatusCode::kNotFound; }
    bool IsCorruption() const { return code_ == StatusCode::kCorruption; }
    bool IsIOError() const { return code_ == StatusCode::kIoError; }
    bool IsInvalidArgument() const { return code_ == StatusCode::kInvalidArgument; }
    bool IsConflict() const { return code_ == StatusCode::kConflict; }
    bool IsOutOfRetention() const { return code_ == StatusCode::kOutOfRetention; }
    bool IsCastError() const { return code_ == StatusCode::kCastError; }
    bool IsCycle() const { return code_ == StatusCode::kCycle; }
    bool IsPrivilegeDenied() const { return code_ == StatusCode::kPrivilegeDenied; }
    bool IsAlreadyExists() const { return code_ == StatusCode::kAlreadyExists; }
    bool IsInternalError() const { return code_ == StatusCode::kInternalError; }

    StatusCode code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    StatusCode code_;
    std::string message_;
};

inline std::string Status::ToString() const {
    std::string result;
    switch (code_) {
        case StatusCode::kOk:
            result = "OK";
            break;
        case StatusCode::kNotFound:
            result = "NotFound";
            break;
        case StatusCode::kCorruption:
            result = "Corruption";
            break;
        case StatusCode::kIoError:
            result = "IOError";
            break;
        case StatusCode::kInvalidArgument:
            result = "InvalidArgument";
            break;
        case StatusCode::kConflict:
            result = "Conflict";
            break;
        case StatusCode::kOutOfRetention:
            result = "OutOfRetention";
            break;
        case StatusCode::kCastError:
            result = "CastError";
            break;
        case StatusCode::kCycle:
            result = "Cycle";
            break;
        case StatusCode::kPrivilegeDenied:
            result = "PrivilegeDenied";
            break;
        case StatusCode::kNotImplemented:
            result = "NotImplemented";
            break;
        case StatusCode::kAlreadyExists:
            result = "AlreadyExists";
            break;
        case StatusCode::kInternalError:
            result = "InternalError";
            break;
    }

    if (!message_.empty()) {
        result += ": " + message_;
    }

    return result;
}

} // namespace strata

// Propagate a non-OK strata::Status to the caller.
#define STRATA_RETURN_NOT_OK(expr)                  \
    do {                                            \
        ::strata::Status _st = (expr);              \
        if (!_st.ok()) return _st;                  \
    } while (false)
