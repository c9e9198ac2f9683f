#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kvault {

/**
 * @brief Closed error taxonomy for every core operation
 *
 * Backend HTTP statuses and transport failures are mapped onto these codes;
 * raw statuses never escape to callers except as Error::http_status context.
 */
enum class ErrorCode {
    NONE,
    VALIDATION,             // bad name, disallowed characters, malformed request
    AUTH,                   // credential invalid or refresh failed
    NOT_FOUND,
    CONFLICT,
    FORBIDDEN,
    TRANSIENT,              // overload, rate limit, transport failure
    RETRY_EXHAUSTED,        // TRANSIENT after the retry budget was spent
    TAG_BUDGET_EXCEEDED,
    NAME_COLLISION,         // stored original_name differs from requested name
    CANCELLED,
    INTERNAL                // malformed payloads, unexpected statuses
};

[[nodiscard]] inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                return "none";
        case ErrorCode::VALIDATION:          return "validation";
        case ErrorCode::AUTH:                return "auth";
        case ErrorCode::NOT_FOUND:           return "not_found";
        case ErrorCode::CONFLICT:            return "conflict";
        case ErrorCode::FORBIDDEN:           return "forbidden";
        case ErrorCode::TRANSIENT:           return "transient";
        case ErrorCode::RETRY_EXHAUSTED:     return "retry_exhausted";
        case ErrorCode::TAG_BUDGET_EXCEEDED: return "tag_budget_exceeded";
        case ErrorCode::NAME_COLLISION:      return "name_collision";
        case ErrorCode::CANCELLED:           return "cancelled";
        case ErrorCode::INTERNAL:            return "internal";
        default:                             return "unknown";
    }
}

struct Error {
    ErrorCode code = ErrorCode::NONE;
    std::string message;
    int http_status = 0;        // last backend status, 0 if none
    uint32_t attempts = 0;      // network attempts made (RETRY_EXHAUSTED)
    std::string cause;          // last underlying failure (RETRY_EXHAUSTED)
    size_t slot_count = 0;      // computed slots (TAG_BUDGET_EXCEEDED)
    size_t slot_limit = 0;

    [[nodiscard]] std::string describe() const {
        std::string out = std::string(error_code_to_string(code)) + ": " + message;
        if (!cause.empty()) out += " (cause: " + cause + ")";
        return out;
    }
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(Error err) {
        Result r;
        r.error_ = std::move(err);
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        return error(Error{.code = code, .message = std::move(message)});
    }

    bool is_ok() const { return value_.has_value(); }
    bool is_error() const { return !value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code; }
    const std::string& error_message() const { return error_.message; }

private:
    std::optional<T> value_;
    Error error_;
};

template<>
class Result<void> {
public:
    static Result ok() { return Result{}; }

    static Result error(Error err) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(err);
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        return error(Error{.code = code, .message = std::move(message)});
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code; }
    const std::string& error_message() const { return error_.message; }

private:
    bool success_ = true;
    Error error_;
};

} // namespace kvault
