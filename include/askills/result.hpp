#pragma once

/**
 * @file result.hpp
 * @brief Error handling shared by every askills operation
 *
 * Fallible library calls return Result<T>. Validation errors are always
 * raised before the first write to a target root.
 */

#include <optional>
#include <string>
#include <utility>

namespace askills {

enum class ErrorCode {
    IO_ERROR,

    // Raised before any write
    INVALID_ARGUMENT,
    BUNDLE_INVALID,
    CONFLICT,
    ABORTED,

    // Governed documents
    NOT_INSTALLED,
    MANIFEST_INVALID,
    SETTINGS_INVALID,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCode::BUNDLE_INVALID: return "bundle_invalid";
        case ErrorCode::CONFLICT: return "conflict";
        case ErrorCode::ABORTED: return "aborted";
        case ErrorCode::NOT_INSTALLED: return "not_installed";
        case ErrorCode::MANIFEST_INVALID: return "manifest_invalid";
        case ErrorCode::SETTINGS_INVALID: return "settings_invalid";
        default: return "unknown";
    }
}

class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// Prefix the message with where it happened ("settings.json: ...")
    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

/**
 * @brief Value or error
 *
 * Check isOk() before value() and isErr() before error(). E is Error
 * except for unit conversion, which reports a SchemaViolation.
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_.emplace(std::move(value));
        return r;
    }
    static Result err(E error) {
        Result r;
        r.error_.emplace(std::move(error));
        return r;
    }

    bool isOk() const { return value_.has_value(); }
    bool isErr() const { return error_.has_value(); }

    T& value() { return *value_; }
    const T& value() const { return *value_; }
    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    Result() = default;

    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) {
        Result r;
        r.error_.emplace(std::move(error));
        return r;
    }

    bool isOk() const { return !error_.has_value(); }
    bool isErr() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    Result() = default;

    std::optional<E> error_;
};

} // namespace askills
