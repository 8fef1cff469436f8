#pragma once

#include "tinyboard/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <functional>

namespace tinyboard {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,
    NotImplemented,

    // Request errors (rejected input, not system faults)
    ValidationFailed,
    NotFound,

    // Media errors
    UnsupportedMediaType,
    InvalidMedia,
    PayloadTooLarge,
    IoError,

    // Store errors
    StoreReadFailed,
    StoreWriteFailed,
    StoreCorrupted,

    // Serialization errors
    SerializationFailed,
    DeserializationFailed
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// True for codes that describe a rejected request rather than an internal failure
bool is_client_error(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for error handling
template<typename T>
class Result {
public:
    // Success constructor
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    // Error constructor
    static Result Err(Error error) {
        return Result(std::move(error));
    }

    // Error constructor with code and message
    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    // Implicit conversion so an Error can be returned from any Result-returning function
    Result(Error error) : value_(std::move(error)) {}

    // Check if result contains a value
    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    T& value() {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    // Get value or default
    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    // Unwrap (throws if error)
    T unwrap() {
        return std::move(value());
    }

    // Convert to optional
    std::optional<T> ok() const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return std::nullopt;
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}

    std::variant<T, Error> value_;
};

// Specialized Result<void> for operations that don't return a value
template<>
class Result<void> {
public:
    static Result Ok() {
        return Result(true);
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    Result(Error error) : error_(std::move(error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const Error& error() const {
        if (!error_) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return *error_;
    }

    void unwrap() {
        if (is_err()) {
            throw std::runtime_error("Called unwrap() on error Result: " + error().to_string());
        }
    }

private:
    explicit Result(bool) : error_(std::nullopt) {}

    std::optional<Error> error_;
};

// Custom exception classes
class TinyboardException : public std::runtime_error {
public:
    TinyboardException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class StorageException : public TinyboardException {
public:
    StorageException(ErrorCode code, const std::string& message)
        : TinyboardException(code, "Storage error: " + message) {}
};

class MediaException : public TinyboardException {
public:
    MediaException(ErrorCode code, const std::string& message)
        : TinyboardException(code, "Media error: " + message) {}
};

// Propagate the error of a Result-returning call out of a function returning Result<U>
#define TINYBOARD_TRY(expr) \
    do { \
        auto tinyboard_try_result_ = (expr); \
        if (tinyboard_try_result_.is_err()) { \
            return tinyboard_try_result_.error(); \
        } \
    } while (0)

} // namespace tinyboard
