#pragma once

#include "securand/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <functional>

namespace securand {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    InvalidArgument,

    // Sampling errors
    InvalidRange,
    InvalidLength,
    InvalidCharset,
    EmptySequence,

    // Entropy errors
    EntropyUnavailable,

    // Configuration errors
    ConfigLoadFailed,
    ConfigParseFailed
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

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

// Value-or-error return type used by every sampling operation.
// Implicitly constructible from an Error so failures can be forwarded
// between results of different value types.
template<typename T>
class Result {
public:
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    Result(Error error) : value_(std::move(error)) {}

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

    ErrorCode code() const {
        return is_ok() ? ErrorCode::Success : std::get<Error>(value_).code();
    }

    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    template<typename F>
    T value_or_else(F&& func) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return func(std::get<Error>(value_));
    }

    T unwrap() {
        return value();
    }

    T expect(const std::string& message) {
        if (is_err()) {
            throw std::runtime_error(message + ": " + error().to_string());
        }
        return value();
    }

    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>()))> {
        using U = decltype(func(std::declval<T>()));
        if (is_ok()) {
            return Result<U>::Ok(func(value()));
        }
        return Result<U>::Err(error());
    }

    std::optional<T> ok() const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return std::nullopt;
    }

    std::optional<Error> err() const {
        if (is_err()) {
            return std::get<Error>(value_);
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

    ErrorCode code() const {
        return error_ ? error_->code() : ErrorCode::Success;
    }

    void unwrap() {
        if (is_err()) {
            throw std::runtime_error("Called unwrap() on error Result: " + error().to_string());
        }
    }

    void expect(const std::string& message) {
        if (is_err()) {
            throw std::runtime_error(message + ": " + error().to_string());
        }
    }

private:
    explicit Result(bool) : error_(std::nullopt) {}

    std::optional<Error> error_;
};

// Exceptions, used only outside the sampling path (configuration I/O, CLI)
class SecurandException : public std::runtime_error {
public:
    SecurandException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class ConfigException : public SecurandException {
public:
    ConfigException(ErrorCode code, const std::string& message)
        : SecurandException(code, "Config error: " + message) {}
};

// Return the error of a failed Result from the enclosing function
#define SECURAND_TRY(expr) \
    do { \
        auto securand_try_result_ = (expr); \
        if (securand_try_result_.is_err()) { \
            return securand_try_result_.error(); \
        } \
    } while (0)

// Evaluate expr and assign its value to an existing lvalue, or return its error
#define SECURAND_TRY_ASSIGN(lhs, expr) \
    do { \
        auto securand_try_result_ = (expr); \
        if (securand_try_result_.is_err()) { \
            return securand_try_result_.error(); \
        } \
        lhs = std::move(securand_try_result_.value()); \
    } while (0)

} // namespace securand
