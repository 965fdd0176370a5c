#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types shared by every zshrcman operation
 *
 * Library functions never throw across their API. Fallible operations return
 * a Result<T>; check isOk() before value(), or isErr() before error().
 *
 * @example
 * ```cpp
 * auto loaded = store.load();
 * if (loaded.isErr()) {
 *     std::cerr << loaded.error().message() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace zshrcman {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    NOT_FOUND,          // profile or package referenced does not exist
    INVALID_OPERATION,  // e.g. deleting the active profile
    IO_ERROR,           // filesystem / symlink failures
    PERSISTENCE_ERROR,  // snapshot load/save failures
    INSTALLER_FAILED,   // the external installer reported failure
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::INVALID_OPERATION: return "INVALID_OPERATION";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::PERSISTENCE_ERROR: return "PERSISTENCE_ERROR";
        case ErrorCode::INSTALLER_FAILED: return "INSTALLER_FAILED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace zshrcman
