#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types for fallible schemafm operations
 *
 * Recoverable conditions (unresolved references, unmapped keys, ...) are
 * warnings and never surface here. Result<T> is reserved for failures that
 * abort one unit of work: an unreadable file, a malformed schema or document,
 * an unparsable model.
 *
 * @example
 * ```cpp
 * auto model = schemafm::load_model("model.uvl");
 * if (model.isErr()) {
 *     std::cerr << model.error().toString() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace schemafm {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for schemafm operations
 */
enum class ErrorCode {
    // System / IO
    FILE_NOT_FOUND,
    IO_ERROR,

    // Input format
    SCHEMA_INVALID,
    MODEL_PARSE_ERROR,
    KEY_MAPPING_INVALID,
    DOCUMENT_INVALID,
    CONFIG_INVALID,

    // Per-document failures
    TRANSLATION_TIMEOUT,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::SCHEMA_INVALID: return "SCHEMA_INVALID";
        case ErrorCode::MODEL_PARSE_ERROR: return "MODEL_PARSE_ERROR";
        case ErrorCode::KEY_MAPPING_INVALID: return "KEY_MAPPING_INVALID";
        case ErrorCode::DOCUMENT_INVALID: return "DOCUMENT_INVALID";
        case ErrorCode::CONFIG_INVALID: return "CONFIG_INVALID";
        case ErrorCode::TRANSLATION_TIMEOUT: return "TRANSLATION_TIMEOUT";
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
 *
 * Check isOk() before accessing value(), or isErr() before error().
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

} // namespace schemafm
