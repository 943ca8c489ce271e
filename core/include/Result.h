#pragma once

/**
 * @file Result.h
 * @brief Error handling types for PinDrop
 *
 * Provides a Result<T, E> type similar to C++23's std::expected. Every
 * operation that can fail at a component boundary returns one of these;
 * exceptions are not thrown across component boundaries.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace pd {

/**
 * @brief Error codes for PinDrop operations
 */
enum class ErrorCode {
    Success = 0,

    // Listener errors (100-149)
    BindError = 100,
    AlreadyRunning = 101,

    // Connection errors (150-199)
    ConnectionRefused = 150,
    Timeout = 151,
    ConnectionFailed = 152,
    InvalidAddress = 153,
    Busy = 154,

    // Handshake / protocol errors (200-249)
    HandshakeFailed = 200,
    PinMismatch = 201,
    ProtocolError = 202,

    // Transfer errors (250-299)
    IncompleteTransfer = 250,
    SizeMismatch = 251,
    TransferTimeout = 252,
    Cancelled = 253,

    // File system errors (300-349)
    FileNotFound = 300,
    FileReadError = 301,
    FileWriteError = 302,
    DirectoryCreateFailed = 303,

    // Configuration errors (600-699)
    ConfigError = 600,
    InvalidConfig = 601,

    // General errors (900-999)
    InvalidArgument = 900,
    InvalidPin = 901,
    InternalError = 999
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::BindError: return "Port unavailable";
        case ErrorCode::AlreadyRunning: return "Already running";
        case ErrorCode::ConnectionRefused: return "Connection refused";
        case ErrorCode::Timeout: return "Connection timed out";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::InvalidAddress: return "Invalid address";
        case ErrorCode::Busy: return "Transfer already in progress";
        case ErrorCode::HandshakeFailed: return "Handshake failed";
        case ErrorCode::PinMismatch: return "PIN mismatch";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::IncompleteTransfer: return "Incomplete transfer";
        case ErrorCode::SizeMismatch: return "File size changed during transfer";
        case ErrorCode::TransferTimeout: return "Transfer timed out";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadError: return "File read error";
        case ErrorCode::FileWriteError: return "File write error";
        case ErrorCode::DirectoryCreateFailed: return "Directory creation failed";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::InvalidConfig: return "Invalid configuration";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidPin: return "Invalid PIN";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/**
 * @brief Stable short name of an error code, used in event streams
 */
inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::BindError: return "BindError";
        case ErrorCode::AlreadyRunning: return "AlreadyRunning";
        case ErrorCode::ConnectionRefused: return "ConnectionRefused";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::ConnectionFailed: return "ConnectionFailed";
        case ErrorCode::InvalidAddress: return "InvalidAddress";
        case ErrorCode::Busy: return "Busy";
        case ErrorCode::HandshakeFailed: return "HandshakeFailed";
        case ErrorCode::PinMismatch: return "PinMismatch";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::IncompleteTransfer: return "IncompleteTransfer";
        case ErrorCode::SizeMismatch: return "SizeMismatch";
        case ErrorCode::TransferTimeout: return "TransferTimeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::FileWriteError: return "FileWriteError";
        case ErrorCode::DirectoryCreateFailed: return "DirectoryCreateFailed";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidPin: return "InvalidPin";
        case ErrorCode::InternalError: return "InternalError";
        default: return "Unknown";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool operator==(const Error& other) const { return code == other.code; }
    bool operator!=(const Error& other) const { return code != other.code; }
};

/**
 * @brief Result type for operations that can fail
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 *
 * Usage:
 * @code
 * Result<int> port = parsePort(text);
 * if (!port) {
 *     logger.error(port.error().message, "Cli");
 *     return 1;
 * }
 * listen(*port);
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    /// Construct success result
    Result(T value) : data_(std::move(value)) {}

    /// Construct error result
    Result(E error) : data_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return std::holds_alternative<T>(data_); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Check if result is error
    bool isError() const { return std::holds_alternative<E>(data_); }

    /// Get success value (throws if error)
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    /// Get success value with default
    T valueOr(T defaultValue) const {
        if (ok()) return std::get<T>(data_);
        return defaultValue;
    }

    /// Get error (throws if success)
    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for void success type
 */
template<typename E>
class Result<void, E> {
public:
    /// Construct success result
    Result() : error_(std::nullopt) {}

    /// Construct error result
    Result(E error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }
    bool isError() const { return error_.has_value(); }

    /// Get error (undefined if success)
    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

/// Create a success result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Create a void success result
inline Result<void> Ok() {
    return Result<void>();
}

/// Create an error result
template<typename T = void>
Result<T> Err(ErrorCode code) {
    return Result<T>(Error{code});
}

/// Create an error result with message
template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace pd
