/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for the Gamebattle orchestrator
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * This file defines all error codes used throughout the orchestrator, along
 * with a Result type for error handling without exceptions.
 */

#pragma once

#ifndef GAMEBATTLE_CORE_ERROR_CODES_HPP
#define GAMEBATTLE_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Gamebattle {

// ============================================================================
// Error Category Enumeration
// ============================================================================

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory : uint8_t {
    None        = 0x00,  ///< No error
    System      = 0x01,  ///< Operating system errors
    Sandbox     = 0x02,  ///< Sandbox lifecycle errors
    Bridge      = 0x03,  ///< I/O bridge errors
    Session     = 0x04,  ///< Session management errors
    Store       = 0x05,  ///< State store errors
    Competition = 0x06,  ///< Scoring and reporting errors
    Network     = 0x07,  ///< Network communication errors
    Crypto      = 0x08,  ///< Cryptographic errors
    Config      = 0x09,  ///< Configuration errors
    IO          = 0x0A,  ///< File I/O errors
    Parse       = 0x0B,  ///< Parsing errors
    Auth        = 0x0C,  ///< Authorization errors
    Internal    = 0xFF   ///< Internal/unknown errors
};

// ============================================================================
// Error Code Enumeration
// ============================================================================

/**
 * @brief Error codes for all orchestrator operations
 *
 * The high byte of each code is its ErrorCategory.
 */
enum class ErrorCode : uint16_t {
    /// Operation completed successfully
    Success = 0x0000,

    // ========================================================================
    // System Errors (0x0100-0x01FF)
    // ========================================================================

    /// Generic system error
    SystemError = 0x0100,

    /// Thread creation failed
    ThreadCreationFailed = 0x0101,

    /// Operation timed out
    Timeout = 0x0102,

    /// Operation was cancelled
    Cancelled = 0x0103,

    /// Feature not supported on this platform
    NotSupported = 0x0104,

    /// Insufficient privileges
    InsufficientPrivileges = 0x0105,

    // ========================================================================
    // Sandbox Errors (0x0200-0x02FF)
    // ========================================================================

    /// Game id unknown to the catalog
    ArtifactNotFound = 0x0200,

    /// Sandbox could not be started
    LaunchFailed = 0x0201,

    /// Host-wide sandbox capacity reached
    QuotaExceeded = 0x0202,

    /// Sandbox I/O already attached
    AlreadyAttached = 0x0203,

    /// Sandbox handle unknown to the controller
    SandboxNotFound = 0x0204,

    /// FIFO or pipe creation failed
    ChannelSetupFailed = 0x0205,

    // ========================================================================
    // Bridge Errors (0x0300-0x03FF)
    // ========================================================================

    /// Bridge already closed
    BridgeClosed = 0x0300,

    /// Remote client went away
    ClientDisconnected = 0x0301,

    /// Sandbox input stream is closed
    EndOfInput = 0x0302,

    // ========================================================================
    // Session Errors (0x0400-0x04FF)
    // ========================================================================

    /// Session id unknown
    SessionNotFound = 0x0400,

    /// Per-user session limit reached
    ConcurrencyLimitExceeded = 0x0401,

    /// Operation invalid in the current lifecycle state
    InvalidState = 0x0402,

    /// Session already terminated
    SessionTerminated = 0x0403,

    // ========================================================================
    // Store Errors (0x0500-0x05FF)
    // ========================================================================

    /// Backing store unreachable after retries
    StoreUnavailable = 0x0500,

    /// Compare-and-set precondition failed
    ConditionFailed = 0x0501,

    /// Lock not acquired within the wait budget
    LockNotAcquired = 0x0502,

    /// Key does not exist
    KeyNotFound = 0x0503,

    /// Lock lease expired or held by another owner
    LeaseLost = 0x0504,

    // ========================================================================
    // Competition Errors (0x0600-0x06FF)
    // ========================================================================

    /// Competition mode is disabled
    CompetitionDisabled = 0x0600,

    /// Outcome already recorded for this session
    DuplicateOutcome = 0x0601,

    /// Authors may not report their own game
    SelfReportNotAllowed = 0x0602,

    // ========================================================================
    // Network Errors (0x0700-0x07FF)
    // ========================================================================

    /// Generic network error
    NetworkError = 0x0700,

    /// Connection failed
    ConnectionFailed = 0x0701,

    /// DNS resolution failed
    DnsResolutionFailed = 0x0702,

    /// Unexpected HTTP status
    HttpError = 0x0703,

    /// libcurl initialization failed
    CurlInitFailed = 0x0704,

    /// TLS handshake failed
    TlsHandshakeFailed = 0x0705,

    // ========================================================================
    // Cryptographic Errors (0x0800-0x08FF)
    // ========================================================================

    /// Generic cryptographic error
    CryptoError = 0x0800,

    /// Random number generation failed
    RandomGenerationFailed = 0x0801,

    /// Invalid key format or size
    InvalidKey = 0x0802,

    // ========================================================================
    // Config Errors (0x0900-0x09FF)
    // ========================================================================

    /// Generic configuration error
    ConfigError = 0x0900,

    /// Required setting missing
    ConfigMissing = 0x0901,

    /// Setting has an invalid value
    ConfigInvalid = 0x0902,

    // ========================================================================
    // I/O Errors (0x0A00-0x0AFF)
    // ========================================================================

    /// Generic I/O error
    IOError = 0x0A00,

    /// File not found
    FileNotFound = 0x0A01,

    /// File exceeds the size limit
    FileTooLarge = 0x0A02,

    /// Path could not be resolved
    InvalidPath = 0x0A03,

    /// Path outside the allowed directory
    AccessDenied = 0x0A04,

    // ========================================================================
    // Parse Errors (0x0B00-0x0BFF)
    // ========================================================================

    /// Generic parse error
    ParseError = 0x0B00,

    /// JSON document malformed
    JsonParseFailed = 0x0B01,

    /// Structurally valid input with wrong shape
    InvalidFormat = 0x0B02,

    // ========================================================================
    // Auth Errors (0x0C00-0x0CFF)
    // ========================================================================

    /// Caller is not owner or admin
    Forbidden = 0x0C00,

    /// No identity supplied
    Unauthenticated = 0x0C01,

    // ========================================================================
    // Internal Errors (0xFF00-0xFFFF)
    // ========================================================================

    /// Internal error
    InternalError = 0xFF00,

    /// Invalid argument
    InvalidArgument = 0xFF01,

    /// Out of range
    OutOfRange = 0xFF02,

    /// Logic error
    LogicError = 0xFF03
};

// ============================================================================
// Error Code Utilities
// ============================================================================

/**
 * @brief Get the category of an error code
 * @param code The error code
 * @return The error category
 */
[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint16_t value = static_cast<uint16_t>(code);
    if (value == 0) return ErrorCategory::None;
    uint8_t category = static_cast<uint8_t>((value >> 8) & 0xFF);
    return static_cast<ErrorCategory>(category);
}

/**
 * @brief Check if an error code represents success
 */
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::Success;
}

/**
 * @brief Check if an error code represents failure
 */
[[nodiscard]] constexpr bool isFailure(ErrorCode code) noexcept {
    return code != ErrorCode::Success;
}

/**
 * @brief Check whether a caller may retry the failed operation later
 *
 * Retryable codes describe transient conditions (capacity, store outage,
 * contention) rather than a wrong request.
 */
[[nodiscard]] constexpr bool isRetryable(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Timeout:
        case ErrorCode::QuotaExceeded:
        case ErrorCode::StoreUnavailable:
        case ErrorCode::LockNotAcquired:
        case ErrorCode::NetworkError:
        case ErrorCode::ConnectionFailed:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Get human-readable error message
 * @param code The error code
 * @return Error message string
 */
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

/**
 * @brief Get error category name
 * @param category The error category
 * @return Category name string
 */
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for operations that can fail
 *
 * This is a discriminated union that holds either a value of type T
 * or an ErrorCode. Use this for error handling without exceptions.
 *
 * @tparam T The success value type
 *
 * @example
 * ```cpp
 * Result<GameArtifact> artifact = catalog.resolve("alice");
 * if (artifact.isFailure()) {
 *     GAMEBATTLE_LOG_WARNING(std::string(getErrorMessage(artifact.error())));
 * }
 * ```
 */
template<typename T>
class Result {
public:
    /// Default constructor creates a failed result
    Result() : m_data(ErrorCode::InternalError) {}

    /// Construct from success value
    Result(const T& value) : m_data(value) {}

    /// Construct from success value (move)
    Result(T&& value) : m_data(std::move(value)) {}

    /// Construct from error code
    Result(ErrorCode error) : m_data(error) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return std::holds_alternative<ErrorCode>(m_data);
    }

    /// True if success
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the success value (throws if failure)
    [[nodiscard]] T& value() & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (const, throws if failure)
    [[nodiscard]] const T& value() const & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (rvalue, throws if failure)
    [[nodiscard]] T&& value() && {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(std::move(m_data));
    }

    /// Get the error code (throws if success)
    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::runtime_error("Attempted to access error of successful Result");
        }
        return std::get<ErrorCode>(m_data);
    }

    /// Get value or default if failure
    [[nodiscard]] T valueOr(const T& defaultValue) const & {
        return isSuccess() ? std::get<T>(m_data) : defaultValue;
    }

    /// Get value or default if failure (move)
    [[nodiscard]] T valueOr(T&& defaultValue) && {
        return isSuccess() ? std::get<T>(std::move(m_data)) : std::move(defaultValue);
    }

    /// Get error or Success if no error
    [[nodiscard]] ErrorCode errorOr(ErrorCode defaultError = ErrorCode::Success) const noexcept {
        return isFailure() ? std::get<ErrorCode>(m_data) : defaultError;
    }

    /// Transform success value using a function
    template<typename F>
    [[nodiscard]] auto map(F&& func) const -> Result<decltype(func(std::declval<T>()))> {
        using U = decltype(func(std::declval<T>()));
        if (isSuccess()) {
            return Result<U>(func(std::get<T>(m_data)));
        }
        return Result<U>(std::get<ErrorCode>(m_data));
    }

    /// Chain with another Result-returning function
    template<typename F>
    [[nodiscard]] auto flatMap(F&& func) const -> decltype(func(std::declval<T>())) {
        using ResultType = decltype(func(std::declval<T>()));
        if (isSuccess()) {
            return func(std::get<T>(m_data));
        }
        return ResultType(std::get<ErrorCode>(m_data));
    }

private:
    std::variant<T, ErrorCode> m_data;
};

/**
 * @brief Specialization of Result for void (no return value)
 */
template<>
class Result<void> {
public:
    /// Construct success result
    Result() : m_error(ErrorCode::Success) {}

    /// Construct from error code
    Result(ErrorCode error) : m_error(error) {}

    /// Create success result
    [[nodiscard]] static Result Success() {
        return Result();
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return m_error == ErrorCode::Success;
    }

    [[nodiscard]] bool isFailure() const noexcept {
        return m_error != ErrorCode::Success;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the error code
    [[nodiscard]] ErrorCode error() const noexcept {
        return m_error;
    }

    /// Get error or Success if no error
    [[nodiscard]] ErrorCode errorOr(ErrorCode defaultError = ErrorCode::Success) const noexcept {
        return isFailure() ? m_error : defaultError;
    }

private:
    ErrorCode m_error;
};

/// Alias for Result<void>
using VoidResult = Result<void>;

// ============================================================================
// Convenience Macros
// ============================================================================

/**
 * @brief Return early if result is failure
 *
 * Usage:
 * ```cpp
 * GAMEBATTLE_TRY(store.remove(key));
 * ```
 */
#define GAMEBATTLE_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

/**
 * @brief Declare a variable from a Result or return early on failure
 *
 * Usage:
 * ```cpp
 * GAMEBATTLE_TRY_ASSIGN(artifact, catalog.resolve(gameId));
 * ```
 */
#define GAMEBATTLE_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (_result_##var.isFailure()) return _result_##var.error(); \
    auto var = std::move(_result_##var).value()

} // namespace Gamebattle

#endif // GAMEBATTLE_CORE_ERROR_CODES_HPP
