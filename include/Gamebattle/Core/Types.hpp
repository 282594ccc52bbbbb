/**
 * @file Types.hpp
 * @brief Core type definitions for the Gamebattle orchestrator
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Fundamental types shared by every orchestrator component.
 */

#pragma once

#ifndef GAMEBATTLE_CORE_TYPES_HPP
#define GAMEBATTLE_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <chrono>
#include <memory>
#include <functional>

namespace Gamebattle {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 1;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

// ============================================================================
// Basic Types
// ============================================================================

/// Byte type for raw stream data
using Byte = uint8_t;

/// Non-owning view of immutable bytes
using ByteSpan = std::span<const Byte>;

/// Non-owning view of mutable bytes
using MutableByteSpan = std::span<Byte>;

/// Owned byte buffer
using ByteBuffer = std::vector<Byte>;

// ============================================================================
// Time Types
// ============================================================================

/// Monotonic clock used for deadlines and durations
using Clock = std::chrono::steady_clock;

/// Monotonic time point
using TimePoint = Clock::time_point;

/// Wall clock used for persisted timestamps
using WallClock = std::chrono::system_clock;

/// Nanosecond duration
using Nanoseconds = std::chrono::nanoseconds;

/// Millisecond duration
using Milliseconds = std::chrono::milliseconds;

/// Second duration
using Seconds = std::chrono::seconds;

/**
 * @brief Current wall-clock time in milliseconds since the Unix epoch
 */
inline int64_t nowEpochMillis() {
    return std::chrono::duration_cast<Milliseconds>(
        WallClock::now().time_since_epoch()).count();
}

// ============================================================================
// Identity Types
// ============================================================================

/// Opaque user identifier supplied by the access gate
using UserId = std::string;

/// Session identifier (UUID v4 text form)
using SessionId = std::string;

/// Game identifier (catalog key)
using GameId = std::string;

/**
 * @brief Caller identity as established by the access gate
 */
struct Identity {
    UserId userId;          ///< Verified user identifier
    bool isAdmin = false;   ///< Member of the admin allow-list
};

// ============================================================================
// Conversion Helpers
// ============================================================================

/// View a string as bytes
inline ByteSpan asBytes(std::string_view text) {
    return ByteSpan(reinterpret_cast<const Byte*>(text.data()), text.size());
}

/// Copy bytes into a string
inline std::string toString(ByteSpan bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique pointer alias
template<typename T>
using UniquePtr = std::unique_ptr<T>;

/// Shared pointer alias
template<typename T>
using SharedPtr = std::shared_ptr<T>;

} // namespace Gamebattle

#endif // GAMEBATTLE_CORE_TYPES_HPP
