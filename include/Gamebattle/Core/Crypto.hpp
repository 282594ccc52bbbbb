/**
 * @file Crypto.hpp
 * @brief Cryptographic helpers for the Gamebattle orchestrator
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Session identifiers, webhook signatures and binary-safe text encoding.
 */

#pragma once

#ifndef GAMEBATTLE_CORE_CRYPTO_HPP
#define GAMEBATTLE_CORE_CRYPTO_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <memory>
#include <string>

namespace Gamebattle::Crypto {

// ============================================================================
// Secure Random
// ============================================================================

/**
 * @brief Cryptographically secure random generator backed by /dev/urandom
 *
 * Thread-safe.
 */
class SecureRandom {
public:
    SecureRandom();
    ~SecureRandom();

    SecureRandom(const SecureRandom&) = delete;
    SecureRandom& operator=(const SecureRandom&) = delete;

    /**
     * @brief Fill a buffer with random bytes
     */
    Result<void> generate(Byte* buffer, size_t size);

    /**
     * @brief Allocate and fill a random buffer
     */
    Result<ByteBuffer> generate(size_t size);

    /**
     * @brief Generate an RFC 4122 version 4 UUID in canonical text form
     */
    Result<std::string> generateUuid();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// HMAC
// ============================================================================

/**
 * @brief HMAC-SHA256 message authentication
 */
class HMAC {
public:
    explicit HMAC(ByteSpan key);
    ~HMAC();

    HMAC(const HMAC&) = delete;
    HMAC& operator=(const HMAC&) = delete;

    /**
     * @brief Compute the MAC of data
     */
    Result<ByteBuffer> compute(ByteSpan data);

    /**
     * @brief Verify a MAC in constant time
     */
    Result<bool> verify(ByteSpan data, ByteSpan mac);

    /**
     * @brief One-shot HMAC-SHA256
     */
    static Result<ByteBuffer> sha256(ByteSpan key, ByteSpan data);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Encoding Utilities
// ============================================================================

/// Constant-time equality of two byte ranges
bool constantTimeCompare(ByteSpan a, ByteSpan b);

/// Lowercase hex encoding
std::string toHex(ByteSpan data);

/// Standard base64 with padding, no line breaks
std::string toBase64(ByteSpan data);

/// Decode standard base64; rejects malformed input
Result<ByteBuffer> fromBase64(const std::string& base64);

} // namespace Gamebattle::Crypto

#endif // GAMEBATTLE_CORE_CRYPTO_HPP
