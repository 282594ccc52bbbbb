/**
 * @file HMAC.cpp
 * @brief HMAC-SHA256 implementation
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Signs outbound webhook payloads so receivers can authenticate them.
 */

#include <Gamebattle/Core/Crypto.hpp>
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <climits>

namespace Gamebattle::Crypto {

// ============================================================================
// HMAC::Impl
// ============================================================================

class HMAC::Impl {
public:
    explicit Impl(ByteSpan key)
        : m_key(key.begin(), key.end()) {
    }

    Result<ByteBuffer> compute(ByteSpan data) {
        // Longer keys are hashed by HMAC anyway; this bounds the int cast below
        constexpr size_t MAX_REASONABLE_KEY_SIZE = 2048;
        if (m_key.size() > MAX_REASONABLE_KEY_SIZE) {
            return ErrorCode::InvalidKey;
        }

        unsigned int len = 0;
        ByteBuffer result(EVP_MAX_MD_SIZE);

        unsigned char* digest = ::HMAC(
            EVP_sha256(),
            m_key.data(),
            static_cast<int>(m_key.size()),
            data.data(),
            data.size(),
            result.data(),
            &len
        );

        if (digest == nullptr) {
            return ErrorCode::CryptoError;
        }

        result.resize(len);
        return result;
    }

    Result<bool> verify(ByteSpan data, ByteSpan mac) {
        auto computed = compute(data);
        if (computed.isFailure()) {
            return computed.error();
        }
        return constantTimeCompare(computed.value(), mac);
    }

private:
    ByteBuffer m_key;
};

// ============================================================================
// HMAC - Public API
// ============================================================================

HMAC::HMAC(ByteSpan key)
    : m_impl(std::make_unique<Impl>(key)) {
}

HMAC::~HMAC() = default;

Result<ByteBuffer> HMAC::compute(ByteSpan data) {
    return m_impl->compute(data);
}

Result<bool> HMAC::verify(ByteSpan data, ByteSpan mac) {
    return m_impl->verify(data, mac);
}

Result<ByteBuffer> HMAC::sha256(ByteSpan key, ByteSpan data) {
    HMAC hmac(key);
    return hmac.compute(data);
}

bool constantTimeCompare(ByteSpan a, ByteSpan b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace Gamebattle::Crypto
