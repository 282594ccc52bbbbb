/**
 * @file SecureRandom.cpp
 * @brief Cryptographically secure random number generator implementation
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Reads /dev/urandom with retry on EINTR.
 */

#include <Gamebattle/Core/Crypto.hpp>

#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstdio>
#include <mutex>

namespace Gamebattle::Crypto {

// ============================================================================
// SecureRandom::Impl
// ============================================================================

class SecureRandom::Impl {
public:
    Impl() {
        m_fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    }

    ~Impl() {
        if (m_fd >= 0) {
            close(m_fd);
        }
    }

    Result<void> generate(Byte* buffer, size_t size) {
        if (buffer == nullptr && size > 0) {
            return ErrorCode::InvalidArgument;
        }
        if (size == 0) {
            return Result<void>::Success();
        }
        if (m_fd < 0) {
            return ErrorCode::RandomGenerationFailed;
        }

        std::lock_guard<std::mutex> lock(m_mutex);

        size_t total = 0;
        while (total < size) {
            ssize_t n = read(m_fd, buffer + total, size - total);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return ErrorCode::RandomGenerationFailed;
            }
            if (n == 0) {
                return ErrorCode::RandomGenerationFailed;
            }
            total += static_cast<size_t>(n);
        }

        return Result<void>::Success();
    }

private:
    int m_fd = -1;
    std::mutex m_mutex;
};

// ============================================================================
// SecureRandom - Public API
// ============================================================================

SecureRandom::SecureRandom()
    : m_impl(std::make_unique<Impl>()) {
}

SecureRandom::~SecureRandom() = default;

Result<void> SecureRandom::generate(Byte* buffer, size_t size) {
    return m_impl->generate(buffer, size);
}

Result<ByteBuffer> SecureRandom::generate(size_t size) {
    ByteBuffer buffer(size);
    auto result = m_impl->generate(buffer.data(), size);
    if (result.isFailure()) {
        return result.error();
    }
    return buffer;
}

Result<std::string> SecureRandom::generateUuid() {
    Byte bytes[16];
    auto result = m_impl->generate(bytes, sizeof(bytes));
    if (result.isFailure()) {
        return result.error();
    }

    bytes[6] = static_cast<Byte>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<Byte>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    char text[37];
    std::snprintf(text, sizeof(text),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                  bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                  bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(text, 36);
}

} // namespace Gamebattle::Crypto
