/**
 * @file Encoding.cpp
 * @brief Hex and base64 encoding
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Base64 carries raw terminal bytes inside JSON frames and stored reports.
 */

#include <Gamebattle/Core/Crypto.hpp>
#include <openssl/evp.h>

namespace Gamebattle::Crypto {

std::string toBase64(ByteSpan data) {
    if (data.empty()) {
        return "";
    }

    std::string result(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(result.data()),
                                  data.data(), static_cast<int>(data.size()));
    result.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return result;
}

Result<ByteBuffer> fromBase64(const std::string& base64) {
    if (base64.empty()) {
        return ByteBuffer{};
    }
    if (base64.size() % 4 != 0) {
        return ErrorCode::InvalidFormat;
    }

    ByteBuffer buffer(3 * (base64.size() / 4));
    int decoded = EVP_DecodeBlock(buffer.data(),
                                  reinterpret_cast<const unsigned char*>(base64.data()),
                                  static_cast<int>(base64.size()));
    if (decoded < 0) {
        return ErrorCode::InvalidFormat;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (base64[base64.size() - 1] == '=') ++padding;
    if (base64[base64.size() - 2] == '=') ++padding;
    buffer.resize(static_cast<size_t>(decoded) - padding);
    return buffer;
}

std::string toHex(ByteSpan data) {
    static const char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);

    for (Byte b : data) {
        result.push_back(hexChars[(b >> 4) & 0x0F]);
        result.push_back(hexChars[b & 0x0F]);
    }

    return result;
}

} // namespace Gamebattle::Crypto
