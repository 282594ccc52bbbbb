/**
 * @file StreamConnection.cpp
 * @brief NDJSON frame queue between the bridge and an HTTP response
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/StreamConnection.hpp>
#include <Gamebattle/Core/Crypto.hpp>
#include <nlohmann/json.hpp>

namespace Gamebattle::Orchestrator {

using json = nlohmann::json;

std::string encodeFrame(const Frame& frame) {
    json doc;
    switch (frame.type) {
        case Frame::Type::Output:
            doc["type"] = "stdout";
            doc["data"] = Crypto::toBase64(frame.data);
            break;
        case Frame::Type::Dropped:
            doc["type"] = "dropped";
            doc["count"] = frame.dropped;
            break;
        case Frame::Type::EndOfInput:
            doc["type"] = "end_of_input";
            break;
        case Frame::Type::EndOfSession:
            doc["type"] = "bye";
            doc["reason"] = toString(frame.reason);
            break;
    }
    return doc.dump() + "\n";
}

StreamConnection::StreamConnection(size_t maxPendingBytes)
    : m_maxPendingBytes(maxPendingBytes) {
}

Result<void> StreamConnection::send(const Frame& frame, Milliseconds timeout) {
    std::string line = encodeFrame(frame);

    std::unique_lock<std::mutex> lock(m_mutex);
    bool ready = m_cv.wait_for(lock, timeout, [this] {
        return m_closed || m_outbound.empty() || m_pendingBytes < m_maxPendingBytes;
    });
    if (m_closed) {
        return ErrorCode::ClientDisconnected;
    }
    if (!ready) {
        return ErrorCode::Timeout;
    }

    m_pendingBytes += line.size();
    m_outbound.push_back(std::move(line));
    m_cv.notify_all();
    return Result<void>::Success();
}

Result<ByteBuffer> StreamConnection::receive(Milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return m_closed || !m_inbound.empty(); });
    if (m_gone || (m_closed && m_inbound.empty())) {
        return ErrorCode::ClientDisconnected;
    }
    if (m_inbound.empty()) {
        return ErrorCode::Timeout;
    }
    ByteBuffer data = std::move(m_inbound.front());
    m_inbound.pop_front();
    return data;
}

void StreamConnection::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

std::optional<std::string> StreamConnection::nextChunk(Milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return m_closed || !m_outbound.empty(); });
    if (m_outbound.empty()) {
        return std::nullopt;
    }
    std::string line = std::move(m_outbound.front());
    m_outbound.pop_front();
    m_pendingBytes -= line.size();
    m_cv.notify_all();
    return line;
}

bool StreamConnection::finished() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_gone || (m_closed && m_outbound.empty());
}

Result<void> StreamConnection::pushInput(ByteBuffer data) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return ErrorCode::ClientDisconnected;
        }
        m_inbound.push_back(std::move(data));
    }
    m_cv.notify_all();
    return Result<void>::Success();
}

void StreamConnection::markGone() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_gone = true;
        m_closed = true;
        m_outbound.clear();
        m_pendingBytes = 0;
        m_inbound.clear();
    }
    m_cv.notify_all();
}

} // namespace Gamebattle::Orchestrator
