/**
 * @file StreamConnection.hpp
 * @brief ClientConnection over a streamed HTTP response and input posts
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Frames are encoded as newline-delimited JSON:
 *   {"type":"stdout","data":"<base64>"}
 *   {"type":"dropped","count":N}
 *   {"type":"end_of_input"}
 *   {"type":"bye","reason":"normal-exit"}
 */

#pragma once

#ifndef GAMEBATTLE_ORCHESTRATOR_STREAM_CONNECTION_HPP
#define GAMEBATTLE_ORCHESTRATOR_STREAM_CONNECTION_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <Gamebattle/Orchestrator/IoBridge.hpp>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace Gamebattle::Orchestrator {

/// One NDJSON line, newline included
std::string encodeFrame(const Frame& frame);

class StreamConnection : public ClientConnection {
public:
    /// @param maxPendingBytes Encoded bytes queued before send() blocks
    explicit StreamConnection(size_t maxPendingBytes = 256 * 1024);

    // ClientConnection
    Result<void> send(const Frame& frame, Milliseconds timeout) override;
    Result<ByteBuffer> receive(Milliseconds timeout) override;
    void close() override;

    /**
     * @brief Next encoded line for the HTTP response
     * @return Line, or nullopt on timeout or once finished()
     */
    std::optional<std::string> nextChunk(Milliseconds timeout);

    /// Closed and every queued line handed out
    [[nodiscard]] bool finished() const;

    /**
     * @brief Queue client input
     * @return ClientDisconnected once closed
     */
    Result<void> pushInput(ByteBuffer data);

    /// The HTTP peer went away
    void markGone();

private:
    const size_t m_maxPendingBytes;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::string> m_outbound;
    size_t m_pendingBytes = 0;
    std::deque<ByteBuffer> m_inbound;
    bool m_closed = false;
    bool m_gone = false;
};

} // namespace Gamebattle::Orchestrator

#endif // GAMEBATTLE_ORCHESTRATOR_STREAM_CONNECTION_HPP
