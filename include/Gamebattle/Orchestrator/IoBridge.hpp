/**
 * @file IoBridge.hpp
 * @brief Relays bytes between a sandbox and a remote client
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Relay tasks per bridge:
 * - pump: sandbox output into a bounded buffer
 * - sender: buffer to the attached client (one per attachment)
 * - receiver: client input into a bounded inbound buffer (one per attachment)
 * - writer: inbound buffer to the sandbox input
 *
 * A sandbox that stops reading its input never blocks the receiver, so a
 * client going away or being replaced is always noticed.
 *
 * When the buffer is full while a client is attached, the pump waits up to
 * the stall timeout and then drops the oldest unsent bytes. The client is
 * told how many bytes were lost by a Dropped frame ahead of the next output.
 */

#pragma once

#ifndef GAMEBATTLE_ORCHESTRATOR_IO_BRIDGE_HPP
#define GAMEBATTLE_ORCHESTRATOR_IO_BRIDGE_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <Gamebattle/Orchestrator/Channel.hpp>
#include <Gamebattle/Orchestrator/OrchestratorConfig.hpp>
#include <functional>
#include <memory>
#include <optional>

namespace Gamebattle::Orchestrator {

/**
 * @brief Why a session's stream ended, as reported to the client
 */
enum class EndReason {
    NormalExit,
    Crash,
    LimitExceeded,
    AdminStop,
    StoppedByOwner,
    Disconnected,
    StoreFailure,
    Shutdown
};

/// Wire name: normal-exit, crash, limit, admin-stop, stopped, disconnected, ...
const char* toString(EndReason reason) noexcept;

/**
 * @brief Unit delivered to a client
 */
struct Frame {
    enum class Type {
        Output,        ///< Sandbox output bytes
        Dropped,       ///< Count of output bytes lost before the next output
        EndOfInput,    ///< Client input arrived after the sandbox closed its input
        EndOfSession   ///< Final frame with the end reason
    };

    Type type = Type::Output;
    ByteBuffer data;
    uint64_t dropped = 0;
    EndReason reason = EndReason::NormalExit;

    static Frame output(ByteBuffer bytes) {
        Frame f;
        f.type = Type::Output;
        f.data = std::move(bytes);
        return f;
    }

    static Frame droppedBytes(uint64_t count) {
        Frame f;
        f.type = Type::Dropped;
        f.dropped = count;
        return f;
    }

    static Frame endOfInput() {
        Frame f;
        f.type = Type::EndOfInput;
        return f;
    }

    static Frame endOfSession(EndReason why) {
        Frame f;
        f.type = Type::EndOfSession;
        f.reason = why;
        return f;
    }
};

/**
 * @brief Remote client endpoint as seen by the bridge
 */
class ClientConnection {
public:
    virtual ~ClientConnection() = default;

    /**
     * @brief Deliver a frame
     * @return Timeout if the client is not keeping up, ClientDisconnected once gone
     */
    virtual Result<void> send(const Frame& frame, Milliseconds timeout) = 0;

    /**
     * @brief Next chunk of client input
     * @return Timeout if nothing arrived, ClientDisconnected once gone
     */
    virtual Result<ByteBuffer> receive(Milliseconds timeout) = 0;

    /// Stop delivering frames; pending receive() calls fail with ClientDisconnected
    virtual void close() = 0;
};

/**
 * @brief Bidirectional relay for one session
 */
class IoBridge {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    struct Options {
        size_t bufferBytes = 64 * 1024;
        size_t replayCapacity = 256 * 1024;
        Milliseconds stallTimeout{2000};
        DetachedOutputPolicy detachedPolicy = DetachedOutputPolicy::ReplayBounded;
        Milliseconds pollInterval{50};
        /// Called from a relay thread when the client goes away. Must not call close().
        std::function<void()> onClientDetached;
    };

    struct Statistics {
        uint64_t bytesToClient = 0;
        uint64_t bytesToSandbox = 0;
        uint64_t droppedBytes = 0;
        uint64_t endOfInputFrames = 0;
        uint64_t attachments = 0;
    };

    explicit IoBridge(ConstructionKey);
    ~IoBridge();

    IoBridge(const IoBridge&) = delete;
    IoBridge& operator=(const IoBridge&) = delete;

    /// Bridge options from the orchestrator configuration
    static Options optionsFrom(const OrchestratorConfig& config);

    /**
     * @brief Start relaying
     * @param streams Sandbox streams from SandboxController::attachIO
     * @param client Initial client; may be null to start detached
     */
    static Result<std::unique_ptr<IoBridge>> open(SandboxStreams streams,
                                                  std::shared_ptr<ClientConnection> client,
                                                  Options options);

    /**
     * @brief Replace the client without touching the sandbox
     * @return BridgeClosed after close()
     */
    Result<void> attach(std::shared_ptr<ClientConnection> client);

    /**
     * @brief Flush, send EndOfSession and release both streams
     *
     * Idempotent; the first caller's reason is the one reported.
     */
    void close(EndReason reason);

    [[nodiscard]] bool isClosed() const;
    [[nodiscard]] bool isAttached() const;

    /// When the last client went away; nullopt while attached
    [[nodiscard]] std::optional<TimePoint> detachedSince() const;

    /// Last byte moved in either direction or last attach
    [[nodiscard]] TimePoint lastActivity() const;

    /// Most recent output, bounded by the replay capacity
    [[nodiscard]] ByteBuffer snapshotOutput() const;

    [[nodiscard]] Statistics stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Gamebattle::Orchestrator

#endif // GAMEBATTLE_ORCHESTRATOR_IO_BRIDGE_HPP
