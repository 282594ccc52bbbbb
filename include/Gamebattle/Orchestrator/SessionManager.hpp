/**
 * @file SessionManager.hpp
 * @brief Session lifecycle, ownership and per-user admission
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Lifecycle: starting -> running -> terminating -> terminated, then evicted
 * after the retention window.
 *
 * Each session has one supervisor thread that performs termination exactly
 * once: wait for the sandbox, close the bridge, release the store slot,
 * then hand the outcome to the competition engine. Every trigger (owner or
 * admin stop, crash, limit, disconnect grace, shutdown) only asks the
 * sandbox to stop and lets the supervisor converge.
 */

#pragma once

#ifndef GAMEBATTLE_ORCHESTRATOR_SESSION_MANAGER_HPP
#define GAMEBATTLE_ORCHESTRATOR_SESSION_MANAGER_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <Gamebattle/Orchestrator/CompetitionEngine.hpp>
#include <Gamebattle/Orchestrator/GameCatalog.hpp>
#include <Gamebattle/Orchestrator/IoBridge.hpp>
#include <Gamebattle/Orchestrator/OrchestratorConfig.hpp>
#include <Gamebattle/Orchestrator/SandboxController.hpp>
#include <Gamebattle/Orchestrator/StateStore.hpp>
#include <memory>
#include <optional>
#include <vector>

namespace Gamebattle::Orchestrator {

enum class SessionState {
    Starting,
    Running,
    Terminating,
    Terminated
};

const char* toString(SessionState state) noexcept;

/**
 * @brief Point-in-time view of a session
 */
struct SessionSummary {
    SessionId sessionId;
    UserId userId;
    GameId gameId;
    std::string gameName;
    SessionState state = SessionState::Starting;
    int64_t startedAt = 0;      ///< Epoch milliseconds
    int64_t lastActivity = 0;   ///< Epoch milliseconds
    bool attached = false;
    std::optional<EndReason> endReason;
    std::optional<ExitOutcome> outcome;
};

/**
 * @brief Result of createOrAttach
 */
struct SessionHandle {
    SessionId sessionId;
    GameId gameId;
    bool reattached = false;   ///< An existing live session was returned
};

class SessionManager {
public:
    SessionManager(std::shared_ptr<const OrchestratorConfig> config,
                   std::shared_ptr<const GameCatalog> catalog,
                   std::shared_ptr<SandboxController> sandboxes,
                   std::shared_ptr<StateStore> store,
                   std::shared_ptr<CompetitionEngine> competition);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Start the reaper
    void start();

    /// Terminate every live session and wait for them
    void shutdown();

    /**
     * @brief Return the caller's live session for the game or start a new one
     * @param client Optional client to attach right away
     * @return Handle, or ArtifactNotFound, ConcurrencyLimitExceeded,
     *         QuotaExceeded, LaunchFailed, StoreUnavailable
     */
    Result<SessionHandle> createOrAttach(const Identity& identity, const GameId& gameId,
                                         std::shared_ptr<ClientConnection> client = nullptr);

    /**
     * @brief Attach a client, replacing the current one
     * @return SessionNotFound, Forbidden (neither owner nor admin), SessionTerminated
     */
    Result<void> attachClient(const SessionId& sessionId, const Identity& identity,
                              std::shared_ptr<ClientConnection> client);

    /**
     * @brief Stop a session; idempotent once terminating
     * @return SessionNotFound or Forbidden
     */
    Result<void> terminate(const SessionId& sessionId, const Identity& identity);

    /**
     * @brief Stop a session and start a fresh one of the same game
     *
     * The new session belongs to the owner of the old one, even when an
     * admin asks. Works on sessions that already ended while retained.
     * @return Handle of the new session, SessionNotFound, Forbidden, Timeout,
     *         or any createOrAttach error
     */
    Result<SessionHandle> restart(const SessionId& sessionId, const Identity& identity);

    /// Live sessions; admins see all, others their own
    std::vector<SessionSummary> listActive(const Identity& identity) const;

    /// One session, including terminated ones still retained
    Result<SessionSummary> getSession(const SessionId& sessionId, const Identity& identity) const;

    /// Recent output of a session (owner or admin)
    Result<ByteBuffer> capturedOutput(const SessionId& sessionId, const Identity& identity) const;

    /**
     * @brief Block until a session is terminated
     * @return Final summary, SessionNotFound, or Timeout
     */
    Result<SessionSummary> awaitTerminated(const SessionId& sessionId, Milliseconds timeout) const;

    /// Sessions not yet terminated
    [[nodiscard]] size_t activeCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Gamebattle::Orchestrator

#endif // GAMEBATTLE_ORCHESTRATOR_SESSION_MANAGER_HPP
