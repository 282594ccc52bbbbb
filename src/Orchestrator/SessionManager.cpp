/**
 * @file SessionManager.cpp
 * @brief Session admission, supervision and reaping
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/SessionManager.hpp>
#include <Gamebattle/Core/Crypto.hpp>
#include <Gamebattle/Core/Logger.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace Gamebattle::Orchestrator {

using json = nlohmann::json;

const char* toString(SessionState state) noexcept {
    switch (state) {
        case SessionState::Starting:    return "starting";
        case SessionState::Running:     return "running";
        case SessionState::Terminating: return "terminating";
        case SessionState::Terminated:  return "terminated";
    }
    return "unknown";
}

namespace {

constexpr int kIdAttempts = 3;
constexpr int kReleaseAttempts = 3;

std::string sessionKey(const SessionId& sessionId) {
    return "session:" + sessionId;
}

std::string userListKey(const UserId& userId) {
    return "user:" + userId + ":sessions";
}

std::string userLockName(const UserId& userId) {
    return "user:" + userId;
}

std::vector<SessionId> parseSessionList(const std::optional<std::string>& raw) {
    std::vector<SessionId> ids;
    if (!raw) {
        return ids;
    }
    try {
        for (const auto& item : json::parse(*raw)) {
            ids.push_back(item.get<std::string>());
        }
    } catch (const json::exception& e) {
        GAMEBATTLE_LOG_ERROR_F("Corrupt session list, treating as empty: %s", e.what());
        ids.clear();
    }
    return ids;
}

EndReason endReasonFor(const ExitOutcome& outcome) {
    if (outcome.killedByLimit()) {
        return EndReason::LimitExceeded;
    }
    if (auto* killed = std::get_if<ExitOutcome::Killed>(&outcome.status)) {
        switch (killed->reason) {
            case KillReason::AdminForced:       return EndReason::AdminStop;
            case KillReason::StopRequested:     return EndReason::StoppedByOwner;
            case KillReason::OwnerDisconnected: return EndReason::Disconnected;
            case KillReason::StoreFailure:      return EndReason::StoreFailure;
            case KillReason::Shutdown:          return EndReason::Shutdown;
            case KillReason::LimitExceeded:     return EndReason::LimitExceeded;
        }
    }
    if (outcome.crashed()) {
        return EndReason::Crash;
    }
    return EndReason::NormalExit;
}

/// Store failures during admission surface as the retryable StoreUnavailable
ErrorCode admissionError(ErrorCode code) {
    if (code == ErrorCode::ConcurrencyLimitExceeded) {
        return code;
    }
    return ErrorCode::StoreUnavailable;
}

} // namespace

// ============================================================================
// SessionManager::Impl
// ============================================================================

class SessionManager::Impl {
public:
    struct Session {
        SessionId id;
        UserId userId;
        GameId gameId;
        std::string gameName;
        SessionState state = SessionState::Starting;
        int64_t startedAt = 0;

        SandboxHandle sandbox;
        std::unique_ptr<IoBridge> bridge;
        std::shared_ptr<ClientConnection> pendingClient;

        std::optional<KillReason> stopReason;
        std::optional<EndReason> endReason;
        std::optional<ExitOutcome> outcome;
        std::optional<TimePoint> terminatedAt;

        std::thread supervisor;
    };

    Impl(std::shared_ptr<const OrchestratorConfig> config,
         std::shared_ptr<const GameCatalog> catalog,
         std::shared_ptr<SandboxController> sandboxes,
         std::shared_ptr<StateStore> store,
         std::shared_ptr<CompetitionEngine> competition)
        : m_config(std::move(config))
        , m_catalog(std::move(catalog))
        , m_sandboxes(std::move(sandboxes))
        , m_store(std::move(store))
        , m_competition(std::move(competition)) {
    }

    // ------------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------------

    void start() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_reaperRunning || m_shuttingDown) {
            return;
        }
        m_reaperRunning = true;
        m_reaper = std::thread(&Impl::reaperLoop, this);
    }

    void shutdown() {
        std::vector<SandboxHandle> toStop;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_shuttingDown) {
                return;
            }
            m_shuttingDown = true;
            m_reaperRunning = false;
            for (auto& [id, session] : m_sessions) {
                if (session->state == SessionState::Terminated) {
                    continue;
                }
                if (!session->stopReason) {
                    session->stopReason = KillReason::Shutdown;
                }
                session->state = SessionState::Terminating;
                if (session->sandbox.valid()) {
                    toStop.push_back(session->sandbox);
                }
            }
        }
        m_cv.notify_all();
        if (m_reaper.joinable()) {
            m_reaper.join();
        }

        GAMEBATTLE_LOG_INFO_F("Shutting down %zu live sessions", toStop.size());
        for (const auto& handle : toStop) {
            signalSandbox(handle, KillReason::Shutdown);
        }

        std::vector<std::shared_ptr<Session>> all;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return std::all_of(m_sessions.begin(), m_sessions.end(), [](const auto& item) {
                    return item.second->state == SessionState::Terminated;
                });
            });
            for (auto& [id, session] : m_sessions) {
                all.push_back(session);
            }
        }
        for (auto& session : all) {
            if (session->supervisor.joinable()) {
                session->supervisor.join();
            }
        }
    }

    // ------------------------------------------------------------------------
    // Admission
    // ------------------------------------------------------------------------

    Result<SessionHandle> createOrAttach(const Identity& identity, const GameId& gameId,
                                         std::shared_ptr<ClientConnection> client) {
        if (identity.userId.empty()) {
            return ErrorCode::Unauthenticated;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_shuttingDown) {
                return ErrorCode::InvalidState;
            }
        }

        GAMEBATTLE_TRY_ASSIGN(artifact, m_catalog->resolve(gameId));

        if (auto existing = reattachExisting(identity.userId, gameId, client)) {
            return *existing;
        }

        auto admitted = admit(identity.userId, artifact);
        if (admitted.isFailure()) {
            return admitted.error();
        }
        std::shared_ptr<Session> session = admitted.value();
        if (!session) {
            // A concurrent request for the same game won the race
            if (auto existing = reattachExisting(identity.userId, gameId, client)) {
                return *existing;
            }
            return ErrorCode::InvalidState;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (client) {
                session->pendingClient = client;
            }
        }

        auto launched = launch(session);
        if (launched.isFailure()) {
            rollback(session);
            return launched.error();
        }

        GAMEBATTLE_LOG_INFO_F("Session %s started: user %s, game %s", session->id.c_str(),
                              session->userId.c_str(), session->gameId.c_str());
        return SessionHandle{session->id, session->gameId, false};
    }

    // ------------------------------------------------------------------------
    // Client operations
    // ------------------------------------------------------------------------

    Result<void> attachClient(const SessionId& sessionId, const Identity& identity,
                              std::shared_ptr<ClientConnection> client) {
        if (!client) {
            return ErrorCode::InvalidArgument;
        }
        std::shared_ptr<Session> session;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto found = lookup(sessionId, identity);
            if (found.isFailure()) {
                return found.error();
            }
            session = found.value();
            if (session->state == SessionState::Terminating || session->state == SessionState::Terminated) {
                return ErrorCode::SessionTerminated;
            }
            if (!session->bridge) {
                session->pendingClient = client;
                return Result<void>::Success();
            }
        }

        auto attached = session->bridge->attach(client);
        if (attached.isFailure()) {
            return ErrorCode::SessionTerminated;
        }
        GAMEBATTLE_LOG_INFO_F("Client attached to session %s by %s", sessionId.c_str(),
                              identity.userId.c_str());
        return Result<void>::Success();
    }

    Result<void> terminate(const SessionId& sessionId, const Identity& identity) {
        SandboxHandle handle;
        KillReason reason;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto found = lookup(sessionId, identity);
            if (found.isFailure()) {
                return found.error();
            }
            auto& session = found.value();
            if (session->state == SessionState::Terminating || session->state == SessionState::Terminated ||
                session->stopReason) {
                return Result<void>::Success();
            }
            reason = (identity.isAdmin && identity.userId != session->userId)
                         ? KillReason::AdminForced
                         : KillReason::StopRequested;
            session->stopReason = reason;
            session->state = SessionState::Terminating;
            handle = session->sandbox;
        }

        GAMEBATTLE_LOG_INFO_F("Session %s stop requested by %s (%s)", sessionId.c_str(),
                              identity.userId.c_str(), toString(reason));
        if (handle.valid()) {
            signalSandbox(handle, reason);
        }
        return Result<void>::Success();
    }

    Result<SessionHandle> restart(const SessionId& sessionId, const Identity& identity) {
        Identity owner;
        GameId gameId;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            GAMEBATTLE_TRY_ASSIGN(session, lookup(sessionId, identity));
            owner = Identity{session->userId, false};
            gameId = session->gameId;
        }

        GAMEBATTLE_TRY(terminate(sessionId, identity));
        // Graceful stop, forced kill, bridge flush and slot release
        const Milliseconds bound = m_config->stopGrace * 2 + m_config->stallTimeout * 4 + m_config->launchTimeout;
        GAMEBATTLE_TRY(awaitTerminated(sessionId, bound));

        GAMEBATTLE_LOG_INFO_F("Restarting game %s for %s (was session %s)", gameId.c_str(),
                              owner.userId.c_str(), sessionId.c_str());
        return createOrAttach(owner, gameId, nullptr);
    }

    std::vector<SessionSummary> listActive(const Identity& identity) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<SessionSummary> out;
        for (const auto& [id, session] : m_sessions) {
            if (session->state == SessionState::Terminated) {
                continue;
            }
            if (!identity.isAdmin && session->userId != identity.userId) {
                continue;
            }
            out.push_back(summarize(*session));
        }
        return out;
    }

    Result<SessionSummary> getSession(const SessionId& sessionId, const Identity& identity) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        GAMEBATTLE_TRY_ASSIGN(session, lookup(sessionId, identity));
        return summarize(*session);
    }

    Result<ByteBuffer> capturedOutput(const SessionId& sessionId, const Identity& identity) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        GAMEBATTLE_TRY_ASSIGN(session, lookup(sessionId, identity));
        if (!session->bridge) {
            return ByteBuffer();
        }
        return session->bridge->snapshotOutput();
    }

    Result<SessionSummary> awaitTerminated(const SessionId& sessionId, Milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(sessionId);
        if (it == m_sessions.end()) {
            return ErrorCode::SessionNotFound;
        }
        auto session = it->second;
        if (!m_cv.wait_for(lock, timeout, [&] { return session->state == SessionState::Terminated; })) {
            return ErrorCode::Timeout;
        }
        return summarize(*session);
    }

    size_t activeCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_t>(std::count_if(m_sessions.begin(), m_sessions.end(), [](const auto& item) {
            return item.second->state != SessionState::Terminated;
        }));
    }

private:
    // ------------------------------------------------------------------------
    // Helpers (m_mutex held unless noted)
    // ------------------------------------------------------------------------

    Result<std::shared_ptr<Session>> lookup(const SessionId& sessionId, const Identity& identity) const {
        auto it = m_sessions.find(sessionId);
        if (it == m_sessions.end()) {
            return ErrorCode::SessionNotFound;
        }
        if (!identity.isAdmin && it->second->userId != identity.userId) {
            return ErrorCode::Forbidden;
        }
        return it->second;
    }

    std::shared_ptr<Session> findLive(const UserId& userId, const GameId& gameId) const {
        for (const auto& [id, session] : m_sessions) {
            if (session->userId == userId && session->gameId == gameId && !session->stopReason &&
                (session->state == SessionState::Starting || session->state == SessionState::Running)) {
                return session;
            }
        }
        return nullptr;
    }

    SessionSummary summarize(const Session& session) const {
        SessionSummary summary;
        summary.sessionId = session.id;
        summary.userId = session.userId;
        summary.gameId = session.gameId;
        summary.gameName = session.gameName;
        summary.state = session.state;
        summary.startedAt = session.startedAt;
        summary.lastActivity = session.startedAt;
        summary.endReason = session.endReason;
        summary.outcome = session.outcome;
        if (session.bridge) {
            auto idle = std::chrono::duration_cast<Milliseconds>(Clock::now() - session.bridge->lastActivity());
            summary.lastActivity = nowEpochMillis() - idle.count();
            summary.attached = session.bridge->isAttached();
        }
        return summary;
    }

    /// Caller does not hold m_mutex
    std::optional<SessionHandle> reattachExisting(const UserId& userId, const GameId& gameId,
                                                  std::shared_ptr<ClientConnection> client) {
        std::shared_ptr<Session> existing;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            existing = findLive(userId, gameId);
            if (!existing) {
                return std::nullopt;
            }
            if (client && !existing->bridge) {
                existing->pendingClient = client;
                client.reset();
            }
        }
        if (client) {
            auto attached = existing->bridge->attach(client);
            if (attached.isFailure()) {
                GAMEBATTLE_LOG_WARNING_F("Re-attach to session %s failed", existing->id.c_str());
            }
        }
        GAMEBATTLE_LOG_INFO_F("Returning live session %s to %s", existing->id.c_str(), userId.c_str());
        return SessionHandle{existing->id, existing->gameId, true};
    }

    /**
     * Claims a slot in the user's session list under the store lock and
     * registers a Starting session. Returns null when a live session for the
     * same game appeared while waiting for the lock. Caller does not hold m_mutex.
     */
    Result<std::shared_ptr<Session>> admit(const UserId& userId, const GameArtifact& artifact) {
        auto lease = m_store->acquireLock(userLockName(userId), m_config->lockLease, m_config->lockWait);
        if (lease.isFailure()) {
            GAMEBATTLE_LOG_WARNING_F("Admission lock for %s unavailable: %s", userId.c_str(),
                                     getErrorMessage(lease.error()).data());
            return ErrorCode::StoreUnavailable;
        }
        ScopedLock guard(*m_store, lease.value());

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (findLive(userId, artifact.id)) {
                return std::shared_ptr<Session>();
            }
        }

        const std::string listKey = userListKey(userId);
        auto current = m_store->get(listKey);
        if (current.isFailure()) {
            return admissionError(current.error());
        }

        // Drop ids whose session record has expired or was removed
        std::vector<SessionId> live;
        for (const auto& sid : parseSessionList(current.value())) {
            auto record = m_store->get(sessionKey(sid));
            if (record.isFailure()) {
                return admissionError(record.error());
            }
            if (record.value()) {
                live.push_back(sid);
            }
        }

        if (live.size() >= m_config->maxSessionsPerUser) {
            GAMEBATTLE_LOG_INFO_F("User %s is at the session limit (%zu)", userId.c_str(),
                                  m_config->maxSessionsPerUser);
            return ErrorCode::ConcurrencyLimitExceeded;
        }

        auto session = std::make_shared<Session>();
        session->userId = userId;
        session->gameId = artifact.id;
        session->gameName = artifact.name;
        session->startedAt = nowEpochMillis();

        Milliseconds recordTtl = std::chrono::duration_cast<Milliseconds>(m_config->limits.wallClock) +
                                 m_config->retention + m_config->lockLease;

        bool claimed = false;
        for (int attempt = 0; attempt < kIdAttempts && !claimed; ++attempt) {
            auto sid = m_random.generateUuid();
            if (sid.isFailure()) {
                return ErrorCode::InternalError;
            }
            session->id = sid.value();

            json record = {
                {"sessionId", session->id},
                {"userId", userId},
                {"gameId", artifact.id},
                {"startedAt", session->startedAt},
            };
            auto created = m_store->compareAndSet(sessionKey(session->id), std::nullopt, record.dump(), recordTtl);
            if (created.isSuccess()) {
                claimed = true;
            } else if (created.error() != ErrorCode::ConditionFailed) {
                return admissionError(created.error());
            }
        }
        if (!claimed) {
            GAMEBATTLE_LOG_ERROR("Could not claim a unique session id");
            return ErrorCode::InternalError;
        }

        live.push_back(session->id);
        auto listed = m_store->compareAndSet(listKey, current.value(), json(live).dump());
        if (listed.isFailure()) {
            auto removed = m_store->remove(sessionKey(session->id));
            if (removed.isFailure()) {
                GAMEBATTLE_LOG_WARNING_F("Orphaned session record %s left to expire", session->id.c_str());
            }
            return admissionError(listed.error());
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_sessions.emplace(session->id, session);
        return session;
    }

    /// Start the sandbox, open the bridge and hand over to the supervisor
    Result<void> launch(const std::shared_ptr<Session>& session) {
        GAMEBATTLE_TRY_ASSIGN(handle, m_sandboxes->start(session->gameId, m_config->limits));

        auto streams = m_sandboxes->attachIO(handle);
        if (streams.isFailure()) {
            discardSandbox(handle);
            return ErrorCode::LaunchFailed;
        }

        IoBridge::Options options = IoBridge::optionsFrom(*m_config);
        options.onClientDetached = [this] { m_cv.notify_all(); };

        std::shared_ptr<ClientConnection> client;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            client = std::move(session->pendingClient);
        }

        auto bridge = IoBridge::open(std::move(streams).value(), client, options);
        if (bridge.isFailure()) {
            discardSandbox(handle);
            return ErrorCode::LaunchFailed;
        }

        std::shared_ptr<ClientConnection> lateClient;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            session->sandbox = handle;
            session->bridge = std::move(bridge).value();
            lateClient = std::move(session->pendingClient);
            if (m_shuttingDown && !session->stopReason) {
                session->stopReason = KillReason::Shutdown;
            }
            // A stop requested while starting already moved the session on
            session->state = session->stopReason ? SessionState::Terminating : SessionState::Running;
            session->supervisor = std::thread(&Impl::supervise, this, session);
        }
        m_cv.notify_all();

        if (lateClient) {
            auto attached = session->bridge->attach(lateClient);
            if (attached.isFailure()) {
                GAMEBATTLE_LOG_DEBUG_F("Late client for %s not attached", session->id.c_str());
            }
        }
        return Result<void>::Success();
    }

    void discardSandbox(const SandboxHandle& handle) {
        signalSandbox(handle, KillReason::Shutdown);
        auto outcome = m_sandboxes->wait(handle, m_config->stopGrace + m_config->launchTimeout);
        if (outcome.isFailure()) {
            GAMEBATTLE_LOG_WARNING("Discarded sandbox did not report an outcome");
        }
        m_sandboxes->release(handle);
    }

    void signalSandbox(const SandboxHandle& handle, KillReason reason) {
        auto stopped = m_sandboxes->signalStop(handle, m_config->stopGrace, reason);
        if (stopped.isFailure()) {
            GAMEBATTLE_LOG_DEBUG_F("Sandbox %s already gone", handle.name.c_str());
        }
    }

    /// Undo a failed launch: store slot, session record and local entry
    void rollback(const std::shared_ptr<Session>& session) {
        auto released = releaseSlot(*session);
        if (released.isFailure()) {
            GAMEBATTLE_LOG_ERROR_F("Rollback of session %s left a store entry behind", session->id.c_str());
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sessions.erase(session->id);
        }
        m_cv.notify_all();
    }

    /// Remove the session from the user's list and delete its record. Caller does not hold m_mutex.
    Result<void> releaseSlot(const Session& session) {
        Milliseconds delay = m_config->storeRetryBaseDelay;
        for (int attempt = 1; attempt <= kReleaseAttempts; ++attempt) {
            auto released = tryReleaseSlot(session);
            if (released.isSuccess()) {
                return released;
            }
            GAMEBATTLE_LOG_WARNING_F("Releasing slot of session %s failed (attempt %d/%d): %s",
                                     session.id.c_str(), attempt, kReleaseAttempts,
                                     getErrorMessage(released.error()).data());
            if (attempt < kReleaseAttempts) {
                std::this_thread::sleep_for(delay);
                delay *= 2;
            }
        }
        return ErrorCode::StoreUnavailable;
    }

    Result<void> tryReleaseSlot(const Session& session) {
        GAMEBATTLE_TRY_ASSIGN(lease, m_store->acquireLock(userLockName(session.userId),
                                                          m_config->lockLease, m_config->lockWait));
        ScopedLock guard(*m_store, lease);

        const std::string listKey = userListKey(session.userId);
        GAMEBATTLE_TRY_ASSIGN(current, m_store->get(listKey));
        auto ids = parseSessionList(current);
        auto removed = std::remove(ids.begin(), ids.end(), session.id);
        if (removed != ids.end()) {
            ids.erase(removed, ids.end());
            std::optional<std::string> desired;
            if (!ids.empty()) {
                desired = json(ids).dump();
            }
            GAMEBATTLE_TRY(m_store->compareAndSet(listKey, current, desired));
        }
        GAMEBATTLE_TRY(m_store->remove(sessionKey(session.id)));
        return guard.release();
    }

    // ------------------------------------------------------------------------
    // Supervisor
    // ------------------------------------------------------------------------

    void supervise(std::shared_ptr<Session> session) {
        std::optional<KillReason> requested;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            requested = session->stopReason;
        }
        if (requested) {
            signalSandbox(session->sandbox, *requested);
        }

        // The controller enforces the hard lifetime, so this always returns
        ExitOutcome outcome;
        auto waited = m_sandboxes->wait(session->sandbox);
        if (waited.isSuccess()) {
            outcome = waited.value();
        } else {
            GAMEBATTLE_LOG_ERROR_F("Lost track of sandbox for session %s", session->id.c_str());
            outcome.status = ExitOutcome::Killed{KillReason::Shutdown, 0};
        }

        EndReason reason = endReasonFor(outcome);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            session->state = SessionState::Terminating;
            session->outcome = outcome;
            session->endReason = reason;
        }
        m_cv.notify_all();

        session->bridge->close(reason);
        m_sandboxes->release(session->sandbox);

        auto released = releaseSlot(*session);
        if (released.isFailure()) {
            GAMEBATTLE_LOG_ERROR_F("Store slot of session %s could not be released; "
                                   "terminating locally, the record expires on its own",
                                   session->id.c_str());
        }

        if (m_competition && m_competition->enabled()) {
            TerminatedSession terminated{session->id, session->userId, session->gameId,
                                         nowEpochMillis(), outcome};
            auto scored = m_competition->onSessionTerminated(terminated);
            if (scored.isFailure()) {
                GAMEBATTLE_LOG_ERROR_F("Scoring session %s failed: %s", session->id.c_str(),
                                       getErrorMessage(scored.error()).data());
            }
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            session->state = SessionState::Terminated;
            session->terminatedAt = Clock::now();
        }
        m_cv.notify_all();

        GAMEBATTLE_LOG_INFO_F("Session %s terminated: %s (%s)", session->id.c_str(), toString(reason),
                              outcome.describe().c_str());
    }

    // ------------------------------------------------------------------------
    // Reaper
    // ------------------------------------------------------------------------

    void reaperLoop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (m_reaperRunning) {
            m_cv.wait_for(lock, m_config->reaperInterval);
            if (!m_reaperRunning) {
                break;
            }

            TimePoint now = Clock::now();
            std::vector<SandboxHandle> abandoned;
            std::vector<std::shared_ptr<Session>> expired;

            for (auto it = m_sessions.begin(); it != m_sessions.end();) {
                auto& session = it->second;
                if (session->state == SessionState::Running && session->bridge && !session->stopReason) {
                    auto since = session->bridge->detachedSince();
                    if (since && now - *since >= m_config->disconnectGrace) {
                        session->stopReason = KillReason::OwnerDisconnected;
                        session->state = SessionState::Terminating;
                        abandoned.push_back(session->sandbox);
                        GAMEBATTLE_LOG_INFO_F("Session %s owner gone past grace", session->id.c_str());
                    }
                }
                if (session->state == SessionState::Terminated && session->terminatedAt &&
                    now - *session->terminatedAt >= m_config->retention) {
                    expired.push_back(session);
                    it = m_sessions.erase(it);
                    continue;
                }
                ++it;
            }

            lock.unlock();
            for (const auto& handle : abandoned) {
                signalSandbox(handle, KillReason::OwnerDisconnected);
            }
            for (auto& session : expired) {
                if (session->supervisor.joinable()) {
                    session->supervisor.join();
                }
                GAMEBATTLE_LOG_DEBUG_F("Evicted session %s", session->id.c_str());
            }
            lock.lock();
        }
    }

    std::shared_ptr<const OrchestratorConfig> m_config;
    std::shared_ptr<const GameCatalog> m_catalog;
    std::shared_ptr<SandboxController> m_sandboxes;
    std::shared_ptr<StateStore> m_store;
    std::shared_ptr<CompetitionEngine> m_competition;
    Crypto::SecureRandom m_random;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    std::map<SessionId, std::shared_ptr<Session>> m_sessions;
    bool m_reaperRunning = false;
    bool m_shuttingDown = false;
    std::thread m_reaper;
};

// ============================================================================
// SessionManager - Public API
// ============================================================================

SessionManager::SessionManager(std::shared_ptr<const OrchestratorConfig> config,
                               std::shared_ptr<const GameCatalog> catalog,
                               std::shared_ptr<SandboxController> sandboxes,
                               std::shared_ptr<StateStore> store,
                               std::shared_ptr<CompetitionEngine> competition)
    : m_impl(std::make_unique<Impl>(std::move(config), std::move(catalog), std::move(sandboxes),
                                    std::move(store), std::move(competition))) {
}

SessionManager::~SessionManager() {
    m_impl->shutdown();
}

void SessionManager::start() {
    m_impl->start();
}

void SessionManager::shutdown() {
    m_impl->shutdown();
}

Result<SessionHandle> SessionManager::createOrAttach(const Identity& identity, const GameId& gameId,
                                                     std::shared_ptr<ClientConnection> client) {
    return m_impl->createOrAttach(identity, gameId, std::move(client));
}

Result<void> SessionManager::attachClient(const SessionId& sessionId, const Identity& identity,
                                          std::shared_ptr<ClientConnection> client) {
    return m_impl->attachClient(sessionId, identity, std::move(client));
}

Result<void> SessionManager::terminate(const SessionId& sessionId, const Identity& identity) {
    return m_impl->terminate(sessionId, identity);
}

Result<SessionHandle> SessionManager::restart(const SessionId& sessionId, const Identity& identity) {
    return m_impl->restart(sessionId, identity);
}

std::vector<SessionSummary> SessionManager::listActive(const Identity& identity) const {
    return m_impl->listActive(identity);
}

Result<SessionSummary> SessionManager::getSession(const SessionId& sessionId, const Identity& identity) const {
    return m_impl->getSession(sessionId, identity);
}

Result<ByteBuffer> SessionManager::capturedOutput(const SessionId& sessionId, const Identity& identity) const {
    return m_impl->capturedOutput(sessionId, identity);
}

Result<SessionSummary> SessionManager::awaitTerminated(const SessionId& sessionId, Milliseconds timeout) const {
    return m_impl->awaitTerminated(sessionId, timeout);
}

size_t SessionManager::activeCount() const {
    return m_impl->activeCount();
}

} // namespace Gamebattle::Orchestrator
