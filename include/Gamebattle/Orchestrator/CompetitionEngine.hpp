/**
 * @file CompetitionEngine.hpp
 * @brief Scoring of finished sessions and the leaderboard
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * onSessionTerminated() is idempotent per session id: a competition record
 * is claimed with create-if-absent, and the leaderboard entry remembers the
 * most recent session ids it has absorbed.
 */

#pragma once

#ifndef GAMEBATTLE_ORCHESTRATOR_COMPETITION_ENGINE_HPP
#define GAMEBATTLE_ORCHESTRATOR_COMPETITION_ENGINE_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <Gamebattle/Orchestrator/GameCatalog.hpp>
#include <Gamebattle/Orchestrator/OrchestratorConfig.hpp>
#include <Gamebattle/Orchestrator/SandboxController.hpp>
#include <Gamebattle/Orchestrator/StateStore.hpp>
#include <Gamebattle/Orchestrator/WebhookNotifier.hpp>
#include <nlohmann/json.hpp>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Gamebattle::Orchestrator {

// ============================================================================
// Scoring
// ============================================================================

struct Score {
    std::string result;   ///< win, draw, loss, crash, or a game-defined name
    int64_t points = 0;
};

class ScoringPolicy {
public:
    virtual ~ScoringPolicy() = default;
    virtual Score score(const GameArtifact& artifact, const ExitOutcome& outcome) const = 0;
};

/**
 * @brief Exit code to result, result to points
 *
 * Defaults: 0 win, 1 loss, 2 draw; win 3, draw 1, loss 0, crash 0. A game's
 * scoring table overrides entries. Unknown exit codes score as loss. Crashes
 * and forced stops score as crash.
 */
class ExitCodeScoringPolicy : public ScoringPolicy {
public:
    ExitCodeScoringPolicy();

    Score score(const GameArtifact& artifact, const ExitOutcome& outcome) const override;

private:
    ScoringTable m_defaults;
};

// ============================================================================
// Records
// ============================================================================

/**
 * @brief Session facts handed over at the terminated transition
 */
struct TerminatedSession {
    SessionId sessionId;
    UserId userId;
    GameId gameId;
    int64_t terminatedAt = 0;   ///< Epoch milliseconds
    ExitOutcome outcome;
};

struct CompetitionRecord {
    SessionId sessionId;
    UserId userId;
    GameId gameId;
    std::string result;
    int64_t score = 0;
    int64_t terminatedAt = 0;
    std::optional<int64_t> rankDelta;
    std::string status;   ///< pending, applied, or excluded (never stored)

    nlohmann::json toJson() const;
    static Result<CompetitionRecord> fromJson(const std::string& text);
};

struct LeaderboardEntry {
    UserId userId;
    int64_t score = 0;
    int64_t sessions = 0;
    int64_t updatedAt = 0;
    int64_t lastTerminatedAt = 0;
    std::deque<SessionId> recentSessions;

    nlohmann::json toJson() const;
    static Result<LeaderboardEntry> fromJson(const std::string& text);
};

/// Leaderboard position of one player
struct PlayerStanding {
    UserId userId;
    int64_t score = 0;
    int64_t sessions = 0;
    int64_t place = 0;    ///< 1-based, 0 when not on the board
    int64_t places = 0;   ///< Entries on the board

    nlohmann::json toJson() const;
};

/// Competition totals of one game
struct GameStats {
    GameId gameId;
    std::string gameName;
    int64_t timesPlayed = 0;
    int64_t totalScore = 0;
    std::map<std::string, int64_t> results;   ///< Sessions per result name
    bool excluded = false;

    nlohmann::json toJson() const;
};

// ============================================================================
// Engine
// ============================================================================

class CompetitionEngine {
public:
    /// Session ids remembered per leaderboard entry for idempotence
    static constexpr size_t kRecentSessions = 32;

    CompetitionEngine(std::shared_ptr<const OrchestratorConfig> config,
                      std::shared_ptr<StateStore> store,
                      std::shared_ptr<const GameCatalog> catalog,
                      std::shared_ptr<const ScoringPolicy> policy,
                      std::shared_ptr<WebhookNotifier> notifier);

    [[nodiscard]] bool enabled() const;

    /**
     * @brief Score a session and merge it into the owner's leaderboard entry
     * @return The applied record; repeated calls return the same record
     */
    Result<CompetitionRecord> onSessionTerminated(const TerminatedSession& session);

    /**
     * @brief Entries ordered by score, then earliest update, then user id
     */
    Result<std::vector<LeaderboardEntry>> leaderboard(size_t limit) const;

    /// Competition record of a session, nullopt if none
    Result<std::optional<CompetitionRecord>> record(const SessionId& sessionId) const;

    /**
     * @brief Stop scoring sessions of a game
     *
     * Sessions already scored keep their points. Idempotent.
     */
    Result<void> excludeGame(const GameId& gameId);

    /// Resume scoring a game. Idempotent.
    Result<void> includeGame(const GameId& gameId);

    /// Excluded games in id order
    Result<std::vector<GameId>> excludedGames() const;

    Result<PlayerStanding> standing(const UserId& userId) const;

    /// Totals of every catalog game plus any scored game no longer listed
    Result<std::vector<GameStats>> gameStats() const;

private:
    Result<void> updateExcluded(const GameId& gameId, bool excluded);

    Result<int64_t> rankOf(const UserId& userId) const;
    /// Merged entry and whether this call changed it
    Result<std::pair<LeaderboardEntry, bool>> mergeScore(const CompetitionRecord& record);

    std::shared_ptr<const OrchestratorConfig> m_config;
    std::shared_ptr<StateStore> m_store;
    std::shared_ptr<const GameCatalog> m_catalog;
    std::shared_ptr<const ScoringPolicy> m_policy;
    std::shared_ptr<WebhookNotifier> m_notifier;
};

} // namespace Gamebattle::Orchestrator

#endif // GAMEBATTLE_ORCHESTRATOR_COMPETITION_ENGINE_HPP
