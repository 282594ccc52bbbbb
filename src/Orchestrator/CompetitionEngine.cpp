/**
 * @file CompetitionEngine.cpp
 * @brief Exit code scoring, leaderboard merge and score webhooks
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/CompetitionEngine.hpp>
#include <Gamebattle/Core/Logger.hpp>

#include <algorithm>
#include <cstdio>

namespace Gamebattle::Orchestrator {

using json = nlohmann::json;

namespace {

constexpr const char* kRecordPrefix = "competition:record:";
constexpr const char* kEntryPrefix = "leaderboard:user:";
constexpr const char* kExcludedKey = "competition:excluded";
constexpr int kMergeAttempts = 3;

bool ranksBefore(const LeaderboardEntry& a, const LeaderboardEntry& b) {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    if (a.updatedAt != b.updatedAt) {
        return a.updatedAt < b.updatedAt;
    }
    return a.userId < b.userId;
}

Result<std::vector<GameId>> parseGameList(const std::string& text) {
    try {
        auto games = json::parse(text).get<std::vector<GameId>>();
        std::sort(games.begin(), games.end());
        return games;
    } catch (const json::exception& e) {
        GAMEBATTLE_LOG_ERROR_F("Corrupt excluded game list: %s", e.what());
        return ErrorCode::JsonParseFailed;
    }
}

} // namespace

// ============================================================================
// ExitCodeScoringPolicy
// ============================================================================

ExitCodeScoringPolicy::ExitCodeScoringPolicy() {
    m_defaults.exitCodeResults = {{0, "win"}, {1, "loss"}, {2, "draw"}};
    m_defaults.points = {{"win", 3}, {"draw", 1}, {"loss", 0}, {"crash", 0}};
}

Score ExitCodeScoringPolicy::score(const GameArtifact& artifact, const ExitOutcome& outcome) const {
    Score score;
    if (auto* exited = std::get_if<ExitOutcome::Exited>(&outcome.status)) {
        auto custom = artifact.scoring.exitCodeResults.find(exited->code);
        if (custom != artifact.scoring.exitCodeResults.end()) {
            score.result = custom->second;
        } else {
            auto standard = m_defaults.exitCodeResults.find(exited->code);
            score.result = standard != m_defaults.exitCodeResults.end() ? standard->second : "loss";
        }
    } else {
        score.result = "crash";
    }

    auto custom = artifact.scoring.points.find(score.result);
    if (custom != artifact.scoring.points.end()) {
        score.points = custom->second;
    } else {
        auto standard = m_defaults.points.find(score.result);
        score.points = standard != m_defaults.points.end() ? standard->second : 0;
    }
    return score;
}

// ============================================================================
// Record serialization
// ============================================================================

json CompetitionRecord::toJson() const {
    json doc = {
        {"sessionId", sessionId},
        {"userId", userId},
        {"gameId", gameId},
        {"result", result},
        {"score", score},
        {"terminatedAt", terminatedAt},
        {"status", status},
    };
    doc["rankDelta"] = rankDelta ? json(*rankDelta) : json(nullptr);
    return doc;
}

Result<CompetitionRecord> CompetitionRecord::fromJson(const std::string& text) {
    try {
        auto doc = json::parse(text);
        CompetitionRecord record;
        record.sessionId = doc.at("sessionId").get<std::string>();
        record.userId = doc.at("userId").get<std::string>();
        record.gameId = doc.at("gameId").get<std::string>();
        record.result = doc.value("result", std::string());
        record.score = doc.value("score", int64_t{0});
        record.terminatedAt = doc.value("terminatedAt", int64_t{0});
        record.status = doc.value("status", std::string("pending"));
        if (doc.contains("rankDelta") && !doc.at("rankDelta").is_null()) {
            record.rankDelta = doc.at("rankDelta").get<int64_t>();
        }
        return record;
    } catch (const json::exception& e) {
        GAMEBATTLE_LOG_ERROR_F("Corrupt competition record: %s", e.what());
        return ErrorCode::JsonParseFailed;
    }
}

json LeaderboardEntry::toJson() const {
    return {
        {"userId", userId},
        {"score", score},
        {"sessions", sessions},
        {"updatedAt", updatedAt},
        {"lastTerminatedAt", lastTerminatedAt},
        {"recentSessions", json(std::vector<std::string>(recentSessions.begin(), recentSessions.end()))},
    };
}

Result<LeaderboardEntry> LeaderboardEntry::fromJson(const std::string& text) {
    try {
        auto doc = json::parse(text);
        LeaderboardEntry entry;
        entry.userId = doc.at("userId").get<std::string>();
        entry.score = doc.value("score", int64_t{0});
        entry.sessions = doc.value("sessions", int64_t{0});
        entry.updatedAt = doc.value("updatedAt", int64_t{0});
        entry.lastTerminatedAt = doc.value("lastTerminatedAt", int64_t{0});
        for (const auto& sid : doc.value("recentSessions", json::array())) {
            entry.recentSessions.push_back(sid.get<std::string>());
        }
        return entry;
    } catch (const json::exception& e) {
        GAMEBATTLE_LOG_ERROR_F("Corrupt leaderboard entry: %s", e.what());
        return ErrorCode::JsonParseFailed;
    }
}

json PlayerStanding::toJson() const {
    return {
        {"userId", userId},
        {"score", score},
        {"sessions", sessions},
        {"place", place == 0 ? json(nullptr) : json(place)},
        {"places", places},
    };
}

json GameStats::toJson() const {
    return {
        {"gameId", gameId},
        {"gameName", gameName},
        {"timesPlayed", timesPlayed},
        {"totalScore", totalScore},
        {"results", results},
        {"excluded", excluded},
    };
}

// ============================================================================
// CompetitionEngine
// ============================================================================

CompetitionEngine::CompetitionEngine(std::shared_ptr<const OrchestratorConfig> config,
                                     std::shared_ptr<StateStore> store,
                                     std::shared_ptr<const GameCatalog> catalog,
                                     std::shared_ptr<const ScoringPolicy> policy,
                                     std::shared_ptr<WebhookNotifier> notifier)
    : m_config(std::move(config))
    , m_store(std::move(store))
    , m_catalog(std::move(catalog))
    , m_policy(policy ? std::move(policy) : std::make_shared<ExitCodeScoringPolicy>())
    , m_notifier(std::move(notifier)) {
}

bool CompetitionEngine::enabled() const {
    return m_config->competitionEnabled;
}

Result<CompetitionRecord> CompetitionEngine::onSessionTerminated(const TerminatedSession& session) {
    if (!enabled()) {
        return ErrorCode::CompetitionDisabled;
    }

    const std::string recordKey = kRecordPrefix + session.sessionId;
    CompetitionRecord record;
    std::string pendingText;

    GAMEBATTLE_TRY_ASSIGN(existing, m_store->get(recordKey));
    if (existing) {
        GAMEBATTLE_TRY_ASSIGN(stored, CompetitionRecord::fromJson(*existing));
        if (stored.status == "applied") {
            GAMEBATTLE_LOG_DEBUG_F("Session %s already scored", session.sessionId.c_str());
            return stored;
        }
        record = std::move(stored);
        pendingText = *existing;
    } else {
        GAMEBATTLE_TRY_ASSIGN(excluded, excludedGames());
        if (std::binary_search(excluded.begin(), excluded.end(), session.gameId)) {
            GAMEBATTLE_LOG_INFO_F("Session %s not scored: game %s is excluded",
                                  session.sessionId.c_str(), session.gameId.c_str());
            record.sessionId = session.sessionId;
            record.userId = session.userId;
            record.gameId = session.gameId;
            record.terminatedAt = session.terminatedAt;
            record.status = "excluded";
            return record;
        }

        GameArtifact artifact;
        auto resolved = m_catalog->resolve(session.gameId);
        if (resolved.isSuccess()) {
            artifact = resolved.value();
        } else {
            artifact.id = session.gameId;
        }

        Score score = m_policy->score(artifact, session.outcome);
        record.sessionId = session.sessionId;
        record.userId = session.userId;
        record.gameId = session.gameId;
        record.result = score.result;
        record.score = score.points;
        record.terminatedAt = session.terminatedAt;
        record.status = "pending";
        pendingText = record.toJson().dump();

        auto claimed = m_store->compareAndSet(recordKey, std::nullopt, pendingText);
        if (claimed.isFailure()) {
            if (claimed.error() != ErrorCode::ConditionFailed) {
                return claimed.error();
            }
            // Someone else claimed it first; continue from their record
            GAMEBATTLE_TRY_ASSIGN(raced, m_store->get(recordKey));
            if (!raced) {
                return ErrorCode::ConditionFailed;
            }
            GAMEBATTLE_TRY_ASSIGN(theirs, CompetitionRecord::fromJson(*raced));
            if (theirs.status == "applied") {
                return theirs;
            }
            record = std::move(theirs);
            pendingText = *raced;
        }
    }

    GAMEBATTLE_TRY_ASSIGN(rankBefore, rankOf(record.userId));
    GAMEBATTLE_TRY_ASSIGN(merged, mergeScore(record));
    GAMEBATTLE_TRY_ASSIGN(rankAfter, rankOf(record.userId));

    const LeaderboardEntry& entry = merged.first;
    record.status = "applied";
    if (merged.second) {
        // Only the call that moved the leaderboard knows the rank change
        record.rankDelta = rankBefore - rankAfter;
        GAMEBATTLE_TRY(m_store->set(recordKey, record.toJson().dump()));
    } else {
        // Completes a record left pending by an interrupted call, but never
        // overwrites the one written by the call that merged the score
        record.rankDelta = 0;
        auto completed = m_store->compareAndSet(recordKey, pendingText, record.toJson().dump());
        if (completed.isFailure()) {
            if (completed.error() != ErrorCode::ConditionFailed) {
                return completed.error();
            }
            GAMEBATTLE_TRY_ASSIGN(current, m_store->get(recordKey));
            if (!current) {
                return ErrorCode::ConditionFailed;
            }
            return CompetitionRecord::fromJson(*current);
        }
    }

    GAMEBATTLE_LOG_INFO_F("Scored session %s: %s %+lld (total %lld)", record.sessionId.c_str(),
                          record.result.c_str(), static_cast<long long>(record.score),
                          static_cast<long long>(entry.score));

    if (merged.second && m_notifier) {
        char content[256];
        std::snprintf(content, sizeof(content), "%s scored %lld on %s (%s), total %lld",
                      record.userId.c_str(), static_cast<long long>(record.score),
                      record.gameId.c_str(), record.result.c_str(),
                      static_cast<long long>(entry.score));
        m_notifier->enqueue({
            {"event", "score"},
            {"sessionId", record.sessionId},
            {"userId", record.userId},
            {"gameId", record.gameId},
            {"result", record.result},
            {"score", record.score},
            {"totalScore", entry.score},
            {"rankDelta", *record.rankDelta},
            {"timestamp", record.terminatedAt},
            {"content", content},
        });
    }
    return record;
}

Result<std::pair<LeaderboardEntry, bool>> CompetitionEngine::mergeScore(const CompetitionRecord& record) {
    GAMEBATTLE_TRY_ASSIGN(lease, m_store->acquireLock("leaderboard:" + record.userId,
                                                      m_config->lockLease, m_config->lockWait));
    ScopedLock guard(*m_store, lease);

    const std::string entryKey = kEntryPrefix + record.userId;
    for (int attempt = 0; attempt < kMergeAttempts; ++attempt) {
        GAMEBATTLE_TRY_ASSIGN(current, m_store->get(entryKey));

        LeaderboardEntry entry;
        entry.userId = record.userId;
        if (current) {
            GAMEBATTLE_TRY_ASSIGN(parsed, LeaderboardEntry::fromJson(*current));
            entry = std::move(parsed);
        }

        auto seen = std::find(entry.recentSessions.begin(), entry.recentSessions.end(), record.sessionId);
        if (seen != entry.recentSessions.end()) {
            return std::make_pair(entry, false);
        }

        entry.score += record.score;
        entry.sessions += 1;
        entry.updatedAt = nowEpochMillis();
        entry.lastTerminatedAt = std::max(entry.lastTerminatedAt, record.terminatedAt);
        entry.recentSessions.push_back(record.sessionId);
        while (entry.recentSessions.size() > kRecentSessions) {
            entry.recentSessions.pop_front();
        }

        auto written = m_store->compareAndSet(entryKey, current, entry.toJson().dump());
        if (written.isSuccess()) {
            return std::make_pair(entry, true);
        }
        if (written.error() != ErrorCode::ConditionFailed) {
            return written.error();
        }
        GAMEBATTLE_LOG_DEBUG_F("Leaderboard entry for %s changed concurrently, retrying",
                               record.userId.c_str());
    }
    return ErrorCode::ConditionFailed;
}

Result<int64_t> CompetitionEngine::rankOf(const UserId& userId) const {
    GAMEBATTLE_TRY_ASSIGN(entries, leaderboard(0));
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].userId == userId) {
            return static_cast<int64_t>(i + 1);
        }
    }
    return static_cast<int64_t>(entries.size() + 1);
}

Result<std::vector<LeaderboardEntry>> CompetitionEngine::leaderboard(size_t limit) const {
    GAMEBATTLE_TRY_ASSIGN(pairs, m_store->scan(kEntryPrefix));

    std::vector<LeaderboardEntry> entries;
    entries.reserve(pairs.size());
    for (const auto& [key, value] : pairs) {
        auto entry = LeaderboardEntry::fromJson(value);
        if (entry.isFailure()) {
            GAMEBATTLE_LOG_WARNING_F("Skipping unreadable leaderboard entry %s", key.c_str());
            continue;
        }
        entries.push_back(std::move(entry).value());
    }

    std::sort(entries.begin(), entries.end(), ranksBefore);
    if (limit != 0 && entries.size() > limit) {
        entries.resize(limit);
    }
    return entries;
}

Result<std::optional<CompetitionRecord>> CompetitionEngine::record(const SessionId& sessionId) const {
    GAMEBATTLE_TRY_ASSIGN(stored, m_store->get(kRecordPrefix + sessionId));
    if (!stored) {
        return std::optional<CompetitionRecord>();
    }
    GAMEBATTLE_TRY_ASSIGN(parsed, CompetitionRecord::fromJson(*stored));
    return std::optional<CompetitionRecord>(std::move(parsed));
}

// ----------------------------------------------------------------------------
// Exclusion and statistics
// ----------------------------------------------------------------------------

Result<void> CompetitionEngine::excludeGame(const GameId& gameId) {
    return updateExcluded(gameId, true);
}

Result<void> CompetitionEngine::includeGame(const GameId& gameId) {
    return updateExcluded(gameId, false);
}

Result<std::vector<GameId>> CompetitionEngine::excludedGames() const {
    GAMEBATTLE_TRY_ASSIGN(stored, m_store->get(kExcludedKey));
    if (!stored) {
        return std::vector<GameId>();
    }
    return parseGameList(*stored);
}

Result<void> CompetitionEngine::updateExcluded(const GameId& gameId, bool excluded) {
    if (gameId.empty()) {
        return ErrorCode::InvalidArgument;
    }
    for (int attempt = 0; attempt < kMergeAttempts; ++attempt) {
        GAMEBATTLE_TRY_ASSIGN(current, m_store->get(kExcludedKey));
        std::vector<GameId> games;
        if (current) {
            GAMEBATTLE_TRY_ASSIGN(parsed, parseGameList(*current));
            games = std::move(parsed);
        }

        auto it = std::lower_bound(games.begin(), games.end(), gameId);
        bool present = it != games.end() && *it == gameId;
        if (present == excluded) {
            return Result<void>::Success();
        }
        if (excluded) {
            games.insert(it, gameId);
        } else {
            games.erase(it);
        }

        std::optional<std::string> desired;
        if (!games.empty()) {
            desired = json(games).dump();
        }
        auto written = m_store->compareAndSet(kExcludedKey, current, desired);
        if (written.isSuccess()) {
            GAMEBATTLE_LOG_INFO_F("Game %s %s competition", gameId.c_str(),
                                  excluded ? "excluded from" : "included in");
            return Result<void>::Success();
        }
        if (written.error() != ErrorCode::ConditionFailed) {
            return written.error();
        }
    }
    return ErrorCode::ConditionFailed;
}

Result<PlayerStanding> CompetitionEngine::standing(const UserId& userId) const {
    GAMEBATTLE_TRY_ASSIGN(entries, leaderboard(0));
    PlayerStanding out;
    out.userId = userId;
    out.places = static_cast<int64_t>(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].userId == userId) {
            out.score = entries[i].score;
            out.sessions = entries[i].sessions;
            out.place = static_cast<int64_t>(i + 1);
            break;
        }
    }
    return out;
}

Result<std::vector<GameStats>> CompetitionEngine::gameStats() const {
    GAMEBATTLE_TRY_ASSIGN(excluded, excludedGames());
    GAMEBATTLE_TRY_ASSIGN(pairs, m_store->scan(kRecordPrefix));

    std::map<GameId, GameStats> byGame;
    for (const auto& artifact : m_catalog->list()) {
        GameStats& stats = byGame[artifact.id];
        stats.gameId = artifact.id;
        stats.gameName = artifact.name;
    }
    for (const auto& [key, value] : pairs) {
        auto parsed = CompetitionRecord::fromJson(value);
        if (parsed.isFailure()) {
            GAMEBATTLE_LOG_WARNING_F("Skipping unreadable competition record %s", key.c_str());
            continue;
        }
        const CompetitionRecord& record = parsed.value();
        if (record.status != "applied") {
            continue;
        }
        GameStats& stats = byGame[record.gameId];
        stats.gameId = record.gameId;
        stats.timesPlayed += 1;
        stats.totalScore += record.score;
        stats.results[record.result] += 1;
    }

    std::vector<GameStats> out;
    out.reserve(byGame.size());
    for (auto& [gameId, stats] : byGame) {
        stats.excluded = std::binary_search(excluded.begin(), excluded.end(), gameId);
        out.push_back(std::move(stats));
    }
    return out;
}

} // namespace Gamebattle::Orchestrator
