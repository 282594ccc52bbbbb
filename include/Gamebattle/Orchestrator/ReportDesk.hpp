/**
 * @file ReportDesk.hpp
 * @brief Player reports against games
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Reports are appended to `report:<gameId>` and forwarded to the webhook.
 * Filing needs competition mode; listing is restricted to admins.
 */

#pragma once

#ifndef GAMEBATTLE_ORCHESTRATOR_REPORT_DESK_HPP
#define GAMEBATTLE_ORCHESTRATOR_REPORT_DESK_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <Gamebattle/Orchestrator/GameCatalog.hpp>
#include <Gamebattle/Orchestrator/OrchestratorConfig.hpp>
#include <Gamebattle/Orchestrator/SessionManager.hpp>
#include <Gamebattle/Orchestrator/StateStore.hpp>
#include <Gamebattle/Orchestrator/WebhookNotifier.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Gamebattle::Orchestrator {

enum class ReportReason {
    Unclear,
    Buggy,
    Other
};

const char* toString(ReportReason reason) noexcept;

/// Parse "unclear", "buggy" or "other"
Result<ReportReason> parseReportReason(const std::string& text);

struct GameReport {
    SessionId sessionId;
    GameId gameId;
    ReportReason shortReason = ReportReason::Other;
    std::string reason;
    std::optional<std::string> output;   ///< Base64 of the captured output
    UserId author;                       ///< Reporting user
    int64_t timestamp = 0;               ///< Epoch milliseconds

    nlohmann::json toJson() const;
    static Result<GameReport> fromJson(const nlohmann::json& doc);
};

class ReportDesk {
public:
    static constexpr size_t kMaxReasonLength = 2000;

    ReportDesk(std::shared_ptr<const OrchestratorConfig> config,
               std::shared_ptr<StateStore> store,
               std::shared_ptr<const GameCatalog> catalog,
               SessionManager& sessions,
               std::shared_ptr<WebhookNotifier> notifier);

    /**
     * @brief Report the game played in a session
     * @param includeOutput Attach the session's recent output
     * @return Number of reports on the game, or CompetitionDisabled,
     *         SessionNotFound, Forbidden, SelfReportNotAllowed
     */
    Result<size_t> fileReport(const Identity& identity, const SessionId& sessionId,
                              ReportReason shortReason, const std::string& reason,
                              bool includeOutput);

    /// Reports filed against a game (admins only)
    Result<std::vector<GameReport>> reports(const GameId& gameId, const Identity& identity) const;

private:
    Result<size_t> append(const GameReport& report);

    std::shared_ptr<const OrchestratorConfig> m_config;
    std::shared_ptr<StateStore> m_store;
    std::shared_ptr<const GameCatalog> m_catalog;
    SessionManager& m_sessions;
    std::shared_ptr<WebhookNotifier> m_notifier;
};

} // namespace Gamebattle::Orchestrator

#endif // GAMEBATTLE_ORCHESTRATOR_REPORT_DESK_HPP
