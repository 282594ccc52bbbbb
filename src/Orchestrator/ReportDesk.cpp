/**
 * @file ReportDesk.cpp
 * @brief Report filing, storage and webhook forwarding
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/ReportDesk.hpp>
#include <Gamebattle/Core/Crypto.hpp>
#include <Gamebattle/Core/Logger.hpp>

namespace Gamebattle::Orchestrator {

using json = nlohmann::json;

namespace {

constexpr const char* kReportPrefix = "report:";
constexpr int kAppendAttempts = 5;

std::string dumpLenient(const json& doc) {
    // Reasons come from users; replace invalid UTF-8 instead of throwing
    return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

const char* toString(ReportReason reason) noexcept {
    switch (reason) {
        case ReportReason::Unclear: return "unclear";
        case ReportReason::Buggy:   return "buggy";
        case ReportReason::Other:   return "other";
    }
    return "other";
}

Result<ReportReason> parseReportReason(const std::string& text) {
    if (text == "unclear") {
        return ReportReason::Unclear;
    }
    if (text == "buggy") {
        return ReportReason::Buggy;
    }
    if (text == "other") {
        return ReportReason::Other;
    }
    return ErrorCode::InvalidArgument;
}

// ============================================================================
// GameReport
// ============================================================================

json GameReport::toJson() const {
    json doc = {
        {"session", sessionId},
        {"gameId", gameId},
        {"short_reason", toString(shortReason)},
        {"reason", reason},
        {"author", author},
        {"timestamp", timestamp},
    };
    doc["output"] = output ? json(*output) : json(nullptr);
    return doc;
}

Result<GameReport> GameReport::fromJson(const json& doc) {
    try {
        GameReport report;
        report.sessionId = doc.at("session").get<std::string>();
        report.gameId = doc.value("gameId", std::string());
        auto shortReason = parseReportReason(doc.value("short_reason", std::string("other")));
        report.shortReason = shortReason.valueOr(ReportReason::Other);
        report.reason = doc.value("reason", std::string());
        report.author = doc.value("author", std::string("unknown"));
        report.timestamp = doc.value("timestamp", int64_t{0});
        if (doc.contains("output") && doc.at("output").is_string()) {
            report.output = doc.at("output").get<std::string>();
        }
        return report;
    } catch (const json::exception& e) {
        GAMEBATTLE_LOG_ERROR_F("Corrupt game report: %s", e.what());
        return ErrorCode::JsonParseFailed;
    }
}

// ============================================================================
// ReportDesk
// ============================================================================

ReportDesk::ReportDesk(std::shared_ptr<const OrchestratorConfig> config,
                       std::shared_ptr<StateStore> store,
                       std::shared_ptr<const GameCatalog> catalog,
                       SessionManager& sessions,
                       std::shared_ptr<WebhookNotifier> notifier)
    : m_config(std::move(config))
    , m_store(std::move(store))
    , m_catalog(std::move(catalog))
    , m_sessions(sessions)
    , m_notifier(std::move(notifier)) {
}

Result<size_t> ReportDesk::fileReport(const Identity& identity, const SessionId& sessionId,
                                      ReportReason shortReason, const std::string& reason,
                                      bool includeOutput) {
    if (!m_config->competitionEnabled) {
        return ErrorCode::CompetitionDisabled;
    }
    if (identity.userId.empty()) {
        return ErrorCode::Unauthenticated;
    }

    GAMEBATTLE_TRY_ASSIGN(summary, m_sessions.getSession(sessionId, identity));
    GAMEBATTLE_TRY_ASSIGN(artifact, m_catalog->resolve(summary.gameId));

    if (artifact.isAuthoredBy(identity.userId)) {
        GAMEBATTLE_LOG_INFO_F("%s tried to report their own game %s", identity.userId.c_str(),
                              artifact.id.c_str());
        return ErrorCode::SelfReportNotAllowed;
    }

    GameReport report;
    report.sessionId = sessionId;
    report.gameId = artifact.id;
    report.shortReason = shortReason;
    report.reason = reason.substr(0, kMaxReasonLength);
    report.author = identity.userId;
    report.timestamp = nowEpochMillis();

    if (includeOutput) {
        GAMEBATTLE_TRY_ASSIGN(output, m_sessions.capturedOutput(sessionId, identity));
        report.output = Crypto::toBase64(output);
    }

    GAMEBATTLE_TRY_ASSIGN(total, append(report));
    GAMEBATTLE_LOG_INFO_F("Game %s reported by %s (%s), %zu reports", artifact.id.c_str(),
                          identity.userId.c_str(), toString(shortReason), total);

    if (m_notifier) {
        std::string content = "Game reported: " + artifact.name + " (" + toString(shortReason) + ")";
        m_notifier->enqueue({
            {"event", "report"},
            {"sessionId", report.sessionId},
            {"gameId", report.gameId},
            {"gameName", artifact.name},
            {"author", artifact.author},
            {"reporter", report.author},
            {"shortReason", toString(report.shortReason)},
            {"reason", report.reason},
            {"logsAttached", report.output.has_value()},
            {"totalReports", total},
            {"timestamp", report.timestamp},
            {"content", content},
        });
    }
    return total;
}

Result<size_t> ReportDesk::append(const GameReport& report) {
    const std::string key = kReportPrefix + report.gameId;
    for (int attempt = 0; attempt < kAppendAttempts; ++attempt) {
        GAMEBATTLE_TRY_ASSIGN(current, m_store->get(key));

        json list = json::array();
        if (current) {
            try {
                list = json::parse(*current);
            } catch (const json::exception& e) {
                GAMEBATTLE_LOG_ERROR_F("Report list for %s unreadable: %s", report.gameId.c_str(), e.what());
                return ErrorCode::JsonParseFailed;
            }
        }
        list.push_back(report.toJson());

        auto written = m_store->compareAndSet(key, current, dumpLenient(list));
        if (written.isSuccess()) {
            return list.size();
        }
        if (written.error() != ErrorCode::ConditionFailed) {
            return written.error();
        }
    }
    return ErrorCode::ConditionFailed;
}

Result<std::vector<GameReport>> ReportDesk::reports(const GameId& gameId, const Identity& identity) const {
    if (!identity.isAdmin) {
        return ErrorCode::Forbidden;
    }

    GAMEBATTLE_TRY_ASSIGN(current, m_store->get(kReportPrefix + gameId));
    std::vector<GameReport> out;
    if (!current) {
        return out;
    }

    try {
        for (const auto& item : json::parse(*current)) {
            auto report = GameReport::fromJson(item);
            if (report.isFailure()) {
                continue;
            }
            out.push_back(std::move(report).value());
        }
    } catch (const json::exception& e) {
        GAMEBATTLE_LOG_ERROR_F("Report list for %s unreadable: %s", gameId.c_str(), e.what());
        return ErrorCode::JsonParseFailed;
    }
    return out;
}

} // namespace Gamebattle::Orchestrator
