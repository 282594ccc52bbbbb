/**
 * @file ApiServer.cpp
 * @brief HTTP routes of the orchestrator
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include "ApiServer.hpp"

#include <Gamebattle/Core/Logger.hpp>
#include <nlohmann/json.hpp>

#include <chrono>

namespace Gamebattle::Server {

using json = nlohmann::json;
using namespace Gamebattle::Orchestrator;

namespace {

constexpr Milliseconds kStreamPoll{250};

void sendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void sendError(httplib::Response& res, ErrorCode code) {
    json error;
    error["status"] = "error";
    error["code"] = static_cast<int>(code);
    error["message"] = std::string(getErrorMessage(code));
    error["retryable"] = isRetryable(code);
    sendJson(res, httpStatusFor(code), error);
}

void sendBadRequest(httplib::Response& res, const std::string& message) {
    json error;
    error["status"] = "error";
    error["message"] = message;
    sendJson(res, 400, error);
}

json summaryToJson(const SessionSummary& summary) {
    json doc = {
        {"sessionId", summary.sessionId},
        {"userId", summary.userId},
        {"gameId", summary.gameId},
        {"gameName", summary.gameName},
        {"state", toString(summary.state)},
        {"startedAt", summary.startedAt},
        {"lastActivity", summary.lastActivity},
        {"attached", summary.attached},
    };
    doc["endReason"] = summary.endReason ? json(toString(*summary.endReason)) : json(nullptr);
    doc["outcome"] = summary.outcome ? json(summary.outcome->describe()) : json(nullptr);
    return doc;
}

Network::HttpHeaders headersOf(const httplib::Request& req) {
    Network::HttpHeaders headers;
    for (const auto& [name, value] : req.headers) {
        headers.emplace(name, value);
    }
    return headers;
}

} // namespace

int httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unauthenticated:
            return 401;
        case ErrorCode::Forbidden:
        case ErrorCode::SelfReportNotAllowed:
            return 403;
        case ErrorCode::ArtifactNotFound:
        case ErrorCode::SessionNotFound:
        case ErrorCode::KeyNotFound:
            return 404;
        case ErrorCode::InvalidState:
        case ErrorCode::SessionTerminated:
        case ErrorCode::BridgeClosed:
        case ErrorCode::CompetitionDisabled:
            return 409;
        case ErrorCode::ConcurrencyLimitExceeded:
            return 429;
        case ErrorCode::InvalidArgument:
        case ErrorCode::JsonParseFailed:
        case ErrorCode::InvalidFormat:
            return 400;
        case ErrorCode::QuotaExceeded:
        case ErrorCode::StoreUnavailable:
        case ErrorCode::LockNotAcquired:
            return 503;
        case ErrorCode::Timeout:
            return 504;
        default:
            return 500;
    }
}

ApiServer::ApiServer(Services services)
    : m_services(std::move(services)) {
}

void ApiServer::registerRoutes(httplib::Server& server) {
    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        json response;
        response["status"] = "ok";
        response["service"] = "Gamebattle Orchestrator";
        res.set_content(response.dump(), "application/json");
    });

    server.Get("/api/v1/status", [this](const httplib::Request& req, httplib::Response& res) {
        handleStatus(req, res);
    });

    server.Get("/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        handleListSessions(req, res);
    });
    server.Post("/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        handleCreateSession(req, res);
    });
    server.Get(R"(/sessions/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handleGetSession(req, res);
    });
    server.Delete(R"(/sessions/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handleTerminate(req, res);
    });
    server.Get(R"(/sessions/([^/]+)/stream)", [this](const httplib::Request& req, httplib::Response& res) {
        handleStream(req, res);
    });
    server.Post(R"(/sessions/([^/]+)/input)", [this](const httplib::Request& req, httplib::Response& res) {
        handleInput(req, res);
    });
    server.Post(R"(/sessions/([^/]+)/report)", [this](const httplib::Request& req, httplib::Response& res) {
        handleReport(req, res);
    });
    server.Post(R"(/sessions/([^/]+)/restart)", [this](const httplib::Request& req, httplib::Response& res) {
        handleRestart(req, res);
    });

    server.Get(R"(/reports/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handleListReports(req, res);
    });
    server.Get("/leaderboard", [this](const httplib::Request& req, httplib::Response& res) {
        handleLeaderboard(req, res);
    });
    server.Get("/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handlePlayerStats(req, res);
    });

    server.Get("/admin/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handleAdminStats(req, res);
    });
    server.Get("/admin/games/excluded", [this](const httplib::Request& req, httplib::Response& res) {
        handleListExcluded(req, res);
    });
    server.Post(R"(/admin/games/([^/]+)/exclude)", [this](const httplib::Request& req, httplib::Response& res) {
        handleExclude(req, res, true);
    });
    server.Delete(R"(/admin/games/([^/]+)/exclude)", [this](const httplib::Request& req, httplib::Response& res) {
        handleExclude(req, res, false);
    });

    server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        GAMEBATTLE_LOG_ERROR_F("Unhandled exception on %s %s: %s", req.method.c_str(), req.path.c_str(),
                               what.c_str());
        sendError(res, ErrorCode::InternalError);
    });
}

std::optional<Identity> ApiServer::identify(const httplib::Request& req, httplib::Response& res) const {
    auto identity = m_services.gate->identify(headersOf(req));
    if (identity.isFailure()) {
        sendError(res, identity.error());
        return std::nullopt;
    }
    return identity.value();
}

std::optional<Identity> ApiServer::identifyAdmin(const httplib::Request& req, httplib::Response& res) const {
    auto identity = identify(req, res);
    if (identity && !identity->isAdmin) {
        sendError(res, ErrorCode::Forbidden);
        return std::nullopt;
    }
    return identity;
}

size_t ApiServer::openStreams() const {
    std::lock_guard<std::mutex> lock(m_streamsMutex);
    return m_streams.size();
}

void ApiServer::forgetStream(const SessionId& sessionId, const StreamConnection* connection) {
    std::lock_guard<std::mutex> lock(m_streamsMutex);
    auto it = m_streams.find(sessionId);
    if (it == m_streams.end()) {
        return;
    }
    auto current = it->second.lock();
    if (!current || current.get() == connection) {
        m_streams.erase(it);
    }
}

// ============================================================================
// Sessions
// ============================================================================

void ApiServer::handleListSessions(const httplib::Request& req, httplib::Response& res) {
    auto identity = identify(req, res);
    if (!identity) {
        return;
    }
    json sessions = json::array();
    for (const auto& summary : m_services.sessions->listActive(*identity)) {
        sessions.push_back(summaryToJson(summary));
    }
    sendJson(res, 200, {{"status", "ok"}, {"sessions", sessions}});
}

void ApiServer::handleCreateSession(const httplib::Request& req, httplib::Response& res) {
    auto identity = identify(req, res);
    if (!identity) {
        return;
    }

    std::string gameId;
    try {
        json data = json::parse(req.body);
        if (!data.contains("gameId") || !data["gameId"].is_string()) {
            sendBadRequest(res, "Missing gameId");
            return;
        }
        gameId = data["gameId"].get<std::string>();
    } catch (const json::exception& e) {
        sendBadRequest(res, e.what());
        return;
    }

    auto handle = m_services.sessions->createOrAttach(*identity, gameId);
    if (handle.isFailure()) {
        sendError(res, handle.error());
        return;
    }

    json response = {
        {"status", "ok"},
        {"sessionId", handle.value().sessionId},
        {"gameId", handle.value().gameId},
        {"reattached", handle.value().reattached},
    };
    sendJson(res, handle.value().reattached ? 200 : 201, response);
}

void ApiServer::handleGetSession(const httplib::Request& req, httplib::Response& res) {
    auto identity = identify(req, res);
    if (!identity) {
        return;
    }
    auto summary = m_services.sessions->getSession(req.matches[1], *identity);
    if (summary.isFailure()) {
        sendError(res, summary.error());
        return;
    }
    sendJson(res, 200, {{"status", "ok"}, {"session", summaryToJson(summary.value())}});
}

void ApiServer::handleTerminate(const httplib::Request& req, httplib::Response& res) {
    auto identity = identify(req, res);
    if (!identity) {
        return;
    }
    auto stopped = m_services.sessions->terminate(req.matches[1], *identity);
    if (stopped.isFailure()) {
        sendError(res, stopped.error());
        return;
    }
    sendJson(res, 202, {{"status", "ok"}});
}

void ApiServer::handleRestart(const httplib::Request& req, httplib::Response& res) {
    auto identity = identify(req, res);
    if (!identity) {
        return;
    }
    auto handle = m_services.sessions->restart(req.matches[1], *identity);
    if (handle.isFailure()) {
        sendError(res, handle.error());
        return;
    }
    json response = {
        {"status", "ok"},
        {"sessionId", handle.value().sessionId},
        {"gameId", handle.value().gameId},
        {"reattached", handle.value().reattached},
    };
    sendJson(res, 201, response);
}

void ApiServer::handleStream(const httplib::Request& req, httplib::Response& res) {
    auto identity = identify(req, res);
    if (!identity) {
        return;
    }
    const SessionId sessionId = req.matches[1];

    auto connection = std::make_shared<StreamConnection>(m_services.config->bridgeBufferBytes);
    auto attached = m_services.sessions->attachClient(sessionId, *identity, connection);
    if (attached.isFailure()) {
        sendError(res, attached.error());
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_streamsMutex);
        m_streams[sessionId] = connection;
    }

    res.set_chunked_content_provider(
        "application/x-ndjson",
        [connection](size_t, httplib::DataSink& sink) {
            auto chunk = connection->nextChunk(kStreamPoll);
            if (chunk) {
                if (!sink.write(chunk->data(), chunk->size())) {
                    connection->markGone();
                    return false;
                }
                return true;
            }
            if (connection->finished()) {
                sink.done();
                return true;
            }
            if (!sink.is_writable()) {
                connection->markGone();
                return false;
            }
            return true;
        },
        [this, sessionId, connection](bool) {
            connection->markGone();
            forgetStream(sessionId, connection.get());
        });
}

void ApiServer::handleInput(const httplib::Request& req, httplib::Response& res) {
    auto identity = identify(req, res);
    if (!identity) {
        return;
    }
    const SessionId sessionId = req.matches[1];

    auto summary = m_services.sessions->getSession(sessionId, *identity);
    if (summary.isFailure()) {
        sendError(res, summary.error());
        return;
    }
    if (summary.value().state == SessionState::Terminating || summary.value().state == SessionState::Terminated) {
        sendError(res, ErrorCode::SessionTerminated);
        return;
    }

    std::shared_ptr<StreamConnection> connection;
    {
        std::lock_guard<std::mutex> lock(m_streamsMutex);
        auto it = m_streams.find(sessionId);
        if (it != m_streams.end()) {
            connection = it->second.lock();
            if (!connection) {
                m_streams.erase(it);
            }
        }
    }
    if (!connection) {
        sendError(res, ErrorCode::ClientDisconnected);
        return;
    }

    auto pushed = connection->pushInput(ByteBuffer(req.body.begin(), req.body.end()));
    if (pushed.isFailure()) {
        sendError(res, pushed.error());
        return;
    }
    sendJson(res, 202, {{"status", "ok"}, {"bytes", req.body.size()}});
}

// ============================================================================
// Competition
// ============================================================================

void ApiServer::handleReport(const httplib::Request& req, httplib::Response& res) {
    auto identity = identify(req, res);
    if (!identity) {
        return;
    }

    ReportReason shortReason = ReportReason::Other;
    std::string reason;
    bool captureOutput = false;
    try {
        json data = json::parse(req.body);
        auto parsed = parseReportReason(data.value("shortReason", std::string("other")));
        if (parsed.isFailure()) {
            sendBadRequest(res, "shortReason must be unclear, buggy or other");
            return;
        }
        shortReason = parsed.value();
        reason = data.value("reason", std::string());
        captureOutput = data.value("captureOutput", false);
    } catch (const json::exception& e) {
        sendBadRequest(res, e.what());
        return;
    }

    auto filed = m_services.reports->fileReport(*identity, req.matches[1], shortReason, reason, captureOutput);
    if (filed.isFailure()) {
        sendError(res, filed.error());
        return;
    }
    sendJson(res, 201, {{"status", "ok"}, {"reports", filed.value()}});
}

void ApiServer::handleListReports(const httplib::Request& req, httplib::Response& res) {
    auto identity = identify(req, res);
    if (!identity) {
        return;
    }
    auto reports = m_services.reports->reports(req.matches[1], *identity);
    if (reports.isFailure()) {
        sendError(res, reports.error());
        return;
    }
    json list = json::array();
    for (const auto& report : reports.value()) {
        list.push_back(report.toJson());
    }
    res.status = 200;
    res.set_content(json({{"status", "ok"}, {"reports", list}})
                        .dump(-1, ' ', false, json::error_handler_t::replace),
                    "application/json");
}

void ApiServer::handleLeaderboard(const httplib::Request& req, httplib::Response& res) {
    if (!m_services.competition->enabled()) {
        sendError(res, ErrorCode::CompetitionDisabled);
        return;
    }

    size_t limit = 0;
    if (req.has_param("limit")) {
        try {
            limit = static_cast<size_t>(std::stoul(req.get_param_value("limit")));
        } catch (const std::exception&) {
            sendBadRequest(res, "limit must be a non-negative integer");
            return;
        }
    }

    auto entries = m_services.competition->leaderboard(limit);
    if (entries.isFailure()) {
        sendError(res, entries.error());
        return;
    }

    json board = json::array();
    int64_t rank = 0;
    for (const auto& entry : entries.value()) {
        board.push_back({
            {"rank", ++rank},
            {"userId", entry.userId},
            {"score", entry.score},
            {"sessions", entry.sessions},
            {"updatedAt", entry.updatedAt},
        });
    }
    sendJson(res, 200, {{"status", "ok"}, {"leaderboard", board}});
}

void ApiServer::handlePlayerStats(const httplib::Request& req, httplib::Response& res) {
    auto identity = identify(req, res);
    if (!identity) {
        return;
    }
    if (!m_services.competition->enabled()) {
        sendError(res, ErrorCode::CompetitionDisabled);
        return;
    }
    auto standing = m_services.competition->standing(identity->userId);
    if (standing.isFailure()) {
        sendError(res, standing.error());
        return;
    }
    sendJson(res, 200, {{"status", "ok"}, {"stats", standing.value().toJson()}});
}

void ApiServer::handleAdminStats(const httplib::Request& req, httplib::Response& res) {
    auto identity = identifyAdmin(req, res);
    if (!identity) {
        return;
    }

    auto games = m_services.competition->gameStats();
    if (games.isFailure()) {
        sendError(res, games.error());
        return;
    }

    std::map<GameId, size_t> live;
    for (const auto& summary : m_services.sessions->listActive(*identity)) {
        ++live[summary.gameId];
    }

    json list = json::array();
    for (const auto& stats : games.value()) {
        json doc = stats.toJson();
        doc["activeSessions"] = live[stats.gameId];
        auto reports = m_services.reports->reports(stats.gameId, *identity);
        if (reports.isFailure()) {
            sendError(res, reports.error());
            return;
        }
        doc["reports"] = reports.value().size();
        list.push_back(std::move(doc));
    }

    auto board = m_services.competition->leaderboard(0);
    if (board.isFailure()) {
        sendError(res, board.error());
        return;
    }
    sendJson(res, 200, {
        {"status", "ok"},
        {"competition", m_services.competition->enabled()},
        {"players", board.value().size()},
        {"games", list},
    });
}

void ApiServer::handleExclude(const httplib::Request& req, httplib::Response& res, bool excluded) {
    auto identity = identifyAdmin(req, res);
    if (!identity) {
        return;
    }
    const GameId gameId = req.matches[1];
    auto updated = excluded ? m_services.competition->excludeGame(gameId)
                            : m_services.competition->includeGame(gameId);
    if (updated.isFailure()) {
        sendError(res, updated.error());
        return;
    }
    GAMEBATTLE_LOG_INFO_F("%s %s game %s", identity->userId.c_str(), excluded ? "excluded" : "included",
                          gameId.c_str());
    sendJson(res, 200, {{"status", "ok"}, {"gameId", gameId}, {"excluded", excluded}});
}

void ApiServer::handleListExcluded(const httplib::Request& req, httplib::Response& res) {
    auto identity = identifyAdmin(req, res);
    if (!identity) {
        return;
    }
    auto games = m_services.competition->excludedGames();
    if (games.isFailure()) {
        sendError(res, games.error());
        return;
    }
    sendJson(res, 200, {{"status", "ok"}, {"games", games.value()}});
}

void ApiServer::handleStatus(const httplib::Request&, httplib::Response& res) {
    json status;
    status["active_sessions"] = m_services.sessions->activeCount();
    status["active_sandboxes"] = m_services.sandboxes->activeCount();
    status["max_sandboxes"] = m_services.config->maxSandboxes;
    status["competition"] = m_services.competition->enabled();
    status["games"] = m_services.catalog->list().size();
    status["open_streams"] = openStreams();
    if (m_services.notifier && m_services.notifier->enabled()) {
        auto stats = m_services.notifier->stats();
        status["webhooks"] = {
            {"enqueued", stats.enqueued},
            {"delivered", stats.delivered},
            {"failed", stats.failed},
            {"discarded", stats.discarded},
        };
    }
    status["server_time"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();

    res.set_content(status.dump(2), "application/json");
}

} // namespace Gamebattle::Server
