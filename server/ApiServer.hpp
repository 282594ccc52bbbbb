/**
 * @file ApiServer.hpp
 * @brief HTTP routes of the orchestrator
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#pragma once

#ifndef GAMEBATTLE_SERVER_API_SERVER_HPP
#define GAMEBATTLE_SERVER_API_SERVER_HPP

#include <Gamebattle/Core/ErrorCodes.hpp>
#include <Gamebattle/Orchestrator/AccessGate.hpp>
#include <Gamebattle/Orchestrator/CompetitionEngine.hpp>
#include <Gamebattle/Orchestrator/GameCatalog.hpp>
#include <Gamebattle/Orchestrator/OrchestratorConfig.hpp>
#include <Gamebattle/Orchestrator/ReportDesk.hpp>
#include <Gamebattle/Orchestrator/SandboxController.hpp>
#include <Gamebattle/Orchestrator/SessionManager.hpp>
#include <Gamebattle/Orchestrator/StreamConnection.hpp>
#include <Gamebattle/Orchestrator/WebhookNotifier.hpp>
#include <httplib.h>
#include <map>
#include <memory>
#include <mutex>

namespace Gamebattle::Server {

/// HTTP status for an operation error
int httpStatusFor(ErrorCode code);

struct Services {
    std::shared_ptr<const Orchestrator::OrchestratorConfig> config;
    std::shared_ptr<const Orchestrator::GameCatalog> catalog;
    std::shared_ptr<Orchestrator::SandboxController> sandboxes;
    std::shared_ptr<Orchestrator::SessionManager> sessions;
    std::shared_ptr<Orchestrator::CompetitionEngine> competition;
    std::shared_ptr<Orchestrator::ReportDesk> reports;
    std::shared_ptr<Orchestrator::WebhookNotifier> notifier;
    std::shared_ptr<const Orchestrator::AccessGate> gate;
};

class ApiServer {
public:
    explicit ApiServer(Services services);

    void registerRoutes(httplib::Server& server);

    /// Stream responses still being served
    [[nodiscard]] size_t openStreams() const;

private:
    void handleListSessions(const httplib::Request& req, httplib::Response& res);
    void handleCreateSession(const httplib::Request& req, httplib::Response& res);
    void handleGetSession(const httplib::Request& req, httplib::Response& res);
    void handleTerminate(const httplib::Request& req, httplib::Response& res);
    void handleRestart(const httplib::Request& req, httplib::Response& res);
    void handleStream(const httplib::Request& req, httplib::Response& res);
    void handleInput(const httplib::Request& req, httplib::Response& res);
    void handleReport(const httplib::Request& req, httplib::Response& res);
    void handleListReports(const httplib::Request& req, httplib::Response& res);
    void handleLeaderboard(const httplib::Request& req, httplib::Response& res);
    void handlePlayerStats(const httplib::Request& req, httplib::Response& res);
    void handleAdminStats(const httplib::Request& req, httplib::Response& res);
    void handleExclude(const httplib::Request& req, httplib::Response& res, bool excluded);
    void handleListExcluded(const httplib::Request& req, httplib::Response& res);
    void handleStatus(const httplib::Request& req, httplib::Response& res);

    /// Identify the caller or answer 401
    std::optional<Identity> identify(const httplib::Request& req, httplib::Response& res) const;
    /// Identify an admin caller or answer 401/403
    std::optional<Identity> identifyAdmin(const httplib::Request& req, httplib::Response& res) const;

    /// Drop the stream entry of a finished response unless a newer stream replaced it
    void forgetStream(const SessionId& sessionId, const Orchestrator::StreamConnection* connection);

    Services m_services;

    mutable std::mutex m_streamsMutex;
    std::map<SessionId, std::weak_ptr<Orchestrator::StreamConnection>> m_streams;
};

} // namespace Gamebattle::Server

#endif // GAMEBATTLE_SERVER_API_SERVER_HPP
