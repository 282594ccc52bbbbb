/**
 * @file main.cpp
 * @brief gamebattle-server entry point
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Usage: gamebattle-server [config-file]
 */

#include "ApiServer.hpp"

#include <Gamebattle/Core/Config.hpp>
#include <Gamebattle/Core/Logger.hpp>
#include <Gamebattle/Orchestrator/RedisStateStore.hpp>

#include <csignal>
#include <pthread.h>
#include <iostream>
#include <thread>

using namespace Gamebattle;
using namespace Gamebattle::Orchestrator;

int main(int argc, char* argv[]) {
    std::cout << "========================================" << std::endl;
    std::cout << "  Gamebattle Session Orchestrator" << std::endl;
    std::cout << "========================================" << std::endl;

    // Signals are taken by a dedicated thread; block them before any thread starts
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

    const std::string configPath = argc > 1 ? argv[1] : "";
    auto loaded = OrchestratorConfig::load(configPath, Config::processEnvironment());
    if (loaded.isFailure()) {
        std::cerr << "Invalid configuration: " << getErrorMessage(loaded.error()) << std::endl;
        return 1;
    }
    auto config = std::make_shared<const OrchestratorConfig>(std::move(loaded).value());

    auto& logger = Core::Logger::Instance();
    Core::LogOutput outputs = Core::LogOutput::Console;
    if (!config->logFile.empty()) {
        outputs = outputs | Core::LogOutput::File;
    }
    if (!logger.Initialize(Core::parseLogLevel(config->logLevel), outputs, config->logFile)) {
        std::cerr << "Failed to initialize logging" << std::endl;
        return 1;
    }

    auto catalog = std::make_shared<DirectoryGameCatalog>(config->gamesPath);
    auto games = catalog->reload();
    if (games.isFailure()) {
        GAMEBATTLE_LOG_CRITICAL("Games directory could not be read");
        logger.Shutdown();
        return 1;
    }
    GAMEBATTLE_LOG_INFO_F("Loaded %zu games from %s", games.value(), config->gamesPath.c_str());

    auto store = makeStateStore(*config);
    if (store.isFailure()) {
        GAMEBATTLE_LOG_CRITICAL("State store could not be created");
        logger.Shutdown();
        return 1;
    }

    auto notifier = std::make_shared<WebhookNotifier>(WebhookNotifier::optionsFrom(*config),
                                                      std::make_shared<HttpWebhookTransport>());
    notifier->start();

    auto competition = std::make_shared<CompetitionEngine>(config, store.value(), catalog, nullptr, notifier);
    auto sandboxes = std::make_shared<ProcessSandboxController>(catalog,
                                                                ProcessSandboxController::optionsFrom(*config));
    auto sessions = std::make_shared<SessionManager>(config, catalog, sandboxes, store.value(), competition);
    sessions->start();

    auto reports = std::make_shared<ReportDesk>(config, store.value(), catalog, *sessions, notifier);
    auto gate = std::make_shared<HeaderAccessGate>(config);

    Server::ApiServer api({config, catalog, sandboxes, sessions, competition, reports, notifier, gate});

    httplib::Server svr;
    api.registerRoutes(svr);

    std::thread signalThread([&svr, stopSignals]() {
        int received = 0;
        if (sigwait(&stopSignals, &received) == 0) {
            GAMEBATTLE_LOG_INFO_F("Received signal %d, stopping", received);
        }
        svr.stop();
    });

    GAMEBATTLE_LOG_INFO_F("Listening on http://%s:%d (competition %s)", config->listenHost.c_str(),
                          config->listenPort, config->competitionEnabled ? "on" : "off");

    int exitCode = 0;
    if (!svr.listen(config->listenHost, config->listenPort)) {
        GAMEBATTLE_LOG_CRITICAL_F("Failed to start server on port %d", config->listenPort);
        exitCode = 1;
        // Wake the signal thread so it can be joined
        pthread_kill(signalThread.native_handle(), SIGTERM);
    }
    signalThread.join();

    sessions->shutdown();
    if (!notifier->flush(config->webhookTimeout)) {
        GAMEBATTLE_LOG_WARNING("Webhook queue not drained before exit");
    }
    notifier->stop();

    GAMEBATTLE_LOG_INFO("Orchestrator stopped");
    logger.Shutdown();
    return exitCode;
}
