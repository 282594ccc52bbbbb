/**
 * @file OrchestratorConfig.hpp
 * @brief Immutable runtime configuration of the session orchestrator
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Built once at startup from a config file plus environment overrides and
 * handed to every component by shared const pointer.
 */

#pragma once

#ifndef GAMEBATTLE_ORCHESTRATOR_CONFIG_HPP
#define GAMEBATTLE_ORCHESTRATOR_CONFIG_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <Gamebattle/Core/Config.hpp>
#include <map>
#include <set>
#include <string>

namespace Gamebattle::Orchestrator {

/**
 * @brief Ceilings applied to every sandbox
 *
 * A zero value disables the corresponding ceiling, except wallClock which
 * is always enforced.
 */
struct ResourceLimits {
    Seconds cpuTime{600};                         ///< RLIMIT_CPU
    uint64_t memoryBytes = 40ull * 1024 * 1024;   ///< RLIMIT_AS or docker --memory
    uint64_t maxProcesses = 64;                   ///< Container --pids-limit only
    uint64_t maxOutputFileBytes = 1024 * 1024;    ///< RLIMIT_FSIZE
    double cpuFraction = 0.1;                     ///< docker --cpus
    Seconds wallClock{3600};                      ///< Hard lifetime
    bool isolateNetwork = true;                   ///< Private network namespace
};

/**
 * @brief What the bridge does with game output while no client is attached
 */
enum class DetachedOutputPolicy {
    ReplayBounded,   ///< Keep the newest output up to a cap and replay it on re-attach
    DropWithMarker   ///< Discard output and report the discarded byte count on re-attach
};

/**
 * @brief Inter-process transport between orchestrator and sandbox
 */
enum class ChannelTransport {
    Fifo,   ///< Named FIFOs under the runtime directory
    Pipe    ///< Anonymous pipes
};

/**
 * @brief State store backend
 */
enum class StoreBackend {
    Memory,
    Redis
};

struct RedisSettings {
    std::string host = "127.0.0.1";
    int port = 6379;
    int db = 0;
    std::string password;
    Milliseconds connectTimeout{1500};
    Milliseconds socketTimeout{1500};
    size_t poolSize = 4;
};

/**
 * @brief Orchestrator configuration
 */
struct OrchestratorConfig {
    // Games
    std::string gamesPath = "games";

    // Sandboxes
    std::string runtimeDir = "/tmp/gamebattle";
    ChannelTransport transport = ChannelTransport::Fifo;
    std::string dockerBinary = "docker";
    size_t maxSandboxes = 64;
    ResourceLimits limits;
    Milliseconds stopGrace{2000};
    Milliseconds launchTimeout{5000};

    // Sessions
    std::set<UserId> adminIds;
    size_t maxSessionsPerUser = 1;
    Milliseconds disconnectGrace{60000};
    Milliseconds retention{300000};
    Milliseconds reaperInterval{1000};

    // Bridge
    size_t bridgeBufferBytes = 64 * 1024;
    size_t replayCapacityBytes = 256 * 1024;
    Milliseconds stallTimeout{2000};
    DetachedOutputPolicy detachedPolicy = DetachedOutputPolicy::ReplayBounded;

    // Store
    StoreBackend storeBackend = StoreBackend::Memory;
    RedisSettings redis;
    int storeRetryAttempts = 3;
    Milliseconds storeRetryBaseDelay{50};
    Milliseconds lockLease{5000};
    Milliseconds lockWait{2000};

    // Competition
    bool competitionEnabled = false;
    std::string webhookUrl;
    std::string webhookSecret;
    int webhookMaxAttempts = 3;
    Milliseconds webhookBaseDelay{500};
    Milliseconds webhookTimeout{5000};

    // Server
    std::string listenHost = "0.0.0.0";
    int listenPort = 8080;
    std::string userHeader = "X-User-Id";
    std::string logLevel = "info";
    std::string logFile;

    /// Membership in the admin allow-list
    [[nodiscard]] bool isAdmin(const UserId& userId) const {
        return adminIds.count(userId) != 0;
    }

    /**
     * @brief Reject inconsistent settings
     */
    [[nodiscard]] Result<void> validate() const;

    /**
     * @brief Build from a parsed configuration map; unset keys keep defaults
     */
    static Result<OrchestratorConfig> fromConfigMap(const Config::ConfigMap& config);

    /**
     * @brief Load a config file (optional) and overlay the environment
     * @param path Config file path; empty to use environment and defaults only
     * @param env Environment lookup
     */
    static Result<OrchestratorConfig> load(const std::string& path,
                                           const Config::EnvironmentLookup& env);
};

/**
 * @brief Environment variable to config key bindings
 */
const std::map<std::string, std::string>& environmentBindings();

} // namespace Gamebattle::Orchestrator

#endif // GAMEBATTLE_ORCHESTRATOR_CONFIG_HPP
