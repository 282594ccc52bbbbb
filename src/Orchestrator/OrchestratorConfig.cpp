/**
 * @file OrchestratorConfig.cpp
 * @brief Conversion of raw configuration into the orchestrator settings
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/OrchestratorConfig.hpp>
#include <Gamebattle/Core/Logger.hpp>
#include <nlohmann/json.hpp>

#include <sstream>

namespace Gamebattle::Orchestrator {

using Config::ConfigMap;
using Config::getBool;
using Config::getDouble;
using Config::getInt;
using Config::getString;

namespace {

template<typename T>
bool readCount(const ConfigMap& config, const std::string& key, T& target) {
    auto value = getInt(config, key);
    if (!value) {
        return config.find(key) == config.end();
    }
    if (*value < 0) {
        return false;
    }
    target = static_cast<T>(*value);
    return true;
}

bool readMillis(const ConfigMap& config, const std::string& key, Milliseconds& target) {
    auto value = getInt(config, key);
    if (!value) {
        return config.find(key) == config.end();
    }
    if (*value < 0) {
        return false;
    }
    target = Milliseconds(*value);
    return true;
}

bool readSeconds(const ConfigMap& config, const std::string& key, Seconds& target) {
    auto value = getInt(config, key);
    if (!value) {
        return config.find(key) == config.end();
    }
    if (*value < 0) {
        return false;
    }
    target = Seconds(*value);
    return true;
}

/// Admin list accepts a JSON array or a comma separated list
Result<std::set<UserId>> parseAdminList(const std::string& raw) {
    std::set<UserId> admins;
    if (raw.empty()) {
        return admins;
    }

    if (raw.front() == '[') {
        try {
            auto parsed = nlohmann::json::parse(raw);
            for (const auto& item : parsed) {
                admins.insert(item.get<std::string>());
            }
        } catch (const nlohmann::json::exception& e) {
            GAMEBATTLE_LOG_ERROR_F("Invalid admin list: %s", e.what());
            return ErrorCode::ConfigInvalid;
        }
        return admins;
    }

    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            admins.insert(item);
        }
    }
    return admins;
}

} // namespace

const std::map<std::string, std::string>& environmentBindings() {
    static const std::map<std::string, std::string> bindings = {
        {"GAMES_PATH",           "games_path"},
        {"RUNTIME_DIR",          "runtime_dir"},
        {"ENABLE_COMPETITION",   "enable_competition"},
        {"REPORT_WEBHOOK",       "webhook_url"},
        {"WEBHOOK_SECRET",       "webhook_secret"},
        {"ADMIN_EMAILS",         "admin_ids"},
        {"MAX_SESSIONS_PER_USER", "max_sessions_per_user"},
        {"STORE_BACKEND",        "store_backend"},
        {"REDIS_HOST",           "redis_host"},
        {"REDIS_PORT",           "redis_port"},
        {"REDIS_DB",             "redis_db"},
        {"REDIS_PASSWORD",       "redis_password"},
        {"LISTEN_HOST",          "listen_host"},
        {"LISTEN_PORT",          "listen_port"},
        {"LOG_LEVEL",            "log_level"},
        {"LOG_FILE",             "log_file"},
    };
    return bindings;
}

Result<void> OrchestratorConfig::validate() const {
    if (gamesPath.empty() || runtimeDir.empty()) {
        GAMEBATTLE_LOG_ERROR("games_path and runtime_dir must be set");
        return ErrorCode::ConfigMissing;
    }
    if (maxSessionsPerUser == 0 || maxSandboxes == 0) {
        GAMEBATTLE_LOG_ERROR("Session and sandbox limits must be positive");
        return ErrorCode::ConfigInvalid;
    }
    if (limits.wallClock.count() <= 0) {
        GAMEBATTLE_LOG_ERROR("Sandbox lifetime must be positive");
        return ErrorCode::ConfigInvalid;
    }
    if (bridgeBufferBytes == 0 || replayCapacityBytes == 0) {
        GAMEBATTLE_LOG_ERROR("Bridge buffers must be non-empty");
        return ErrorCode::ConfigInvalid;
    }
    if (storeRetryAttempts < 1 || webhookMaxAttempts < 1) {
        GAMEBATTLE_LOG_ERROR("Retry budgets must allow at least one attempt");
        return ErrorCode::ConfigInvalid;
    }
    if (listenPort <= 0 || listenPort > 65535 || redis.port <= 0 || redis.port > 65535) {
        GAMEBATTLE_LOG_ERROR("Port out of range");
        return ErrorCode::ConfigInvalid;
    }
    if (limits.cpuFraction < 0.0) {
        return ErrorCode::ConfigInvalid;
    }
    return Result<void>::Success();
}

Result<OrchestratorConfig> OrchestratorConfig::fromConfigMap(const ConfigMap& config) {
    OrchestratorConfig out;
    bool ok = true;

    if (auto v = getString(config, "games_path")) out.gamesPath = *v;
    if (auto v = getString(config, "runtime_dir")) out.runtimeDir = *v;
    if (auto v = getString(config, "docker_binary")) out.dockerBinary = *v;

    if (auto v = getString(config, "transport")) {
        if (*v == "fifo") {
            out.transport = ChannelTransport::Fifo;
        } else if (*v == "pipe") {
            out.transport = ChannelTransport::Pipe;
        } else {
            GAMEBATTLE_LOG_ERROR_F("Unknown transport '%s'", v->c_str());
            ok = false;
        }
    }

    ok = readCount(config, "max_sandboxes", out.maxSandboxes) && ok;
    ok = readSeconds(config, "sandbox_cpu_seconds", out.limits.cpuTime) && ok;
    ok = readCount(config, "sandbox_memory_bytes", out.limits.memoryBytes) && ok;
    ok = readCount(config, "sandbox_max_processes", out.limits.maxProcesses) && ok;
    ok = readCount(config, "sandbox_max_output_file_bytes", out.limits.maxOutputFileBytes) && ok;
    ok = readSeconds(config, "sandbox_lifetime_seconds", out.limits.wallClock) && ok;
    if (auto v = getDouble(config, "sandbox_cpu_fraction")) out.limits.cpuFraction = *v;
    if (auto v = getBool(config, "sandbox_isolate_network")) out.limits.isolateNetwork = *v;
    ok = readMillis(config, "stop_grace_ms", out.stopGrace) && ok;
    ok = readMillis(config, "launch_timeout_ms", out.launchTimeout) && ok;

    if (auto v = getString(config, "admin_ids")) {
        auto admins = parseAdminList(*v);
        if (admins.isFailure()) {
            return admins.error();
        }
        out.adminIds = std::move(admins).value();
    }
    ok = readCount(config, "max_sessions_per_user", out.maxSessionsPerUser) && ok;
    ok = readMillis(config, "disconnect_grace_ms", out.disconnectGrace) && ok;
    ok = readMillis(config, "retention_ms", out.retention) && ok;
    ok = readMillis(config, "reaper_interval_ms", out.reaperInterval) && ok;

    ok = readCount(config, "bridge_buffer_bytes", out.bridgeBufferBytes) && ok;
    ok = readCount(config, "replay_capacity_bytes", out.replayCapacityBytes) && ok;
    ok = readMillis(config, "stall_timeout_ms", out.stallTimeout) && ok;
    if (auto v = getString(config, "detached_output_policy")) {
        if (*v == "replay") {
            out.detachedPolicy = DetachedOutputPolicy::ReplayBounded;
        } else if (*v == "drop") {
            out.detachedPolicy = DetachedOutputPolicy::DropWithMarker;
        } else {
            GAMEBATTLE_LOG_ERROR_F("Unknown detached_output_policy '%s'", v->c_str());
            ok = false;
        }
    }

    if (auto v = getString(config, "store_backend")) {
        if (*v == "memory") {
            out.storeBackend = StoreBackend::Memory;
        } else if (*v == "redis") {
            out.storeBackend = StoreBackend::Redis;
        } else {
            GAMEBATTLE_LOG_ERROR_F("Unknown store_backend '%s'", v->c_str());
            ok = false;
        }
    }
    if (auto v = getString(config, "redis_host")) out.redis.host = *v;
    if (auto v = getInt(config, "redis_port")) out.redis.port = static_cast<int>(*v);
    if (auto v = getInt(config, "redis_db")) out.redis.db = static_cast<int>(*v);
    if (auto v = getString(config, "redis_password")) out.redis.password = *v;
    ok = readMillis(config, "redis_timeout_ms", out.redis.socketTimeout) && ok;
    out.redis.connectTimeout = out.redis.socketTimeout;
    if (auto v = getInt(config, "store_retry_attempts")) out.storeRetryAttempts = static_cast<int>(*v);
    ok = readMillis(config, "store_retry_delay_ms", out.storeRetryBaseDelay) && ok;
    ok = readMillis(config, "lock_lease_ms", out.lockLease) && ok;
    ok = readMillis(config, "lock_wait_ms", out.lockWait) && ok;

    if (auto v = getBool(config, "enable_competition")) out.competitionEnabled = *v;
    if (auto v = getString(config, "webhook_url")) out.webhookUrl = *v;
    if (auto v = getString(config, "webhook_secret")) out.webhookSecret = *v;
    if (auto v = getInt(config, "webhook_max_attempts")) out.webhookMaxAttempts = static_cast<int>(*v);
    ok = readMillis(config, "webhook_retry_delay_ms", out.webhookBaseDelay) && ok;
    ok = readMillis(config, "webhook_timeout_ms", out.webhookTimeout) && ok;

    if (auto v = getString(config, "listen_host")) out.listenHost = *v;
    if (auto v = getInt(config, "listen_port")) out.listenPort = static_cast<int>(*v);
    if (auto v = getString(config, "user_header")) out.userHeader = *v;
    if (auto v = getString(config, "log_level")) out.logLevel = *v;
    if (auto v = getString(config, "log_file")) out.logFile = *v;

    if (!ok) {
        return ErrorCode::ConfigInvalid;
    }

    auto valid = out.validate();
    if (valid.isFailure()) {
        return valid.error();
    }
    return out;
}

Result<OrchestratorConfig> OrchestratorConfig::load(const std::string& path,
                                                    const Config::EnvironmentLookup& env) {
    ConfigMap config;
    if (!path.empty()) {
        Config::ConfigLoader loader;
        auto loaded = loader.load(path);
        if (loaded.isFailure()) {
            return loaded.error();
        }
        config = std::move(loaded).value();
    }

    size_t overridden = Config::ConfigLoader::applyEnvironment(config, environmentBindings(), env);
    GAMEBATTLE_LOG_DEBUG_F("Applied %zu environment overrides", overridden);

    return fromConfigMap(config);
}

} // namespace Gamebattle::Orchestrator
