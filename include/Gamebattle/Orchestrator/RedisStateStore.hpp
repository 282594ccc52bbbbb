/**
 * @file RedisStateStore.hpp
 * @brief StateStore over Redis using redis-plus-plus
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Compare-and-set and lock release run as Lua scripts so they are atomic on
 * the server. Locks are `SET NX PX` with a random token.
 */

#pragma once

#ifndef GAMEBATTLE_ORCHESTRATOR_REDIS_STATE_STORE_HPP
#define GAMEBATTLE_ORCHESTRATOR_REDIS_STATE_STORE_HPP

#include <Gamebattle/Orchestrator/StateStore.hpp>
#include <Gamebattle/Orchestrator/OrchestratorConfig.hpp>
#include <memory>

namespace Gamebattle::Orchestrator {

class RedisStateStore : public StateStore {
public:
    explicit RedisStateStore(const RedisSettings& settings);
    ~RedisStateStore() override;

    RedisStateStore(const RedisStateStore&) = delete;
    RedisStateStore& operator=(const RedisStateStore&) = delete;

    /**
     * @brief PING the server
     */
    Result<void> ping();

    Result<std::optional<std::string>> get(const std::string& key) override;
    Result<void> set(const std::string& key, const std::string& value,
                     std::optional<Milliseconds> ttl = std::nullopt) override;
    Result<void> compareAndSet(const std::string& key,
                               const std::optional<std::string>& expected,
                               const std::optional<std::string>& desired,
                               std::optional<Milliseconds> ttl = std::nullopt) override;
    Result<void> remove(const std::string& key) override;
    Result<std::vector<std::pair<std::string, std::string>>> scan(const std::string& prefix) override;
    Result<LockLease> acquireLock(const std::string& name, Milliseconds lease, Milliseconds wait) override;
    Result<void> releaseLock(const LockLease& lease) override;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Store for the configured backend, wrapped in the retry decorator
 */
Result<std::shared_ptr<StateStore>> makeStateStore(const OrchestratorConfig& config);

} // namespace Gamebattle::Orchestrator

#endif // GAMEBATTLE_ORCHESTRATOR_REDIS_STATE_STORE_HPP
