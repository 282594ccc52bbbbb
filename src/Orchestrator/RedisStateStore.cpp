/**
 * @file RedisStateStore.cpp
 * @brief redis-plus-plus backed StateStore
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/RedisStateStore.hpp>
#include <Gamebattle/Core/Crypto.hpp>
#include <Gamebattle/Core/Logger.hpp>

#include <sw/redis++/redis++.h>

#include <iterator>
#include <thread>
#include <unordered_set>

namespace Gamebattle::Orchestrator {

namespace {

// KEYS[1] key
// ARGV: hasExpected, expected, hasDesired, desired, ttlMillis (0 = none)
constexpr const char* kCompareAndSetScript = R"lua(
local current = redis.call('GET', KEYS[1])
if ARGV[1] == '1' then
    if current ~= ARGV[2] then return 0 end
elseif current then
    return 0
end
if ARGV[3] == '1' then
    if tonumber(ARGV[5]) > 0 then
        redis.call('SET', KEYS[1], ARGV[4], 'PX', ARGV[5])
    else
        redis.call('SET', KEYS[1], ARGV[4])
    end
else
    redis.call('DEL', KEYS[1])
end
return 1
)lua";

constexpr const char* kReleaseScript = R"lua(
if redis.call('GET', KEYS[1]) == ARGV[1] then
    return redis.call('DEL', KEYS[1])
end
return 0
)lua";

/// Escape glob metacharacters for SCAN MATCH
std::string globEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 1);
    for (char c : text) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

// ============================================================================
// RedisStateStore::Impl
// ============================================================================

class RedisStateStore::Impl {
public:
    explicit Impl(const RedisSettings& settings) {
        sw::redis::ConnectionOptions connection;
        connection.host = settings.host;
        connection.port = settings.port;
        connection.db = settings.db;
        if (!settings.password.empty()) {
            connection.password = settings.password;
        }
        connection.connect_timeout = settings.connectTimeout;
        connection.socket_timeout = settings.socketTimeout;

        sw::redis::ConnectionPoolOptions pool;
        pool.size = settings.poolSize;

        // Connections are opened lazily; construction does not touch the network
        redis = std::make_unique<sw::redis::Redis>(connection, pool);
    }

    /// Run a redis++ call, mapping its exceptions to error codes
    template<typename Operation>
    auto guarded(const char* what, Operation&& operation) -> Result<decltype(operation())> {
        try {
            return operation();
        } catch (const sw::redis::TimeoutError& e) {
            GAMEBATTLE_LOG_WARNING_F("Redis %s timed out: %s", what, e.what());
            return ErrorCode::Timeout;
        } catch (const sw::redis::Error& e) {
            GAMEBATTLE_LOG_WARNING_F("Redis %s failed: %s", what, e.what());
            return ErrorCode::StoreUnavailable;
        }
    }

    Result<void> guardedVoid(const char* what, const std::function<void()>& operation) {
        auto result = guarded(what, [&] {
            operation();
            return true;
        });
        if (result.isFailure()) {
            return result.error();
        }
        return Result<void>::Success();
    }

    std::unique_ptr<sw::redis::Redis> redis;
    Crypto::SecureRandom random;
};

// ============================================================================
// RedisStateStore - Public API
// ============================================================================

RedisStateStore::RedisStateStore(const RedisSettings& settings)
    : m_impl(std::make_unique<Impl>(settings)) {
}

RedisStateStore::~RedisStateStore() = default;

Result<void> RedisStateStore::ping() {
    return m_impl->guardedVoid("PING", [&] { m_impl->redis->ping(); });
}

Result<std::optional<std::string>> RedisStateStore::get(const std::string& key) {
    return m_impl->guarded("GET", [&] {
        auto value = m_impl->redis->get(key);
        return value ? std::optional<std::string>(*value) : std::nullopt;
    });
}

Result<void> RedisStateStore::set(const std::string& key, const std::string& value,
                                  std::optional<Milliseconds> ttl) {
    return m_impl->guardedVoid("SET", [&] {
        m_impl->redis->set(key, value, ttl.value_or(Milliseconds(0)));
    });
}

Result<void> RedisStateStore::compareAndSet(const std::string& key,
                                            const std::optional<std::string>& expected,
                                            const std::optional<std::string>& desired,
                                            std::optional<Milliseconds> ttl) {
    auto applied = m_impl->guarded("CAS", [&] {
        return m_impl->redis->eval<long long>(
            kCompareAndSetScript,
            {key},
            {expected ? std::string("1") : std::string("0"),
             expected.value_or(std::string()),
             desired ? std::string("1") : std::string("0"),
             desired.value_or(std::string()),
             std::to_string(ttl.value_or(Milliseconds(0)).count())});
    });
    if (applied.isFailure()) {
        return applied.error();
    }
    if (applied.value() == 0) {
        return ErrorCode::ConditionFailed;
    }
    return Result<void>::Success();
}

Result<void> RedisStateStore::remove(const std::string& key) {
    return m_impl->guardedVoid("DEL", [&] { m_impl->redis->del(key); });
}

Result<std::vector<std::pair<std::string, std::string>>> RedisStateStore::scan(const std::string& prefix) {
    return m_impl->guarded("SCAN", [&] {
        std::unordered_set<std::string> keys;
        std::string pattern = globEscape(prefix) + "*";
        long long cursor = 0;
        do {
            cursor = m_impl->redis->scan(cursor, pattern, 100, std::inserter(keys, keys.begin()));
        } while (cursor != 0);

        std::vector<std::pair<std::string, std::string>> out;
        out.reserve(keys.size());
        for (const auto& key : keys) {
            auto value = m_impl->redis->get(key);
            if (value) {
                out.emplace_back(key, *value);
            }
        }
        return out;
    });
}

Result<LockLease> RedisStateStore::acquireLock(const std::string& name, Milliseconds lease, Milliseconds wait) {
    GAMEBATTLE_TRY_ASSIGN(token, m_impl->random.generateUuid());
    std::string key = "lock:" + name;

    TimePoint deadline = Clock::now() + wait;
    for (;;) {
        auto taken = m_impl->guarded("SET NX", [&] {
            return m_impl->redis->set(key, token, lease, sw::redis::UpdateType::NOT_EXIST);
        });
        if (taken.isFailure()) {
            return taken.error();
        }
        if (taken.value()) {
            return LockLease{name, token, Clock::now() + lease};
        }
        if (Clock::now() >= deadline) {
            return ErrorCode::LockNotAcquired;
        }
        std::this_thread::sleep_for(Milliseconds(10));
    }
}

Result<void> RedisStateStore::releaseLock(const LockLease& lease) {
    auto released = m_impl->guarded("lock release", [&] {
        return m_impl->redis->eval<long long>(kReleaseScript, {"lock:" + lease.name}, {lease.token});
    });
    if (released.isFailure()) {
        return released.error();
    }
    if (released.value() == 0) {
        return ErrorCode::LeaseLost;
    }
    return Result<void>::Success();
}

// ============================================================================
// Factory
// ============================================================================

Result<std::shared_ptr<StateStore>> makeStateStore(const OrchestratorConfig& config) {
    std::shared_ptr<StateStore> backend;
    if (config.storeBackend == StoreBackend::Redis) {
        auto redis = std::make_shared<RedisStateStore>(config.redis);
        auto reachable = redis->ping();
        if (reachable.isFailure()) {
            GAMEBATTLE_LOG_WARNING_F("Redis at %s:%d is not reachable yet",
                                     config.redis.host.c_str(), config.redis.port);
        }
        backend = redis;
        GAMEBATTLE_LOG_INFO_F("Using Redis state store at %s:%d/%d",
                              config.redis.host.c_str(), config.redis.port, config.redis.db);
    } else {
        backend = std::make_shared<MemoryStateStore>();
        GAMEBATTLE_LOG_INFO("Using in-process state store");
    }
    return std::shared_ptr<StateStore>(
        std::make_shared<RetryingStateStore>(backend, config.storeRetryAttempts, config.storeRetryBaseDelay));
}

} // namespace Gamebattle::Orchestrator
