/**
 * @file StateStore.hpp
 * @brief Shared key-value state with compare-and-set and leased locks
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Keyspace used by the orchestrator:
 * - `session:<sid>`              session record (JSON)
 * - `user:<uid>:sessions`        JSON list of the user's live session ids
 * - `leaderboard:user:<uid>`     leaderboard entry (JSON)
 * - `competition:record:<sid>`   competition record (JSON)
 * - `report:<gameId>`            JSON list of game reports
 * - `lock:<name>`                lock tokens
 */

#pragma once

#ifndef GAMEBATTLE_ORCHESTRATOR_STATE_STORE_HPP
#define GAMEBATTLE_ORCHESTRATOR_STATE_STORE_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Gamebattle::Orchestrator {

/**
 * @brief Proof of holding a named lock
 */
struct LockLease {
    std::string name;
    std::string token;
    TimePoint expiresAt;
};

/**
 * @brief Store interface
 *
 * Every operation fails with StoreUnavailable when the backend cannot be
 * reached. Values are opaque strings.
 */
class StateStore {
public:
    virtual ~StateStore() = default;

    /// Value of a key, nullopt if absent
    virtual Result<std::optional<std::string>> get(const std::string& key) = 0;

    virtual Result<void> set(const std::string& key, const std::string& value,
                             std::optional<Milliseconds> ttl = std::nullopt) = 0;

    /**
     * @brief Atomically replace a value if it still equals the expected one
     * @param expected Current value; nullopt requires the key to be absent
     * @param desired New value; nullopt deletes the key
     * @return ConditionFailed when the current value differs
     */
    virtual Result<void> compareAndSet(const std::string& key,
                                       const std::optional<std::string>& expected,
                                       const std::optional<std::string>& desired,
                                       std::optional<Milliseconds> ttl = std::nullopt) = 0;

    virtual Result<void> remove(const std::string& key) = 0;

    /// All pairs whose key starts with prefix
    virtual Result<std::vector<std::pair<std::string, std::string>>> scan(const std::string& prefix) = 0;

    /**
     * @brief Acquire `lock:<name>`
     * @param lease How long the lock is held unless released
     * @param wait How long to keep trying
     * @return Lease, or LockNotAcquired
     */
    virtual Result<LockLease> acquireLock(const std::string& name, Milliseconds lease, Milliseconds wait) = 0;

    /**
     * @brief Release a lease
     * @return LeaseLost if the lock expired and was taken by someone else
     */
    virtual Result<void> releaseLock(const LockLease& lease) = 0;
};

/**
 * @brief Releases a lease when leaving scope
 */
class ScopedLock {
public:
    ScopedLock(StateStore& store, LockLease lease) : m_store(&store), m_lease(std::move(lease)) {}
    ~ScopedLock() { release(); }

    ScopedLock(const ScopedLock&) = delete;
    ScopedLock& operator=(const ScopedLock&) = delete;

    /// Release now; returns LeaseLost if the lease had expired
    Result<void> release();

private:
    StateStore* m_store;
    LockLease m_lease;
    bool m_released = false;
};

// ============================================================================
// In-process store
// ============================================================================

/**
 * @brief Single-process store with lazy TTL expiry
 *
 * Used for single-node deployments and tests. setAvailable() and failNext()
 * simulate backend outages.
 */
class MemoryStateStore : public StateStore {
public:
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

    /// While false every operation fails with StoreUnavailable
    void setAvailable(bool available);

    /// Fail the next n operations with StoreUnavailable
    void failNext(int count);

    [[nodiscard]] size_t size() const;

private:
    struct Entry {
        std::string value;
        std::optional<TimePoint> expiresAt;
    };

    bool checkAvailable();
    void expireLocked(const std::string& key);

    mutable std::mutex m_mutex;
    std::map<std::string, Entry> m_entries;
    bool m_available = true;
    int m_failures = 0;
};

// ============================================================================
// Retry decorator
// ============================================================================

/**
 * @brief Retries StoreUnavailable and Timeout with exponential backoff
 */
class RetryingStateStore : public StateStore {
public:
    RetryingStateStore(std::shared_ptr<StateStore> inner, int maxAttempts, Milliseconds baseDelay);

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
    template<typename Operation>
    auto retry(const char* what, Operation&& operation) -> decltype(operation());

    std::shared_ptr<StateStore> m_inner;
    int m_maxAttempts;
    Milliseconds m_baseDelay;
};

} // namespace Gamebattle::Orchestrator

#endif // GAMEBATTLE_ORCHESTRATOR_STATE_STORE_HPP
