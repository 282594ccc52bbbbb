/**
 * @file StateStore.cpp
 * @brief In-process store, retry decorator and scoped lock
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/StateStore.hpp>
#include <Gamebattle/Core/Crypto.hpp>
#include <Gamebattle/Core/Logger.hpp>

#include <thread>

namespace Gamebattle::Orchestrator {

namespace {

std::string lockKey(const std::string& name) {
    return "lock:" + name;
}

Result<std::string> newLockToken() {
    static Crypto::SecureRandom random;
    return random.generateUuid();
}

} // namespace

// ============================================================================
// ScopedLock
// ============================================================================

Result<void> ScopedLock::release() {
    if (m_released) {
        return Result<void>::Success();
    }
    m_released = true;
    auto released = m_store->releaseLock(m_lease);
    if (released.isFailure()) {
        GAMEBATTLE_LOG_WARNING_F("Releasing lock %s failed: %s", m_lease.name.c_str(),
                                 getErrorMessage(released.error()).data());
    }
    return released;
}

// ============================================================================
// MemoryStateStore
// ============================================================================

bool MemoryStateStore::checkAvailable() {
    if (!m_available) {
        return false;
    }
    if (m_failures > 0) {
        --m_failures;
        return false;
    }
    return true;
}

void MemoryStateStore::expireLocked(const std::string& key) {
    auto it = m_entries.find(key);
    if (it != m_entries.end() && it->second.expiresAt && *it->second.expiresAt <= Clock::now()) {
        m_entries.erase(it);
    }
}

Result<std::optional<std::string>> MemoryStateStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!checkAvailable()) {
        return ErrorCode::StoreUnavailable;
    }
    expireLocked(key);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::optional<std::string>();
    }
    return std::optional<std::string>(it->second.value);
}

Result<void> MemoryStateStore::set(const std::string& key, const std::string& value,
                                   std::optional<Milliseconds> ttl) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!checkAvailable()) {
        return ErrorCode::StoreUnavailable;
    }
    Entry& entry = m_entries[key];
    entry.value = value;
    entry.expiresAt = ttl ? std::optional<TimePoint>(Clock::now() + *ttl) : std::nullopt;
    return Result<void>::Success();
}

Result<void> MemoryStateStore::compareAndSet(const std::string& key,
                                             const std::optional<std::string>& expected,
                                             const std::optional<std::string>& desired,
                                             std::optional<Milliseconds> ttl) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!checkAvailable()) {
        return ErrorCode::StoreUnavailable;
    }
    expireLocked(key);

    auto it = m_entries.find(key);
    bool present = it != m_entries.end();
    if (expected.has_value() != present || (present && it->second.value != *expected)) {
        return ErrorCode::ConditionFailed;
    }

    if (!desired) {
        if (present) {
            m_entries.erase(it);
        }
        return Result<void>::Success();
    }

    Entry& entry = m_entries[key];
    entry.value = *desired;
    entry.expiresAt = ttl ? std::optional<TimePoint>(Clock::now() + *ttl) : std::nullopt;
    return Result<void>::Success();
}

Result<void> MemoryStateStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!checkAvailable()) {
        return ErrorCode::StoreUnavailable;
    }
    m_entries.erase(key);
    return Result<void>::Success();
}

Result<std::vector<std::pair<std::string, std::string>>> MemoryStateStore::scan(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!checkAvailable()) {
        return ErrorCode::StoreUnavailable;
    }

    std::vector<std::pair<std::string, std::string>> out;
    TimePoint now = Clock::now();
    for (auto it = m_entries.lower_bound(prefix); it != m_entries.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        if (it->second.expiresAt && *it->second.expiresAt <= now) {
            continue;
        }
        out.emplace_back(it->first, it->second.value);
    }
    return out;
}

Result<LockLease> MemoryStateStore::acquireLock(const std::string& name, Milliseconds lease, Milliseconds wait) {
    GAMEBATTLE_TRY_ASSIGN(token, newLockToken());

    TimePoint deadline = Clock::now() + wait;
    for (;;) {
        auto taken = compareAndSet(lockKey(name), std::nullopt, token, lease);
        if (taken.isSuccess()) {
            return LockLease{name, token, Clock::now() + lease};
        }
        if (taken.error() != ErrorCode::ConditionFailed) {
            return taken.error();
        }
        if (Clock::now() >= deadline) {
            return ErrorCode::LockNotAcquired;
        }
        std::this_thread::sleep_for(Milliseconds(5));
    }
}

Result<void> MemoryStateStore::releaseLock(const LockLease& lease) {
    auto released = compareAndSet(lockKey(lease.name), lease.token, std::nullopt);
    if (released.isFailure() && released.error() == ErrorCode::ConditionFailed) {
        return ErrorCode::LeaseLost;
    }
    return released;
}

void MemoryStateStore::setAvailable(bool available) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_available = available;
}

void MemoryStateStore::failNext(int count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failures = count;
}

size_t MemoryStateStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

// ============================================================================
// RetryingStateStore
// ============================================================================

RetryingStateStore::RetryingStateStore(std::shared_ptr<StateStore> inner, int maxAttempts, Milliseconds baseDelay)
    : m_inner(std::move(inner))
    , m_maxAttempts(maxAttempts < 1 ? 1 : maxAttempts)
    , m_baseDelay(baseDelay) {
}

template<typename Operation>
auto RetryingStateStore::retry(const char* what, Operation&& operation) -> decltype(operation()) {
    Milliseconds delay = m_baseDelay;
    for (int attempt = 1;; ++attempt) {
        auto result = operation();
        if (result.isSuccess()) {
            return result;
        }
        ErrorCode error = result.error();
        if ((error != ErrorCode::StoreUnavailable && error != ErrorCode::Timeout) || attempt >= m_maxAttempts) {
            if (error == ErrorCode::Timeout) {
                return ErrorCode::StoreUnavailable;
            }
            return result;
        }
        GAMEBATTLE_LOG_DEBUG_F("Store %s failed (attempt %d/%d), retrying", what, attempt, m_maxAttempts);
        std::this_thread::sleep_for(delay);
        delay *= 2;
    }
}

Result<std::optional<std::string>> RetryingStateStore::get(const std::string& key) {
    return retry("get", [&] { return m_inner->get(key); });
}

Result<void> RetryingStateStore::set(const std::string& key, const std::string& value,
                                     std::optional<Milliseconds> ttl) {
    return retry("set", [&] { return m_inner->set(key, value, ttl); });
}

Result<void> RetryingStateStore::compareAndSet(const std::string& key,
                                               const std::optional<std::string>& expected,
                                               const std::optional<std::string>& desired,
                                               std::optional<Milliseconds> ttl) {
    return retry("compareAndSet", [&] { return m_inner->compareAndSet(key, expected, desired, ttl); });
}

Result<void> RetryingStateStore::remove(const std::string& key) {
    return retry("remove", [&] { return m_inner->remove(key); });
}

Result<std::vector<std::pair<std::string, std::string>>> RetryingStateStore::scan(const std::string& prefix) {
    return retry("scan", [&] { return m_inner->scan(prefix); });
}

Result<LockLease> RetryingStateStore::acquireLock(const std::string& name, Milliseconds lease, Milliseconds wait) {
    return retry("acquireLock", [&] { return m_inner->acquireLock(name, lease, wait); });
}

Result<void> RetryingStateStore::releaseLock(const LockLease& lease) {
    return retry("releaseLock", [&] { return m_inner->releaseLock(lease); });
}

} // namespace Gamebattle::Orchestrator
