/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: lock_manager.h

    Description:
        Distributed exclusive locks over the shared store.

        A lock on resource R is the single store key "lock:R" whose value is
        the owner token. The store's TTL is the only expiry mechanism.

        Acquire:  set_if_absent(lock:R, fresh token, ttl)
        Release:  compare_and_delete(lock:R, token)
        Extend:   compare_and_expire(lock:R, token, ttl)

        Exactly one of N racing acquirers wins because set_if_absent is
        atomic in the store. Release and extend with a stale token (the lock
        expired and was re-acquired by someone else) return false and leave
        the current owner's lock untouched.

        The manager remembers the tokens it acquired only so release_all()
        can clean up on shutdown. is_held() and get_owner() always ask the
        store.

    Typical Usage:
        LockManager locks(store);
        LockOptions opts;
        opts.timeout_ms = 2000;
        if (auto token = locks.acquire("repo/main", opts)) {
            // ... exclusive section ...
            locks.release("repo/main", *token);
        }
*******************************************************************************/

#ifndef LOCK_MANAGER_H
#define LOCK_MANAGER_H

#include "store/shared_store.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace fleetwatch {

struct LockOptions {
    int ttl_seconds;
    int timeout_ms;       // 0 = single attempt
    int retry_delay_ms;

    LockOptions() : ttl_seconds(30), timeout_ms(0), retry_delay_ms(50) {}
};

class LockManager {
public:
    explicit LockManager(SharedStore& store);

    /**
     * @brief Tries to take the lock on resource.
     *
     * Retries every retry_delay_ms until timeout_ms has elapsed since the
     * first attempt.
     *
     * @return owner token, or nullopt on contention/timeout
     * @throws InvalidArgumentError for a blank resource name
     * @throws UnavailableError if the store is unreachable
     */
    std::optional<std::string> acquire(const std::string& resource,
                                       const LockOptions& options = LockOptions());

    /**
     * @return true iff token was the current, unexpired owner token
     */
    bool release(const std::string& resource, const std::string& token);

    /**
     * @brief Resets the lock's expiry to now + ttl_seconds if token owns it.
     */
    bool extend(const std::string& resource, const std::string& token, int ttl_seconds);

    bool is_held(const std::string& resource);

    std::optional<std::string> get_owner(const std::string& resource);

    /**
     * @brief Releases every lock this manager acquired and still owns.
     *
     * Every release is attempted even if earlier ones throw.
     *
     * @return number of locks actually released
     */
    size_t release_all();

    void cleanup();

    static std::string lock_key(const std::string& resource) { return "lock:" + resource; }

    /**
     * @brief 128-bit random hex token, never repeated within a process.
     */
    static std::string generate_token();

private:
    SharedStore& store_;

    std::map<std::string, std::string> acquired_;   // resource -> token
    std::mutex acquired_mutex_;

    void forget(const std::string& resource, const std::string& token);
};

} // namespace fleetwatch

#endif // LOCK_MANAGER_H
