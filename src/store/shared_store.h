/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: shared_store.h

    Description:
        Abstract client interface to the shared key-value store that every
        fleetwatch process coordinates through. LockManager, WorkerRegistry
        and MessageBus are written against this interface only.

        Implementations:
        - LocalStore:  in-process KvEngine (single process, tests)
        - StoreClient: TCP client of the fleetwatch_stored daemon

        Contract (all implementations):
        - Every method is atomic with respect to every other caller of the
          same store, including callers in other processes.
        - Every method is safe to call from multiple threads.
        - Every method throws UnavailableError when the store cannot be
          reached. No method retries internally.
        - TTLs are enforced by the store; a key past its TTL is absent for
          every reader.
*******************************************************************************/

#ifndef SHARED_STORE_H
#define SHARED_STORE_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch {

/**
 * @brief Receives one published message.
 * @param channel  Concrete channel the message was published on (also for
 *                 pattern subscriptions)
 */
using SubscriptionCallback =
    std::function<void(const std::string& channel, const std::string& payload)>;

class SharedStore {
public:
    virtual ~SharedStore() = default;

    /**
     * @brief Stores value under key only if key is absent (or expired).
     * @param ttl_ms  Expiry in milliseconds, must be > 0
     * @return true if this call created the key
     */
    virtual bool set_if_absent(const std::string& key, const std::string& value,
                               int64_t ttl_ms) = 0;

    /**
     * @brief Deletes key only if its current value equals expected.
     */
    virtual bool compare_and_delete(const std::string& key, const std::string& expected) = 0;

    /**
     * @brief Resets key's TTL to now + ttl_ms only if its value equals expected.
     */
    virtual bool compare_and_expire(const std::string& key, const std::string& expected,
                                    int64_t ttl_ms) = 0;

    /**
     * @brief Replaces key's value only if it still equals expected. An empty
     *        expected means the key must be absent (or expired).
     * @param ttl_ms  Expiry of the new value; 0 stores without expiry
     * @return false if another writer changed the key first
     */
    virtual bool compare_and_set(const std::string& key,
                                 const std::optional<std::string>& expected,
                                 const std::string& value, int64_t ttl_ms = 0) = 0;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    virtual bool exists(const std::string& key) = 0;

    /**
     * @brief Unconditional write. ttl_ms == 0 stores without expiry.
     */
    virtual void set(const std::string& key, const std::string& value, int64_t ttl_ms = 0) = 0;

    /**
     * @return true if a live key was removed
     */
    virtual bool del(const std::string& key) = 0;

    /**
     * @brief Live keys beginning with prefix, sorted ascending.
     */
    virtual std::vector<std::string> keys_with_prefix(const std::string& prefix) = 0;

    /**
     * @return number of subscriptions the message was delivered to
     */
    virtual size_t publish(const std::string& channel, const std::string& payload) = 0;

    virtual uint64_t subscribe(const std::string& channel, SubscriptionCallback callback) = 0;

    /**
     * @brief Subscribes to every channel matching a glob pattern
     *        ('*' any run, '?' any single character).
     */
    virtual uint64_t psubscribe(const std::string& pattern, SubscriptionCallback callback) = 0;

    /**
     * @return false if id was not an active subscription
     */
    virtual bool unsubscribe(uint64_t subscription_id) = 0;

    virtual size_t num_subscribers(const std::string& channel) = 0;

    virtual bool ping() = 0;
};

/**
 * @brief Glob match used for pattern subscriptions.
 */
bool glob_match(const std::string& pattern, const std::string& text);

} // namespace fleetwatch

#endif // SHARED_STORE_H
