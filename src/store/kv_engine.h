/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: kv_engine.h

    Description:
        In-memory key-value engine with per-key TTL and pub/sub routing.
        It is the state behind the store daemon and behind LocalStore.

        Atomicity:
            One mutex guards the key map and the subscription table. Each
            public method runs entirely under that mutex, so
            set_if_absent, compare_and_delete, compare_and_expire and
            compare_and_set are
            linearizable: N racing set_if_absent calls on one key produce
            exactly one true.

        Expiry:
            Keys carry an absolute steady-clock deadline. Every read and
            write treats a key past its deadline as absent (lazy expiry).
            purge_expired() reclaims memory and is driven by the server's
            sweep thread.

        Pub/Sub:
            publish() snapshots the matching callbacks under the mutex and
            invokes them after releasing it. Callbacks may therefore call
            back into the engine.
*******************************************************************************/

#ifndef KV_ENGINE_H
#define KV_ENGINE_H

#include "store/shared_store.h"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch {

class KvEngine {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    KvEngine();

    bool set_if_absent(const std::string& key, const std::string& value, int64_t ttl_ms);
    bool compare_and_delete(const std::string& key, const std::string& expected);
    bool compare_and_expire(const std::string& key, const std::string& expected, int64_t ttl_ms);
    bool compare_and_set(const std::string& key, const std::optional<std::string>& expected,
                         const std::string& value, int64_t ttl_ms = 0);
    std::optional<std::string> get(const std::string& key);
    bool exists(const std::string& key);
    void set(const std::string& key, const std::string& value, int64_t ttl_ms);
    bool del(const std::string& key);
    std::vector<std::string> keys_with_prefix(const std::string& prefix);

    /**
     * @brief Remaining TTL of a live key in milliseconds.
     * @return -1 for a key without expiry, nullopt for an absent key
     */
    std::optional<int64_t> ttl_remaining_ms(const std::string& key);

    size_t publish(const std::string& channel, const std::string& payload);
    uint64_t subscribe(const std::string& channel, SubscriptionCallback callback);
    uint64_t psubscribe(const std::string& pattern, SubscriptionCallback callback);
    bool unsubscribe(uint64_t subscription_id);
    size_t num_subscribers(const std::string& channel);

    /**
     * @return number of expired keys removed
     */
    size_t purge_expired();

    size_t key_count();

private:
    struct Entry {
        std::string value;
        bool has_expiry;
        TimePoint expires_at;

        Entry() : has_expiry(false) {}
    };

    struct Subscription {
        std::string target;
        bool is_pattern;
        SubscriptionCallback callback;

        Subscription() : is_pattern(false) {}
    };

    std::map<std::string, Entry> entries_;
    std::map<uint64_t, Subscription> subscriptions_;
    uint64_t next_subscription_id_;
    std::mutex mutex_;

    // Caller holds mutex_. Erases the entry if it has expired.
    Entry* find_live(const std::string& key, TimePoint now);

    uint64_t add_subscription(const std::string& target, bool is_pattern,
                              SubscriptionCallback callback);

    static TimePoint deadline_from(TimePoint now, int64_t ttl_ms);
};

} // namespace fleetwatch

#endif // KV_ENGINE_H
