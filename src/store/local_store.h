/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: local_store.h

    Description:
        SharedStore over an owned, in-process KvEngine. Used when every
        participant lives in one process and by the unit tests.

        set_available(false) simulates a lost store connection: every
        call then throws UnavailableError until availability is restored.
*******************************************************************************/

#ifndef LOCAL_STORE_H
#define LOCAL_STORE_H

#include "store/shared_store.h"
#include "store/kv_engine.h"

#include <atomic>

namespace fleetwatch {

class LocalStore : public SharedStore {
public:
    LocalStore();

    bool set_if_absent(const std::string& key, const std::string& value,
                       int64_t ttl_ms) override;
    bool compare_and_delete(const std::string& key, const std::string& expected) override;
    bool compare_and_expire(const std::string& key, const std::string& expected,
                            int64_t ttl_ms) override;
    bool compare_and_set(const std::string& key, const std::optional<std::string>& expected,
                         const std::string& value, int64_t ttl_ms = 0) override;
    std::optional<std::string> get(const std::string& key) override;
    bool exists(const std::string& key) override;
    void set(const std::string& key, const std::string& value, int64_t ttl_ms = 0) override;
    bool del(const std::string& key) override;
    std::vector<std::string> keys_with_prefix(const std::string& prefix) override;

    size_t publish(const std::string& channel, const std::string& payload) override;
    uint64_t subscribe(const std::string& channel, SubscriptionCallback callback) override;
    uint64_t psubscribe(const std::string& pattern, SubscriptionCallback callback) override;
    bool unsubscribe(uint64_t subscription_id) override;
    size_t num_subscribers(const std::string& channel) override;

    bool ping() override;

    void set_available(bool available) { available_ = available; }
    bool is_available() const { return available_; }

    KvEngine& engine() { return engine_; }

private:
    KvEngine engine_;
    std::atomic<bool> available_;

    void check_available() const;
};

} // namespace fleetwatch

#endif // LOCAL_STORE_H
