/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: local_store.cpp
*******************************************************************************/

#include "store/local_store.h"
#include "common/errors.h"

#include <utility>

namespace fleetwatch {

LocalStore::LocalStore() : available_(true) {}

void LocalStore::check_available() const {
    if (!available_) {
        throw UnavailableError("Shared store connection lost");
    }
}

bool LocalStore::set_if_absent(const std::string& key, const std::string& value, int64_t ttl_ms) {
    check_available();
    return engine_.set_if_absent(key, value, ttl_ms);
}

bool LocalStore::compare_and_delete(const std::string& key, const std::string& expected) {
    check_available();
    return engine_.compare_and_delete(key, expected);
}

bool LocalStore::compare_and_expire(const std::string& key, const std::string& expected,
                                    int64_t ttl_ms) {
    check_available();
    return engine_.compare_and_expire(key, expected, ttl_ms);
}

bool LocalStore::compare_and_set(const std::string& key, const std::optional<std::string>& expected,
                                 const std::string& value, int64_t ttl_ms) {
    check_available();
    return engine_.compare_and_set(key, expected, value, ttl_ms);
}

std::optional<std::string> LocalStore::get(const std::string& key) {
    check_available();
    return engine_.get(key);
}

bool LocalStore::exists(const std::string& key) {
    check_available();
    return engine_.exists(key);
}

void LocalStore::set(const std::string& key, const std::string& value, int64_t ttl_ms) {
    check_available();
    engine_.set(key, value, ttl_ms);
}

bool LocalStore::del(const std::string& key) {
    check_available();
    return engine_.del(key);
}

std::vector<std::string> LocalStore::keys_with_prefix(const std::string& prefix) {
    check_available();
    return engine_.keys_with_prefix(prefix);
}

size_t LocalStore::publish(const std::string& channel, const std::string& payload) {
    check_available();
    return engine_.publish(channel, payload);
}

uint64_t LocalStore::subscribe(const std::string& channel, SubscriptionCallback callback) {
    check_available();
    return engine_.subscribe(channel, std::move(callback));
}

uint64_t LocalStore::psubscribe(const std::string& pattern, SubscriptionCallback callback) {
    check_available();
    return engine_.psubscribe(pattern, std::move(callback));
}

bool LocalStore::unsubscribe(uint64_t subscription_id) {
    check_available();
    return engine_.unsubscribe(subscription_id);
}

size_t LocalStore::num_subscribers(const std::string& channel) {
    check_available();
    return engine_.num_subscribers(channel);
}

bool LocalStore::ping() {
    check_available();
    return true;
}

} // namespace fleetwatch
