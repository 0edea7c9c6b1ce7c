/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: kv_engine.cpp

    Description:
        Implementation of the in-memory key-value engine and the glob
        matcher used by pattern subscriptions.
*******************************************************************************/

#include "store/kv_engine.h"
#include "common/logger.h"

#include <utility>

namespace fleetwatch {

//==============================================================================
// SECTION 1: Glob matching
//==============================================================================

bool glob_match(const std::string& pattern, const std::string& text) {
    size_t p = 0;
    size_t t = 0;
    size_t star_p = std::string::npos;
    size_t star_t = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star_p = p++;
            star_t = t;
        } else if (star_p != std::string::npos) {
            // Let the last '*' absorb one more character.
            p = star_p + 1;
            t = ++star_t;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

//==============================================================================
// SECTION 2: Key space
//==============================================================================

KvEngine::KvEngine() : next_subscription_id_(1) {}

KvEngine::TimePoint KvEngine::deadline_from(TimePoint now, int64_t ttl_ms) {
    return now + std::chrono::milliseconds(ttl_ms);
}

KvEngine::Entry* KvEngine::find_live(const std::string& key, TimePoint now) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;

    if (it->second.has_expiry && it->second.expires_at <= now) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

bool KvEngine::set_if_absent(const std::string& key, const std::string& value, int64_t ttl_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = std::chrono::steady_clock::now();

    if (find_live(key, now) != nullptr) return false;

    Entry entry;
    entry.value = value;
    if (ttl_ms > 0) {
        entry.has_expiry = true;
        entry.expires_at = deadline_from(now, ttl_ms);
    }
    entries_[key] = std::move(entry);
    return true;
}

bool KvEngine::compare_and_delete(const std::string& key, const std::string& expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_live(key, std::chrono::steady_clock::now());
    if (entry == nullptr || entry->value != expected) return false;

    entries_.erase(key);
    return true;
}

bool KvEngine::compare_and_expire(const std::string& key, const std::string& expected,
                                  int64_t ttl_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = std::chrono::steady_clock::now();
    Entry* entry = find_live(key, now);
    if (entry == nullptr || entry->value != expected) return false;

    if (ttl_ms > 0) {
        entry->has_expiry = true;
        entry->expires_at = deadline_from(now, ttl_ms);
    } else {
        // A non-positive TTL expires the key immediately.
        entries_.erase(key);
    }
    return true;
}

bool KvEngine::compare_and_set(const std::string& key, const std::optional<std::string>& expected,
                               const std::string& value, int64_t ttl_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = std::chrono::steady_clock::now();
    Entry* entry = find_live(key, now);

    if (expected) {
        if (entry == nullptr || entry->value != *expected) return false;
    } else if (entry != nullptr) {
        return false;
    }

    Entry replacement;
    replacement.value = value;
    if (ttl_ms > 0) {
        replacement.has_expiry = true;
        replacement.expires_at = deadline_from(now, ttl_ms);
    }
    entries_[key] = std::move(replacement);
    return true;
}

std::optional<std::string> KvEngine::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_live(key, std::chrono::steady_clock::now());
    if (entry == nullptr) return std::nullopt;
    return entry->value;
}

bool KvEngine::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_live(key, std::chrono::steady_clock::now()) != nullptr;
}

void KvEngine::set(const std::string& key, const std::string& value, int64_t ttl_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    Entry entry;
    entry.value = value;
    if (ttl_ms > 0) {
        entry.has_expiry = true;
        entry.expires_at = deadline_from(std::chrono::steady_clock::now(), ttl_ms);
    }
    entries_[key] = std::move(entry);
}

bool KvEngine::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (find_live(key, std::chrono::steady_clock::now()) == nullptr) return false;
    entries_.erase(key);
    return true;
}

std::vector<std::string> KvEngine::keys_with_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = std::chrono::steady_clock::now();

    std::vector<std::string> keys;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        if (it->second.has_expiry && it->second.expires_at <= now) continue;
        keys.push_back(it->first);
    }
    return keys;
}

std::optional<int64_t> KvEngine::ttl_remaining_ms(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = std::chrono::steady_clock::now();
    Entry* entry = find_live(key, now);
    if (entry == nullptr) return std::nullopt;
    if (!entry->has_expiry) return -1;

    return std::chrono::duration_cast<std::chrono::milliseconds>(entry->expires_at - now).count();
}

size_t KvEngine::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = std::chrono::steady_clock::now();

    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.has_expiry && it->second.expires_at <= now) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t KvEngine::key_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

//==============================================================================
// SECTION 3: Pub/Sub
//==============================================================================

uint64_t KvEngine::add_subscription(const std::string& target, bool is_pattern,
                                    SubscriptionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_subscription_id_++;

    Subscription sub;
    sub.target = target;
    sub.is_pattern = is_pattern;
    sub.callback = std::move(callback);
    subscriptions_[id] = std::move(sub);
    return id;
}

uint64_t KvEngine::subscribe(const std::string& channel, SubscriptionCallback callback) {
    return add_subscription(channel, false, std::move(callback));
}

uint64_t KvEngine::psubscribe(const std::string& pattern, SubscriptionCallback callback) {
    return add_subscription(pattern, true, std::move(callback));
}

bool KvEngine::unsubscribe(uint64_t subscription_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.erase(subscription_id) > 0;
}

size_t KvEngine::num_subscribers(const std::string& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, sub] : subscriptions_) {
        if (!sub.is_pattern && sub.target == channel) ++count;
    }
    return count;
}

size_t KvEngine::publish(const std::string& channel, const std::string& payload) {
    std::vector<SubscriptionCallback> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, sub] : subscriptions_) {
            bool matches = sub.is_pattern ? glob_match(sub.target, channel)
                                          : sub.target == channel;
            if (matches) targets.push_back(sub.callback);
        }
    }

    for (auto& callback : targets) {
        try {
            callback(channel, payload);
        } catch (const std::exception& e) {
            Logger::error("Subscriber callback on '" + channel + "' failed: " + e.what());
        }
    }
    return targets.size();
}

} // namespace fleetwatch
