/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: lock_manager.cpp
*******************************************************************************/

#include "coordination/lock_manager.h"
#include "common/errors.h"
#include "common/logger.h"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <thread>
#include <vector>

namespace fleetwatch {

LockManager::LockManager(SharedStore& store) : store_(store) {}

std::string LockManager::generate_token() {
    static std::atomic<uint64_t> counter(0);
    static std::mutex rng_mutex;
    static std::mt19937_64 rng = [] {
        std::random_device rd;
        std::seed_seq seed{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seed);
    }();

    uint64_t high;
    uint64_t low;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        high = rng();
        low = rng();
    }
    // The counter keeps tokens unique even if the generator ever repeats.
    low ^= counter.fetch_add(1) * 0x9E3779B97F4A7C15ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
    return ss.str();
}

std::optional<std::string> LockManager::acquire(const std::string& resource,
                                                const LockOptions& options) {
    require_non_blank(resource, "Resource name");

    int ttl_seconds = options.ttl_seconds > 0 ? options.ttl_seconds : 30;
    int retry_delay_ms = options.retry_delay_ms > 0 ? options.retry_delay_ms : 50;

    const std::string key = lock_key(resource);
    const std::string token = generate_token();
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(options.timeout_ms);

    int attempts = 0;
    while (true) {
        ++attempts;
        if (store_.set_if_absent(key, token, static_cast<int64_t>(ttl_seconds) * 1000)) {
            std::lock_guard<std::mutex> lock(acquired_mutex_);
            acquired_[resource] = token;
            Logger::debug("Acquired " + key + " after " + std::to_string(attempts) + " attempt(s)");
            return token;
        }

        if (options.timeout_ms <= 0 || std::chrono::steady_clock::now() >= deadline) {
            Logger::debug("Lock contention on " + key + ", gave up after " +
                          std::to_string(attempts) + " attempt(s)");
            return std::nullopt;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(retry_delay_ms));
    }
}

void LockManager::forget(const std::string& resource, const std::string& token) {
    std::lock_guard<std::mutex> lock(acquired_mutex_);
    auto it = acquired_.find(resource);
    if (it != acquired_.end() && it->second == token) {
        acquired_.erase(it);
    }
}

bool LockManager::release(const std::string& resource, const std::string& token) {
    require_non_blank(resource, "Resource name");

    bool released = store_.compare_and_delete(lock_key(resource), token);
    if (released) {
        forget(resource, token);
    }
    return released;
}

bool LockManager::extend(const std::string& resource, const std::string& token, int ttl_seconds) {
    require_non_blank(resource, "Resource name");
    if (ttl_seconds <= 0) {
        throw InvalidArgumentError("Lock TTL must be positive");
    }
    return store_.compare_and_expire(lock_key(resource), token,
                                     static_cast<int64_t>(ttl_seconds) * 1000);
}

bool LockManager::is_held(const std::string& resource) {
    require_non_blank(resource, "Resource name");
    return store_.exists(lock_key(resource));
}

std::optional<std::string> LockManager::get_owner(const std::string& resource) {
    require_non_blank(resource, "Resource name");
    return store_.get(lock_key(resource));
}

size_t LockManager::release_all() {
    std::vector<std::pair<std::string, std::string>> held;
    {
        std::lock_guard<std::mutex> lock(acquired_mutex_);
        held.assign(acquired_.begin(), acquired_.end());
    }

    size_t released = 0;
    size_t failures = 0;
    for (const auto& [resource, token] : held) {
        try {
            if (release(resource, token)) {
                ++released;
            } else {
                // Expired or taken over; nothing left to release.
                forget(resource, token);
            }
        } catch (const std::exception& e) {
            ++failures;
            Logger::error("Failed to release lock:" + resource + ": " + e.what());
        }
    }

    if (failures > 0) {
        Logger::warning("release_all: " + std::to_string(failures) + " release(s) failed");
    }
    return released;
}

void LockManager::cleanup() {
    release_all();
    std::lock_guard<std::mutex> lock(acquired_mutex_);
    acquired_.clear();
}

} // namespace fleetwatch
