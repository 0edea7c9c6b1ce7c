/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: test_state_synchronizer.cpp

    Description:
        Unit tests for StateSynchronizer and the update_record primitive,
        run against an in-process LocalStore.

        Test Coverage:
        - Test 1: set_state / get_state bump the version
        - Test 2: set_state_if_version rejects stale versions
        - Test 3: update_fields merges, increment_field adds
        - Test 4: Concurrent increments all land
        - Test 5: TTL, list_keys, delete_state and blank names
        - Test 6: update_record gives up with ConflictError

    Exit Codes:
        0: All tests passed
        1: One or more tests failed
*******************************************************************************/

#include "coordination/state_synchronizer.h"
#include "store/local_store.h"
#include "common/errors.h"
#include "common/logger.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace fleetwatch;

// Every conditional write loses, as if another writer always got there first.
class ContendedStore : public LocalStore {
public:
    int attempts = 0;

    bool compare_and_set(const std::string& key, const std::optional<std::string>& expected,
                         const std::string& value, int64_t ttl_ms = 0) override {
        attempts++;
        LocalStore::set(key, "other-writer-" + std::to_string(attempts));
        return LocalStore::compare_and_set(key, expected, value, ttl_ms);
    }
};

int main() {
    Logger::set_level(LogLevel::INFO);
    Logger::info("Running StateSynchronizer tests...");

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Versioned writes... ";
        try {
            LocalStore store;
            StateSynchronizer sync(store);

            assert(!sync.get_state("session", "s1").has_value());

            Json::Value state(Json::objectValue);
            state["phase"] = "plan";
            assert(sync.set_state("session", "s1", state) == 1);

            state["phase"] = "review";
            assert(sync.set_state("session", "s1", state) == 2);

            auto versioned = sync.get_state_with_version("session", "s1");
            assert(versioned.has_value());
            assert(versioned->version == 2);
            assert(versioned->state["phase"].asString() == "review");
            assert(sync.get_state("session", "s1")->get("phase", "").asString() == "review");
            assert(store.exists("state:session:s1"));

            // Unreadable envelopes are ignored on read and replaced on write.
            store.set("state:session:broken", "not json");
            assert(!sync.get_state_with_version("session", "broken").has_value());
            assert(sync.set_state("session", "broken", state) == 1);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Conditional writes... ";
        try {
            LocalStore store;
            StateSynchronizer sync(store);

            Json::Value state(Json::objectValue);
            state["owner"] = "w1";
            assert(sync.set_state_if_version("lease", "job-1", state, 0).value() == 1);

            // A second creator loses.
            state["owner"] = "w2";
            assert(!sync.set_state_if_version("lease", "job-1", state, 0).has_value());

            assert(sync.set_state_if_version("lease", "job-1", state, 1).value() == 2);
            assert(!sync.set_state_if_version("lease", "job-1", state, 1).has_value());
            assert(sync.get_state("lease", "job-1")->get("owner", "").asString() == "w2");

            assert(!sync.set_state_if_version("lease", "job-2", state, 3).has_value());
            assert(!sync.get_state("lease", "job-2").has_value());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Field updates... ";
        try {
            LocalStore store;
            StateSynchronizer sync(store);

            Json::Value fields(Json::objectValue);
            fields["attempts"] = 1;
            assert(!sync.update_fields("session", "s1", fields).has_value());
            assert(!sync.increment_field("session", "s1", "attempts", 1).has_value());

            Json::Value state(Json::objectValue);
            state["phase"] = "plan";
            state["attempts"] = 2;
            sync.set_state("session", "s1", state);

            fields = Json::Value(Json::objectValue);
            fields["phase"] = "review";
            fields["reviewer"] = "w3";
            assert(sync.update_fields("session", "s1", fields).value() == 2);

            auto merged = sync.get_state("session", "s1");
            assert((*merged)["phase"].asString() == "review");
            assert((*merged)["reviewer"].asString() == "w3");
            assert((*merged)["attempts"].asInt() == 2);

            assert(sync.increment_field("session", "s1", "attempts", 3).value() == 5);
            assert(sync.increment_field("session", "s1", "attempts", -1).value() == 4);
            // Non-integer fields start over from zero.
            assert(sync.increment_field("session", "s1", "phase", 2).value() == 2);
            assert(sync.get_state_with_version("session", "s1")->version == 5);

            bool threw = false;
            try {
                sync.update_fields("session", "s1", Json::Value("scalar"));
            } catch (const InvalidArgumentError&) {
                threw = true;
            }
            assert(threw);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Concurrent increments... ";
        try {
            LocalStore store;
            StateSynchronizer sync(store, 10000);
            sync.set_state("counter", "c", Json::Value(Json::objectValue));

            const int threads = 4;
            const int per_thread = 250;
            std::vector<std::thread> workers;
            for (int t = 0; t < threads; ++t) {
                workers.emplace_back([&sync]() {
                    for (int i = 0; i < per_thread; ++i) {
                        sync.increment_field("counter", "c", "hits", 1);
                    }
                });
            }
            for (auto& worker : workers) worker.join();

            auto versioned = sync.get_state_with_version("counter", "c");
            assert(versioned->state["hits"].asInt64() == threads * per_thread);
            assert(versioned->version == 1 + threads * per_thread);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Expiry, listing and deletion... ";
        try {
            LocalStore store;
            StateSynchronizer sync(store);

            StateOptions short_lived;
            short_lived.ttl_seconds = 1;
            sync.set_state("session", "temp", Json::Value("x"), short_lived);
            sync.set_state("session", "a", Json::Value("y"));
            sync.set_state("session", "b", Json::Value("z"));
            sync.set_state("other", "a", Json::Value("w"));

            auto keys = sync.list_keys("session");
            assert(keys.size() == 3);
            assert(keys[0] == "a");
            assert(keys[1] == "b");
            assert(keys[2] == "temp");

            std::this_thread::sleep_for(std::chrono::milliseconds(1200));
            assert(!sync.get_state("session", "temp").has_value());
            assert(sync.list_keys("session").size() == 2);

            assert(sync.delete_state("session", "a"));
            assert(!sync.delete_state("session", "a"));
            assert(sync.list_keys("session").size() == 1);
            assert(sync.get_state("other", "a").has_value());

            int rejected = 0;
            try {
                sync.set_state("", "a", Json::Value(1));
            } catch (const InvalidArgumentError&) {
                rejected++;
            }
            try {
                sync.get_state("session", "  ");
            } catch (const InvalidArgumentError&) {
                rejected++;
            }
            try {
                sync.list_keys("");
            } catch (const InvalidArgumentError&) {
                rejected++;
            }
            assert(rejected == 3);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Lost races end in ConflictError... ";
        try {
            ContendedStore store;
            bool threw = false;
            try {
                update_record(store, "worker:w1",
                              [](const std::optional<std::string>&) {
                                  return std::optional<std::string>("mine");
                              },
                              0, 5);
            } catch (const ConflictError&) {
                threw = true;
            }
            assert(threw);
            assert(store.attempts == 5);
            assert(store.get("worker:w1").value() != "mine");

            // Declining writes nothing and is not a conflict.
            LocalStore plain;
            assert(!update_record(plain, "worker:w2", [](const std::optional<std::string>&) {
                return std::optional<std::string>();
            }));
            assert(!plain.exists("worker:w2"));

            // Store outages propagate.
            plain.set_available(false);
            threw = false;
            try {
                StateSynchronizer(plain).set_state("session", "s1", Json::Value(1));
            } catch (const UnavailableError&) {
                threw = true;
            }
            assert(threw);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return failed == 0 ? 0 : 1;
}
