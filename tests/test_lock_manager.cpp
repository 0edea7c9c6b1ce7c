/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: test_lock_manager.cpp

    Description:
        Unit tests for LockManager against an in-process LocalStore.

        Test Coverage:
        - Test 1: Concurrent acquire from many threads has exactly one winner
        - Test 2: A held lock is refused, then free again after its TTL
        - Test 3: Release and extend require the owner token
        - Test 4: Acquire with a timeout waits for the holder to release
        - Test 5: release_all frees only what this manager still owns
        - Test 6: Blank names and an unreachable store raise errors
        - Test 7: Extend keeps the lock past its original TTL

    Exit Codes:
        0: All tests passed
        1: One or more tests failed
*******************************************************************************/

#include "coordination/lock_manager.h"
#include "store/local_store.h"
#include "common/errors.h"
#include "common/logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <thread>
#include <vector>

using namespace fleetwatch;

int main() {
    Logger::set_level(LogLevel::INFO);
    Logger::info("Running LockManager tests...");

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Single winner under contention... ";
        try {
            LocalStore store;
            const int kContenders = 16;

            std::atomic<int> winners(0);
            std::vector<std::thread> threads;
            for (int i = 0; i < kContenders; ++i) {
                threads.emplace_back([&store, &winners]() {
                    LockManager locks(store);
                    LockOptions options;
                    options.ttl_seconds = 10;
                    if (locks.acquire("shared-report", options)) {
                        winners++;
                    }
                });
            }
            for (auto& t : threads) t.join();

            assert(winners == 1);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Lock expires after TTL... ";
        try {
            LocalStore store;
            LockManager first(store);
            LockManager second(store);

            LockOptions options;
            options.ttl_seconds = 1;

            auto token = first.acquire("deploy", options);
            assert(token.has_value());
            assert(first.is_held("deploy"));
            assert(first.get_owner("deploy").value() == *token);
            assert(!second.acquire("deploy", options).has_value());

            std::this_thread::sleep_for(std::chrono::milliseconds(1100));
            assert(!first.is_held("deploy"));

            auto late = second.acquire("deploy", options);
            assert(late.has_value());
            assert(*late != *token);

            // The expired owner cannot release the new holder's lock.
            assert(!first.release("deploy", *token));
            assert(second.is_held("deploy"));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Release and extend check ownership... ";
        try {
            LocalStore store;
            LockManager locks(store);

            LockOptions options;
            options.ttl_seconds = 5;
            auto token = locks.acquire("index", options);
            assert(token.has_value());

            assert(!locks.release("index", "not-the-token"));
            assert(!locks.extend("index", "not-the-token", 60));
            assert(locks.is_held("index"));

            assert(locks.extend("index", *token, 60));
            auto ttl = store.engine().ttl_remaining_ms(LockManager::lock_key("index"));
            assert(ttl.has_value() && *ttl > 5000);

            assert(locks.release("index", *token));
            assert(!locks.is_held("index"));
            assert(!locks.release("index", *token));
            assert(!locks.extend("index", *token, 60));
            assert(!locks.get_owner("index").has_value());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Acquire waits for release... ";
        try {
            LocalStore store;
            LockManager holder(store);
            LockManager waiter(store);

            auto token = holder.acquire("migration");
            assert(token.has_value());

            LockOptions quick;
            quick.timeout_ms = 100;
            quick.retry_delay_ms = 20;
            auto start = std::chrono::steady_clock::now();
            assert(!waiter.acquire("migration", quick).has_value());
            auto waited = std::chrono::steady_clock::now() - start;
            assert(waited >= std::chrono::milliseconds(100));

            std::thread releaser([&holder, &token]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(150));
                holder.release("migration", *token);
            });

            LockOptions patient;
            patient.timeout_ms = 3000;
            patient.retry_delay_ms = 20;
            auto acquired = waiter.acquire("migration", patient);
            releaser.join();
            assert(acquired.has_value());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: release_all... ";
        try {
            LocalStore store;
            LockManager locks(store);
            LockManager other(store);

            auto a = locks.acquire("a");
            auto b = locks.acquire("b");
            auto c = other.acquire("c");
            assert(a && b && c);
            assert(locks.release("a", *a));

            assert(locks.release_all() == 1);
            assert(!locks.is_held("b"));
            assert(other.is_held("c"));
            assert(locks.release_all() == 0);

            std::set<std::string> tokens;
            for (int i = 0; i < 1000; ++i) {
                tokens.insert(LockManager::generate_token());
            }
            assert(tokens.size() == 1000);
            assert(tokens.begin()->size() == 32);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Invalid names and lost store... ";
        try {
            LocalStore store;
            LockManager locks(store);

            bool threw = false;
            try {
                locks.acquire("   ");
            } catch (const InvalidArgumentError&) {
                threw = true;
            }
            assert(threw);

            store.set_available(false);
            threw = false;
            try {
                locks.acquire("report");
            } catch (const UnavailableError&) {
                threw = true;
            }
            assert(threw);

            threw = false;
            try {
                locks.is_held("report");
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

    {
        std::cout << "Test 7: Extend outlives the original TTL... ";
        try {
            LocalStore store;
            LockManager holder(store);
            LockManager contender(store);

            LockOptions options;
            options.ttl_seconds = 1;
            auto start = std::chrono::steady_clock::now();
            auto token = holder.acquire("compaction", options);
            assert(token.has_value());
            assert(holder.extend("compaction", *token, 2));

            std::this_thread::sleep_until(start + std::chrono::milliseconds(1500));
            assert(!contender.acquire("compaction", options).has_value());
            assert(holder.get_owner("compaction").value() == *token);

            std::this_thread::sleep_until(start + std::chrono::milliseconds(2100));
            assert(contender.acquire("compaction", options).has_value());

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
