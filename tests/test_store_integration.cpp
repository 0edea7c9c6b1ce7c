/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: test_store_integration.cpp

    Description:
        End-to-end tests: a StoreServer on an ephemeral port and several
        StoreClient connections, each standing in for a separate process.

        Test Coverage:
        - Test 1: Key-value operations over TCP, including TTL expiry
        - Test 2: Lock race across independent clients has one winner
        - Test 3: Worker registry shared between clients
        - Test 4: MessageBus events cross connections
        - Test 5: Server shutdown surfaces as UnavailableError
        - Test 6: Subscriptions come back after a store restart

    Exit Codes:
        0: All tests passed
        1: One or more tests failed
*******************************************************************************/

#include "coordination/lock_manager.h"
#include "coordination/message_bus.h"
#include "coordination/worker_registry.h"
#include "store/store_client.h"
#include "store/store_server.h"
#include "common/errors.h"
#include "common/logger.h"

#include <signal.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace fleetwatch;

static StoreClientConfig client_config(uint16_t port) {
    StoreClientConfig config;
    config.host = "127.0.0.1";
    config.port = port;
    return config;
}

int main() {
    Logger::set_level(LogLevel::INFO);
    Logger::info("Running shared store integration tests...");

    // Writes to a connection the server has closed must fail, not kill the test.
    signal(SIGPIPE, SIG_IGN);

    int passed = 0;
    int failed = 0;

    StoreServerConfig server_config;
    server_config.listen_port = 0;
    server_config.sweep_interval_ms = 50;

    StoreServer server(server_config);
    if (!server.start()) {
        std::cout << "FAILED: store server did not start\n";
        return 1;
    }
    const uint16_t port = server.port();
    assert(port != 0);

    {
        std::cout << "Test 1: Key-value over TCP... ";
        try {
            StoreClient client(client_config(port));
            assert(client.connect());
            assert(client.is_connected());
            assert(client.ping());

            assert(client.set_if_absent("lock:x", "t1", 100));
            assert(!client.set_if_absent("lock:x", "t2", 100));
            assert(client.get("lock:x").value() == "t1");
            assert(!client.compare_and_delete("lock:x", "t2"));
            assert(client.compare_and_expire("lock:x", "t1", 100));

            client.set("worker:a", "{\"workerId\":\"a\"}");
            client.set("worker:b", "{}");
            auto keys = client.keys_with_prefix("worker:");
            assert(keys.size() == 2);
            assert(client.exists("worker:a"));
            assert(client.del("worker:a"));
            assert(!client.del("worker:a"));
            assert(!client.get("worker:a").has_value());

            assert(client.compare_and_set("worker:c", std::nullopt, "v1"));
            assert(!client.compare_and_set("worker:c", std::string("v0"), "v2"));
            assert(client.compare_and_set("worker:c", std::string("v1"), "v2"));
            assert(client.get("worker:c").value() == "v2");

            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            assert(!client.exists("lock:x"));
            assert(server.requests_served() > 0);

            client.close();
            assert(!client.is_connected());

            bool threw = false;
            try {
                client.get("worker:b");
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
        std::cout << "Test 2: Lock race across clients... ";
        try {
            const int kClients = 8;
            std::atomic<int> winners(0);
            std::atomic<int> errors(0);
            std::vector<std::thread> threads;

            for (int i = 0; i < kClients; ++i) {
                threads.emplace_back([port, &winners, &errors]() {
                    StoreClient client(client_config(port));
                    if (!client.connect()) {
                        errors++;
                        return;
                    }
                    LockManager locks(client);
                    LockOptions options;
                    options.ttl_seconds = 10;
                    if (locks.acquire("nightly-report", options)) winners++;
                    client.close();
                });
            }
            for (auto& t : threads) t.join();

            assert(errors == 0);
            assert(winners == 1);

            StoreClient observer(client_config(port));
            assert(observer.connect());
            LockManager locks(observer);
            assert(locks.is_held("nightly-report"));
            assert(!locks.acquire("nightly-report").has_value());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Shared worker registry... ";
        try {
            StoreClient first(client_config(port));
            StoreClient second(client_config(port));
            assert(first.connect() && second.connect());

            auto now = std::make_shared<int64_t>(1700000000000LL);
            RegistryConfig config;
            config.key_prefix = "itest-worker:";
            config.clock = [now]() { return *now; };

            WorkerRegistry writer(first, config);
            WorkerRegistry reader(second, config);

            writer.register_worker("w1", "chat-1");
            writer.register_worker("w2", "chat-2");
            assert(reader.list_workers().size() == 2);

            *now += 31000;
            writer.heartbeat("w1");
            auto crashed = reader.get_crashed_workers();
            assert(crashed.size() == 1);
            assert(crashed[0].worker_id == "w2");
            assert(writer.get_worker("w2")->health == WorkerHealth::CRASHED);

            writer.unregister_worker("w1");
            writer.unregister_worker("w2");
            assert(reader.list_workers().empty());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Events across connections... ";
        try {
            StoreClient publisher_conn(client_config(port));
            StoreClient subscriber_conn(client_config(port));
            assert(publisher_conn.connect() && subscriber_conn.connect());

            MessageBus publisher(publisher_conn);
            MessageBus subscriber(subscriber_conn);

            std::mutex mutex;
            std::condition_variable cv;
            std::vector<std::string> received;

            subscriber.subscribe("tasks", [&](const BusEvent& event, const std::string& channel) {
                std::lock_guard<std::mutex> lock(mutex);
                received.push_back(channel + ":" + event.data["taskId"].asString());
                cv.notify_all();
            });
            subscriber.psubscribe("chat:*", [&](const BusEvent& event, const std::string& channel) {
                std::lock_guard<std::mutex> lock(mutex);
                received.push_back(channel + ":" + event.type);
                cv.notify_all();
            });
            assert(publisher.get_subscriber_count("tasks") == 1);

            Json::Value data(Json::objectValue);
            data["taskId"] = "t-7";
            assert(publisher.publish("tasks", BusEvent("task_assigned", data, 1)) == 1);
            assert(publisher.publish("chat:42", BusEvent("resumed", Json::Value(), 2)) == 1);

            {
                std::unique_lock<std::mutex> lock(mutex);
                bool done = cv.wait_for(lock, std::chrono::seconds(3),
                                        [&received] { return received.size() >= 2; });
                assert(done);
            }
            assert(received[0] == "tasks:t-7");
            assert(received[1] == "chat:42:resumed");

            assert(subscriber.close() == 0);
            assert(publisher.get_subscriber_count("tasks") == 0);
            assert(publisher.publish("tasks", BusEvent("task_assigned", data, 3)) == 0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Server shutdown... ";
        try {
            StoreClient client(client_config(port));
            assert(client.connect());
            LockManager locks(client);
            assert(locks.acquire("before-shutdown").has_value());

            server.stop();
            assert(!server.is_running());

            bool threw = false;
            try {
                locks.acquire("after-shutdown");
            } catch (const UnavailableError&) {
                threw = true;
            }
            assert(threw);

            StoreClient late(client_config(port));
            assert(!late.connect());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    server.stop();

    {
        std::cout << "Test 6: Subscriptions survive a store restart... ";
        try {
            auto first = std::make_unique<StoreServer>(server_config);
            assert(first->start());
            const uint16_t restart_port = first->port();

            StoreClient subscriber_conn(client_config(restart_port));
            assert(subscriber_conn.connect());
            MessageBus subscriber(subscriber_conn);

            std::mutex mutex;
            std::condition_variable cv;
            std::vector<std::string> received;
            subscriber.subscribe("events", [&](const BusEvent& event, const std::string&) {
                std::lock_guard<std::mutex> lock(mutex);
                received.push_back(event.type);
                cv.notify_all();
            });
            assert(subscriber_conn.subscriber_connected());

            first->stop();
            first.reset();
            for (int i = 0; i < 300 && subscriber_conn.subscriber_connected(); ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            assert(!subscriber_conn.subscriber_connected());
            assert(subscriber_conn.subscription_count() == 1);

            StoreServerConfig same_port = server_config;
            same_port.listen_port = restart_port;
            StoreServer second(same_port);
            assert(second.start());

            // The first request on the old command connection finds it dead.
            try {
                subscriber_conn.ping();
            } catch (const UnavailableError&) {
            }
            assert(subscriber_conn.connect());
            assert(subscriber_conn.subscriber_connected());

            StoreClient publisher_conn(client_config(restart_port));
            assert(publisher_conn.connect());
            MessageBus publisher(publisher_conn);
            assert(publisher.get_subscriber_count("events") == 1);
            assert(publisher.publish("events", BusEvent("worker_crashed", Json::Value(), 1)) == 1);

            {
                std::unique_lock<std::mutex> lock(mutex);
                bool done = cv.wait_for(lock, std::chrono::seconds(3),
                                        [&received] { return !received.empty(); });
                assert(done);
            }
            assert(received[0] == "worker_crashed");

            subscriber.close();
            subscriber_conn.close();
            publisher_conn.close();
            second.stop();

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
