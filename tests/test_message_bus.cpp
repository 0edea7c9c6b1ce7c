/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: test_message_bus.cpp

    Description:
        Unit tests for MessageBus over a LocalStore, which delivers
        synchronously inside publish().

        Test Coverage:
        - Test 1: Event reaches every handler with type, data and timestamp
        - Test 2: A throwing handler does not stop the others
        - Test 3: Pattern subscriptions see the concrete channel
        - Test 4: Unparseable payloads are counted as failures
        - Test 5: Unsubscribe, close and argument validation
        - Test 6: A bus destroyed mid-publish is not called back

    Exit Codes:
        0: All tests passed
        1: One or more tests failed
*******************************************************************************/

#include "coordination/message_bus.h"
#include "store/local_store.h"
#include "common/errors.h"
#include "common/logger.h"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace fleetwatch;

static Json::Value task_data(const std::string& task_id) {
    Json::Value data(Json::objectValue);
    data["taskId"] = task_id;
    return data;
}

int main() {
    Logger::set_level(LogLevel::INFO);
    Logger::info("Running MessageBus tests...");

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Publish to handlers... ";
        try {
            LocalStore store;
            MessageBus bus(store);

            std::vector<BusEvent> first;
            std::vector<std::string> second;
            bus.subscribe("tasks", [&first](const BusEvent& event, const std::string&) {
                first.push_back(event);
            });
            bus.subscribe("tasks", [&second](const BusEvent& event, const std::string& channel) {
                second.push_back(channel + "/" + event.type);
            });

            // Two handlers, one store subscription.
            assert(bus.get_subscriber_count("tasks") == 1);

            assert(bus.publish("tasks", BusEvent("task_assigned", task_data("t-1"), 1234)) == 1);

            assert(first.size() == 1);
            assert(first[0].type == "task_assigned");
            assert(first[0].data["taskId"].asString() == "t-1");
            assert(first[0].timestamp_ms == 1234);
            assert(second.size() == 1 && second[0] == "tasks/task_assigned");

            EventStats stats = bus.get_event_stats();
            assert(stats.published == 1);
            assert(stats.delivered == 2);
            assert(stats.failed == 0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Handler failure isolation... ";
        try {
            LocalStore store;
            MessageBus bus(store);

            int before = 0;
            int after = 0;
            bus.subscribe("tasks", [&before](const BusEvent&, const std::string&) { before++; });
            bus.subscribe("tasks", [](const BusEvent&, const std::string&) {
                throw std::runtime_error("handler blew up");
            });
            bus.subscribe("tasks", [&after](const BusEvent&, const std::string&) { after++; });

            bus.publish("tasks", BusEvent("task_failed", task_data("t-2"), 1));
            bus.publish("tasks", BusEvent("task_failed", task_data("t-3"), 2));

            assert(before == 2);
            assert(after == 2);

            EventStats stats = bus.get_event_stats();
            assert(stats.delivered == 4);
            assert(stats.failed == 2);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Pattern subscriptions... ";
        try {
            LocalStore store;
            MessageBus bus(store);

            std::vector<std::string> channels;
            bus.psubscribe("worker:*", [&channels](const BusEvent&, const std::string& channel) {
                channels.push_back(channel);
            });

            bus.publish("worker:a", BusEvent("heartbeat", Json::Value(Json::objectValue), 1));
            bus.publish("worker:b", BusEvent("heartbeat", Json::Value(Json::objectValue), 2));
            bus.publish("tasks", BusEvent("heartbeat", Json::Value(Json::objectValue), 3));

            assert(channels.size() == 2);
            assert(channels[0] == "worker:a");
            assert(channels[1] == "worker:b");

            bus.punsubscribe("worker:*");
            bus.publish("worker:c", BusEvent("heartbeat", Json::Value(Json::objectValue), 4));
            assert(channels.size() == 2);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Unparseable payload... ";
        try {
            LocalStore store;
            MessageBus bus(store);

            int calls = 0;
            bus.subscribe("tasks", [&calls](const BusEvent&, const std::string&) { calls++; });

            store.publish("tasks", "not json");
            store.publish("tasks", "{\"data\":{}}");
            store.publish("tasks", "{\"type\":\"raw\"}");

            assert(calls == 1);
            assert(bus.get_event_stats().failed == 2);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Unsubscribe, close, validation... ";
        try {
            LocalStore store;
            MessageBus bus(store);

            int calls = 0;
            bus.subscribe("tasks", [&calls](const BusEvent&, const std::string&) { calls++; });
            bus.subscribe("results", [&calls](const BusEvent&, const std::string&) { calls++; });
            bus.psubscribe("chat:*", [&calls](const BusEvent&, const std::string&) { calls++; });

            bus.unsubscribe("tasks");
            assert(bus.get_subscriber_count("tasks") == 0);
            assert(bus.publish("tasks", BusEvent("x", Json::Value(Json::objectValue), 1)) == 0);
            assert(calls == 0);

            bool threw = false;
            try {
                bus.publish(" ", BusEvent("x", Json::Value(Json::objectValue), 1));
            } catch (const InvalidArgumentError&) {
                threw = true;
            }
            assert(threw);

            threw = false;
            try {
                bus.publish("tasks", BusEvent());
            } catch (const InvalidArgumentError&) {
                threw = true;
            }
            assert(threw);

            assert(bus.close() == 0);
            assert(bus.get_subscriber_count("results") == 0);
            assert(store.publish("chat:1", "{\"type\":\"x\"}") == 0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Bus destroyed during delivery... ";
        try {
            LocalStore store;
            auto first = std::make_unique<MessageBus>(store);
            auto second = std::make_unique<MessageBus>(store);

            // The store has already picked both subscribers when the first
            // handler destroys the second bus.
            int second_calls = 0;
            first->subscribe("tasks", [&second](const BusEvent&, const std::string&) {
                second.reset();
            });
            second->subscribe("tasks", [&second_calls](const BusEvent&, const std::string&) {
                second_calls++;
            });

            assert(first->publish("tasks", BusEvent("task_assigned", task_data("t-1"), 1)) == 2);
            assert(!second);
            assert(second_calls == 0);
            assert(first->get_event_stats().delivered == 1);
            assert(store.num_subscribers("tasks") == 1);

            // Buses come and go while another thread keeps publishing.
            std::atomic<bool> stop(false);
            std::thread publisher([&store, &stop]() {
                while (!stop) store.publish("load", "{\"type\":\"tick\"}");
            });
            for (int i = 0; i < 200; ++i) {
                auto ticks = std::make_shared<std::atomic<int>>(0);
                MessageBus transient(store);
                transient.subscribe("load", [ticks](const BusEvent&, const std::string&) {
                    (*ticks)++;
                });
            }
            stop = true;
            publisher.join();
            assert(store.num_subscribers("load") == 0);

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
