/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: main_supervisor.cpp

    Description:
        Entry point of fleetwatch_supervisor, the process that keeps a
        session alive.

        Usage:
            $ ./fleetwatch_supervisor --session chat-42 --pid 12345 \
                  --restart-cmd "/usr/bin/session-launcher --resume" \
                  --chat-url https://example.test/chat/42
            $ ./fleetwatch_supervisor --config supervisor.json --log-level debug

        What It Runs:
            - Registers itself in the WorkerRegistry and heartbeats through
              a HeartbeatTimer, so other supervisors can see it die
            - Watches the session process (--pid) with a ProcessMonitor;
              a vanished process goes through RecoverySupervisor, which
              restarts it under the "restart:<session>" lock
            - Every crashedWorkerPollInterval, asks the registry for workers
              past their heartbeat timeout and feeds each newly crashed one
              into the same recovery flow
            - Recovery events are published on "recovery:events"

        Exit Codes:
            0: clean shutdown
            1: bad configuration or the shared store is unreachable
*******************************************************************************/

#include "checkpoint/file_checkpoint_repository.h"
#include "common/errors.h"
#include "common/logger.h"
#include "coordination/heartbeat_timer.h"
#include "coordination/lock_manager.h"
#include "coordination/message_bus.h"
#include "coordination/worker_registry.h"
#include "recovery/process_monitor.h"
#include "recovery/recovery_supervisor.h"
#include "recovery/restarter.h"
#include "recovery/supervisor_config.h"
#include "store/store_client.h"

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

using namespace fleetwatch;

std::atomic<bool> shutdown_requested(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested = true;
    }
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    SupervisorConfig config;
    try {
        if (!parse_supervisor_args(argc, argv, config)) {
            print_supervisor_usage(argv[0]);
            return 0;
        }
    } catch (const InvalidArgumentError& e) {
        std::cerr << e.what() << "\n";
        print_supervisor_usage(argv[0]);
        return 1;
    }

    Logger::set_level(Logger::parse_level(config.log_level));
    Logger::info("=== Fleetwatch Supervisor ===");

    if (config.supervisor_id.empty()) {
        config.supervisor_id = "supervisor-" + std::to_string(getpid());
    }
    if (config.auto_restart && config.restart_command.empty()) {
        Logger::warning("No restart command configured; crashes will only be reported");
    }

    StoreClientConfig store_config;
    store_config.host = config.store_host;
    store_config.port = config.store_port;

    StoreClient store(store_config);
    if (!store.connect()) {
        Logger::error("Cannot reach shared store at " + config.store_host + ":" +
                      std::to_string(config.store_port));
        return 1;
    }

    RegistryConfig registry_config;
    registry_config.heartbeat_timeout_ms = config.heartbeat_timeout_ms;

    LockManager locks(store);
    WorkerRegistry registry(store, registry_config);
    MessageBus bus(store);

    FileCheckpointRepository checkpoints(config.checkpoint_dir);
    std::unique_ptr<CommandRestarter> restarter;

    try {
        checkpoints.initialize();
        if (!config.restart_command.empty()) {
            restarter = std::make_unique<CommandRestarter>(config.restart_command);
        }
    } catch (const std::runtime_error& e) {
        Logger::error(std::string("Startup failed: ") + e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        Logger::error(std::string("Startup failed: ") + e.what());
        return 1;
    }

    RecoveryConfig recovery_config;
    recovery_config.state_path = config.state_path;
    recovery_config.auto_restart = config.auto_restart;
    recovery_config.polling_interval_ms = config.polling_interval_ms;
    recovery_config.crash_detection_window_min = config.crash_detection_window_min;

    RecoverySupervisor recovery(recovery_config, locks, restarter.get(), &bus);
    recovery.set_listener([](const RecoveryEvent& event) {
        Logger::info(std::string("Recovery event: ") + recovery_event_name(event.type) +
                     " session=" + event.session_id);
    });

    ProcessMonitorConfig monitor_config;
    monitor_config.polling_interval_ms = config.polling_interval_ms;
    monitor_config.crash_detection_window_min = config.crash_detection_window_min;

    ProcessMonitor monitor(config.session_id, &checkpoints, monitor_config);
    monitor.set_crash_handler([&recovery, &monitor](const CrashEvent& event) {
        if (recovery.handle_crash(event)) {
            auto restart = recovery.last_restart();
            if (restart && restart->pid > 0) monitor.watch(restart->pid);
        }
    });

    HeartbeatTimer heartbeat(registry, config.supervisor_id, config.heartbeat_interval_ms);

    try {
        recovery.initialize();
        // File and argv settings win over what was persisted last run.
        recovery.update_config(config.auto_restart, config.polling_interval_ms,
                               config.crash_detection_window_min);
        if (!config.chat_url.empty()) {
            recovery.set_current_chat_url(config.chat_url);
        }

        registry.register_worker(config.supervisor_id, config.session_id);
        heartbeat.start();
    } catch (const std::runtime_error& e) {
        Logger::error(std::string("Startup failed: ") + e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        Logger::error(std::string("Startup failed: ") + e.what());
        return 1;
    }

    if (config.process_pid > 0) {
        if (config.session_id.empty()) {
            Logger::error("--pid requires --session");
            return 1;
        }
        monitor.watch(config.process_pid);
        monitor.start();
    }

    Logger::info("Supervisor " + config.supervisor_id + " running. Press Ctrl+C to stop.");

    WorkerCrashPoller poller(registry, recovery, config.supervisor_id);
    auto next_poll = std::chrono::steady_clock::now();

    while (!shutdown_requested) {
        if (std::chrono::steady_clock::now() >= next_poll) {
            next_poll += std::chrono::milliseconds(config.crashed_worker_poll_ms);
            try {
                poller.poll();
            } catch (const UnavailableError& e) {
                Logger::error(std::string("Shared store unavailable: ") + e.what());
                if (!store.is_connected() && !store.connect()) {
                    Logger::warning("Reconnect failed, retrying next poll");
                }
            } catch (const std::runtime_error& e) {
                Logger::error(std::string("Crashed worker poll failed: ") + e.what());
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    Logger::info("Shutting down...");
    monitor.stop();
    heartbeat.stop();

    try {
        registry.unregister_worker(config.supervisor_id);
    } catch (const UnavailableError& e) {
        Logger::warning(std::string("Could not unregister: ") + e.what());
    }
    locks.release_all();
    size_t bus_failures = bus.close();
    if (bus_failures > 0) {
        Logger::warning(std::to_string(bus_failures) + " bus subscriptions not closed cleanly");
    }
    store.close();
    checkpoints.close();

    Logger::info("Supervisor shutdown complete");
    return 0;
}
