/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: test_recovery.cpp

    Description:
        Tests for the crash recovery path: ProcessMonitor against real
        child processes, CommandRestarter, RecoverySupervisor with a
        scripted Restarter, and supervisor configuration parsing.

        Test Coverage:
        - Test 1: Liveness of a forked child, crash event on exit
        - Test 2: Background monitor thread reports a crash
        - Test 3: CommandRestarter success, immediate exit, bad argv
        - Test 4: Crash flow restarts and publishes recovery events
        - Test 5: Restart lock held elsewhere skips the restart
        - Test 6: Auto-restart off, missing and throwing restarters
        - Test 7: State file survives a supervisor restart
        - Test 8: Config file plus argv layering
        - Test 9: Silent workers are recovered once per silence
        - Test 10: A rejected event publish does not abort the crash flow

    Exit Codes:
        0: All tests passed
        1: One or more tests failed
*******************************************************************************/

#include "checkpoint/file_checkpoint_repository.h"
#include "recovery/process_monitor.h"
#include "recovery/recovery_supervisor.h"
#include "recovery/restarter.h"
#include "recovery/supervisor_config.h"
#include "coordination/worker_registry.h"
#include "store/local_store.h"
#include "common/errors.h"
#include "common/logger.h"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace fleetwatch;

static std::string make_scratch_dir() {
    char path[] = "/tmp/fleetwatch-recovery-XXXXXX";
    if (mkdtemp(path) == nullptr) {
        throw std::runtime_error("mkdtemp failed");
    }
    return path;
}

// Child that stays alive until killed.
static pid_t spawn_sleeper() {
    pid_t pid = fork();
    if (pid == 0) {
        for (;;) pause();
    }
    return pid;
}

static void reap(pid_t pid) {
    kill(pid, SIGKILL);
    int status;
    waitpid(pid, &status, 0);
}

class ScriptedRestarter : public Restarter {
public:
    int calls = 0;
    bool succeed = true;
    bool throw_instead = false;
    std::string last_url;

    RestartResult restart(const CrashEvent& crash, const std::string& chat_url) override {
        calls++;
        last_url = chat_url;
        if (throw_instead) throw std::runtime_error("launcher missing");

        RestartResult result;
        result.success = succeed;
        result.pid = succeed ? 4242 : 0;
        result.duration_ms = 7;
        if (!succeed) result.error = "launcher exited for " + crash.session_id;
        return result;
    }
};

// Store whose publish is refused by the server.
class RejectingPublishStore : public LocalStore {
public:
    size_t publish(const std::string& channel, const std::string&) override {
        throw ProtocolError("Store rejected PUBLISH on " + channel);
    }
};

static RecoveryConfig config_in(const std::string& dir) {
    RecoveryConfig config;
    config.state_path = dir + "/supervisor.json";
    return config;
}

int main() {
    Logger::set_level(LogLevel::INFO);
    Logger::info("Running recovery tests...");

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Process liveness and crash event... ";
        std::string dir = make_scratch_dir();
        try {
            FileCheckpointRepository repository(dir);
            repository.initialize();
            Checkpoint recent;
            recent.session_id = "chat-1";
            repository.save(recent);

            ProcessMonitor monitor("chat-1", &repository);
            std::vector<CrashEvent> events;
            monitor.set_crash_handler([&events](const CrashEvent& e) { events.push_back(e); });

            // Nothing is reported for a pid that was never seen alive.
            monitor.watch(999999);
            monitor.poll();
            assert(events.empty());

            pid_t child = spawn_sleeper();
            assert(child > 0);
            monitor.watch(child);
            monitor.poll();
            assert(monitor.process_seen());
            assert(ProcessMonitor::is_process_alive(child));
            assert(events.empty());

            reap(child);
            assert(!ProcessMonitor::is_process_alive(child));
            monitor.poll();
            monitor.poll();

            assert(events.size() == 1);
            assert(events[0].pid == child);
            assert(events[0].session_id == "chat-1");
            assert(events[0].had_recent_checkpoint);
            assert(events[0].last_checkpoint_age_min >= 0.0);
            assert(events[0].to_json()["metadata"]["hadRecentCheckpoint"].asBool());

            ProcessMonitor orphan("chat-2", nullptr);
            pid_t second = spawn_sleeper();
            orphan.set_crash_handler([](const CrashEvent& e) {
                assert(!e.had_recent_checkpoint);
                assert(e.last_checkpoint_age_min < 0);
                throw std::runtime_error("handler failure is logged");
            });
            orphan.watch(second);
            orphan.poll();
            reap(second);
            orphan.poll();
            assert(!orphan.process_seen());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
        std::filesystem::remove_all(dir);
    }

    {
        std::cout << "Test 2: Monitor thread... ";
        try {
            ProcessMonitorConfig config;
            config.polling_interval_ms = 20;
            ProcessMonitor monitor("chat-3", nullptr, config);

            std::atomic<int> crashes(0);
            monitor.set_crash_handler([&crashes](const CrashEvent&) { crashes++; });

            pid_t child = spawn_sleeper();
            monitor.watch(child);
            assert(monitor.start());
            assert(!monitor.start());

            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            assert(monitor.process_seen());
            reap(child);

            for (int i = 0; i < 100 && crashes == 0; ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            monitor.stop();
            monitor.stop();
            assert(!monitor.is_running());
            assert(crashes == 1);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: CommandRestarter... ";
        try {
            CrashEvent crash;
            crash.session_id = "chat-4";

            // The chat URL lands in $0 of the shell script.
            CommandRestarter launcher({"sh", "-c", "sleep 5"}, 100);
            RestartResult ok = launcher.restart(crash, "https://example.test/chat/4");
            assert(ok.success);
            assert(ok.pid > 0);
            assert(ok.duration_ms >= 100);
            assert(ProcessMonitor::is_process_alive(ok.pid));
            reap(ok.pid);

            CommandRestarter quitter({"false"}, 200);
            RestartResult bad = quitter.restart(crash, "");
            assert(!bad.success);
            assert(bad.error.find("exited immediately") != std::string::npos);

            CommandRestarter missing({"/nonexistent/fleetwatch-launcher"}, 200);
            RestartResult absent = missing.restart(crash, "");
            assert(!absent.success);
            assert(absent.error.find("127") != std::string::npos);

            bool threw = false;
            try {
                CommandRestarter empty({});
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
        std::cout << "Test 4: Crash flow with restart... ";
        std::string dir = make_scratch_dir();
        try {
            LocalStore store;
            LockManager locks(store);
            MessageBus bus(store);
            ScriptedRestarter restarter;

            std::vector<std::string> published;
            bus.subscribe(RecoverySupervisor::kEventsChannel,
                          [&published](const BusEvent& event, const std::string&) {
                              published.push_back(event.type);
                          });

            RecoverySupervisor supervisor(config_in(dir), locks, &restarter, &bus);
            supervisor.initialize();
            supervisor.set_current_chat_url("https://example.test/chat/1");

            std::vector<RecoveryEvent> events;
            supervisor.set_listener([&events](const RecoveryEvent& e) { events.push_back(e); });

            CrashEvent crash;
            crash.pid = 1234;
            crash.session_id = "chat-1";
            assert(supervisor.handle_crash(crash));

            assert(restarter.calls == 1);
            assert(restarter.last_url == "https://example.test/chat/1");
            assert(events.size() == 3);
            assert(events[0].type == RecoveryEventType::CRASH_DETECTED);
            assert(events[0].pid == 1234);
            assert(events[1].type == RecoveryEventType::RESTART_INITIATED);
            assert(events[2].type == RecoveryEventType::RESTART_COMPLETED);
            assert(events[2].pid == 4242);
            assert(events[2].duration_ms == 7);

            assert(published.size() == 3);
            assert(published[0] == "crash_detected");
            assert(published[2] == "restart_completed");

            RecoveryStatus status = supervisor.status();
            assert(status.crash_count == 1);
            assert(status.restart_count == 1);
            assert(status.last_restart_ms.has_value());
            assert(supervisor.last_restart()->pid == 4242);
            assert(!locks.is_held("restart:chat-1"));
            assert(std::filesystem::exists(dir + "/supervisor.json"));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
        std::filesystem::remove_all(dir);
    }

    {
        std::cout << "Test 5: Restart lock contention... ";
        std::string dir = make_scratch_dir();
        try {
            LocalStore store;
            LockManager ours(store);
            LockManager theirs(store);
            ScriptedRestarter restarter;

            auto token = theirs.acquire("restart:chat-1");
            assert(token.has_value());

            RecoverySupervisor supervisor(config_in(dir), ours, &restarter);
            std::vector<RecoveryEventType> types;
            supervisor.set_listener([&types](const RecoveryEvent& e) { types.push_back(e.type); });

            CrashEvent crash;
            crash.session_id = "chat-1";
            assert(!supervisor.handle_crash(crash));
            assert(restarter.calls == 0);
            assert(types.size() == 1);
            assert(types[0] == RecoveryEventType::CRASH_DETECTED);
            assert(supervisor.status().crash_count == 1);
            assert(theirs.get_owner("restart:chat-1").value() == *token);

            assert(theirs.release("restart:chat-1", *token));
            assert(supervisor.handle_crash(crash));
            assert(restarter.calls == 1);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
        std::filesystem::remove_all(dir);
    }

    {
        std::cout << "Test 6: Disabled and failing restarts... ";
        std::string dir = make_scratch_dir();
        try {
            LocalStore store;
            LockManager locks(store);
            ScriptedRestarter restarter;
            CrashEvent crash;
            crash.session_id = "chat-1";

            RecoverySupervisor supervisor(config_in(dir), locks, &restarter);
            supervisor.update_config(false, 0, 0);
            assert(!supervisor.handle_crash(crash));
            assert(restarter.calls == 0);
            assert(supervisor.status().polling_interval_ms == 1000);

            supervisor.update_config(true, 250, 10);
            restarter.throw_instead = true;
            std::vector<RecoveryEvent> events;
            supervisor.set_listener([&events](const RecoveryEvent& e) { events.push_back(e); });
            assert(!supervisor.handle_crash(crash));
            assert(events.back().type == RecoveryEventType::RESTART_FAILED);
            assert(events.back().error == "launcher missing");
            assert(!locks.is_held("restart:chat-1"));

            restarter.throw_instead = false;
            restarter.succeed = false;
            assert(!supervisor.handle_crash(crash));
            assert(events.back().error == "launcher exited for chat-1");

            RecoverySupervisor unconfigured(config_in(dir), locks, nullptr);
            events.clear();
            unconfigured.set_listener([&events](const RecoveryEvent& e) { events.push_back(e); });
            assert(!unconfigured.handle_crash(crash));
            assert(events.back().error == "No restart command configured");

            RecoveryStatus status = supervisor.status();
            assert(status.crash_count == 3);
            assert(status.restart_count == 0);
            assert(!status.last_restart_ms.has_value());
            assert(!supervisor.last_restart().has_value());

            bool threw = false;
            try {
                CrashEvent anonymous;
                supervisor.handle_crash(anonymous);
            } catch (const InvalidArgumentError&) {
                threw = true;
            }
            assert(threw);

            store.set_available(false);
            threw = false;
            try {
                supervisor.handle_crash(crash);
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
        std::filesystem::remove_all(dir);
    }

    {
        std::cout << "Test 7: State file round trip... ";
        std::string dir = make_scratch_dir();
        try {
            LocalStore store;
            LockManager locks(store);
            ScriptedRestarter restarter;

            {
                RecoverySupervisor first(config_in(dir), locks, &restarter);
                first.initialize();
                first.set_current_chat_url("https://example.test/chat/9");
                first.update_config(false, 2500, 15);
                CrashEvent crash;
                crash.session_id = "chat-9";
                first.handle_crash(crash);
            }

            RecoverySupervisor second(config_in(dir), locks, &restarter);
            second.initialize();
            RecoveryStatus status = second.status();
            assert(status.current_chat_url == "https://example.test/chat/9");
            assert(status.crash_count == 1);
            assert(status.restart_count == 0);
            assert(!status.auto_restart);
            assert(status.polling_interval_ms == 2500);
            assert(status.crash_detection_window_min == 15);

            bool threw = false;
            try {
                second.set_current_chat_url("not a url");
            } catch (const InvalidArgumentError&) {
                threw = true;
            }
            assert(threw);
            assert(second.status().current_chat_url == "https://example.test/chat/9");

            {
                std::ofstream out(dir + "/supervisor.json", std::ios::trunc);
                out << "{ broken";
            }
            RecoverySupervisor third(config_in(dir), locks, &restarter);
            third.initialize();
            assert(third.status().crash_count == 0);

            RecoveryConfig unwritable;
            unwritable.state_path = dir + "/missing-dir/supervisor.json";
            RecoverySupervisor stuck(unwritable, locks, &restarter);
            threw = false;
            try {
                stuck.persist_state();
            } catch (const PersistenceError&) {
                threw = true;
            }
            assert(threw);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
        std::filesystem::remove_all(dir);
    }

    {
        std::cout << "Test 8: Supervisor configuration... ";
        std::string dir = make_scratch_dir();
        try {
            std::string path = dir + "/supervisor-config.json";
            {
                std::ofstream out(path);
                out << "{\n"
                    << "  \"storePort\": 7001,\n"
                    << "  \"sessionId\": \"chat-from-file\",\n"
                    << "  \"restartCommand\": [\"/usr/bin/launcher\", \"--resume\", \"a b\"],\n"
                    << "  \"autoRestart\": false,\n"
                    << "  \"heartbeatTimeout\": 45000,\n"
                    << "  \"logLevel\": \"debug\"\n"
                    << "}\n";
            }

            std::vector<std::string> args = {"fleetwatch_supervisor", "--session", "chat-cli",
                                              "--config", path, "--poll-ms", "250"};
            std::vector<char*> argv;
            for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));

            SupervisorConfig config;
            assert(parse_supervisor_args(static_cast<int>(argv.size()), argv.data(), config));
            assert(config.store_port == 7001);
            assert(config.session_id == "chat-cli");
            assert(config.restart_command.size() == 3);
            assert(config.restart_command[2] == "a b");
            assert(!config.auto_restart);
            assert(config.heartbeat_timeout_ms == 45000);
            assert(config.polling_interval_ms == 250);
            assert(config.log_level == "debug");
            assert(config.store_host == "localhost");

            std::vector<std::string> more = {"fleetwatch_supervisor", "--restart-cmd",
                                              "/usr/bin/launcher  --fast", "--pid", "77"};
            argv.clear();
            for (auto& a : more) argv.push_back(const_cast<char*>(a.c_str()));
            SupervisorConfig second;
            assert(parse_supervisor_args(static_cast<int>(argv.size()), argv.data(), second));
            assert(second.restart_command.size() == 2);
            assert(second.process_pid == 77);

            std::vector<std::string> help = {"fleetwatch_supervisor", "--help"};
            argv.clear();
            for (auto& a : help) argv.push_back(const_cast<char*>(a.c_str()));
            SupervisorConfig ignored;
            assert(!parse_supervisor_args(static_cast<int>(argv.size()), argv.data(), ignored));

            std::vector<std::vector<std::string>> invalid = {
                {"fleetwatch_supervisor", "--bogus"},
                {"fleetwatch_supervisor", "--store-port", "70000"},
                {"fleetwatch_supervisor", "--poll-ms", "12abc"},
                {"fleetwatch_supervisor", "--config", dir + "/absent.json"},
            };
            for (auto& bad : invalid) {
                argv.clear();
                for (auto& a : bad) argv.push_back(const_cast<char*>(a.c_str()));
                bool threw = false;
                try {
                    SupervisorConfig c;
                    parse_supervisor_args(static_cast<int>(argv.size()), argv.data(), c);
                } catch (const InvalidArgumentError&) {
                    threw = true;
                }
                assert(threw);
            }

            Json::Value wrong_type(Json::objectValue);
            wrong_type["autoRestart"] = "yes";
            bool threw = false;
            try {
                SupervisorConfig c;
                apply_supervisor_json(wrong_type, c);
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
        std::filesystem::remove_all(dir);
    }

    {
        std::cout << "Test 9: Crashed worker polling... ";
        std::string dir = make_scratch_dir();
        try {
            auto now = std::make_shared<int64_t>(1700000000000LL);
            Clock manual = [now]() { return *now; };

            LocalStore store;
            RegistryConfig registry_config;
            registry_config.clock = manual;
            WorkerRegistry registry(store, registry_config);
            LockManager locks(store);
            ScriptedRestarter restarter;
            RecoverySupervisor supervisor(config_in(dir), locks, &restarter);
            WorkerCrashPoller poller(registry, supervisor, "self", manual);

            registry.register_worker("self", "chat-self");
            registry.register_worker("w1", "chat-1");
            registry.register_worker("w2", "chat-2");

            *now += 31000;
            registry.heartbeat("w2");
            assert(poller.poll() == 1);
            assert(restarter.calls == 1);
            assert(poller.tracked_silences() == 1);

            // Same silence, nothing new.
            assert(poller.poll() == 0);
            assert(restarter.calls == 1);

            // The worker came back: its marker is dropped.
            registry.heartbeat("w1");
            assert(poller.poll() == 0);
            assert(poller.tracked_silences() == 0);

            *now += 31000;
            assert(poller.poll() == 2);
            assert(restarter.calls == 3);
            assert(poller.tracked_silences() == 2);

            registry.unregister_worker("w2");
            assert(poller.poll() == 0);
            assert(poller.tracked_silences() == 1);
            assert(supervisor.status().crash_count == 3);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
        std::filesystem::remove_all(dir);
    }

    {
        std::cout << "Test 10: Rejected event publish... ";
        std::string dir = make_scratch_dir();
        try {
            RejectingPublishStore store;
            LockManager locks(store);
            MessageBus bus(store);
            ScriptedRestarter restarter;
            RecoverySupervisor supervisor(config_in(dir), locks, &restarter, &bus);

            std::vector<RecoveryEventType> types;
            supervisor.set_listener([&types](const RecoveryEvent& e) { types.push_back(e.type); });

            CrashEvent crash;
            crash.session_id = "chat-1";
            assert(supervisor.handle_crash(crash));
            assert(restarter.calls == 1);
            assert(types.size() == 3);
            assert(types[2] == RecoveryEventType::RESTART_COMPLETED);
            assert(!locks.is_held("restart:chat-1"));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
        std::filesystem::remove_all(dir);
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return failed == 0 ? 0 : 1;
}
