/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: test_signal_history.cpp

    Description:
        Unit tests for SignalHistoryRepository on a scratch directory under
        /tmp, with a manual clock.

        Test Coverage:
        - Test 1: Snapshots are numbered per session and read back in order
        - Test 2: Batch save returns ids in input order
        - Test 3: Risk and time range queries across sessions
        - Test 4: Retention cleanup and session delete keep the numbering
        - Test 5: Use before initialize() is rejected
        - Test 6: Torn trailing record is ignored and repaired

    Exit Codes:
        0: All tests passed
        1: One or more tests failed
*******************************************************************************/

#include "signals/signal_history_repository.h"
#include "common/errors.h"
#include "common/logger.h"

#include <cstdlib>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

using namespace fleetwatch;

static std::string make_scratch_dir() {
    char path[] = "/tmp/fleetwatch-signals-XXXXXX";
    if (mkdtemp(path) == nullptr) {
        throw std::runtime_error("mkdtemp failed");
    }
    return path;
}

static CrashSignals signals_with(CrashRisk risk, int64_t messages) {
    CrashSignals s;
    s.crash_risk = risk;
    s.message_count = messages;
    s.tool_failure_rate = 0.125;
    s.risk_factors = {"High message count"};
    return s;
}

int main() {
    Logger::set_level(LogLevel::INFO);
    Logger::info("Running SignalHistoryRepository tests...");

    int passed = 0;
    int failed = 0;

    const int64_t kDayMs = 24LL * 60 * 60 * 1000;
    auto now = std::make_shared<int64_t>(1700000000000LL);
    Clock clock = [now]() { return *now; };

    {
        std::cout << "Test 1: Per-session numbering... ";
        std::string dir = make_scratch_dir();
        try {
            SignalHistoryRepository history(dir, clock);
            history.initialize();

            assert(history.save_snapshot("chat/1", signals_with(CrashRisk::SAFE, 3)) == "chat%2F1:1");
            *now += 1000;
            assert(history.save_snapshot("chat/1", signals_with(CrashRisk::WARNING, 40)) == "chat%2F1:2");
            assert(history.save_snapshot("chat-2", signals_with(CrashRisk::SAFE, 1)) == "chat-2:1");

            auto snapshots = history.get_session_snapshots("chat/1");
            assert(snapshots.size() == 2);
            assert(snapshots[0].snapshot_number == 1);
            assert(snapshots[1].snapshot_number == 2);
            assert(snapshots[1].session_id == "chat/1");
            assert(snapshots[1].timestamp_ms == *now);
            assert(snapshots[1].signals.message_count == 40);
            assert(snapshots[1].signals.crash_risk == CrashRisk::WARNING);
            assert(snapshots[1].signals.tool_failure_rate == 0.125);
            assert(snapshots[1].signals.risk_factors.size() == 1);

            auto latest = history.get_latest_snapshot("chat/1");
            assert(latest && latest->snapshot_number == 2);
            assert(!history.get_latest_snapshot("nobody").has_value());
            assert(history.get_session_snapshots("nobody").empty());

            // A second instance on the same directory continues the numbering.
            SignalHistoryRepository reopened(dir, clock);
            reopened.initialize();
            assert(reopened.save_snapshot("chat/1", signals_with(CrashRisk::SAFE, 41)) == "chat%2F1:3");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
        std::filesystem::remove_all(dir);
    }

    {
        std::cout << "Test 2: Batch save... ";
        std::string dir = make_scratch_dir();
        try {
            SignalHistoryRepository history(dir, clock);
            history.initialize();
            history.save_snapshot("b", signals_with(CrashRisk::SAFE, 1));

            auto ids = history.save_snapshots({
                {"a", signals_with(CrashRisk::SAFE, 1)},
                {"b", signals_with(CrashRisk::SAFE, 2)},
                {"a", signals_with(CrashRisk::DANGER, 3)},
            });
            assert(ids.size() == 3);
            assert(ids[0] == "a:1");
            assert(ids[1] == "b:2");
            assert(ids[2] == "a:2");
            assert(history.get_session_snapshots("a").back().signals.crash_risk == CrashRisk::DANGER);

            bool threw = false;
            try {
                history.save_snapshots({{"ok", CrashSignals()}, {" ", CrashSignals()}});
            } catch (const InvalidArgumentError&) {
                threw = true;
            }
            assert(threw);
            // Validation happens before anything is written.
            assert(history.get_session_snapshots("ok").empty());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
        std::filesystem::remove_all(dir);
    }

    {
        std::cout << "Test 3: Risk and time range queries... ";
        std::string dir = make_scratch_dir();
        try {
            *now = 1700000000000LL;
            SignalHistoryRepository history(dir, clock);
            history.initialize();

            history.save_snapshot("s1", signals_with(CrashRisk::DANGER, 60));
            *now += 100;
            history.save_snapshot("s2", signals_with(CrashRisk::SAFE, 2));
            *now += 100;
            history.save_snapshot("s2", signals_with(CrashRisk::DANGER, 70));
            *now += 100;
            history.save_snapshot("s1", signals_with(CrashRisk::WARNING, 36));

            auto danger = history.get_snapshots_by_risk(CrashRisk::DANGER);
            assert(danger.size() == 2);
            assert(danger[0].session_id == "s2");
            assert(danger[1].session_id == "s1");

            int64_t t0 = 1700000000000LL;
            auto range = history.get_snapshots_in_time_range(t0 + 100, t0 + 200);
            assert(range.size() == 2);
            assert(range[0].timestamp_ms == t0 + 100);
            assert(range[1].timestamp_ms == t0 + 200);
            assert(history.get_snapshots_in_time_range(t0 + 301, t0 + 900).empty());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
        std::filesystem::remove_all(dir);
    }

    {
        std::cout << "Test 4: Cleanup and delete... ";
        std::string dir = make_scratch_dir();
        try {
            *now = 1700000000000LL;
            SignalHistoryRepository history(dir, clock);
            history.initialize();

            history.save_snapshot("old", signals_with(CrashRisk::SAFE, 1));
            history.save_snapshot("mixed", signals_with(CrashRisk::SAFE, 1));
            *now += 10 * kDayMs;
            history.save_snapshot("mixed", signals_with(CrashRisk::SAFE, 2));

            assert(history.cleanup_old_snapshots(7) == 2);
            assert(history.get_session_snapshots("old").empty());
            auto mixed = history.get_session_snapshots("mixed");
            assert(mixed.size() == 1);
            assert(mixed[0].snapshot_number == 2);
            assert(history.cleanup_old_snapshots(7) == 0);

            // Numbers of removed snapshots are never handed out again.
            assert(history.save_snapshot("old", signals_with(CrashRisk::SAFE, 3)) == "old:2");
            assert(history.get_session_snapshots("old").size() == 1);

            history.delete_session_snapshots("mixed");
            assert(history.get_session_snapshots("mixed").empty());
            assert(history.save_snapshot("mixed", signals_with(CrashRisk::SAFE, 4)) == "mixed:3");
            assert(history.get_latest_snapshot("mixed")->snapshot_number == 3);

            history.delete_session_snapshots("never-existed");
            assert(!std::filesystem::exists(dir + "/never-existed.signals"));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
        std::filesystem::remove_all(dir);
    }

    {
        std::cout << "Test 5: Not initialized... ";
        std::string dir = make_scratch_dir();
        try {
            SignalHistoryRepository history(dir, clock);

            bool threw = false;
            try {
                history.save_snapshot("s", CrashSignals());
            } catch (const PersistenceError&) {
                threw = true;
            }
            assert(threw);

            history.initialize();
            history.save_snapshot("s", CrashSignals());
            history.close();

            threw = false;
            try {
                history.get_snapshots_by_risk(CrashRisk::SAFE);
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
        std::cout << "Test 6: Torn trailing record... ";
        std::string dir = make_scratch_dir();
        try {
            SignalHistoryRepository history(dir, clock);
            history.initialize();
            history.save_snapshot("torn", signals_with(CrashRisk::SAFE, 1));

            {
                // Length prefix promising more bytes than follow.
                std::ofstream out(dir + "/torn.signals", std::ios::app | std::ios::binary);
                const char partial[] = {0, 0, 1, 0, '{', '"'};
                out.write(partial, sizeof(partial));
            }

            assert(history.get_session_snapshots("torn").size() == 1);
            assert(history.save_snapshot("torn", signals_with(CrashRisk::SAFE, 2)) == "torn:2");

            auto snapshots = history.get_session_snapshots("torn");
            assert(snapshots.size() == 2);
            assert(snapshots[1].signals.message_count == 2);

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
