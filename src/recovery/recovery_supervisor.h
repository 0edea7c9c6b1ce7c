/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: recovery_supervisor.h

    Description:
        Drives crash recovery for sessions: counts crashes, restarts the
        session when auto-restart is on and keeps a small state document
        on disk.

        Crash Flow:
            1. crash_count++, emit crash_detected
            2. auto-restart off -> done
            3. acquire lock "restart:<session>"; if another supervisor
               holds it, that supervisor is restarting and we stop here
            4. emit restart_initiated, run the Restarter
            5. emit restart_completed (restart_count++) or restart_failed
            6. release the lock, persist state

        Events go to the registered listener and, when a MessageBus is
        attached, to the channel "recovery:events". A failed publish is
        logged and never interrupts the flow.

        WorkerCrashPoller turns the registry's timed-out workers into crash
        events, once per silence of each worker.

        State File (pretty JSON, replaced via temp file + rename):
            {
              "currentChatUrl": "...",
              "restartCount": n,
              "crashCount": n,
              "config": {"autoRestart": true, "pollingInterval": 1000,
                         "crashDetectionWindow": 5},
              "lastUpdated": "2026-10-19T12:00:00.000Z"
            }
*******************************************************************************/

#ifndef RECOVERY_SUPERVISOR_H
#define RECOVERY_SUPERVISOR_H

#include "common/clock.h"
#include "coordination/lock_manager.h"
#include "coordination/message_bus.h"
#include "coordination/worker_registry.h"
#include "recovery/restarter.h"

#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace fleetwatch {

enum class RecoveryEventType {
    CRASH_DETECTED,
    RESTART_INITIATED,
    RESTART_COMPLETED,
    RESTART_FAILED
};

const char* recovery_event_name(RecoveryEventType type);

struct RecoveryEvent {
    RecoveryEventType type;
    std::string session_id;
    pid_t pid;                  // crashed pid, or the new pid on completion
    int64_t timestamp_ms;
    int64_t duration_ms;
    std::string error;

    RecoveryEvent()
        : type(RecoveryEventType::CRASH_DETECTED), pid(0), timestamp_ms(0), duration_ms(0) {}

    Json::Value to_json() const;
};

using RecoveryListener = std::function<void(const RecoveryEvent& event)>;

struct RecoveryConfig {
    std::string state_path;
    bool auto_restart;
    int64_t polling_interval_ms;
    int crash_detection_window_min;
    int restart_lock_ttl_seconds;
    Clock clock;

    RecoveryConfig()
        : state_path("fleetwatch-supervisor.json"),
          auto_restart(true),
          polling_interval_ms(1000),
          crash_detection_window_min(5),
          restart_lock_ttl_seconds(60),
          clock(system_clock()) {}
};

struct RecoveryStatus {
    std::string current_chat_url;
    uint64_t crash_count;
    uint64_t restart_count;
    bool auto_restart;
    int64_t polling_interval_ms;
    int crash_detection_window_min;
    std::optional<int64_t> last_restart_ms;

    RecoveryStatus()
        : crash_count(0), restart_count(0), auto_restart(true),
          polling_interval_ms(1000), crash_detection_window_min(5) {}
};

class RecoverySupervisor {
public:
    /**
     * @param restarter  may be nullptr; every restart then fails
     * @param bus        may be nullptr
     */
    RecoverySupervisor(const RecoveryConfig& config, LockManager& locks, Restarter* restarter,
                       MessageBus* bus = nullptr);

    /**
     * @brief Loads the state file if present. A missing file is fine; an
     *        unreadable one is logged and ignored.
     */
    void initialize();

    void set_listener(RecoveryListener listener);

    /**
     * @throws InvalidArgumentError unless url looks like scheme://rest
     * @throws PersistenceError if the state file cannot be written
     */
    void set_current_chat_url(const std::string& url);

    /**
     * @throws PersistenceError if the state file cannot be written
     */
    void update_config(bool auto_restart, int64_t polling_interval_ms,
                       int crash_detection_window_min);

    /**
     * @brief Runs the crash flow for one event.
     * @return true if this call restarted the session
     * @throws UnavailableError if the shared store is unreachable
     */
    bool handle_crash(const CrashEvent& crash);

    /**
     * @brief Restart state of the last successful restart, if any.
     */
    std::optional<RestartResult> last_restart() const;

    RecoveryStatus status() const;

    /**
     * @throws PersistenceError
     */
    void persist_state();

    static const char* kEventsChannel;

private:
    RecoveryConfig config_;
    LockManager& locks_;
    Restarter* restarter_;
    MessageBus* bus_;

    mutable std::mutex mutex_;
    RecoveryListener listener_;
    std::string current_chat_url_;
    uint64_t crash_count_;
    uint64_t restart_count_;
    std::optional<RestartResult> last_restart_;
    std::optional<int64_t> last_restart_ms_;

    void emit(const RecoveryEvent& event);
    void persist_quietly();
};

class WorkerCrashPoller {
public:
    /**
     * @param self_id  worker id of this supervisor, never recovered
     */
    WorkerCrashPoller(WorkerRegistry& registry, RecoverySupervisor& recovery,
                      const std::string& self_id, Clock clock = system_clock());

    /**
     * @brief Hands every newly silent worker to the RecoverySupervisor.
     *        A worker that heartbeats again and goes quiet later is handed
     *        over again.
     * @return number of crash events raised
     * @throws UnavailableError if the shared store is unreachable
     */
    size_t poll();

    size_t tracked_silences() const { return handled_.size(); }

private:
    WorkerRegistry& registry_;
    RecoverySupervisor& recovery_;
    std::string self_id_;
    Clock clock_;

    // "<workerId>@<lastHeartbeat>" of silences already handed over
    std::set<std::string> handled_;
};

} // namespace fleetwatch

#endif // RECOVERY_SUPERVISOR_H
