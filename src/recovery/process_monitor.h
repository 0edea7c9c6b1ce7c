/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: process_monitor.h

    Description:
        Watches one session process and reports when it disappears.

        A polling thread checks the pid every polling_interval_ms with
        kill(pid, 0). Children of this process are reaped with
        waitpid(WNOHANG) first, so a dead child is not mistaken for a live
        zombie.

        State Transitions:
            not seen -> alive   remembered, nothing emitted
            alive    -> gone    CrashEvent delivered to the crash handler

        The event carries whether the session had a checkpoint within
        crash_detection_window_min, looked up in the checkpoint repository
        when one is attached.
*******************************************************************************/

#ifndef PROCESS_MONITOR_H
#define PROCESS_MONITOR_H

#include "checkpoint/checkpoint_repository.h"
#include "common/clock.h"

#include <sys/types.h>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace fleetwatch {

struct CrashEvent {
    pid_t pid;
    std::string session_id;
    int64_t timestamp_ms;
    bool had_recent_checkpoint;
    double last_checkpoint_age_min;   // -1 when there is no checkpoint

    CrashEvent()
        : pid(0), timestamp_ms(0), had_recent_checkpoint(false), last_checkpoint_age_min(-1.0) {}

    Json::Value to_json() const;
};

using CrashHandler = std::function<void(const CrashEvent& event)>;

struct ProcessMonitorConfig {
    int64_t polling_interval_ms;
    int crash_detection_window_min;
    Clock clock;

    ProcessMonitorConfig()
        : polling_interval_ms(1000), crash_detection_window_min(5), clock(system_clock()) {}
};

class ProcessMonitor {
public:
    /**
     * @param repository  may be nullptr; events then report no checkpoint
     */
    ProcessMonitor(const std::string& session_id, CheckpointRepository* repository,
                   const ProcessMonitorConfig& config = ProcessMonitorConfig());
    ~ProcessMonitor();

    ProcessMonitor(const ProcessMonitor&) = delete;
    ProcessMonitor& operator=(const ProcessMonitor&) = delete;

    void set_crash_handler(CrashHandler handler);

    /**
     * @brief Starts (or switches) monitoring to pid. The next poll that
     *        finds it alive arms crash detection.
     */
    void watch(pid_t pid);

    /**
     * @return false if already running
     */
    bool start();

    /**
     * @brief Stops the polling thread. No-op when not running.
     */
    void stop();

    bool is_running() const { return running_; }
    pid_t watched_pid() const { return pid_; }
    bool process_seen() const { return was_alive_; }

    /**
     * @brief One detection step; the polling thread calls this.
     */
    void poll();

    static bool is_process_alive(pid_t pid);

private:
    std::string session_id_;
    CheckpointRepository* repository_;
    ProcessMonitorConfig config_;

    std::atomic<pid_t> pid_;
    std::atomic<bool> was_alive_;
    std::atomic<bool> running_;

    std::mutex handler_mutex_;
    CrashHandler handler_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;

    CrashEvent build_event(pid_t pid);
    void monitor_loop();
};

} // namespace fleetwatch

#endif // PROCESS_MONITOR_H
