/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: heartbeat_timer.h

    Description:
        Worker-side heartbeat thread. Sends WorkerRegistry::heartbeat() for
        one worker immediately on start() and then every interval_ms.

        A failed heartbeat (store unavailable) is logged and counted; the
        timer keeps running so liveness resumes once the store is back.
        stop() wakes the thread immediately and is a no-op when the timer
        is not running.
*******************************************************************************/

#ifndef HEARTBEAT_TIMER_H
#define HEARTBEAT_TIMER_H

#include "coordination/worker_registry.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace fleetwatch {

class HeartbeatTimer {
public:
    HeartbeatTimer(WorkerRegistry& registry, const std::string& worker_id, int interval_ms);
    ~HeartbeatTimer();

    HeartbeatTimer(const HeartbeatTimer&) = delete;
    HeartbeatTimer& operator=(const HeartbeatTimer&) = delete;

    /**
     * @return false if already running
     */
    bool start();
    void stop();

    bool is_running() const { return running_; }
    uint64_t beats_sent() const { return beats_sent_; }
    uint64_t beats_failed() const { return beats_failed_; }

private:
    WorkerRegistry& registry_;
    std::string worker_id_;
    int interval_ms_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> beats_sent_;
    std::atomic<uint64_t> beats_failed_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;

    void heartbeat_loop();
    void send_heartbeat();
};

} // namespace fleetwatch

#endif // HEARTBEAT_TIMER_H
