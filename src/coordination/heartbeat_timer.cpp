/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: heartbeat_timer.cpp
*******************************************************************************/

#include "coordination/heartbeat_timer.h"
#include "common/logger.h"

#include <chrono>

namespace fleetwatch {

HeartbeatTimer::HeartbeatTimer(WorkerRegistry& registry, const std::string& worker_id,
                               int interval_ms)
    : registry_(registry),
      worker_id_(worker_id),
      interval_ms_(interval_ms > 0 ? interval_ms : 1000),
      running_(false),
      beats_sent_(0),
      beats_failed_(0) {
}

HeartbeatTimer::~HeartbeatTimer() {
    stop();
}

bool HeartbeatTimer::start() {
    if (running_) {
        Logger::warning("Heartbeat timer for " + worker_id_ + " already running");
        return false;
    }
    running_ = true;
    thread_ = std::thread(&HeartbeatTimer::heartbeat_loop, this);
    Logger::debug("Heartbeat timer started for " + worker_id_ + " every " +
                  std::to_string(interval_ms_) + "ms");
    return true;
}

void HeartbeatTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    Logger::debug("Heartbeat timer stopped for " + worker_id_);
}

void HeartbeatTimer::send_heartbeat() {
    try {
        registry_.heartbeat(worker_id_);
        beats_sent_++;
    } catch (const std::exception& e) {
        beats_failed_++;
        Logger::warning("Failed to send heartbeat for " + worker_id_ + ": " + e.what());
    }
}

void HeartbeatTimer::heartbeat_loop() {
    send_heartbeat();

    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        cv_.wait_for(lock, std::chrono::milliseconds(interval_ms_), [this] { return !running_; });
        if (!running_) break;

        lock.unlock();
        send_heartbeat();
        lock.lock();
    }
}

} // namespace fleetwatch
