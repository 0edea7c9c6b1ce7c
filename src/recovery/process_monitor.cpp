/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: process_monitor.cpp
*******************************************************************************/

#include "recovery/process_monitor.h"
#include "common/logger.h"

#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>

namespace fleetwatch {

Json::Value CrashEvent::to_json() const {
    Json::Value json(Json::objectValue);
    json["pid"] = static_cast<Json::Int>(pid);
    json["sessionId"] = session_id;
    json["timestamp"] = Json::Int64(timestamp_ms);

    Json::Value metadata(Json::objectValue);
    metadata["hadRecentCheckpoint"] = had_recent_checkpoint;
    if (last_checkpoint_age_min >= 0) {
        metadata["lastCheckpointAge"] = last_checkpoint_age_min;
    }
    json["metadata"] = metadata;
    return json;
}

ProcessMonitor::ProcessMonitor(const std::string& session_id, CheckpointRepository* repository,
                               const ProcessMonitorConfig& config)
    : session_id_(session_id),
      repository_(repository),
      config_(config),
      pid_(0),
      was_alive_(false),
      running_(false) {
    if (!config_.clock) config_.clock = system_clock();
    if (config_.polling_interval_ms <= 0) config_.polling_interval_ms = 1000;
}

ProcessMonitor::~ProcessMonitor() {
    stop();
}

void ProcessMonitor::set_crash_handler(CrashHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
}

void ProcessMonitor::watch(pid_t pid) {
    pid_ = pid;
    was_alive_ = false;
    Logger::info("Monitoring pid " + std::to_string(pid) + " for session " + session_id_);
}

bool ProcessMonitor::start() {
    if (running_) {
        Logger::warning("Process monitor for " + session_id_ + " already running");
        return false;
    }
    running_ = true;
    thread_ = std::thread(&ProcessMonitor::monitor_loop, this);
    return true;
}

void ProcessMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    Logger::debug("Process monitor stopped for " + session_id_);
}

bool ProcessMonitor::is_process_alive(pid_t pid) {
    if (pid <= 0) return false;

    int status;
    pid_t reaped = waitpid(pid, &status, WNOHANG);
    if (reaped == pid) return false;

    if (kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

CrashEvent ProcessMonitor::build_event(pid_t pid) {
    CrashEvent event;
    event.pid = pid;
    event.session_id = session_id_;
    event.timestamp_ms = config_.clock();

    if (repository_ && !session_id_.empty()) {
        try {
            auto last = repository_->get_most_recent(session_id_);
            if (last) {
                event.last_checkpoint_age_min =
                    static_cast<double>(event.timestamp_ms - last->created_at_ms) / 60000.0;
                event.had_recent_checkpoint =
                    event.last_checkpoint_age_min <= config_.crash_detection_window_min;
            }
        } catch (const std::exception& e) {
            Logger::warning("Checkpoint lookup for crash of " + session_id_ + " failed: " +
                            e.what());
        }
    }
    return event;
}

void ProcessMonitor::poll() {
    pid_t pid = pid_;
    if (pid <= 0) return;

    bool alive = is_process_alive(pid);
    if (alive) {
        if (!was_alive_) {
            Logger::debug("Process " + std::to_string(pid) + " found");
        }
        was_alive_ = true;
        return;
    }

    if (!was_alive_.exchange(false)) return;

    CrashEvent event = build_event(pid);
    Logger::warning("Process " + std::to_string(pid) + " of session " + session_id_ +
                    " is gone" + (event.had_recent_checkpoint ? " (recent checkpoint)" : ""));

    CrashHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = handler_;
    }
    if (!handler) return;

    try {
        handler(event);
    } catch (const std::exception& e) {
        Logger::error("Crash handler for " + session_id_ + " failed: " + e.what());
    }
}

void ProcessMonitor::monitor_loop() {
    poll();

    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        cv_.wait_for(lock, std::chrono::milliseconds(config_.polling_interval_ms),
                     [this] { return !running_; });
        if (!running_) break;

        lock.unlock();
        poll();
        lock.lock();
    }
}

} // namespace fleetwatch
