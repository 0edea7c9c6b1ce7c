/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: recovery_supervisor.cpp
*******************************************************************************/

#include "recovery/recovery_supervisor.h"
#include "common/errors.h"
#include "common/json_util.h"
#include "common/logger.h"

#include <unistd.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <utility>

namespace fleetwatch {

const char* RecoverySupervisor::kEventsChannel = "recovery:events";

const char* recovery_event_name(RecoveryEventType type) {
    switch (type) {
        case RecoveryEventType::CRASH_DETECTED: return "crash_detected";
        case RecoveryEventType::RESTART_INITIATED: return "restart_initiated";
        case RecoveryEventType::RESTART_COMPLETED: return "restart_completed";
        case RecoveryEventType::RESTART_FAILED: return "restart_failed";
    }
    return "crash_detected";
}

Json::Value RecoveryEvent::to_json() const {
    Json::Value json(Json::objectValue);
    json["type"] = recovery_event_name(type);
    json["sessionId"] = session_id;
    json["pid"] = static_cast<Json::Int>(pid);
    json["timestamp"] = Json::Int64(timestamp_ms);
    if (duration_ms > 0) json["duration"] = Json::Int64(duration_ms);
    if (!error.empty()) json["error"] = error;
    return json;
}

RecoverySupervisor::RecoverySupervisor(const RecoveryConfig& config, LockManager& locks,
                                       Restarter* restarter, MessageBus* bus)
    : config_(config),
      locks_(locks),
      restarter_(restarter),
      bus_(bus),
      crash_count_(0),
      restart_count_(0) {
    if (!config_.clock) config_.clock = system_clock();
}

//==============================================================================
// SECTION 1: State file
//==============================================================================

void RecoverySupervisor::initialize() {
    std::ifstream in(config_.state_path);
    if (!in) {
        Logger::debug("No supervisor state at " + config_.state_path);
        return;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    Json::Value json;
    std::string error;
    if (!parse_json(buffer.str(), json, &error) || !json.isObject()) {
        Logger::warning("Ignoring unreadable supervisor state " + config_.state_path + ": " + error);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (json["currentChatUrl"].isString()) {
        current_chat_url_ = json["currentChatUrl"].asString();
    }
    if (json["restartCount"].isIntegral()) restart_count_ = json["restartCount"].asUInt64();
    if (json["crashCount"].isIntegral()) crash_count_ = json["crashCount"].asUInt64();

    const Json::Value& saved = json["config"];
    if (saved.isObject()) {
        if (saved["autoRestart"].isBool()) config_.auto_restart = saved["autoRestart"].asBool();
        if (saved["pollingInterval"].isIntegral()) {
            config_.polling_interval_ms = saved["pollingInterval"].asInt64();
        }
        if (saved["crashDetectionWindow"].isIntegral()) {
            config_.crash_detection_window_min = saved["crashDetectionWindow"].asInt();
        }
    }

    Logger::info("Loaded supervisor state: " + std::to_string(crash_count_) + " crashes, " +
                 std::to_string(restart_count_) + " restarts");
}

void RecoverySupervisor::persist_state() {
    Json::Value json(Json::objectValue);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        json["currentChatUrl"] = current_chat_url_.empty()
            ? Json::Value(Json::nullValue) : Json::Value(current_chat_url_);
        json["restartCount"] = Json::UInt64(restart_count_);
        json["crashCount"] = Json::UInt64(crash_count_);

        Json::Value saved(Json::objectValue);
        saved["autoRestart"] = config_.auto_restart;
        saved["pollingInterval"] = Json::Int64(config_.polling_interval_ms);
        saved["crashDetectionWindow"] = config_.crash_detection_window_min;
        json["config"] = saved;
    }
    json["lastUpdated"] = format_iso8601(config_.clock());

    std::string temp_path = config_.state_path + ".tmp." + std::to_string(getpid());
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out) {
            throw PersistenceError("Failed to open " + temp_path);
        }
        out << to_pretty_json(json) << "\n";
        out.flush();
        if (!out) {
            std::remove(temp_path.c_str());
            throw PersistenceError("Failed to write " + temp_path);
        }
    }

    if (std::rename(temp_path.c_str(), config_.state_path.c_str()) != 0) {
        std::remove(temp_path.c_str());
        throw PersistenceError("Failed to replace " + config_.state_path);
    }
}

void RecoverySupervisor::persist_quietly() {
    try {
        persist_state();
    } catch (const PersistenceError& e) {
        Logger::error(std::string("Supervisor state not saved: ") + e.what());
    }
}

//==============================================================================
// SECTION 2: Configuration
//==============================================================================

void RecoverySupervisor::set_listener(RecoveryListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void RecoverySupervisor::set_current_chat_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0 || scheme_end + 3 >= url.size()) {
        throw InvalidArgumentError("Invalid URL: " + url);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_chat_url_ = url;
    }
    persist_state();
}

void RecoverySupervisor::update_config(bool auto_restart, int64_t polling_interval_ms,
                                       int crash_detection_window_min) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.auto_restart = auto_restart;
        if (polling_interval_ms > 0) config_.polling_interval_ms = polling_interval_ms;
        if (crash_detection_window_min > 0) {
            config_.crash_detection_window_min = crash_detection_window_min;
        }
    }
    persist_state();
}

RecoveryStatus RecoverySupervisor::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RecoveryStatus s;
    s.current_chat_url = current_chat_url_;
    s.crash_count = crash_count_;
    s.restart_count = restart_count_;
    s.auto_restart = config_.auto_restart;
    s.polling_interval_ms = config_.polling_interval_ms;
    s.crash_detection_window_min = config_.crash_detection_window_min;
    s.last_restart_ms = last_restart_ms_;
    return s;
}

std::optional<RestartResult> RecoverySupervisor::last_restart() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_restart_;
}

//==============================================================================
// SECTION 3: Crash flow
//==============================================================================

void RecoverySupervisor::emit(const RecoveryEvent& event) {
    RecoveryListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }

    if (listener) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            Logger::warning(std::string("Recovery listener failed on ") +
                            recovery_event_name(event.type) + ": " + e.what());
        }
    }

    if (bus_) {
        try {
            bus_->publish(kEventsChannel,
                          BusEvent(recovery_event_name(event.type), event.to_json(),
                                   event.timestamp_ms));
        } catch (const std::runtime_error& e) {
            Logger::warning(std::string("Recovery event not published: ") + e.what());
        }
    }
}

bool RecoverySupervisor::handle_crash(const CrashEvent& crash) {
    require_non_blank(crash.session_id, "Session id");

    bool auto_restart;
    std::string chat_url;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        crash_count_++;
        auto_restart = config_.auto_restart;
        chat_url = current_chat_url_;
    }

    RecoveryEvent detected;
    detected.type = RecoveryEventType::CRASH_DETECTED;
    detected.session_id = crash.session_id;
    detected.pid = crash.pid;
    detected.timestamp_ms = config_.clock();
    emit(detected);
    persist_quietly();

    if (!auto_restart) {
        Logger::info("Auto-restart disabled, not restarting " + crash.session_id);
        return false;
    }

    std::string resource = "restart:" + crash.session_id;
    LockOptions options;
    options.ttl_seconds = config_.restart_lock_ttl_seconds;
    options.timeout_ms = 0;

    auto token = locks_.acquire(resource, options);
    if (!token) {
        Logger::info("Restart of " + crash.session_id + " is handled by another supervisor");
        return false;
    }

    RecoveryEvent initiated;
    initiated.type = RecoveryEventType::RESTART_INITIATED;
    initiated.session_id = crash.session_id;
    initiated.pid = crash.pid;
    initiated.timestamp_ms = config_.clock();
    emit(initiated);

    RestartResult result;
    try {
        if (restarter_) {
            result = restarter_->restart(crash, chat_url);
        } else {
            result.error = "No restart command configured";
        }
    } catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
    }

    RecoveryEvent outcome;
    outcome.session_id = crash.session_id;
    outcome.timestamp_ms = config_.clock();
    outcome.duration_ms = result.duration_ms;

    if (result.success) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            restart_count_++;
            last_restart_ = result;
            last_restart_ms_ = outcome.timestamp_ms;
        }
        outcome.type = RecoveryEventType::RESTART_COMPLETED;
        outcome.pid = result.pid;
        Logger::info("Session " + crash.session_id + " restarted as pid " +
                     std::to_string(result.pid));
    } else {
        outcome.type = RecoveryEventType::RESTART_FAILED;
        outcome.pid = crash.pid;
        outcome.error = result.error;
        Logger::error("Restart of " + crash.session_id + " failed: " + result.error);
    }
    emit(outcome);

    try {
        locks_.release(resource, *token);
    } catch (const std::runtime_error& e) {
        // The lock expires on its own after restart_lock_ttl_seconds.
        Logger::warning("Could not release " + resource + ": " + e.what());
    }

    persist_quietly();
    return result.success;
}

//==============================================================================
// SECTION 4: Registry polling
//==============================================================================

WorkerCrashPoller::WorkerCrashPoller(WorkerRegistry& registry, RecoverySupervisor& recovery,
                                     const std::string& self_id, Clock clock)
    : registry_(registry), recovery_(recovery), self_id_(self_id), clock_(std::move(clock)) {}

size_t WorkerCrashPoller::poll() {
    std::set<std::string> silent;
    size_t raised = 0;

    for (const auto& worker : registry_.get_crashed_workers()) {
        if (worker.worker_id == self_id_) continue;

        std::string marker = worker.worker_id + "@" + std::to_string(worker.last_heartbeat_ms);
        silent.insert(marker);
        if (!handled_.insert(marker).second) continue;

        CrashEvent event;
        event.session_id = worker.chat_id.empty() ? worker.worker_id : worker.chat_id;
        event.timestamp_ms = clock_();
        recovery_.handle_crash(event);
        raised++;
    }

    // Forget silences that ended: the worker beat again or was removed.
    for (auto it = handled_.begin(); it != handled_.end();) {
        if (silent.count(*it) == 0) {
            it = handled_.erase(it);
        } else {
            ++it;
        }
    }
    return raised;
}

} // namespace fleetwatch
