/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: worker_registry.cpp
*******************************************************************************/

#include "coordination/worker_registry.h"
#include "coordination/state_synchronizer.h"
#include "common/errors.h"
#include "common/json_util.h"
#include "common/logger.h"

#include <algorithm>

namespace fleetwatch {

//==============================================================================
// SECTION 1: Record encoding
//==============================================================================

const char* worker_status_name(WorkerStatus status) {
    switch (status) {
        case WorkerStatus::IDLE: return "idle";
        case WorkerStatus::BUSY: return "busy";
        case WorkerStatus::CRASHED: return "crashed";
    }
    return "idle";
}

const char* worker_health_name(WorkerHealth health) {
    switch (health) {
        case WorkerHealth::HEALTHY: return "healthy";
        case WorkerHealth::CRASHED: return "crashed";
    }
    return "healthy";
}

std::optional<WorkerStatus> parse_worker_status(const std::string& name) {
    if (name == "idle") return WorkerStatus::IDLE;
    if (name == "busy") return WorkerStatus::BUSY;
    if (name == "crashed") return WorkerStatus::CRASHED;
    return std::nullopt;
}

std::optional<WorkerHealth> parse_worker_health(const std::string& name) {
    if (name == "healthy") return WorkerHealth::HEALTHY;
    if (name == "crashed") return WorkerHealth::CRASHED;
    return std::nullopt;
}

Json::Value WorkerInfo::to_json() const {
    Json::Value json(Json::objectValue);
    json["workerId"] = worker_id;
    json["chatId"] = chat_id;
    json["status"] = worker_status_name(status);
    json["health"] = worker_health_name(health);
    json["registeredAt"] = Json::Int64(registered_at_ms);
    json["lastHeartbeat"] = Json::Int64(last_heartbeat_ms);
    if (current_task) {
        json["currentTask"] = *current_task;
    }
    return json;
}

std::optional<WorkerInfo> WorkerInfo::from_json(const Json::Value& json) {
    if (!json.isObject() || !json["workerId"].isString() ||
        !json["lastHeartbeat"].isIntegral()) {
        return std::nullopt;
    }

    WorkerInfo worker;
    worker.worker_id = json["workerId"].asString();
    worker.chat_id = json.get("chatId", "").asString();
    worker.status = parse_worker_status(json.get("status", "idle").asString())
                        .value_or(WorkerStatus::IDLE);
    worker.health = parse_worker_health(json.get("health", "healthy").asString())
                        .value_or(WorkerHealth::HEALTHY);
    worker.last_heartbeat_ms = json["lastHeartbeat"].asInt64();
    worker.registered_at_ms = json.isMember("registeredAt") && json["registeredAt"].isIntegral()
                                  ? json["registeredAt"].asInt64()
                                  : worker.last_heartbeat_ms;
    if (json["currentTask"].isString()) {
        worker.current_task = json["currentTask"].asString();
    }
    return worker;
}

//==============================================================================
// SECTION 2: Registry operations
//==============================================================================

WorkerRegistry::WorkerRegistry(SharedStore& store, const RegistryConfig& config)
    : store_(store), config_(config) {
    if (!config_.clock) config_.clock = system_clock();
}

static std::optional<WorkerInfo> decode_worker(const std::string& raw) {
    Json::Value json;
    if (!parse_json(raw, json)) return std::nullopt;
    return WorkerInfo::from_json(json);
}

bool WorkerRegistry::timed_out(const WorkerInfo& worker, int64_t now) const {
    return now - worker.last_heartbeat_ms > config_.heartbeat_timeout_ms;
}

bool WorkerRegistry::mutate(const std::string& key, const WorkerChange& change) {
    return update_record(store_, key,
                         [&change](const std::optional<std::string>& current)
                             -> std::optional<std::string> {
                             if (!current) return std::nullopt;
                             auto worker = decode_worker(*current);
                             if (!worker || !change(*worker)) return std::nullopt;
                             return to_compact_json(worker->to_json());
                         });
}

void WorkerRegistry::observe_liveness(const std::string& key, WorkerInfo& worker) {
    int64_t now = config_.clock();
    if (worker.health == WorkerHealth::CRASHED || !timed_out(worker, now)) return;

    std::optional<WorkerInfo> latest;
    bool marked = mutate(key, [&](WorkerInfo& stored) {
        latest = stored;
        if (stored.health == WorkerHealth::CRASHED || !timed_out(stored, now)) return false;
        stored.health = WorkerHealth::CRASHED;
        latest = stored;
        return true;
    });

    if (marked) {
        Logger::warning("Worker " + worker.worker_id + " heartbeat timeout (" +
                        std::to_string(now - worker.last_heartbeat_ms) + "ms)");
    }
    if (latest) {
        worker = *latest;
    } else {
        // Unregistered meanwhile; report what was read.
        worker.health = WorkerHealth::CRASHED;
    }
}

std::optional<WorkerInfo> WorkerRegistry::load(const std::string& key) {
    auto raw = store_.get(key);
    if (!raw) return std::nullopt;

    Json::Value json;
    std::string error;
    if (!parse_json(*raw, json, &error)) {
        Logger::warning("Ignoring unreadable worker record " + key + ": " + error);
        return std::nullopt;
    }

    auto worker = WorkerInfo::from_json(json);
    if (!worker) {
        Logger::warning("Ignoring malformed worker record " + key);
        return std::nullopt;
    }

    observe_liveness(key, *worker);
    return worker;
}

void WorkerRegistry::register_worker(const std::string& worker_id, const std::string& chat_id) {
    require_non_blank(worker_id, "Worker id");

    int64_t now = config_.clock();
    bool existed = false;

    update_record(store_, worker_key(worker_id),
                  [&](const std::optional<std::string>& current) -> std::optional<std::string> {
                      std::optional<WorkerInfo> existing;
                      if (current) existing = decode_worker(*current);
                      existed = existing.has_value();

                      WorkerInfo worker;
                      if (existing) {
                          worker = *existing;
                          worker.chat_id = chat_id;
                          worker.last_heartbeat_ms = std::max(worker.last_heartbeat_ms, now);
                      } else {
                          worker.worker_id = worker_id;
                          worker.chat_id = chat_id;
                          worker.registered_at_ms = now;
                          worker.last_heartbeat_ms = now;
                      }
                      return to_compact_json(worker.to_json());
                  });

    Logger::info("Registered worker " + worker_id + " (chat " + chat_id + ")" +
                 (existed ? " [re-registration]" : ""));
}

void WorkerRegistry::unregister_worker(const std::string& worker_id) {
    require_non_blank(worker_id, "Worker id");
    if (store_.del(worker_key(worker_id))) {
        Logger::info("Unregistered worker " + worker_id);
    }
}

void WorkerRegistry::heartbeat(const std::string& worker_id) {
    require_non_blank(worker_id, "Worker id");

    int64_t now = config_.clock();
    mutate(worker_key(worker_id), [now](WorkerInfo& worker) {
        if (now <= worker.last_heartbeat_ms) return false;
        worker.last_heartbeat_ms = now;
        return true;
    });
}

std::optional<WorkerInfo> WorkerRegistry::get_worker(const std::string& worker_id) {
    require_non_blank(worker_id, "Worker id");
    return load(worker_key(worker_id));
}

std::vector<WorkerInfo> WorkerRegistry::list_workers() {
    std::vector<WorkerInfo> workers;
    for (const auto& key : store_.keys_with_prefix(config_.key_prefix)) {
        // A key can vanish between listing and reading; load() returns nullopt then.
        auto worker = load(key);
        if (worker) workers.push_back(*worker);
    }
    return workers;
}

std::vector<WorkerInfo> WorkerRegistry::get_crashed_workers() {
    int64_t now = config_.clock();
    std::vector<WorkerInfo> crashed;

    for (const auto& worker : list_workers()) {
        if (timed_out(worker, now)) crashed.push_back(worker);
    }
    return crashed;
}

std::vector<WorkerInfo> WorkerRegistry::get_workers_by_health(WorkerHealth health) {
    std::vector<WorkerInfo> matching;
    for (const auto& worker : list_workers()) {
        if (worker.health == health) matching.push_back(worker);
    }
    return matching;
}

void WorkerRegistry::update_health(const std::string& worker_id, WorkerHealth health) {
    require_non_blank(worker_id, "Worker id");

    mutate(worker_key(worker_id), [health](WorkerInfo& worker) {
        if (worker.health == health) return false;
        worker.health = health;
        return true;
    });
}

void WorkerRegistry::update_status(const std::string& worker_id, WorkerStatus status,
                                   const std::optional<std::string>& current_task) {
    require_non_blank(worker_id, "Worker id");

    mutate(worker_key(worker_id), [status, &current_task](WorkerInfo& worker) {
        worker.status = status;
        if (current_task) {
            worker.current_task = current_task;
        } else if (status == WorkerStatus::IDLE) {
            worker.current_task.reset();
        }
        return true;
    });
}

} // namespace fleetwatch
