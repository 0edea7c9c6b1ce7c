/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: worker_registry.h

    Description:
        Liveness registry for the worker fleet, kept in the shared store.

        Each worker is one JSON record under "worker:<id>":
            {"workerId":"w-1","chatId":"c-9","status":"idle",
             "health":"healthy","registeredAt":1760868000000,
             "lastHeartbeat":1760868004000,"currentTask":"t-3"}

        Failure Detection:
            There is no sweep thread. Liveness is computed on read: every
            reader (get_worker, list_workers, get_workers_by_health,
            get_crashed_workers) sees a worker whose last heartbeat is
            older than heartbeat_timeout_ms as crashed, and the first
            reader to notice persists health "crashed". Detection latency
            is therefore bounded by heartbeat_timeout_ms plus the polling
            period of whoever reads the registry.

        Writers:
            Every change is an optimistic read-modify-write of the record
            (update_record, compare_and_set with retry), so a heartbeat
            racing a health or status update is never lost and
            lastHeartbeat never moves backwards.
*******************************************************************************/

#ifndef WORKER_REGISTRY_H
#define WORKER_REGISTRY_H

#include "common/clock.h"
#include "store/shared_store.h"

#include <json/json.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch {

enum class WorkerStatus { IDLE, BUSY, CRASHED };

enum class WorkerHealth { HEALTHY, CRASHED };

const char* worker_status_name(WorkerStatus status);
const char* worker_health_name(WorkerHealth health);
std::optional<WorkerStatus> parse_worker_status(const std::string& name);
std::optional<WorkerHealth> parse_worker_health(const std::string& name);

struct WorkerInfo {
    std::string worker_id;
    std::string chat_id;
    WorkerStatus status;
    WorkerHealth health;
    int64_t registered_at_ms;
    int64_t last_heartbeat_ms;
    std::optional<std::string> current_task;

    WorkerInfo()
        : status(WorkerStatus::IDLE), health(WorkerHealth::HEALTHY),
          registered_at_ms(0), last_heartbeat_ms(0) {}

    Json::Value to_json() const;
    static std::optional<WorkerInfo> from_json(const Json::Value& json);
};

struct RegistryConfig {
    int64_t heartbeat_timeout_ms;
    std::string key_prefix;
    Clock clock;

    RegistryConfig()
        : heartbeat_timeout_ms(30000), key_prefix("worker:"), clock(system_clock()) {}
};

class WorkerRegistry {
public:
    explicit WorkerRegistry(SharedStore& store, const RegistryConfig& config = RegistryConfig());

    /**
     * @brief Creates the record, or refreshes chatId and lastHeartbeat of an
     *        existing one (registeredAt, status and health are kept).
     */
    void register_worker(const std::string& worker_id, const std::string& chat_id);

    void unregister_worker(const std::string& worker_id);

    /**
     * @brief Refreshes lastHeartbeat. No-op for an unknown worker.
     */
    void heartbeat(const std::string& worker_id);

    std::optional<WorkerInfo> get_worker(const std::string& worker_id);

    std::vector<WorkerInfo> list_workers();

    /**
     * @brief Every worker past the heartbeat timeout, marked crashed.
     */
    std::vector<WorkerInfo> get_crashed_workers();

    std::vector<WorkerInfo> get_workers_by_health(WorkerHealth health);

    void update_health(const std::string& worker_id, WorkerHealth health);

    /**
     * @brief Sets status. A task id is attached when given; moving to IDLE
     *        without a task clears the current task.
     */
    void update_status(const std::string& worker_id, WorkerStatus status,
                       const std::optional<std::string>& current_task = std::nullopt);

    int64_t heartbeat_timeout_ms() const { return config_.heartbeat_timeout_ms; }

private:
    SharedStore& store_;
    RegistryConfig config_;

    std::string worker_key(const std::string& worker_id) const {
        return config_.key_prefix + worker_id;
    }

    // Returns false to leave the record unchanged.
    using WorkerChange = std::function<bool(WorkerInfo& worker)>;

    std::optional<WorkerInfo> load(const std::string& key);
    bool mutate(const std::string& key, const WorkerChange& change);
    void observe_liveness(const std::string& key, WorkerInfo& worker);
    bool timed_out(const WorkerInfo& worker, int64_t now) const;
};

} // namespace fleetwatch

#endif // WORKER_REGISTRY_H
