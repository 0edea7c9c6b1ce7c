/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: checkpoint_manager.h

    Description:
        Decides when a session should be checkpointed and writes the
        checkpoint through a CheckpointRepository.

        Trigger Priority (first match wins):
            1. crash risk DANGER                       -> danger_zone
            2. crash risk WARNING                      -> warning_zone
            3. tool calls since checkpoint >= interval -> tool_call_interval
            4. time since last checkpoint >= interval  -> time_interval
            otherwise no checkpoint

        Checkpoint Lifecycle:
            1. Take a CrashSignals snapshot from the SignalCollector
            2. Build the checkpoint with number 0
            3. Repository save() assigns the session's next number
            4. Reset the collector's since-checkpoint counter and the
               last-checkpoint time
            5. Optionally record the snapshot in the signal history

        If step 3 throws, nothing is reset and the error reaches the
        caller. A checkpoint that silently failed would leave the session
        without a recovery point.

        Thread Safety:
            Safe to call from several threads. No lock is held across
            repository I/O; numbering is the repository's job.
*******************************************************************************/

#ifndef CHECKPOINT_MANAGER_H
#define CHECKPOINT_MANAGER_H

#include "checkpoint/checkpoint_repository.h"
#include "common/clock.h"
#include "signals/signal_collector.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch {

class SignalHistoryRepository;

struct CheckpointManagerConfig {
    int64_t tool_call_interval;
    int64_t time_interval_ms;
    Clock clock;

    CheckpointManagerConfig()
        : tool_call_interval(5), time_interval_ms(10 * 60 * 1000), clock(system_clock()) {}
};

struct TriggerCheckResult {
    bool should_trigger;
    std::optional<CheckpointTrigger> reason;
    CrashRisk risk;

    TriggerCheckResult() : should_trigger(false), risk(CrashRisk::SAFE) {}
};

/**
 * @struct AutoCheckpointInput
 * @brief What the session is doing right now. Only session_id, operation
 *        and progress are required; phase defaults from progress and the
 *        summary from the operation.
 */
struct AutoCheckpointInput {
    std::string session_id;
    std::string operation;
    double progress;
    std::string phase;
    std::vector<std::string> completed_steps;
    std::vector<std::string> next_steps;
    std::vector<std::string> blockers;
    std::string conversation_summary;
    std::vector<std::string> active_files;
    std::vector<std::string> recent_tools;
    std::string user_preferences;

    AutoCheckpointInput() : progress(0.0) {}
};

struct CreateCheckpointInput : AutoCheckpointInput {
    CheckpointTrigger trigger;

    CreateCheckpointInput() : trigger(CheckpointTrigger::MANUAL) {}
    CreateCheckpointInput(const AutoCheckpointInput& input, CheckpointTrigger t)
        : AutoCheckpointInput(input), trigger(t) {}
};

struct AutoCheckpointResult {
    bool created;
    std::optional<Checkpoint> checkpoint;
    std::optional<CheckpointTrigger> reason;

    AutoCheckpointResult() : created(false) {}
};

struct CheckpointStats {
    size_t total_checkpoints;
    std::optional<Checkpoint> last_checkpoint;

    CheckpointStats() : total_checkpoints(0) {}
};

class CheckpointManager {
public:
    CheckpointManager(SignalCollector& collector, CheckpointRepository& repository,
                      const CheckpointManagerConfig& config = CheckpointManagerConfig());

    /**
     * @brief Records every checkpoint's signal snapshot in history as well.
     *        The history must outlive the manager. nullptr detaches.
     */
    void attach_signal_history(SignalHistoryRepository* history);

    TriggerCheckResult should_trigger_checkpoint() const;

    /**
     * @throws InvalidArgumentError for a blank session id or progress
     *         outside [0, 1]
     * @throws PersistenceError if the repository could not store it
     */
    Checkpoint create_checkpoint(const CreateCheckpointInput& input);

    /**
     * @brief Checkpoints only when a trigger fires. Without a trigger the
     *        result is {false, none, none} and nothing changes.
     */
    AutoCheckpointResult auto_checkpoint(const AutoCheckpointInput& input);

    CheckpointStats get_checkpoint_stats(const std::string& session_id);

    /**
     * @brief The trigger rule on its own, without any state.
     */
    static std::optional<CheckpointTrigger> decide_trigger(const CrashSignals& signals,
                                                           int64_t tool_call_interval,
                                                           int64_t elapsed_ms,
                                                           int64_t time_interval_ms);

private:
    SignalCollector& collector_;
    CheckpointRepository& repository_;
    CheckpointManagerConfig config_;
    SignalHistoryRepository* history_;

    mutable std::mutex mutex_;
    int64_t last_checkpoint_ms_;
};

} // namespace fleetwatch

#endif // CHECKPOINT_MANAGER_H
