/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: checkpoint_manager.cpp
*******************************************************************************/

#include "checkpoint/checkpoint_manager.h"
#include "common/errors.h"
#include "common/logger.h"
#include "signals/signal_history_repository.h"

#include <cmath>

namespace fleetwatch {

CheckpointManager::CheckpointManager(SignalCollector& collector,
                                     CheckpointRepository& repository,
                                     const CheckpointManagerConfig& config)
    : collector_(collector),
      repository_(repository),
      config_(config),
      history_(nullptr) {
    if (!config_.clock) config_.clock = system_clock();
    last_checkpoint_ms_ = config_.clock();
}

void CheckpointManager::attach_signal_history(SignalHistoryRepository* history) {
    std::lock_guard<std::mutex> lock(mutex_);
    history_ = history;
}

//==============================================================================
// SECTION 1: Trigger decision
//==============================================================================

std::optional<CheckpointTrigger> CheckpointManager::decide_trigger(const CrashSignals& signals,
                                                                   int64_t tool_call_interval,
                                                                   int64_t elapsed_ms,
                                                                   int64_t time_interval_ms) {
    if (signals.crash_risk == CrashRisk::DANGER) return CheckpointTrigger::DANGER_ZONE;
    if (signals.crash_risk == CrashRisk::WARNING) return CheckpointTrigger::WARNING_ZONE;
    if (signals.tool_calls_since_checkpoint >= tool_call_interval) {
        return CheckpointTrigger::TOOL_CALL_INTERVAL;
    }
    if (elapsed_ms >= time_interval_ms) return CheckpointTrigger::TIME_INTERVAL;
    return std::nullopt;
}

TriggerCheckResult CheckpointManager::should_trigger_checkpoint() const {
    CrashSignals signals = collector_.get_signals();

    int64_t elapsed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        elapsed = config_.clock() - last_checkpoint_ms_;
    }

    TriggerCheckResult result;
    result.risk = signals.crash_risk;
    result.reason = decide_trigger(signals, config_.tool_call_interval, elapsed,
                                   config_.time_interval_ms);
    result.should_trigger = result.reason.has_value();
    return result;
}

//==============================================================================
// SECTION 2: Checkpoint creation
//==============================================================================

Checkpoint CheckpointManager::create_checkpoint(const CreateCheckpointInput& input) {
    require_non_blank(input.session_id, "Session id");
    if (!std::isfinite(input.progress) || input.progress < 0.0 || input.progress > 1.0) {
        throw InvalidArgumentError("Progress must be between 0 and 1");
    }

    Checkpoint checkpoint;
    checkpoint.session_id = input.session_id;
    checkpoint.checkpoint_number = 0;
    checkpoint.created_at_ms = config_.clock();
    checkpoint.trigger = input.trigger;

    checkpoint.task_state.operation = input.operation;
    checkpoint.task_state.phase = !input.phase.empty()
        ? input.phase
        : (input.progress < 0.5 ? "in-progress" : "near-completion");
    checkpoint.task_state.progress = input.progress;
    checkpoint.task_state.completed_steps = input.completed_steps;
    checkpoint.task_state.next_steps = input.next_steps;
    checkpoint.task_state.blockers = input.blockers;

    checkpoint.conversation_summary = !input.conversation_summary.empty()
        ? input.conversation_summary
        : "Operation: " + input.operation;
    checkpoint.active_files = input.active_files;
    checkpoint.recent_tools = input.recent_tools;
    checkpoint.signals = collector_.get_signals();
    checkpoint.user_preferences = input.user_preferences;

    // Throws on failure; counters stay untouched so the next poll retries.
    repository_.save(checkpoint);

    collector_.reset_checkpoint_counter();

    SignalHistoryRepository* history;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_checkpoint_ms_ = config_.clock();
        history = history_;
    }

    Logger::info("Checkpoint " + checkpoint.id + " created (" +
                 checkpoint_trigger_name(checkpoint.trigger) + ", risk " +
                 crash_risk_name(checkpoint.signals.crash_risk) + ")");

    if (history) {
        try {
            history->save_snapshot(checkpoint.session_id, checkpoint.signals);
        } catch (const std::exception& e) {
            // The checkpoint itself is durable at this point.
            Logger::warning("Signal snapshot for " + checkpoint.id + " not recorded: " + e.what());
        }
    }

    return checkpoint;
}

AutoCheckpointResult CheckpointManager::auto_checkpoint(const AutoCheckpointInput& input) {
    AutoCheckpointResult result;

    TriggerCheckResult check = should_trigger_checkpoint();
    if (!check.should_trigger || !check.reason) {
        return result;
    }

    result.checkpoint = create_checkpoint(CreateCheckpointInput(input, *check.reason));
    result.created = true;
    result.reason = check.reason;
    return result;
}

CheckpointStats CheckpointManager::get_checkpoint_stats(const std::string& session_id) {
    auto checkpoints = repository_.list_by_session(session_id);

    CheckpointStats stats;
    stats.total_checkpoints = checkpoints.size();
    if (!checkpoints.empty()) {
        stats.last_checkpoint = checkpoints.back();
    }
    return stats;
}

} // namespace fleetwatch
