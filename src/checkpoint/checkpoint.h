/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: checkpoint.h

    Description:
        Data model for session checkpoints and resume bookkeeping.

        A checkpoint is a numbered snapshot of what a session was doing:
        the task being worked on, the files and tools in play, the crash
        signals at the time, and the user's preferences. Checkpoints are
        never modified once written; restoring one is recorded separately.

        JSON Layout (one record per checkpoint):
            {
              "id": "<session>:<n>",
              "sessionId": "...",
              "checkpointNumber": n,
              "createdAt": <epoch ms>,
              "triggeredBy": "danger_zone",
              "taskState": "<compact JSON text of the task state>",
              "conversationSummary": "...",
              "activeFiles": [...],
              "recentTools": [...],
              "signals": {...},
              "userPreferences": "<caller's text, verbatim>"
            }

        taskState and userPreferences are kept as text so the payload the
        caller handed in comes back byte for byte.
*******************************************************************************/

#ifndef CHECKPOINT_H
#define CHECKPOINT_H

#include "signals/crash_signals.h"

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch {

enum class CheckpointTrigger {
    TOOL_CALL_INTERVAL,
    TIME_INTERVAL,
    DANGER_ZONE,
    WARNING_ZONE,
    MANUAL
};

enum class InterruptionReason {
    CRASH,           // crash likely imminent when the checkpoint was taken
    ELEVATED_RISK,
    TIMEOUT,
    MANUAL_EXIT,
    UNKNOWN
};

const char* checkpoint_trigger_name(CheckpointTrigger trigger);
std::optional<CheckpointTrigger> parse_checkpoint_trigger(const std::string& name);

const char* interruption_reason_name(InterruptionReason reason);
std::optional<InterruptionReason> parse_interruption_reason(const std::string& name);

struct TaskState {
    std::string operation;
    std::string phase;
    double progress;                // 0.0 - 1.0
    std::vector<std::string> completed_steps;
    std::vector<std::string> next_steps;
    std::vector<std::string> blockers;

    TaskState() : progress(0.0) {}

    Json::Value to_json() const;
    static std::optional<TaskState> from_json(const Json::Value& json);
};

struct Checkpoint {
    std::string id;
    std::string session_id;
    int64_t checkpoint_number;      // 0 until the repository assigns one
    int64_t created_at_ms;
    CheckpointTrigger trigger;

    TaskState task_state;
    std::string conversation_summary;
    std::vector<std::string> active_files;
    std::vector<std::string> recent_tools;
    CrashSignals signals;
    std::string user_preferences;

    std::optional<int64_t> restored_at_ms;

    Checkpoint()
        : checkpoint_number(0), created_at_ms(0), trigger(CheckpointTrigger::MANUAL) {}

    Json::Value to_json() const;
    static std::optional<Checkpoint> from_json(const Json::Value& json);
};

/**
 * @struct ResumeEvent
 * @brief One attempt to restore a session from a checkpoint.
 */
struct ResumeEvent {
    std::string id;
    std::string checkpoint_id;
    std::string session_id;
    int64_t restored_at_ms;
    InterruptionReason interruption_reason;
    int64_t time_since_checkpoint_ms;
    double resume_confidence;
    std::optional<bool> user_confirmed;
    bool success;
    double fidelity_score;
    std::string notes;

    ResumeEvent()
        : restored_at_ms(0), interruption_reason(InterruptionReason::UNKNOWN),
          time_since_checkpoint_ms(0), resume_confidence(0.0), success(false),
          fidelity_score(0.0) {}

    Json::Value to_json() const;
    static std::optional<ResumeEvent> from_json(const Json::Value& json);
};

} // namespace fleetwatch

#endif // CHECKPOINT_H
