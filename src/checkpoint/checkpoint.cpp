/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: checkpoint.cpp
*******************************************************************************/

#include "checkpoint/checkpoint.h"
#include "common/json_util.h"

namespace fleetwatch {

const char* checkpoint_trigger_name(CheckpointTrigger trigger) {
    switch (trigger) {
        case CheckpointTrigger::TOOL_CALL_INTERVAL: return "tool_call_interval";
        case CheckpointTrigger::TIME_INTERVAL: return "time_interval";
        case CheckpointTrigger::DANGER_ZONE: return "danger_zone";
        case CheckpointTrigger::WARNING_ZONE: return "warning_zone";
        case CheckpointTrigger::MANUAL: return "manual";
    }
    return "manual";
}

std::optional<CheckpointTrigger> parse_checkpoint_trigger(const std::string& name) {
    if (name == "tool_call_interval") return CheckpointTrigger::TOOL_CALL_INTERVAL;
    if (name == "time_interval") return CheckpointTrigger::TIME_INTERVAL;
    if (name == "danger_zone") return CheckpointTrigger::DANGER_ZONE;
    if (name == "warning_zone") return CheckpointTrigger::WARNING_ZONE;
    if (name == "manual") return CheckpointTrigger::MANUAL;
    return std::nullopt;
}

const char* interruption_reason_name(InterruptionReason reason) {
    switch (reason) {
        case InterruptionReason::CRASH: return "crash";
        case InterruptionReason::ELEVATED_RISK: return "elevated_risk";
        case InterruptionReason::TIMEOUT: return "timeout";
        case InterruptionReason::MANUAL_EXIT: return "manual_exit";
        case InterruptionReason::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::optional<InterruptionReason> parse_interruption_reason(const std::string& name) {
    if (name == "crash") return InterruptionReason::CRASH;
    if (name == "elevated_risk") return InterruptionReason::ELEVATED_RISK;
    if (name == "timeout") return InterruptionReason::TIMEOUT;
    if (name == "manual_exit") return InterruptionReason::MANUAL_EXIT;
    if (name == "unknown") return InterruptionReason::UNKNOWN;
    return std::nullopt;
}

//==============================================================================
// SECTION 1: Task state
//==============================================================================

Json::Value TaskState::to_json() const {
    Json::Value json(Json::objectValue);
    json["operation"] = operation;
    json["phase"] = phase;
    json["progress"] = progress;
    json["completedSteps"] = string_list_to_json(completed_steps);
    json["nextSteps"] = string_list_to_json(next_steps);
    json["blockers"] = string_list_to_json(blockers);
    return json;
}

std::optional<TaskState> TaskState::from_json(const Json::Value& json) {
    if (!json.isObject() || !json["operation"].isString() || !json["progress"].isNumeric()) {
        return std::nullopt;
    }

    TaskState state;
    state.operation = json["operation"].asString();
    state.phase = json.get("phase", "").asString();
    state.progress = json["progress"].asDouble();
    state.completed_steps = json_to_string_list(json["completedSteps"]);
    state.next_steps = json_to_string_list(json["nextSteps"]);
    state.blockers = json_to_string_list(json["blockers"]);
    return state;
}

//==============================================================================
// SECTION 2: Checkpoint
//==============================================================================

Json::Value Checkpoint::to_json() const {
    Json::Value json(Json::objectValue);
    json["id"] = id;
    json["sessionId"] = session_id;
    json["checkpointNumber"] = Json::Int64(checkpoint_number);
    json["createdAt"] = Json::Int64(created_at_ms);
    json["triggeredBy"] = checkpoint_trigger_name(trigger);
    json["taskState"] = to_compact_json(task_state.to_json());
    json["conversationSummary"] = conversation_summary;
    json["activeFiles"] = string_list_to_json(active_files);
    json["recentTools"] = string_list_to_json(recent_tools);
    json["signals"] = signals.to_json();
    json["userPreferences"] = user_preferences;
    if (restored_at_ms) {
        json["restoredAt"] = Json::Int64(*restored_at_ms);
    }
    return json;
}

std::optional<Checkpoint> Checkpoint::from_json(const Json::Value& json) {
    if (!json.isObject() || !json["sessionId"].isString() ||
        !json["checkpointNumber"].isIntegral() || !json["taskState"].isString()) {
        return std::nullopt;
    }

    auto trigger = parse_checkpoint_trigger(json.get("triggeredBy", "").asString());
    auto signals = CrashSignals::from_json(json["signals"]);

    Json::Value task_json;
    if (!trigger || !signals || !parse_json(json["taskState"].asString(), task_json)) {
        return std::nullopt;
    }
    auto task_state = TaskState::from_json(task_json);
    if (!task_state) return std::nullopt;

    Checkpoint checkpoint;
    checkpoint.id = json.get("id", "").asString();
    checkpoint.session_id = json["sessionId"].asString();
    checkpoint.checkpoint_number = json["checkpointNumber"].asInt64();
    checkpoint.created_at_ms = json["createdAt"].isIntegral() ? json["createdAt"].asInt64() : 0;
    checkpoint.trigger = *trigger;
    checkpoint.task_state = *task_state;
    checkpoint.conversation_summary = json.get("conversationSummary", "").asString();
    checkpoint.active_files = json_to_string_list(json["activeFiles"]);
    checkpoint.recent_tools = json_to_string_list(json["recentTools"]);
    checkpoint.signals = *signals;
    checkpoint.user_preferences = json.get("userPreferences", "").asString();
    if (json["restoredAt"].isIntegral()) {
        checkpoint.restored_at_ms = json["restoredAt"].asInt64();
    }
    return checkpoint;
}

//==============================================================================
// SECTION 3: Resume event
//==============================================================================

Json::Value ResumeEvent::to_json() const {
    Json::Value json(Json::objectValue);
    json["id"] = id;
    json["checkpointId"] = checkpoint_id;
    json["sessionId"] = session_id;
    json["restoredAt"] = Json::Int64(restored_at_ms);
    json["interruptionReason"] = interruption_reason_name(interruption_reason);
    json["timeSinceCheckpoint"] = Json::Int64(time_since_checkpoint_ms);
    json["resumeConfidence"] = resume_confidence;
    if (user_confirmed) {
        json["userConfirmed"] = *user_confirmed;
    }
    json["success"] = success;
    json["fidelityScore"] = fidelity_score;
    if (!notes.empty()) {
        json["notes"] = notes;
    }
    return json;
}

std::optional<ResumeEvent> ResumeEvent::from_json(const Json::Value& json) {
    if (!json.isObject() || !json["checkpointId"].isString() || !json["sessionId"].isString()) {
        return std::nullopt;
    }

    ResumeEvent event;
    event.id = json.get("id", "").asString();
    event.checkpoint_id = json["checkpointId"].asString();
    event.session_id = json["sessionId"].asString();
    event.restored_at_ms = json["restoredAt"].isIntegral() ? json["restoredAt"].asInt64() : 0;
    event.interruption_reason =
        parse_interruption_reason(json.get("interruptionReason", "").asString())
            .value_or(InterruptionReason::UNKNOWN);
    event.time_since_checkpoint_ms =
        json["timeSinceCheckpoint"].isIntegral() ? json["timeSinceCheckpoint"].asInt64() : 0;
    event.resume_confidence = json.get("resumeConfidence", 0.0).asDouble();
    if (json["userConfirmed"].isBool()) {
        event.user_confirmed = json["userConfirmed"].asBool();
    }
    event.success = json.get("success", false).asBool();
    event.fidelity_score = json.get("fidelityScore", 0.0).asDouble();
    event.notes = json.get("notes", "").asString();
    return event;
}

} // namespace fleetwatch
