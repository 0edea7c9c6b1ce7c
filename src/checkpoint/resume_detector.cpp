/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: resume_detector.cpp
*******************************************************************************/

#include "checkpoint/resume_detector.h"
#include "common/logger.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace fleetwatch {

static const int64_t kMinuteMs = 60 * 1000;
static const int64_t kTimeoutSessionMs = 90 * kMinuteMs;

static std::string join_or(const std::vector<std::string>& items, const std::string& fallback) {
    if (items.empty()) return fallback;

    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

static std::string situation_text(InterruptionReason reason) {
    switch (reason) {
        case InterruptionReason::CRASH:
            return "Session interrupted due to crash or context window overflow";
        case InterruptionReason::ELEVATED_RISK:
            return "Session interrupted while crash risk was elevated";
        case InterruptionReason::TIMEOUT:
            return "Session timed out due to inactivity";
        case InterruptionReason::MANUAL_EXIT:
            return "Session ended manually after task completion";
        case InterruptionReason::UNKNOWN:
            return "Session interrupted for unknown reason";
    }
    return "Session interrupted for unknown reason";
}

ResumeDetector::ResumeDetector(CheckpointRepository& repository, Clock clock)
    : repository_(repository), clock_(clock ? clock : system_clock()) {}

//==============================================================================
// SECTION 1: Detection
//==============================================================================

ResumeDetection ResumeDetector::check_resume(const std::string& session_id) {
    ResumeDetection detection;

    auto last = repository_.get_most_recent(session_id);
    if (!last) {
        return detection;
    }

    detection.last_checkpoint = last;
    if (last->restored_at_ms) {
        Logger::debug("Checkpoint " + last->id + " already restored, no resume offered");
        return detection;
    }

    int64_t time_since = std::max<int64_t>(0, clock_() - last->created_at_ms);
    detection.should_resume = true;
    detection.interruption_reason = classify_interruption(*last);
    detection.time_since_interruption_ms = time_since;
    detection.confidence = calculate_confidence(*last, time_since, detection.interruption_reason);

    Logger::info("Session " + session_id + " can resume from " + last->id + " (" +
                 interruption_reason_name(detection.interruption_reason) + ", confidence " +
                 std::to_string(detection.confidence) + ")");
    return detection;
}

InterruptionReason ResumeDetector::classify_interruption(const Checkpoint& checkpoint) {
    if (checkpoint.signals.crash_risk == CrashRisk::DANGER) return InterruptionReason::CRASH;
    if (checkpoint.signals.crash_risk == CrashRisk::WARNING) return InterruptionReason::ELEVATED_RISK;
    if (checkpoint.task_state.progress >= 1.0) return InterruptionReason::MANUAL_EXIT;
    if (checkpoint.signals.session_duration_ms > kTimeoutSessionMs) return InterruptionReason::TIMEOUT;
    return InterruptionReason::UNKNOWN;
}

double ResumeDetector::calculate_confidence(const Checkpoint& checkpoint, int64_t time_since_ms,
                                            InterruptionReason reason) {
    double confidence = 0.0;
    switch (reason) {
        case InterruptionReason::CRASH: confidence = 0.95; break;
        case InterruptionReason::ELEVATED_RISK: confidence = 0.85; break;
        case InterruptionReason::TIMEOUT: confidence = 0.85; break;
        case InterruptionReason::MANUAL_EXIT: confidence = 0.9; break;
        case InterruptionReason::UNKNOWN: confidence = 0.3; break;
    }

    // Independent risk factors agreeing with a risk-based classification.
    if (reason == InterruptionReason::CRASH || reason == InterruptionReason::ELEVATED_RISK) {
        size_t factors = checkpoint.signals.risk_factors.size();
        if (factors > 1) confidence += 0.02 * static_cast<double>(factors - 1);
    }

    if (time_since_ms < 5 * kMinuteMs) {
        confidence += 0.1;
    } else if (time_since_ms > 60 * kMinuteMs) {
        confidence -= 0.2;
    }

    return std::min(1.0, std::max(0.0, confidence));
}

bool ResumeDetector::record_resume(const ResumeDetection& detection, bool success,
                                   double fidelity_score, std::optional<bool> user_confirmed) {
    if (!detection.last_checkpoint) return false;
    const Checkpoint& checkpoint = *detection.last_checkpoint;

    ResumeEvent event;
    event.checkpoint_id = checkpoint.id;
    event.session_id = checkpoint.session_id;
    event.interruption_reason = detection.interruption_reason;
    event.time_since_checkpoint_ms = detection.time_since_interruption_ms;
    event.resume_confidence = detection.confidence;
    event.user_confirmed = user_confirmed;
    event.success = success;
    event.fidelity_score = fidelity_score;

    repository_.record_resume_event(event);
    if (success) {
        repository_.mark_restored(checkpoint.id);
    }
    return true;
}

//==============================================================================
// SECTION 2: Prompt
//==============================================================================

ResumePrompt ResumeDetector::generate_resume_prompt(const Checkpoint& checkpoint) const {
    int64_t time_since = std::max<int64_t>(0, clock_() - checkpoint.created_at_ms);
    InterruptionReason reason = classify_interruption(checkpoint);

    ResumePrompt prompt;
    prompt.checkpoint_id = checkpoint.id;
    prompt.interruption_reason = reason;
    prompt.time_since = format_duration(time_since);
    prompt.progress = checkpoint.task_state.progress;

    long percent = std::lround(checkpoint.task_state.progress * 100.0);

    prompt.sections.situation = situation_text(reason);
    prompt.sections.progress = "Operation: " + checkpoint.task_state.operation + " (" +
                               std::to_string(percent) + "% complete)";
    prompt.sections.context = checkpoint.conversation_summary;
    prompt.sections.next = join_or(checkpoint.task_state.next_steps, "No next steps defined");
    prompt.sections.files = join_or(checkpoint.active_files, "No active files");
    prompt.sections.tools = join_or(checkpoint.recent_tools, "No recent tool calls");
    prompt.sections.blockers = join_or(checkpoint.task_state.blockers, "No blockers");
    return prompt;
}

std::string ResumeDetector::render(const ResumePrompt& prompt) {
    std::ostringstream out;
    out << "Resuming from checkpoint " << prompt.checkpoint_id
        << " (" << prompt.time_since << " ago)\n"
        << "Situation: " << prompt.sections.situation << "\n"
        << "Progress: " << prompt.sections.progress << "\n"
        << "Context: " << prompt.sections.context << "\n"
        << "Next steps: " << prompt.sections.next << "\n"
        << "Active files: " << prompt.sections.files << "\n"
        << "Recent tools: " << prompt.sections.tools << "\n"
        << "Blockers: " << prompt.sections.blockers << "\n";
    return out.str();
}

std::string ResumeDetector::format_duration(int64_t ms) {
    int64_t minutes = std::max<int64_t>(0, ms) / kMinuteMs;
    auto unit = [](int64_t n, const char* word) {
        return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
    };

    if (minutes < 60) {
        return unit(minutes, "minute");
    }
    return unit(minutes / 60, "hour") + ", " + unit(minutes % 60, "minute");
}

} // namespace fleetwatch
