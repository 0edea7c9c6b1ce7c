/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: resume_detector.h

    Description:
        Decides, when a session starts, whether it is picking up after an
        interruption, and if so explains why it was interrupted.

        Interruption Reason (from the last checkpoint's signal snapshot):
            risk DANGER                   -> crash
            risk WARNING                  -> elevated_risk
            task progress >= 100%         -> manual_exit
            session ran longer than 90m   -> timeout
            otherwise                     -> unknown

        Confidence:
            base      crash 0.95, elevated_risk 0.85, timeout 0.85,
                      manual_exit 0.90, unknown 0.30
            +0.02     per recorded risk factor beyond the first
                      (crash and elevated_risk only)
            +0.10     checkpoint younger than 5 minutes
            -0.20     checkpoint older than 60 minutes
            clamped to [0, 1]

        A checkpoint that was already restored is never offered again.
*******************************************************************************/

#ifndef RESUME_DETECTOR_H
#define RESUME_DETECTOR_H

#include "checkpoint/checkpoint_repository.h"
#include "common/clock.h"

#include <optional>
#include <string>

namespace fleetwatch {

struct ResumeDetection {
    bool should_resume;
    std::optional<Checkpoint> last_checkpoint;
    InterruptionReason interruption_reason;
    int64_t time_since_interruption_ms;
    double confidence;

    ResumeDetection()
        : should_resume(false), interruption_reason(InterruptionReason::UNKNOWN),
          time_since_interruption_ms(0), confidence(0.0) {}
};

struct ResumePromptSections {
    std::string situation;
    std::string progress;
    std::string context;
    std::string next;
    std::string files;
    std::string tools;
    std::string blockers;
};

struct ResumePrompt {
    ResumePromptSections sections;
    std::string checkpoint_id;

    InterruptionReason interruption_reason;
    std::string time_since;
    double progress;

    ResumePrompt() : interruption_reason(InterruptionReason::UNKNOWN), progress(0.0) {}
};

class ResumeDetector {
public:
    explicit ResumeDetector(CheckpointRepository& repository, Clock clock = system_clock());

    ResumeDetection check_resume(const std::string& session_id);

    ResumePrompt generate_resume_prompt(const Checkpoint& checkpoint) const;

    /**
     * @brief Marks the detected checkpoint restored and logs a ResumeEvent.
     * @return false if the detection had no checkpoint to resume
     */
    bool record_resume(const ResumeDetection& detection, bool success, double fidelity_score,
                       std::optional<bool> user_confirmed = std::nullopt);

    static std::string render(const ResumePrompt& prompt);

    static InterruptionReason classify_interruption(const Checkpoint& checkpoint);
    static double calculate_confidence(const Checkpoint& checkpoint, int64_t time_since_ms,
                                       InterruptionReason reason);
    static std::string format_duration(int64_t ms);

private:
    CheckpointRepository& repository_;
    Clock clock_;
};

} // namespace fleetwatch

#endif // RESUME_DETECTOR_H
