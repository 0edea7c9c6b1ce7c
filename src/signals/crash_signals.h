/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: crash_signals.h

    Description:
        Point-in-time crash signal snapshot of one session, the risk zone
        thresholds it is classified against, and their JSON form.

        CrashSignals is derived state. It is recomputed by SignalCollector
        on every get_signals() call and only persisted as an embedded copy
        inside checkpoints and signal history snapshots.

        JSON field names match the checkpoint format used by the rest of
        the fleet tooling (camelCase, durations in milliseconds).
*******************************************************************************/

#ifndef CRASH_SIGNALS_H
#define CRASH_SIGNALS_H

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch {

enum class CrashRisk { SAFE, WARNING, DANGER };

enum class LatencyTrend { STABLE, INCREASING, DECREASING };

enum class ResponseLatencyTrend { NORMAL, DEGRADING, CRITICAL };

const char* crash_risk_name(CrashRisk risk);
const char* latency_trend_name(LatencyTrend trend);
const char* response_latency_trend_name(ResponseLatencyTrend trend);

std::optional<CrashRisk> parse_crash_risk(const std::string& name);
std::optional<LatencyTrend> parse_latency_trend(const std::string& name);
std::optional<ResponseLatencyTrend> parse_response_latency_trend(const std::string& name);

/**
 * @struct ZoneThresholds
 * @brief One risk zone's boundaries. A signal at or above a boundary
 *        counts toward the zone.
 */
struct ZoneThresholds {
    double context_window_usage;          // fraction of the context window
    int64_t message_count;
    int64_t session_duration_ms;
    int64_t tool_calls_since_checkpoint;
    double tool_failure_rate;             // fraction of recent tool calls

    ZoneThresholds()
        : context_window_usage(0.0), message_count(0), session_duration_ms(0),
          tool_calls_since_checkpoint(0), tool_failure_rate(0.0) {}

    ZoneThresholds(double context, int64_t messages, int64_t duration_ms,
                   int64_t tool_calls, double failure_rate)
        : context_window_usage(context), message_count(messages),
          session_duration_ms(duration_ms), tool_calls_since_checkpoint(tool_calls),
          tool_failure_rate(failure_rate) {}
};

struct RiskThresholds {
    ZoneThresholds warning;
    ZoneThresholds danger;

    // 60%/35 msgs/60 min/10 calls/15% and 75%/50 msgs/90 min/15 calls/20%
    RiskThresholds()
        : warning(0.60, 35, 60LL * 60 * 1000, 10, 0.15),
          danger(0.75, 50, 90LL * 60 * 1000, 15, 0.20) {}
};

struct CrashSignals {
    // Tokens
    int64_t estimated_total_tokens;
    double tokens_per_message;
    double context_window_usage;
    int64_t context_window_remaining;

    // Messages
    int64_t message_count;
    int64_t tool_call_count;
    int64_t tool_calls_since_checkpoint;
    double messages_per_minute;

    // Time
    int64_t session_duration_ms;
    double avg_response_latency_ms;
    int64_t time_since_last_response_ms;
    LatencyTrend latency_trend;

    // Behavior
    double tool_failure_rate;
    int64_t consecutive_tool_failures;
    ResponseLatencyTrend response_latency_trend;

    // Derived
    CrashRisk crash_risk;
    std::vector<std::string> risk_factors;

    CrashSignals()
        : estimated_total_tokens(0), tokens_per_message(0.0), context_window_usage(0.0),
          context_window_remaining(0), message_count(0), tool_call_count(0),
          tool_calls_since_checkpoint(0), messages_per_minute(0.0), session_duration_ms(0),
          avg_response_latency_ms(0.0), time_since_last_response_ms(0),
          latency_trend(LatencyTrend::STABLE), tool_failure_rate(0.0),
          consecutive_tool_failures(0), response_latency_trend(ResponseLatencyTrend::NORMAL),
          crash_risk(CrashRisk::SAFE) {}

    Json::Value to_json() const;

    /**
     * @return nullopt if json is not an object; missing fields default
     */
    static std::optional<CrashSignals> from_json(const Json::Value& json);
};

} // namespace fleetwatch

#endif // CRASH_SIGNALS_H
