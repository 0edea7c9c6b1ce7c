/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: signal_collector.h

    Description:
        Rolling aggregator of one session's activity. It turns message and
        tool call events into a CrashSignals snapshot and a risk zone.

        Bounded windows (oldest sample dropped first):
            message token estimates   20
            message timestamps        20
            tool call latencies       20
            tool call outcomes        50

        Risk classification (first match wins):
            1. context usage >= danger.context        -> DANGER
            2. count signals >= danger thresholds     (danger_count)
               count signals >= warning thresholds    (warning_count)
               over {context, messages, duration, calls since checkpoint,
                     failure rate}
            3. danger_count >= 2                      -> DANGER
               danger_count >= 1 || warning_count >= 1 -> WARNING
               otherwise                               -> SAFE

        Risk factors are a separate derivation from the same snapshot, using
        strict comparisons against the danger zone.

        All methods are thread-safe.
*******************************************************************************/

#ifndef SIGNAL_COLLECTOR_H
#define SIGNAL_COLLECTOR_H

#include "common/clock.h"
#include "signals/crash_signals.h"

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace fleetwatch {

enum class MessageRole { USER, ASSISTANT };

/**
 * @struct ToolResult
 * @brief Outcome of one tool call. A call succeeded iff is_error is false.
 */
struct ToolResult {
    bool is_error;
    std::string error;

    ToolResult() : is_error(false) {}

    static ToolResult ok() { return ToolResult(); }
    static ToolResult failure(const std::string& message) {
        ToolResult r;
        r.is_error = true;
        r.error = message;
        return r;
    }
};

struct SignalCollectorConfig {
    RiskThresholds thresholds;
    int64_t context_window_tokens;
    Clock clock;

    SignalCollectorConfig() : context_window_tokens(200000), clock(system_clock()) {}
};

class SignalCollector {
public:
    static constexpr size_t kTokenWindow = 20;
    static constexpr size_t kTimestampWindow = 20;
    static constexpr size_t kLatencyWindow = 20;
    static constexpr size_t kToolResultWindow = 50;

    explicit SignalCollector(const SignalCollectorConfig& config = SignalCollectorConfig());

    void on_message(const std::string& content, MessageRole role);

    /**
     * @param args  Tool arguments as given (opaque, not retained)
     */
    void on_tool_call(const std::string& tool, const std::string& args,
                      const ToolResult& result, double latency_ms);

    CrashSignals get_signals() const;

    CrashRisk get_crash_risk() const;

    void reset_checkpoint_counter();

    const RiskThresholds& thresholds() const { return config_.thresholds; }

    // Pure derivations, exposed for reuse and direct testing.
    static CrashRisk assess_risk(const CrashSignals& signals, const RiskThresholds& thresholds);
    static std::vector<std::string> identify_risk_factors(const CrashSignals& signals,
                                                          const RiskThresholds& thresholds);
    static int count_signals_at_or_above(const CrashSignals& signals, const ZoneThresholds& zone);
    static LatencyTrend latency_trend(const std::deque<double>& latencies);
    static ResponseLatencyTrend response_latency_trend(double avg_latency_ms);
    static double messages_per_minute(const std::deque<int64_t>& timestamps);

private:
    SignalCollectorConfig config_;

    int64_t message_count_;
    int64_t tool_call_count_;
    int64_t tool_calls_since_checkpoint_;
    int64_t consecutive_tool_failures_;
    int64_t estimated_total_tokens_;

    std::deque<int64_t> token_history_;
    std::deque<int64_t> message_timestamps_;
    std::deque<double> latency_history_;
    std::deque<bool> tool_outcomes_;      // true = success

    int64_t session_start_ms_;
    int64_t last_response_ms_;

    mutable std::mutex mutex_;

    template <typename T>
    static void push_bounded(std::deque<T>& window, const T& value, size_t limit) {
        window.push_back(value);
        while (window.size() > limit) window.pop_front();
    }
};

} // namespace fleetwatch

#endif // SIGNAL_COLLECTOR_H
