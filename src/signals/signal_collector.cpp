/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: signal_collector.cpp
*******************************************************************************/

#include "signals/signal_collector.h"
#include "signals/token_estimator.h"

#include <algorithm>
#include <numeric>

namespace fleetwatch {

SignalCollector::SignalCollector(const SignalCollectorConfig& config)
    : config_(config),
      message_count_(0),
      tool_call_count_(0),
      tool_calls_since_checkpoint_(0),
      consecutive_tool_failures_(0),
      estimated_total_tokens_(0) {
    if (!config_.clock) config_.clock = system_clock();
    if (config_.context_window_tokens <= 0) config_.context_window_tokens = 200000;

    session_start_ms_ = config_.clock();
    last_response_ms_ = session_start_ms_;
}

//==============================================================================
// SECTION 1: Event intake
//==============================================================================

void SignalCollector::on_message(const std::string& content, MessageRole /*role*/) {
    int64_t tokens = static_cast<int64_t>(TokenEstimator::count(content));
    int64_t now = config_.clock();

    std::lock_guard<std::mutex> lock(mutex_);
    message_count_++;
    estimated_total_tokens_ += tokens;
    push_bounded(token_history_, tokens, kTokenWindow);
    push_bounded(message_timestamps_, now, kTimestampWindow);
    last_response_ms_ = now;
}

void SignalCollector::on_tool_call(const std::string& /*tool*/, const std::string& /*args*/,
                                   const ToolResult& result, double latency_ms) {
    bool success = !result.is_error;
    int64_t now = config_.clock();

    std::lock_guard<std::mutex> lock(mutex_);
    tool_call_count_++;
    tool_calls_since_checkpoint_++;
    push_bounded(tool_outcomes_, success, kToolResultWindow);

    if (success) {
        consecutive_tool_failures_ = 0;
    } else {
        consecutive_tool_failures_++;
    }

    push_bounded(latency_history_, latency_ms, kLatencyWindow);
    last_response_ms_ = now;
}

void SignalCollector::reset_checkpoint_counter() {
    std::lock_guard<std::mutex> lock(mutex_);
    tool_calls_since_checkpoint_ = 0;
}

//==============================================================================
// SECTION 2: Snapshot
//==============================================================================

CrashSignals SignalCollector::get_signals() const {
    int64_t now = config_.clock();
    CrashSignals s;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        s.estimated_total_tokens = estimated_total_tokens_;
        s.tokens_per_message = token_history_.empty()
            ? 0.0
            : static_cast<double>(std::accumulate(token_history_.begin(), token_history_.end(),
                                                  int64_t(0))) / token_history_.size();
        s.context_window_usage =
            static_cast<double>(estimated_total_tokens_) / config_.context_window_tokens;
        s.context_window_remaining = config_.context_window_tokens - estimated_total_tokens_;

        s.message_count = message_count_;
        s.tool_call_count = tool_call_count_;
        s.tool_calls_since_checkpoint = tool_calls_since_checkpoint_;
        s.messages_per_minute = messages_per_minute(message_timestamps_);

        s.session_duration_ms = now - session_start_ms_;
        s.avg_response_latency_ms = latency_history_.empty()
            ? 0.0
            : std::accumulate(latency_history_.begin(), latency_history_.end(), 0.0) /
                  latency_history_.size();
        s.time_since_last_response_ms = now - last_response_ms_;
        s.latency_trend = latency_trend(latency_history_);

        if (!tool_outcomes_.empty()) {
            auto failures = std::count(tool_outcomes_.begin(), tool_outcomes_.end(), false);
            s.tool_failure_rate = static_cast<double>(failures) / tool_outcomes_.size();
        }
        s.consecutive_tool_failures = consecutive_tool_failures_;
    }

    s.response_latency_trend = response_latency_trend(s.avg_response_latency_ms);
    s.crash_risk = assess_risk(s, config_.thresholds);
    s.risk_factors = identify_risk_factors(s, config_.thresholds);
    return s;
}

CrashRisk SignalCollector::get_crash_risk() const {
    return get_signals().crash_risk;
}

//==============================================================================
// SECTION 3: Derivations
//==============================================================================

double SignalCollector::messages_per_minute(const std::deque<int64_t>& timestamps) {
    if (timestamps.size() < 2) return 0.0;

    size_t window = std::min<size_t>(timestamps.size(), 10);
    int64_t first = timestamps[timestamps.size() - window];
    int64_t last = timestamps.back();

    double minutes = static_cast<double>(last - first) / 60000.0;
    return minutes > 0 ? window / minutes : 0.0;
}

LatencyTrend SignalCollector::latency_trend(const std::deque<double>& latencies) {
    if (latencies.size() < 5) return LatencyTrend::STABLE;

    // Least-squares slope over the last 10 samples, x = 0..n-1.
    size_t n = std::min<size_t>(latencies.size(), 10);
    size_t offset = latencies.size() - n;

    double sum_x = n * (n - 1) / 2.0;
    double sum_x2 = n * (n - 1) * (2.0 * n - 1) / 6.0;
    double sum_y = 0.0;
    double sum_xy = 0.0;
    for (size_t x = 0; x < n; ++x) {
        double y = latencies[offset + x];
        sum_y += y;
        sum_xy += x * y;
    }

    double slope = (n * sum_xy - sum_x * sum_y) / (n * sum_x2 - sum_x * sum_x);
    if (slope > 0.1) return LatencyTrend::INCREASING;
    if (slope < -0.1) return LatencyTrend::DECREASING;
    return LatencyTrend::STABLE;
}

ResponseLatencyTrend SignalCollector::response_latency_trend(double avg_latency_ms) {
    if (avg_latency_ms < 2000) return ResponseLatencyTrend::NORMAL;
    if (avg_latency_ms < 5000) return ResponseLatencyTrend::DEGRADING;
    return ResponseLatencyTrend::CRITICAL;
}

int SignalCollector::count_signals_at_or_above(const CrashSignals& s, const ZoneThresholds& zone) {
    int count = 0;
    if (s.context_window_usage >= zone.context_window_usage) count++;
    if (s.message_count >= zone.message_count) count++;
    if (s.session_duration_ms >= zone.session_duration_ms) count++;
    if (s.tool_calls_since_checkpoint >= zone.tool_calls_since_checkpoint) count++;
    if (s.tool_failure_rate >= zone.tool_failure_rate) count++;
    return count;
}

CrashRisk SignalCollector::assess_risk(const CrashSignals& s, const RiskThresholds& thresholds) {
    // Context exhaustion overrides every other signal.
    if (s.context_window_usage >= thresholds.danger.context_window_usage) {
        return CrashRisk::DANGER;
    }

    int danger_count = count_signals_at_or_above(s, thresholds.danger);
    int warning_count = count_signals_at_or_above(s, thresholds.warning);

    if (danger_count >= 2) return CrashRisk::DANGER;
    if (danger_count >= 1 || warning_count >= 1) return CrashRisk::WARNING;
    return CrashRisk::SAFE;
}

std::vector<std::string> SignalCollector::identify_risk_factors(const CrashSignals& s,
                                                                const RiskThresholds& thresholds) {
    std::vector<std::string> factors;

    if (s.context_window_usage > thresholds.danger.context_window_usage) {
        factors.push_back("Context window usage critical");
    }
    if (s.message_count > thresholds.danger.message_count) {
        factors.push_back("High message count");
    }
    if (s.tool_failure_rate > thresholds.danger.tool_failure_rate) {
        factors.push_back("High tool failure rate");
    }
    if (s.consecutive_tool_failures >= 3) {
        factors.push_back("Multiple consecutive tool failures");
    }
    if (s.latency_trend == LatencyTrend::INCREASING) {
        factors.push_back("Increasing response latency");
    }
    return factors;
}

} // namespace fleetwatch
