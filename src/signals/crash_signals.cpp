/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: crash_signals.cpp
*******************************************************************************/

#include "signals/crash_signals.h"
#include "common/json_util.h"

namespace fleetwatch {

const char* crash_risk_name(CrashRisk risk) {
    switch (risk) {
        case CrashRisk::SAFE: return "safe";
        case CrashRisk::WARNING: return "warning";
        case CrashRisk::DANGER: return "danger";
    }
    return "safe";
}

const char* latency_trend_name(LatencyTrend trend) {
    switch (trend) {
        case LatencyTrend::STABLE: return "stable";
        case LatencyTrend::INCREASING: return "increasing";
        case LatencyTrend::DECREASING: return "decreasing";
    }
    return "stable";
}

const char* response_latency_trend_name(ResponseLatencyTrend trend) {
    switch (trend) {
        case ResponseLatencyTrend::NORMAL: return "normal";
        case ResponseLatencyTrend::DEGRADING: return "degrading";
        case ResponseLatencyTrend::CRITICAL: return "critical";
    }
    return "normal";
}

std::optional<CrashRisk> parse_crash_risk(const std::string& name) {
    if (name == "safe") return CrashRisk::SAFE;
    if (name == "warning") return CrashRisk::WARNING;
    if (name == "danger") return CrashRisk::DANGER;
    return std::nullopt;
}

std::optional<LatencyTrend> parse_latency_trend(const std::string& name) {
    if (name == "stable") return LatencyTrend::STABLE;
    if (name == "increasing") return LatencyTrend::INCREASING;
    if (name == "decreasing") return LatencyTrend::DECREASING;
    return std::nullopt;
}

std::optional<ResponseLatencyTrend> parse_response_latency_trend(const std::string& name) {
    if (name == "normal") return ResponseLatencyTrend::NORMAL;
    if (name == "degrading") return ResponseLatencyTrend::DEGRADING;
    if (name == "critical") return ResponseLatencyTrend::CRITICAL;
    return std::nullopt;
}

Json::Value CrashSignals::to_json() const {
    Json::Value json(Json::objectValue);
    json["estimatedTotalTokens"] = Json::Int64(estimated_total_tokens);
    json["tokensPerMessage"] = tokens_per_message;
    json["contextWindowUsage"] = context_window_usage;
    json["contextWindowRemaining"] = Json::Int64(context_window_remaining);
    json["messageCount"] = Json::Int64(message_count);
    json["toolCallCount"] = Json::Int64(tool_call_count);
    json["toolCallsSinceCheckpoint"] = Json::Int64(tool_calls_since_checkpoint);
    json["messagesPerMinute"] = messages_per_minute;
    json["sessionDuration"] = Json::Int64(session_duration_ms);
    json["avgResponseLatency"] = avg_response_latency_ms;
    json["timeSinceLastResponse"] = Json::Int64(time_since_last_response_ms);
    json["latencyTrend"] = latency_trend_name(latency_trend);
    json["toolFailureRate"] = tool_failure_rate;
    json["consecutiveToolFailures"] = Json::Int64(consecutive_tool_failures);
    json["responseLatencyTrend"] = response_latency_trend_name(response_latency_trend);
    json["crashRisk"] = crash_risk_name(crash_risk);
    json["riskFactors"] = string_list_to_json(risk_factors);
    return json;
}

std::optional<CrashSignals> CrashSignals::from_json(const Json::Value& json) {
    if (!json.isObject()) return std::nullopt;

    auto int_field = [&json](const char* name) -> int64_t {
        const Json::Value& v = json[name];
        return v.isNumeric() ? v.asInt64() : 0;
    };
    auto real_field = [&json](const char* name) -> double {
        const Json::Value& v = json[name];
        return v.isNumeric() ? v.asDouble() : 0.0;
    };

    CrashSignals s;
    s.estimated_total_tokens = int_field("estimatedTotalTokens");
    s.tokens_per_message = real_field("tokensPerMessage");
    s.context_window_usage = real_field("contextWindowUsage");
    s.context_window_remaining = int_field("contextWindowRemaining");
    s.message_count = int_field("messageCount");
    s.tool_call_count = int_field("toolCallCount");
    s.tool_calls_since_checkpoint = int_field("toolCallsSinceCheckpoint");
    s.messages_per_minute = real_field("messagesPerMinute");
    s.session_duration_ms = int_field("sessionDuration");
    s.avg_response_latency_ms = real_field("avgResponseLatency");
    s.time_since_last_response_ms = int_field("timeSinceLastResponse");
    s.latency_trend = parse_latency_trend(json.get("latencyTrend", "stable").asString())
                          .value_or(LatencyTrend::STABLE);
    s.tool_failure_rate = real_field("toolFailureRate");
    s.consecutive_tool_failures = int_field("consecutiveToolFailures");
    s.response_latency_trend =
        parse_response_latency_trend(json.get("responseLatencyTrend", "normal").asString())
            .value_or(ResponseLatencyTrend::NORMAL);
    s.crash_risk = parse_crash_risk(json.get("crashRisk", "safe").asString())
                       .value_or(CrashRisk::SAFE);
    s.risk_factors = json_to_string_list(json["riskFactors"]);
    return s;
}

} // namespace fleetwatch
