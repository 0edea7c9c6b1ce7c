/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: signal_history_repository.cpp
*******************************************************************************/

#include "signals/signal_history_repository.h"
#include "common/errors.h"
#include "common/json_util.h"
#include "common/logger.h"
#include "common/record_log.h"

#include <algorithm>
#include <map>

namespace fleetwatch {

static const char* kSignalsSuffix = ".signals";

static bool is_sequence_record(const Json::Value& json) {
    return json.isObject() && json.get("kind", "").asString() == "sequence";
}

// Highest snapshot number ever assigned in a session file, including
// numbers whose snapshots were removed since.
static int64_t last_snapshot_number(const std::vector<std::string>& records) {
    int64_t last = 0;
    for (const auto& record : records) {
        Json::Value json;
        if (!parse_json(record, json) || !json.isObject()) continue;

        const Json::Value& number = is_sequence_record(json) ? json["last"]
                                                             : json["snapshotNumber"];
        if (number.isIntegral()) last = std::max(last, number.asInt64());
    }
    return last;
}

static std::string sequence_record(int64_t last) {
    Json::Value sequence(Json::objectValue);
    sequence["kind"] = "sequence";
    sequence["last"] = Json::Int64(last);
    return to_compact_json(sequence);
}

Json::Value SignalSnapshot::to_json() const {
    Json::Value json(Json::objectValue);
    json["id"] = id;
    json["sessionId"] = session_id;
    json["snapshotNumber"] = Json::Int64(snapshot_number);
    json["timestamp"] = Json::Int64(timestamp_ms);
    json["signals"] = signals.to_json();
    return json;
}

std::optional<SignalSnapshot> SignalSnapshot::from_json(const Json::Value& json) {
    if (!json.isObject() || !json["sessionId"].isString() ||
        !json["snapshotNumber"].isIntegral()) {
        return std::nullopt;
    }

    auto signals = CrashSignals::from_json(json["signals"]);
    if (!signals) return std::nullopt;

    SignalSnapshot snapshot;
    snapshot.id = json.get("id", "").asString();
    snapshot.session_id = json["sessionId"].asString();
    snapshot.snapshot_number = json["snapshotNumber"].asInt64();
    snapshot.timestamp_ms = json["timestamp"].isIntegral() ? json["timestamp"].asInt64() : 0;
    snapshot.signals = *signals;
    return snapshot;
}

SignalHistoryRepository::SignalHistoryRepository(const std::string& directory, Clock clock)
    : directory_(directory), clock_(clock ? clock : system_clock()), initialized_(false) {}

void SignalHistoryRepository::initialize() {
    ensure_directory(directory_);
    initialized_ = true;
    Logger::debug("Signal history at " + directory_);
}

void SignalHistoryRepository::close() {
    initialized_ = false;
}

void SignalHistoryRepository::check_initialized() const {
    if (!initialized_) {
        throw PersistenceError("Signal history repository not initialized");
    }
}

std::string SignalHistoryRepository::session_path(const std::string& session_id) const {
    return directory_ + "/" + encode_file_component(session_id) + kSignalsSuffix;
}

std::vector<SignalSnapshot> SignalHistoryRepository::read_file(const std::string& path) {
    LockedFile file(path, false, false);
    std::vector<SignalSnapshot> snapshots;

    for (const auto& record : file.read_all()) {
        Json::Value json;
        std::optional<SignalSnapshot> snapshot;
        if (parse_json(record, json)) {
            if (is_sequence_record(json)) continue;
            snapshot = SignalSnapshot::from_json(json);
        }

        if (snapshot) {
            snapshots.push_back(*snapshot);
        } else {
            Logger::warning("Skipping malformed signal snapshot in " + path);
        }
    }
    return snapshots;
}

std::vector<SignalSnapshot> SignalHistoryRepository::read_all_sessions() {
    std::vector<SignalSnapshot> all;
    for (const auto& name : list_files_with_suffix(directory_, kSignalsSuffix)) {
        auto snapshots = read_file(directory_ + "/" + name);
        all.insert(all.end(), snapshots.begin(), snapshots.end());
    }
    return all;
}

std::vector<std::string> SignalHistoryRepository::append_batch(
        const std::string& session_id, const std::vector<CrashSignals>& signals) {
    require_non_blank(session_id, "Session id");
    check_initialized();

    LockedFile file(session_path(session_id), true, true);
    int64_t last_number = last_snapshot_number(file.read_all());

    std::vector<std::string> ids;
    for (const auto& s : signals) {
        SignalSnapshot snapshot;
        snapshot.session_id = session_id;
        snapshot.snapshot_number = ++last_number;
        snapshot.id = encode_file_component(session_id) + ":" +
                      std::to_string(snapshot.snapshot_number);
        snapshot.timestamp_ms = clock_();
        snapshot.signals = s;

        file.append(to_compact_json(snapshot.to_json()));
        ids.push_back(snapshot.id);
    }
    return ids;
}

std::string SignalHistoryRepository::save_snapshot(const std::string& session_id,
                                                   const CrashSignals& signals) {
    return append_batch(session_id, {signals}).front();
}

std::vector<std::string> SignalHistoryRepository::save_snapshots(
        const std::vector<std::pair<std::string, CrashSignals>>& batch) {
    // Group by session, keeping input order within each session.
    std::vector<std::string> order;
    std::map<std::string, std::vector<CrashSignals>> grouped;
    for (const auto& [session_id, signals] : batch) {
        require_non_blank(session_id, "Session id");
        if (grouped.find(session_id) == grouped.end()) order.push_back(session_id);
        grouped[session_id].push_back(signals);
    }

    std::map<std::string, std::vector<std::string>> ids_by_session;
    for (const auto& session_id : order) {
        ids_by_session[session_id] = append_batch(session_id, grouped[session_id]);
    }

    std::vector<std::string> ids;
    std::map<std::string, size_t> cursor;
    for (const auto& entry : batch) {
        ids.push_back(ids_by_session[entry.first][cursor[entry.first]++]);
    }
    return ids;
}

std::vector<SignalSnapshot> SignalHistoryRepository::get_session_snapshots(
        const std::string& session_id) {
    require_non_blank(session_id, "Session id");
    check_initialized();

    auto snapshots = read_file(session_path(session_id));
    std::sort(snapshots.begin(), snapshots.end(),
              [](const SignalSnapshot& a, const SignalSnapshot& b) {
                  return a.snapshot_number < b.snapshot_number;
              });
    return snapshots;
}

std::optional<SignalSnapshot> SignalHistoryRepository::get_latest_snapshot(
        const std::string& session_id) {
    auto snapshots = get_session_snapshots(session_id);
    if (snapshots.empty()) return std::nullopt;
    return snapshots.back();
}

std::vector<SignalSnapshot> SignalHistoryRepository::get_snapshots_by_risk(CrashRisk risk) {
    check_initialized();

    std::vector<SignalSnapshot> matching;
    for (const auto& snapshot : read_all_sessions()) {
        if (snapshot.signals.crash_risk == risk) matching.push_back(snapshot);
    }
    std::sort(matching.begin(), matching.end(),
              [](const SignalSnapshot& a, const SignalSnapshot& b) {
                  return a.timestamp_ms > b.timestamp_ms;
              });
    return matching;
}

std::vector<SignalSnapshot> SignalHistoryRepository::get_snapshots_in_time_range(int64_t start_ms,
                                                                                 int64_t end_ms) {
    check_initialized();

    std::vector<SignalSnapshot> matching;
    for (const auto& snapshot : read_all_sessions()) {
        if (snapshot.timestamp_ms >= start_ms && snapshot.timestamp_ms <= end_ms) {
            matching.push_back(snapshot);
        }
    }
    std::sort(matching.begin(), matching.end(),
              [](const SignalSnapshot& a, const SignalSnapshot& b) {
                  return a.timestamp_ms < b.timestamp_ms;
              });
    return matching;
}

size_t SignalHistoryRepository::cleanup_old_snapshots(int retention_days) {
    check_initialized();

    int64_t cutoff = clock_() - static_cast<int64_t>(retention_days) * 24 * 60 * 60 * 1000;
    size_t deleted = 0;

    for (const auto& name : list_files_with_suffix(directory_, kSignalsSuffix)) {
        LockedFile file(directory_ + "/" + name, true, false);
        if (!file.is_open()) continue;

        auto records = file.read_all();
        std::vector<std::string> kept;
        kept.push_back(sequence_record(last_snapshot_number(records)));

        size_t removed_here = 0;
        for (const auto& record : records) {
            Json::Value json;
            bool parsed = parse_json(record, json);
            if (parsed && is_sequence_record(json)) continue;

            bool expired = parsed && json["timestamp"].isIntegral() &&
                           json["timestamp"].asInt64() < cutoff;
            if (expired) {
                ++removed_here;
            } else {
                kept.push_back(record);
            }
        }

        if (removed_here > 0) {
            file.rewrite(kept);
            deleted += removed_here;
        }
    }

    if (deleted > 0) {
        Logger::info("Removed " + std::to_string(deleted) + " signal snapshots older than " +
                     std::to_string(retention_days) + " days");
    }
    return deleted;
}

void SignalHistoryRepository::delete_session_snapshots(const std::string& session_id) {
    require_non_blank(session_id, "Session id");
    check_initialized();

    LockedFile file(session_path(session_id), true, false);
    if (!file.is_open()) return;

    int64_t last = last_snapshot_number(file.read_all());
    if (last > 0) {
        file.rewrite({sequence_record(last)});
    } else {
        file.rewrite({});
    }
}

} // namespace fleetwatch
