/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: file_checkpoint_repository.cpp
*******************************************************************************/

#include "checkpoint/file_checkpoint_repository.h"
#include "common/errors.h"
#include "common/json_util.h"
#include "common/logger.h"
#include "common/record_log.h"

#include <algorithm>
#include <map>
#include <set>

namespace fleetwatch {

static const char* kCheckpointSuffix = ".checkpoints";
static const char* kResumeSuffix = ".resume";

// Session part of a checkpoint id "<encoded session>:<number>". Only the
// exact encoding produced by save() is accepted, so an id never names a
// file outside the repository directory.
static std::optional<std::string> encoded_session_of(const std::string& id) {
    size_t colon = id.rfind(':');
    if (colon == std::string::npos || colon == 0) return std::nullopt;

    std::string prefix = id.substr(0, colon);
    if (encode_file_component(decode_file_component(prefix)) != prefix) return std::nullopt;
    return prefix;
}

FileCheckpointRepository::FileCheckpointRepository(const std::string& directory, Clock clock)
    : directory_(directory), clock_(clock ? clock : system_clock()), initialized_(false) {}

void FileCheckpointRepository::initialize() {
    ensure_directory(directory_);
    initialized_ = true;
    Logger::info("Checkpoint repository at " + directory_);
}

void FileCheckpointRepository::close() {
    initialized_ = false;
}

void FileCheckpointRepository::check_initialized() const {
    if (!initialized_) {
        throw PersistenceError("Checkpoint repository not initialized");
    }
}

std::string FileCheckpointRepository::checkpoints_path(const std::string& encoded_session) const {
    return directory_ + "/" + encoded_session + kCheckpointSuffix;
}

std::string FileCheckpointRepository::resume_path(const std::string& encoded_session) const {
    return directory_ + "/" + encoded_session + kResumeSuffix;
}

//==============================================================================
// SECTION 1: Reading session logs
//==============================================================================

FileCheckpointRepository::SessionLog FileCheckpointRepository::parse_records(
        const std::vector<std::string>& records, const std::string& path) {
    SessionLog log;
    std::map<std::string, int64_t> restored;

    for (const auto& record : records) {
        Json::Value json;
        if (!parse_json(record, json) || !json.isObject()) {
            Logger::warning("Skipping unreadable record in " + path);
            continue;
        }

        std::string kind = json.get("kind", "").asString();
        if (kind == "checkpoint") {
            auto checkpoint = Checkpoint::from_json(json);
            if (!checkpoint) {
                Logger::warning("Skipping malformed checkpoint in " + path);
                continue;
            }
            log.last_number = std::max(log.last_number, checkpoint->checkpoint_number);
            log.checkpoints.push_back(*checkpoint);
        } else if (kind == "restored") {
            // First restore wins.
            std::string id = json.get("id", "").asString();
            if (restored.find(id) == restored.end()) {
                restored[id] = json.get("at", Json::Int64(0)).asInt64();
            }
        } else if (kind == "sequence") {
            log.last_number = std::max(log.last_number, json.get("last", Json::Int64(0)).asInt64());
        }
    }

    for (auto& checkpoint : log.checkpoints) {
        auto it = restored.find(checkpoint.id);
        if (it != restored.end()) checkpoint.restored_at_ms = it->second;
    }

    std::sort(log.checkpoints.begin(), log.checkpoints.end(),
              [](const Checkpoint& a, const Checkpoint& b) {
                  return a.checkpoint_number < b.checkpoint_number;
              });
    return log;
}

FileCheckpointRepository::SessionLog FileCheckpointRepository::read_session(
        const std::string& path) {
    LockedFile file(path, false, false);
    return parse_records(file.read_all(), path);
}

//==============================================================================
// SECTION 2: Checkpoints
//==============================================================================

std::string FileCheckpointRepository::save(Checkpoint& checkpoint) {
    require_non_blank(checkpoint.session_id, "Session id");
    check_initialized();

    std::string encoded = encode_file_component(checkpoint.session_id);
    LockedFile file(checkpoints_path(encoded), true, true);
    SessionLog log = parse_records(file.read_all(), file.path());

    if (checkpoint.checkpoint_number == 0) {
        checkpoint.checkpoint_number = log.last_number + 1;
    } else if (checkpoint.checkpoint_number <= log.last_number) {
        throw PersistenceError("Checkpoint number " +
                               std::to_string(checkpoint.checkpoint_number) +
                               " already used for session " + checkpoint.session_id);
    }

    checkpoint.id = encoded + ":" + std::to_string(checkpoint.checkpoint_number);
    if (checkpoint.created_at_ms == 0) checkpoint.created_at_ms = clock_();
    checkpoint.restored_at_ms.reset();

    Json::Value json = checkpoint.to_json();
    json["kind"] = "checkpoint";
    file.append(to_compact_json(json));

    Logger::debug("Saved checkpoint " + checkpoint.id + " (" +
                  checkpoint_trigger_name(checkpoint.trigger) + ")");
    return checkpoint.id;
}

std::vector<Checkpoint> FileCheckpointRepository::list_by_session(const std::string& session_id) {
    require_non_blank(session_id, "Session id");
    check_initialized();
    return read_session(checkpoints_path(encode_file_component(session_id))).checkpoints;
}

std::optional<Checkpoint> FileCheckpointRepository::get_most_recent(const std::string& session_id) {
    auto checkpoints = list_by_session(session_id);
    if (checkpoints.empty()) return std::nullopt;
    return checkpoints.back();
}

std::optional<Checkpoint> FileCheckpointRepository::get_by_id(const std::string& id) {
    check_initialized();

    auto encoded = encoded_session_of(id);
    if (!encoded) return std::nullopt;

    SessionLog log = read_session(checkpoints_path(*encoded));
    for (const auto& checkpoint : log.checkpoints) {
        if (checkpoint.id == id) return checkpoint;
    }
    return std::nullopt;
}

int64_t FileCheckpointRepository::get_next_checkpoint_number(const std::string& session_id) {
    require_non_blank(session_id, "Session id");
    check_initialized();
    return read_session(checkpoints_path(encode_file_component(session_id))).last_number + 1;
}

bool FileCheckpointRepository::mark_restored(const std::string& id) {
    check_initialized();

    auto encoded = encoded_session_of(id);
    if (!encoded) return false;

    LockedFile file(checkpoints_path(*encoded), true, false);
    if (!file.is_open()) return false;

    SessionLog log = parse_records(file.read_all(), file.path());
    auto it = std::find_if(log.checkpoints.begin(), log.checkpoints.end(),
                           [&id](const Checkpoint& c) { return c.id == id; });
    if (it == log.checkpoints.end()) return false;
    if (it->restored_at_ms) return true;

    Json::Value marker(Json::objectValue);
    marker["kind"] = "restored";
    marker["id"] = id;
    marker["at"] = Json::Int64(clock_());
    file.append(to_compact_json(marker));
    return true;
}

//==============================================================================
// SECTION 3: Resume events
//==============================================================================

void FileCheckpointRepository::record_resume_event(ResumeEvent& event) {
    require_non_blank(event.session_id, "Session id");
    require_non_blank(event.checkpoint_id, "Checkpoint id");
    check_initialized();

    std::string encoded = encode_file_component(event.session_id);
    LockedFile file(resume_path(encoded), true, true);

    if (event.id.empty()) {
        event.id = encoded + ":resume:" + std::to_string(file.read_all().size() + 1);
    }
    if (event.restored_at_ms == 0) event.restored_at_ms = clock_();

    file.append(to_compact_json(event.to_json()));
}

std::vector<ResumeEvent> FileCheckpointRepository::get_resume_events(const std::string& session_id) {
    require_non_blank(session_id, "Session id");
    check_initialized();

    std::string path = resume_path(encode_file_component(session_id));
    LockedFile file(path, false, false);

    std::vector<ResumeEvent> events;
    for (const auto& record : file.read_all()) {
        Json::Value json;
        std::optional<ResumeEvent> event;
        if (parse_json(record, json)) event = ResumeEvent::from_json(json);

        if (event) {
            events.push_back(*event);
        } else {
            Logger::warning("Skipping malformed resume event in " + path);
        }
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const ResumeEvent& a, const ResumeEvent& b) {
                         return a.restored_at_ms > b.restored_at_ms;
                     });
    return events;
}

//==============================================================================
// SECTION 4: Retention
//==============================================================================

size_t FileCheckpointRepository::cleanup(int retention_days) {
    check_initialized();

    int64_t cutoff = clock_() - static_cast<int64_t>(retention_days) * 24 * 60 * 60 * 1000;
    size_t deleted = 0;

    for (const auto& name : list_files_with_suffix(directory_, kCheckpointSuffix)) {
        LockedFile file(directory_ + "/" + name, true, false);
        if (!file.is_open()) continue;

        auto records = file.read_all();
        SessionLog log = parse_records(records, file.path());

        std::set<std::string> expired;
        for (const auto& checkpoint : log.checkpoints) {
            if (checkpoint.created_at_ms < cutoff) expired.insert(checkpoint.id);
        }
        if (expired.empty()) continue;

        Json::Value sequence(Json::objectValue);
        sequence["kind"] = "sequence";
        sequence["last"] = Json::Int64(log.last_number);

        std::vector<std::string> kept;
        kept.push_back(to_compact_json(sequence));
        for (const auto& record : records) {
            Json::Value json;
            if (!parse_json(record, json) || !json.isObject()) continue;

            std::string kind = json.get("kind", "").asString();
            if (kind == "sequence") continue;
            if ((kind == "checkpoint" || kind == "restored") &&
                expired.count(json.get("id", "").asString()) > 0) {
                continue;
            }
            kept.push_back(record);
        }

        file.rewrite(kept);
        deleted += expired.size();
    }

    if (deleted > 0) {
        Logger::info("Removed " + std::to_string(deleted) + " checkpoints older than " +
                     std::to_string(retention_days) + " days");
    }
    return deleted;
}

} // namespace fleetwatch
