/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: state_synchronizer.cpp
*******************************************************************************/

#include "coordination/state_synchronizer.h"
#include "common/errors.h"
#include "common/json_util.h"
#include "common/logger.h"

namespace fleetwatch {

//==============================================================================
// SECTION 1: Optimistic read-modify-write
//==============================================================================

bool update_record(SharedStore& store, const std::string& key, const RecordUpdate& update,
                   int64_t ttl_ms, int max_attempts) {
    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        auto current = store.get(key);
        auto next = update(current);
        if (!next) return false;

        if (store.compare_and_set(key, current, *next, ttl_ms)) return true;
        Logger::debug("Concurrent write to " + key + ", retrying");
    }
    throw ConflictError("Gave up updating " + key + " after " +
                        std::to_string(max_attempts) + " conflicting writes");
}

//==============================================================================
// SECTION 2: Envelope
//==============================================================================

std::string StateSynchronizer::state_key(const std::string& ns, const std::string& key) {
    return "state:" + ns + ":" + key;
}

std::optional<VersionedState> StateSynchronizer::decode(const std::string& raw) {
    Json::Value json;
    if (!parse_json(raw, json) || !json.isObject() || !json["version"].isIntegral()) {
        return std::nullopt;
    }

    VersionedState decoded;
    decoded.version = json["version"].asInt64();
    decoded.state = json["state"];
    return decoded;
}

std::string StateSynchronizer::encode(const Json::Value& state, int64_t version) {
    Json::Value json(Json::objectValue);
    json["version"] = Json::Int64(version);
    json["state"] = state;
    return to_compact_json(json);
}

//==============================================================================
// SECTION 3: State operations
//==============================================================================

StateSynchronizer::StateSynchronizer(SharedStore& store, int max_attempts)
    : store_(store), max_attempts_(max_attempts > 0 ? max_attempts : 1) {}

int64_t StateSynchronizer::set_state(const std::string& ns, const std::string& key,
                                     const Json::Value& state, const StateOptions& options) {
    require_non_blank(ns, "Namespace");
    require_non_blank(key, "State key");

    const std::string store_key = state_key(ns, key);
    int64_t written = 0;

    update_record(store_, store_key,
                  [&](const std::optional<std::string>& current) -> std::optional<std::string> {
                      int64_t version = 0;
                      if (current) {
                          auto decoded = decode(*current);
                          if (decoded) {
                              version = decoded->version;
                          } else {
                              Logger::warning("Replacing unreadable state " + store_key);
                          }
                      }
                      written = version + 1;
                      return encode(state, written);
                  },
                  int64_t(options.ttl_seconds) * 1000, max_attempts_);
    return written;
}

std::optional<Json::Value> StateSynchronizer::get_state(const std::string& ns,
                                                        const std::string& key) {
    auto versioned = get_state_with_version(ns, key);
    if (!versioned) return std::nullopt;
    return versioned->state;
}

std::optional<VersionedState> StateSynchronizer::get_state_with_version(const std::string& ns,
                                                                        const std::string& key) {
    require_non_blank(ns, "Namespace");
    require_non_blank(key, "State key");

    auto raw = store_.get(state_key(ns, key));
    if (!raw) return std::nullopt;

    auto decoded = decode(*raw);
    if (!decoded) {
        Logger::warning("Ignoring unreadable state " + state_key(ns, key));
    }
    return decoded;
}

std::optional<int64_t> StateSynchronizer::set_state_if_version(const std::string& ns,
                                                               const std::string& key,
                                                               const Json::Value& state,
                                                               int64_t expected_version,
                                                               const StateOptions& options) {
    require_non_blank(ns, "Namespace");
    require_non_blank(key, "State key");

    const std::string store_key = state_key(ns, key);
    auto current = store_.get(store_key);

    int64_t version = 0;
    if (current) {
        auto decoded = decode(*current);
        if (!decoded) return std::nullopt;
        version = decoded->version;
    }
    if (version != expected_version) return std::nullopt;

    if (!store_.compare_and_set(store_key, current, encode(state, version + 1),
                                int64_t(options.ttl_seconds) * 1000)) {
        return std::nullopt;
    }
    return version + 1;
}

bool StateSynchronizer::delete_state(const std::string& ns, const std::string& key) {
    require_non_blank(ns, "Namespace");
    require_non_blank(key, "State key");
    return store_.del(state_key(ns, key));
}

std::optional<int64_t> StateSynchronizer::update_fields(const std::string& ns,
                                                        const std::string& key,
                                                        const Json::Value& fields) {
    require_non_blank(ns, "Namespace");
    require_non_blank(key, "State key");
    if (!fields.isObject()) {
        throw InvalidArgumentError("State fields must be a JSON object");
    }

    int64_t written = 0;
    bool updated = update_record(
        store_, state_key(ns, key),
        [&](const std::optional<std::string>& current) -> std::optional<std::string> {
            if (!current) return std::nullopt;
            auto decoded = decode(*current);
            if (!decoded) return std::nullopt;

            Json::Value merged = decoded->state.isObject() ? decoded->state
                                                           : Json::Value(Json::objectValue);
            for (const auto& name : fields.getMemberNames()) {
                merged[name] = fields[name];
            }
            written = decoded->version + 1;
            return encode(merged, written);
        },
        0, max_attempts_);

    if (!updated) return std::nullopt;
    return written;
}

std::optional<int64_t> StateSynchronizer::increment_field(const std::string& ns,
                                                          const std::string& key,
                                                          const std::string& field,
                                                          int64_t delta) {
    require_non_blank(ns, "Namespace");
    require_non_blank(key, "State key");
    require_non_blank(field, "Field");

    int64_t value = 0;
    bool updated = update_record(
        store_, state_key(ns, key),
        [&](const std::optional<std::string>& current) -> std::optional<std::string> {
            if (!current) return std::nullopt;
            auto decoded = decode(*current);
            if (!decoded) return std::nullopt;

            Json::Value state = decoded->state.isObject() ? decoded->state
                                                          : Json::Value(Json::objectValue);
            int64_t base = state[field].isIntegral() ? state[field].asInt64() : 0;
            value = base + delta;
            state[field] = Json::Int64(value);
            return encode(state, decoded->version + 1);
        },
        0, max_attempts_);

    if (!updated) return std::nullopt;
    return value;
}

std::vector<std::string> StateSynchronizer::list_keys(const std::string& ns) {
    require_non_blank(ns, "Namespace");

    const std::string prefix = state_key(ns, "");
    std::vector<std::string> keys;
    for (const auto& full : store_.keys_with_prefix(prefix)) {
        keys.push_back(full.substr(prefix.size()));
    }
    return keys;
}

} // namespace fleetwatch
