/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: state_synchronizer.h

    Description:
        Versioned shared state with optimistic concurrency, kept in the
        shared store.

        Every state lives in one key, "state:<namespace>:<key>", as an
        envelope holding the JSON state and its version:
            {"version":7,"state":{"phase":"review","attempts":2}}

        Version and state change together in one compare_and_set, so a
        reader never sees a state paired with another write's version.
        Versions start at 1; version 0 means "no state".

        Optimistic Updates:
            update_record() reads a key, computes the new value and writes
            it with compare_and_set. When another writer got there first it
            re-reads and recomputes. Only after max_attempts lost races does
            it give up with ConflictError. WorkerRegistry uses the same
            primitive for its worker records.

        TTL:
            A state written with ttl_seconds > 0 expires as a whole. Writes
            without StateOptions store the state without expiry.
*******************************************************************************/

#ifndef STATE_SYNCHRONIZER_H
#define STATE_SYNCHRONIZER_H

#include "store/shared_store.h"

#include <json/json.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch {

/**
 * @brief Computes a key's next value from its current one.
 * @return the value to write, or nullopt to leave the key untouched
 */
using RecordUpdate =
    std::function<std::optional<std::string>(const std::optional<std::string>& current)>;

constexpr int kDefaultUpdateAttempts = 64;

/**
 * @brief Optimistic read-modify-write of one key.
 * @param ttl_ms  Expiry of the written value, 0 for none
 * @return true if a value was written, false if update declined
 * @throws ConflictError after max_attempts lost compare_and_set races
 * @throws UnavailableError if the store is unreachable
 */
bool update_record(SharedStore& store, const std::string& key, const RecordUpdate& update,
                   int64_t ttl_ms = 0, int max_attempts = kDefaultUpdateAttempts);

struct StateOptions {
    int ttl_seconds;     // 0: no expiry

    StateOptions() : ttl_seconds(0) {}
};

struct VersionedState {
    Json::Value state;
    int64_t version;

    VersionedState() : version(0) {}
};

class StateSynchronizer {
public:
    explicit StateSynchronizer(SharedStore& store, int max_attempts = kDefaultUpdateAttempts);

    /**
     * @brief Unconditional write; bumps the version.
     * @return the new version
     * @throws InvalidArgumentError for a blank namespace or key
     */
    int64_t set_state(const std::string& ns, const std::string& key, const Json::Value& state,
                      const StateOptions& options = StateOptions());

    std::optional<Json::Value> get_state(const std::string& ns, const std::string& key);

    std::optional<VersionedState> get_state_with_version(const std::string& ns,
                                                         const std::string& key);

    /**
     * @brief Writes only if the stored version still equals
     *        expected_version (0: only if no state exists).
     * @return the new version, or nullopt on a version conflict
     */
    std::optional<int64_t> set_state_if_version(const std::string& ns, const std::string& key,
                                                const Json::Value& state,
                                                int64_t expected_version,
                                                const StateOptions& options = StateOptions());

    /**
     * @return true if a state was removed
     */
    bool delete_state(const std::string& ns, const std::string& key);

    /**
     * @brief Merges the members of fields into the stored object state.
     * @return the new version, nullopt if no state exists
     * @throws InvalidArgumentError if fields is not an object
     */
    std::optional<int64_t> update_fields(const std::string& ns, const std::string& key,
                                         const Json::Value& fields);

    /**
     * @brief Adds delta to an integer field; a missing or non-integer field
     *        counts as 0.
     * @return the field's new value, nullopt if no state exists
     */
    std::optional<int64_t> increment_field(const std::string& ns, const std::string& key,
                                           const std::string& field, int64_t delta);

    /**
     * @brief Keys of every live state in the namespace, sorted.
     */
    std::vector<std::string> list_keys(const std::string& ns);

    static std::string state_key(const std::string& ns, const std::string& key);

private:
    SharedStore& store_;
    int max_attempts_;

    static std::optional<VersionedState> decode(const std::string& raw);
    static std::string encode(const Json::Value& state, int64_t version);
};

} // namespace fleetwatch

#endif // STATE_SYNCHRONIZER_H
