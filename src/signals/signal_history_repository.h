/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: signal_history_repository.h

    Description:
        Durable, append-only history of CrashSignals snapshots.

        Storage:
            <dir>/<session>.signals, one record log per session (see
            record_log.h). Each record is the compact JSON
                {"id":"<session>:<n>","sessionId":"...","snapshotNumber":n,
                 "timestamp":ms,"signals":{...}}

        Numbering:
            Snapshot numbers start at 1 per session and are assigned while
            the session file is exclusively locked, so concurrent writers in
            any number of processes never produce gaps or duplicates.

        Retention:
            cleanup_old_snapshots() rewrites each session file without the
            expired records (temp file + rename). The rewritten file starts
            with {"kind":"sequence","last":n} so numbering continues after
            n even when every snapshot was removed; delete_session_snapshots()
            leaves only that record.
*******************************************************************************/

#ifndef SIGNAL_HISTORY_REPOSITORY_H
#define SIGNAL_HISTORY_REPOSITORY_H

#include "common/clock.h"
#include "signals/crash_signals.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fleetwatch {

struct SignalSnapshot {
    std::string id;
    std::string session_id;
    int64_t snapshot_number;
    int64_t timestamp_ms;
    CrashSignals signals;

    SignalSnapshot() : snapshot_number(0), timestamp_ms(0) {}

    Json::Value to_json() const;
    static std::optional<SignalSnapshot> from_json(const Json::Value& json);
};

class SignalHistoryRepository {
public:
    explicit SignalHistoryRepository(const std::string& directory, Clock clock = system_clock());

    /**
     * @brief Creates the history directory.
     * @throws PersistenceError
     */
    void initialize();

    /**
     * @return id of the new snapshot
     * @throws InvalidArgumentError for a blank session id
     * @throws PersistenceError
     */
    std::string save_snapshot(const std::string& session_id, const CrashSignals& signals);

    /**
     * @brief Bulk ingestion. Snapshots of one session are appended under a
     *        single lock and numbered in input order.
     */
    std::vector<std::string> save_snapshots(
        const std::vector<std::pair<std::string, CrashSignals>>& batch);

    /**
     * @brief Snapshots of one session, ascending by snapshot number.
     */
    std::vector<SignalSnapshot> get_session_snapshots(const std::string& session_id);

    std::optional<SignalSnapshot> get_latest_snapshot(const std::string& session_id);

    std::vector<SignalSnapshot> get_snapshots_by_risk(CrashRisk risk);

    /**
     * @brief Snapshots with start_ms <= timestamp <= end_ms, oldest first.
     */
    std::vector<SignalSnapshot> get_snapshots_in_time_range(int64_t start_ms, int64_t end_ms);

    /**
     * @return number of snapshots deleted
     */
    size_t cleanup_old_snapshots(int retention_days);

    void delete_session_snapshots(const std::string& session_id);

    void close();

private:
    std::string directory_;
    Clock clock_;
    bool initialized_;

    std::string session_path(const std::string& session_id) const;
    std::vector<SignalSnapshot> read_file(const std::string& path);
    std::vector<SignalSnapshot> read_all_sessions();
    std::vector<std::string> append_batch(const std::string& session_id,
                                          const std::vector<CrashSignals>& signals);
    void check_initialized() const;
};

} // namespace fleetwatch

#endif // SIGNAL_HISTORY_REPOSITORY_H
