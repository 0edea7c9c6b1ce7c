/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: checkpoint_repository.h

    Description:
        Persistence boundary for checkpoints. The repository, not the
        caller, owns the per-session checkpoint sequence: save() assigns
        the next number atomically, so concurrent savers for one session
        always get distinct, consecutive numbers.

        Checkpoints are insert-only. Restoring one appends a marker that
        readers fold into Checkpoint::restored_at_ms.
*******************************************************************************/

#ifndef CHECKPOINT_REPOSITORY_H
#define CHECKPOINT_REPOSITORY_H

#include "checkpoint/checkpoint.h"

#include <optional>
#include <string>
#include <vector>

namespace fleetwatch {

class CheckpointRepository {
public:
    virtual ~CheckpointRepository() = default;

    virtual void initialize() = 0;

    /**
     * @brief Persists a checkpoint. When checkpoint_number is 0 the next
     *        number for the session is assigned; id, number and creation
     *        time are written back into the argument.
     * @return the checkpoint id
     * @throws PersistenceError if the checkpoint could not be stored
     */
    virtual std::string save(Checkpoint& checkpoint) = 0;

    virtual std::optional<Checkpoint> get_most_recent(const std::string& session_id) = 0;

    virtual std::optional<Checkpoint> get_by_id(const std::string& id) = 0;

    /**
     * @brief All checkpoints of a session, ascending by number.
     */
    virtual std::vector<Checkpoint> list_by_session(const std::string& session_id) = 0;

    /**
     * @brief The number save() would assign right now. Informational only;
     *        another writer may take it first.
     */
    virtual int64_t get_next_checkpoint_number(const std::string& session_id) = 0;

    /**
     * @return false if no such checkpoint exists
     */
    virtual bool mark_restored(const std::string& id) = 0;

    virtual void record_resume_event(ResumeEvent& event) = 0;

    /**
     * @brief Resume events of a session, most recent first.
     */
    virtual std::vector<ResumeEvent> get_resume_events(const std::string& session_id) = 0;

    /**
     * @brief Deletes checkpoints older than retention_days.
     * @return number of checkpoints deleted
     */
    virtual size_t cleanup(int retention_days) = 0;

    virtual void close() = 0;
};

} // namespace fleetwatch

#endif // CHECKPOINT_REPOSITORY_H
