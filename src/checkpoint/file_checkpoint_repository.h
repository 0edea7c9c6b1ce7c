/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: file_checkpoint_repository.h

    Description:
        CheckpointRepository on plain files, one append-only record log per
        session (see record_log.h):

            <dir>/<session>.checkpoints   checkpoints and restore markers
            <dir>/<session>.resume        resume events

        Record kinds in a .checkpoints file:
            {"kind":"checkpoint", ...Checkpoint JSON...}
            {"kind":"restored","id":"<checkpoint id>","at":<epoch ms>}
            {"kind":"sequence","last":n}

        Number allocation reads the file and appends the new checkpoint
        while holding an exclusive flock, so numbering is gap-free and
        collision-free across threads and processes. A "sequence" record
        is written when cleanup removes checkpoints, so numbers are never
        handed out twice for a session.

        Checkpoint ids are "<encoded session>:<number>", which lets
        get_by_id() go straight to the right file.
*******************************************************************************/

#ifndef FILE_CHECKPOINT_REPOSITORY_H
#define FILE_CHECKPOINT_REPOSITORY_H

#include "checkpoint/checkpoint_repository.h"
#include "common/clock.h"

#include <string>
#include <vector>

namespace fleetwatch {

class FileCheckpointRepository : public CheckpointRepository {
public:
    explicit FileCheckpointRepository(const std::string& directory,
                                      Clock clock = system_clock());
    ~FileCheckpointRepository() override = default;

    void initialize() override;
    std::string save(Checkpoint& checkpoint) override;
    std::optional<Checkpoint> get_most_recent(const std::string& session_id) override;
    std::optional<Checkpoint> get_by_id(const std::string& id) override;
    std::vector<Checkpoint> list_by_session(const std::string& session_id) override;
    int64_t get_next_checkpoint_number(const std::string& session_id) override;
    bool mark_restored(const std::string& id) override;
    void record_resume_event(ResumeEvent& event) override;
    std::vector<ResumeEvent> get_resume_events(const std::string& session_id) override;
    size_t cleanup(int retention_days) override;
    void close() override;

    const std::string& directory() const { return directory_; }

private:
    struct SessionLog {
        std::vector<Checkpoint> checkpoints;   // ascending by number
        int64_t last_number;

        SessionLog() : last_number(0) {}
    };

    std::string directory_;
    Clock clock_;
    bool initialized_;

    std::string checkpoints_path(const std::string& encoded_session) const;
    std::string resume_path(const std::string& encoded_session) const;

    static SessionLog parse_records(const std::vector<std::string>& records,
                                    const std::string& path);
    SessionLog read_session(const std::string& path);

    void check_initialized() const;
};

} // namespace fleetwatch

#endif // FILE_CHECKPOINT_REPOSITORY_H
