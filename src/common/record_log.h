/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: record_log.h

    Description:
        Append-only record files shared by the checkpoint and signal history
        repositories. Several processes may append to the same file, so
        every access goes through an flock()ed descriptor.

        File Format:
            [4 bytes: record length (big-endian)][N bytes: record]
            [4 bytes: record length]...

        A record cut short by a crash mid-append is ignored on read and
        overwritten by the next append.

        Sequence Allocation:
            A caller that holds the exclusive lock can read the records,
            derive the next sequence number and append, and no other
            process can interleave. This is how checkpoint and snapshot
            numbers stay gap-free across processes.

        Compaction:
            rewrite() replaces a file through temp file + rename while the
            old file is locked. LockedFile re-checks the inode after taking
            the lock, so a writer that was waiting on the replaced file
            retries on the new one.
*******************************************************************************/

#ifndef RECORD_LOG_H
#define RECORD_LOG_H

#include <string>
#include <vector>

namespace fleetwatch {

class LockedFile {
public:
    /**
     * @param exclusive  LOCK_EX when true, LOCK_SH otherwise
     * @param create     create the file if missing; when false a missing
     *                   file leaves is_open() false
     * @throws PersistenceError on any other open/lock failure
     */
    LockedFile(const std::string& path, bool exclusive, bool create);
    ~LockedFile();

    LockedFile(const LockedFile&) = delete;
    LockedFile& operator=(const LockedFile&) = delete;

    bool is_open() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

    /**
     * @brief All complete records, in file order.
     */
    std::vector<std::string> read_all();

    /**
     * @brief Appends one record after the last complete one and syncs.
     * @throws PersistenceError
     */
    void append(const std::string& record);

    /**
     * @brief Atomically replaces the file content with records.
     *        An empty list removes the file.
     * @throws PersistenceError
     */
    void rewrite(const std::vector<std::string>& records);

private:
    std::string path_;
    int fd_;
    size_t valid_bytes_;   // end of the last complete record seen by read_all()
    bool scanned_;
};

/**
 * @brief Creates dir (and missing parents).
 * @throws PersistenceError
 */
void ensure_directory(const std::string& dir);

/**
 * @brief Names of regular files in dir ending with suffix.
 */
std::vector<std::string> list_files_with_suffix(const std::string& dir, const std::string& suffix);

/**
 * @brief Percent-encodes everything outside [A-Za-z0-9._-] so an id can be
 *        used as a file name.
 */
std::string encode_file_component(const std::string& value);

std::string decode_file_component(const std::string& value);

} // namespace fleetwatch

#endif // RECORD_LOG_H
