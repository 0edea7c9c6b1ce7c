/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: record_log.cpp
*******************************************************************************/

#include "common/record_log.h"
#include "common/errors.h"
#include "common/logger.h"
#include "common/message.h"

#include <dirent.h>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace fleetwatch {

static std::string errno_text() {
    return std::string(strerror(errno));
}

//==============================================================================
// SECTION 1: Locked record file
//==============================================================================

LockedFile::LockedFile(const std::string& path, bool exclusive, bool create)
    : path_(path), fd_(-1), valid_bytes_(0), scanned_(false) {
    while (true) {
        int flags = O_RDWR | O_CLOEXEC | (create ? O_CREAT : 0);
        int fd = ::open(path_.c_str(), flags, 0644);
        if (fd < 0) {
            if (!create && errno == ENOENT) return;
            throw PersistenceError("Failed to open " + path_ + ": " + errno_text());
        }

        int rc;
        do {
            rc = flock(fd, exclusive ? LOCK_EX : LOCK_SH);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) {
            std::string reason = errno_text();
            ::close(fd);
            throw PersistenceError("Failed to lock " + path_ + ": " + reason);
        }

        // The file may have been replaced or removed while we waited.
        struct stat held;
        struct stat current;
        if (fstat(fd, &held) != 0) {
            std::string reason = errno_text();
            ::close(fd);
            throw PersistenceError("Failed to stat " + path_ + ": " + reason);
        }
        if (stat(path_.c_str(), &current) != 0) {
            ::close(fd);
            if (errno == ENOENT) {
                if (!create) return;
                continue;
            }
            throw PersistenceError("Failed to stat " + path_ + ": " + errno_text());
        }
        if (held.st_ino != current.st_ino || held.st_dev != current.st_dev) {
            ::close(fd);
            continue;
        }

        fd_ = fd;
        return;
    }
}

LockedFile::~LockedFile() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

std::vector<std::string> LockedFile::read_all() {
    std::vector<std::string> records;
    if (fd_ < 0) return records;

    struct stat st;
    if (fstat(fd_, &st) != 0) {
        throw PersistenceError("Failed to stat " + path_ + ": " + errno_text());
    }

    std::vector<char> data(static_cast<size_t>(st.st_size));
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = pread(fd_, data.data() + total, data.size() - total, static_cast<off_t>(total));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw PersistenceError("Failed to read " + path_ + ": " + errno_text());
        }
        if (n == 0) break;
        total += static_cast<size_t>(n);
    }

    size_t offset = 0;
    while (offset + 4 <= total) {
        uint32_t len;
        std::memcpy(&len, data.data() + offset, 4);
        len = ntoh32(len);
        if (total - offset - 4 < len) break;

        records.emplace_back(data.data() + offset + 4, len);
        offset += 4 + len;
    }

    if (offset < total) {
        Logger::warning("Ignoring " + std::to_string(total - offset) +
                        " trailing bytes of incomplete record in " + path_);
    }

    valid_bytes_ = offset;
    scanned_ = true;
    return records;
}

void LockedFile::append(const std::string& record) {
    if (fd_ < 0) {
        throw PersistenceError("Record file not open: " + path_);
    }
    if (!scanned_) read_all();

    // Drop a torn tail left by an earlier crash.
    if (ftruncate(fd_, static_cast<off_t>(valid_bytes_)) != 0) {
        throw PersistenceError("Failed to truncate " + path_ + ": " + errno_text());
    }

    std::string frame;
    frame.reserve(4 + record.size());
    uint32_t net_len = hton32(static_cast<uint32_t>(record.size()));
    frame.append(reinterpret_cast<const char*>(&net_len), 4);
    frame.append(record);

    size_t written = 0;
    while (written < frame.size()) {
        ssize_t n = pwrite(fd_, frame.data() + written, frame.size() - written,
                           static_cast<off_t>(valid_bytes_ + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw PersistenceError("Failed to write " + path_ + ": " + errno_text());
        }
        written += static_cast<size_t>(n);
    }

    if (fsync(fd_) != 0) {
        throw PersistenceError("Failed to sync " + path_ + ": " + errno_text());
    }
    valid_bytes_ += frame.size();
}

void LockedFile::rewrite(const std::vector<std::string>& records) {
    if (fd_ < 0) {
        throw PersistenceError("Record file not open: " + path_);
    }

    if (records.empty()) {
        if (unlink(path_.c_str()) != 0 && errno != ENOENT) {
            throw PersistenceError("Failed to remove " + path_ + ": " + errno_text());
        }
        return;
    }

    std::string temp_path = path_ + ".tmp." + std::to_string(getpid());
    int temp_fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (temp_fd < 0) {
        throw PersistenceError("Failed to create " + temp_path + ": " + errno_text());
    }

    bool ok = true;
    for (const auto& record : records) {
        uint32_t net_len = hton32(static_cast<uint32_t>(record.size()));
        if (write(temp_fd, &net_len, 4) != 4 ||
            write(temp_fd, record.data(), record.size()) != static_cast<ssize_t>(record.size())) {
            ok = false;
            break;
        }
    }
    if (ok && fsync(temp_fd) != 0) ok = false;
    std::string reason = ok ? "" : errno_text();
    ::close(temp_fd);

    if (!ok || rename(temp_path.c_str(), path_.c_str()) != 0) {
        if (ok) reason = errno_text();
        unlink(temp_path.c_str());
        throw PersistenceError("Failed to rewrite " + path_ + ": " + reason);
    }
}

//==============================================================================
// SECTION 2: Directory helpers
//==============================================================================

void ensure_directory(const std::string& dir) {
    if (dir.empty()) {
        throw PersistenceError("Directory path is empty");
    }

    std::string partial;
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = dir.find('/', pos + 1);
        partial = dir.substr(0, pos);
        if (partial.empty()) continue;

        struct stat st;
        if (stat(partial.c_str(), &st) == 0) {
            if (!S_ISDIR(st.st_mode)) {
                throw PersistenceError(partial + " exists and is not a directory");
            }
            continue;
        }
        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            throw PersistenceError("Failed to create directory " + partial + ": " + errno_text());
        }
    }
}

std::vector<std::string> list_files_with_suffix(const std::string& dir, const std::string& suffix) {
    std::vector<std::string> names;

    DIR* handle = opendir(dir.c_str());
    if (!handle) {
        return names;
    }

    struct dirent* entry;
    while ((entry = readdir(handle)) != nullptr) {
        std::string name = entry->d_name;
        if (name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            names.push_back(name);
        }
    }
    closedir(handle);
    return names;
}

std::string encode_file_component(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());

    for (unsigned char c : value) {
        bool plain = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                     (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (plain) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }

    // "." and ".." are not usable as file names.
    if (out == "." || out == "..") {
        std::string escaped;
        for (size_t i = 0; i < out.size(); ++i) escaped += "%2E";
        return escaped;
    }
    return out;
}

std::string decode_file_component(const std::string& value) {
    std::string out;
    out.reserve(value.size());

    auto hex_value = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };

    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(value[i]);
    }
    return out;
}

} // namespace fleetwatch
