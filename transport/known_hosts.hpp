#pragma once

// ============================================================
// known_hosts.hpp -- Locked, append-only access to known_hosts
// ============================================================

#include <mutex>
#include <string>

// Holds the known_hosts file exclusively for its lifetime: a process-wide
// mutex orders threads, flock() orders other processes. New entries are
// appended, existing lines are never rewritten.
class KnownHostsFile {
public:
    // Opens 'path' for append, creating it (0600) and its directory when
    // missing. An unwritable file still takes the lock; append() then throws.
    explicit KnownHostsFile(const std::string& path);
    ~KnownHostsFile();

    KnownHostsFile(const KnownHostsFile&) = delete;
    KnownHostsFile& operator=(const KnownHostsFile&) = delete;

    const std::string& path() const { return path_; }
    bool writable() const { return fd_ >= 0; }

    // Append one entry; a final line without '\n' is terminated first.
    // Throws std::runtime_error.
    void append(const std::string& line);

private:
    std::unique_lock<std::mutex> guard_;
    std::string path_;
    int         fd_{-1};
    std::string open_error_;
};
