#pragma once

// ============================================================
// resume_store.hpp -- Persisted progress of partial uploads
//
// One text file per resume key under the store directory:
//   <dir>/<key>.resume   with "name=value" lines
// Every write replaces the file atomically. Thread-safe.
// ============================================================

#include "../common/file_io.hpp"
#include "../common/platform.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct ResumeRecord {
    std::string resume_key;
    std::string local_path;
    std::string remote_host;
    std::string remote_path;
    u64         transferred_bytes{0};
    u64         total_bytes{0};
    u64         local_mtime{0};     // ns since epoch

    double percentage() const;
};

// Result of a validity-checked lookup
struct ResumeLookup {
    std::optional<ResumeRecord> record;   // usable record, if any
    bool mismatch{false};                 // a stale record was found and deleted
};

class ResumeStore {
public:
    explicit ResumeStore(std::string dir);

    // Deterministic key for (local_path, remote_host, remote_path)
    static std::string make_key(const std::string& local_path,
                                const std::string& remote_host,
                                const std::string& remote_path);

    // nullopt if absent or malformed
    std::optional<ResumeRecord> load(const std::string& key) const;

    // Load and check against the current local file. A record whose
    // local_mtime or total_bytes differ is deleted.
    ResumeLookup load_resumable(const std::string& key, const file_io::FileStat& current);

    // Throws std::runtime_error on I/O failure
    void save(const ResumeRecord& rec);

    // Missing keys are not an error
    void remove(const std::string& key);

    // All well-formed records, sorted by key
    std::vector<ResumeRecord> list() const;

    // Delete records whose file was last written more than max_age_s ago.
    // Returns the number deleted.
    size_t purge_older_than(u64 max_age_s);

    const std::string& dir() const { return dir_; }

private:
    std::string path_for(const std::string& key) const;
    static std::optional<ResumeRecord> parse(const std::string& text);
    static std::string serialize(const ResumeRecord& rec);

    std::string        dir_;
    mutable std::mutex mutex_;
};
