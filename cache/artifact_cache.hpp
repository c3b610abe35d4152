#pragma once

// ============================================================
// artifact_cache.hpp -- Reuse-or-rebuild decisions for artifacts
//
// Metadata lives in one text file, one entry per line:
//   <sha256-hex> <mtime_ns> <size_bytes> <absolute path>
// An entry is trusted while mtime and size still match the file;
// the hash is only computed when an artifact is recorded or
// explicitly verified.
// ============================================================

#include "../common/platform.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct CacheEntry {
    std::string local_path;   // absolute, normalized
    std::string sha256;
    u64         mtime{0};     // ns since epoch
    u64         size_bytes{0};
};

class ArtifactCache {
public:
    explicit ArtifactCache(std::string cache_dir);

    // True when no entry exists or mtime/size changed. Never hashes.
    bool should_rebuild(const std::string& local_path) const;

    // Hash the file and store a fresh entry. Throws std::runtime_error
    // if the file cannot be read or the store cannot be written.
    CacheEntry record(const std::string& local_path);

    // Full integrity check: cheap check first, then SHA-256 comparison
    bool verify(const std::string& local_path) const;

    // Drop one entry; returns false if there was none
    bool forget(const std::string& local_path);

    std::optional<CacheEntry> lookup(const std::string& local_path) const;
    std::vector<CacheEntry> entries() const;
    u64 total_size() const;

    // Remove the whole store
    void clear();

    const std::string& dir() const { return dir_; }
    std::string metadata_path() const;

private:
    using EntryMap = std::map<std::string, CacheEntry>;

    EntryMap read_locked() const;
    void write_locked(const EntryMap& m) const;

    std::string        dir_;
    mutable std::mutex mutex_;
};
