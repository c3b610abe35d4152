#pragma once

// ============================================================
// file_io.hpp -- Memory-mapped reads, file metadata, atomic writes
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

    // Get pointer to chunk at given offset, clamped to available bytes
    const char* chunk_ptr(u64 offset) const {
        if (offset >= size_) return nullptr;
        return data_ + offset;
    }

    u64 chunk_len(u64 offset, u64 max_len) const {
        if (offset >= size_) return 0;
        u64 remaining = size_ - offset;
        return remaining < max_len ? remaining : max_len;
    }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};
    int fd_{-1};
};

// Size and modification time of a regular file
struct FileStat {
    u64 size{0};
    u64 mtime_ns{0};

    bool operator==(const FileStat& o) const { return size == o.size && mtime_ns == o.mtime_ns; }
    bool operator!=(const FileStat& o) const { return !(*this == o); }
};

// ---- Utility functions ----

// Stat a regular file; nullopt if missing or not a regular file
std::optional<FileStat> stat_file(const std::string& path);

// Set file modification time (nanoseconds since epoch)
void set_mtime(const std::string& path, u64 mtime_ns);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

// Get file modification time as nanoseconds since epoch; 0 if not found
u64 get_mtime_ns(const std::string& path);

// Read entire text file; nullopt if it cannot be opened
std::optional<std::string> read_text_file(const std::string& path);

// Replace 'path' with 'content' atomically: write a sibling temp file,
// fsync it, then rename over the target. Readers observe either the old
// or the new file, never a partial one. Throws std::runtime_error.
void atomic_write(const std::string& path, const std::string& content);

// Absolute, lexically normalized form of a local path
std::string normalize_path(const std::string& path);

} // namespace file_io
