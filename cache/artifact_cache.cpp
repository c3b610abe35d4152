// ============================================================
// artifact_cache.cpp -- Artifact metadata store
// ============================================================

#include "artifact_cache.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <sstream>
#include <stdexcept>

ArtifactCache::ArtifactCache(std::string cache_dir) : dir_(utils::expand_user(cache_dir)) {}

std::string ArtifactCache::metadata_path() const {
    return (fs::path(dir_) / "metadata").string();
}

ArtifactCache::EntryMap ArtifactCache::read_locked() const {
    EntryMap m;
    auto text = file_io::read_text_file(metadata_path());
    if (!text) return m;

    std::istringstream in(*text);
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line[0] == '#') continue;
        std::istringstream ls(line);
        CacheEntry e;
        if (!(ls >> e.sha256 >> e.mtime >> e.size_bytes)) {
            LOG_WARN("Cache metadata line " + std::to_string(line_no) + " is malformed, ignored");
            continue;
        }
        std::string path;
        std::getline(ls, path);
        e.local_path = utils::trim(path);
        if (e.local_path.empty()) continue;
        m[e.local_path] = e;
    }
    return m;
}

void ArtifactCache::write_locked(const EntryMap& m) const {
    std::ostringstream ss;
    ss << "# cargoline artifact cache: sha256 mtime_ns size path\n";
    for (const auto& kv : m) {
        const CacheEntry& e = kv.second;
        ss << e.sha256 << " " << e.mtime << " " << e.size_bytes << " " << e.local_path << "\n";
    }
    file_io::atomic_write(metadata_path(), ss.str());
}

std::optional<CacheEntry> ArtifactCache::lookup(const std::string& local_path) const {
    std::string key = file_io::normalize_path(local_path);
    std::lock_guard<std::mutex> lk(mutex_);
    EntryMap m = read_locked();
    auto it = m.find(key);
    if (it == m.end()) return std::nullopt;
    return it->second;
}

bool ArtifactCache::should_rebuild(const std::string& local_path) const {
    std::string key = file_io::normalize_path(local_path);
    auto entry = lookup(key);
    if (!entry) {
        LOG_DEBUG("Cache miss for " + key);
        return true;
    }
    auto st = file_io::stat_file(key);
    if (!st) {
        LOG_INFO("CacheInvalidated: " + key + " no longer exists");
        return true;
    }
    if (st->mtime_ns != entry->mtime || st->size != entry->size_bytes) {
        LOG_INFO("CacheInvalidated: " + key + " changed (size " +
                 std::to_string(entry->size_bytes) + " -> " + std::to_string(st->size) + ")");
        return true;
    }
    LOG_DEBUG("Cache hit for " + key);
    return false;
}

CacheEntry ArtifactCache::record(const std::string& local_path) {
    std::string key = file_io::normalize_path(local_path);
    auto st = file_io::stat_file(key);
    if (!st) {
        throw std::runtime_error("cannot record missing artifact " + key);
    }

    // Hash outside the lock; it can take a while for large artifacts
    u64 start = utils::now_ms();
    CacheEntry e;
    e.local_path = key;
    e.sha256     = hash::sha256_file(key);
    e.mtime      = st->mtime_ns;
    e.size_bytes = st->size;

    {
        std::lock_guard<std::mutex> lk(mutex_);
        EntryMap m = read_locked();
        m[key] = e;
        write_locked(m);
    }
    LOG_INFO("Cached " + key + " (" + utils::format_bytes(e.size_bytes) + ", sha256 " +
             e.sha256.substr(0, 12) + ", hashed in " + std::to_string(utils::now_ms() - start) + " ms)");
    return e;
}

bool ArtifactCache::verify(const std::string& local_path) const {
    std::string key = file_io::normalize_path(local_path);
    if (should_rebuild(key)) return false;
    auto entry = lookup(key);
    if (!entry) return false;
    std::string actual = hash::sha256_file(key);
    if (actual != entry->sha256) {
        LOG_WARN("CacheInvalidated: " + key + " content hash differs from the recorded one");
        return false;
    }
    return true;
}

bool ArtifactCache::forget(const std::string& local_path) {
    std::string key = file_io::normalize_path(local_path);
    std::lock_guard<std::mutex> lk(mutex_);
    EntryMap m = read_locked();
    if (m.erase(key) == 0) return false;
    write_locked(m);
    return true;
}

std::vector<CacheEntry> ArtifactCache::entries() const {
    std::lock_guard<std::mutex> lk(mutex_);
    EntryMap m = read_locked();
    std::vector<CacheEntry> out;
    out.reserve(m.size());
    for (const auto& kv : m) out.push_back(kv.second);
    return out;
}

u64 ArtifactCache::total_size() const {
    u64 total = 0;
    for (const auto& e : entries()) total += e.size_bytes;
    return total;
}

void ArtifactCache::clear() {
    std::lock_guard<std::mutex> lk(mutex_);
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) {
        throw std::runtime_error("cannot clear cache " + dir_ + ": " + ec.message());
    }
    LOG_INFO("Cleared artifact cache " + dir_);
}
