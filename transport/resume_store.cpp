// ============================================================
// resume_store.cpp -- Resume record persistence
// ============================================================

#include "resume_store.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

static const char* kSuffix = ".resume";

double ResumeRecord::percentage() const {
    return utils::percent(transferred_bytes, total_bytes);
}

ResumeStore::ResumeStore(std::string dir) : dir_(utils::expand_user(dir)) {}

std::string ResumeStore::make_key(const std::string& local_path,
                                  const std::string& remote_host,
                                  const std::string& remote_path) {
    std::string material = file_io::normalize_path(local_path);
    material += '\0';
    material += remote_host;
    material += '\0';
    material += remote_path;
    return hash::bytes_to_hex8(hash::xxh3_128(material));
}

std::string ResumeStore::path_for(const std::string& key) const {
    return (fs::path(dir_) / (key + kSuffix)).string();
}

std::string ResumeStore::serialize(const ResumeRecord& rec) {
    std::ostringstream ss;
    ss << "# cargoline resume record\n";
    ss << "resume_key=" << rec.resume_key << "\n";
    ss << "local_path=" << rec.local_path << "\n";
    ss << "remote_host=" << rec.remote_host << "\n";
    ss << "remote_path=" << rec.remote_path << "\n";
    ss << "transferred_bytes=" << rec.transferred_bytes << "\n";
    ss << "total_bytes=" << rec.total_bytes << "\n";
    ss << "file_size=" << rec.total_bytes << "\n";
    ss << "percentage=" << std::fixed << std::setprecision(2) << rec.percentage() << "\n";
    ss << "local_mtime=" << rec.local_mtime << "\n";
    return ss.str();
}

std::optional<ResumeRecord> ResumeStore::parse(const std::string& text) {
    ResumeRecord rec;
    bool have_local = false, have_host = false, have_remote = false;
    bool have_sent = false, have_total = false, have_mtime = false;

    std::istringstream in(text);
    std::string line;
    try {
        while (std::getline(in, line)) {
            if (line.empty() || line[0] == '#') continue;
            size_t eq = line.find('=');
            if (eq == std::string::npos) return std::nullopt;
            std::string k = line.substr(0, eq);
            std::string v = line.substr(eq + 1);
            if (k == "resume_key") {
                rec.resume_key = v;
            } else if (k == "local_path") {
                rec.local_path = v;
                have_local = true;
            } else if (k == "remote_host") {
                rec.remote_host = v;
                have_host = true;
            } else if (k == "remote_path") {
                rec.remote_path = v;
                have_remote = true;
            } else if (k == "transferred_bytes") {
                rec.transferred_bytes = utils::parse_u64(v);
                have_sent = true;
            } else if (k == "total_bytes") {
                rec.total_bytes = utils::parse_u64(v);
                have_total = true;
            } else if (k == "local_mtime") {
                rec.local_mtime = utils::parse_u64(v);
                have_mtime = true;
            }
            // file_size and percentage are derived, informational only
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    if (!(have_local && have_host && have_remote && have_sent && have_total && have_mtime)) {
        return std::nullopt;
    }
    if (rec.transferred_bytes > rec.total_bytes) return std::nullopt;
    return rec;
}

std::optional<ResumeRecord> ResumeStore::load(const std::string& key) const {
    std::string path = path_for(key);
    std::optional<std::string> text;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        text = file_io::read_text_file(path);
    }
    if (!text) return std::nullopt;
    auto rec = parse(*text);
    if (!rec) {
        LOG_WARN("Ignoring malformed resume record " + path);
        return std::nullopt;
    }
    rec->resume_key = key;
    return rec;
}

ResumeLookup ResumeStore::load_resumable(const std::string& key, const file_io::FileStat& current) {
    ResumeLookup out;
    auto rec = load(key);
    if (!rec) return out;

    if (rec->local_mtime != current.mtime_ns || rec->total_bytes != current.size) {
        LOG_INFO("ResumeMismatch: " + rec->local_path + " changed since the partial upload to " +
                 rec->remote_host + " (size " + std::to_string(rec->total_bytes) + " -> " +
                 std::to_string(current.size) + "), restarting at 0");
        remove(key);
        out.mismatch = true;
        return out;
    }
    out.record = std::move(rec);
    return out;
}

void ResumeStore::save(const ResumeRecord& rec) {
    if (rec.resume_key.empty()) {
        throw std::runtime_error("resume record without key");
    }
    std::string content = serialize(rec);
    std::lock_guard<std::mutex> lk(mutex_);
    file_io::atomic_write(path_for(rec.resume_key), content);
}

void ResumeStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lk(mutex_);
    std::error_code ec;
    fs::remove(path_for(key), ec);
    if (ec) {
        throw std::runtime_error("cannot remove resume record " + path_for(key) + ": " + ec.message());
    }
}

std::vector<ResumeRecord> ResumeStore::list() const {
    std::vector<ResumeRecord> out;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return out;

    std::vector<std::string> keys;
    for (const auto& de : fs::directory_iterator(dir_, ec)) {
        if (!de.is_regular_file()) continue;
        std::string name = de.path().filename().string();
        size_t slen = std::char_traits<char>::length(kSuffix);
        if (name.size() <= slen || name.compare(name.size() - slen, slen, kSuffix) != 0) continue;
        keys.push_back(name.substr(0, name.size() - slen));
    }
    std::sort(keys.begin(), keys.end());
    for (const auto& k : keys) {
        auto rec = load(k);
        if (rec) out.push_back(std::move(*rec));
    }
    return out;
}

size_t ResumeStore::purge_older_than(u64 max_age_s) {
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return 0;

    u64 now_ns = (u64)std::chrono::duration_cast<std::chrono::nanoseconds>(
                     std::chrono::system_clock::now().time_since_epoch()).count();
    u64 max_age_ns = max_age_s * 1000000000ULL;

    std::vector<fs::path> victims;
    for (const auto& de : fs::directory_iterator(dir_, ec)) {
        if (!de.is_regular_file()) continue;
        if (de.path().extension() != kSuffix) continue;
        u64 mtime = file_io::get_mtime_ns(de.path().string());
        if (mtime != 0 && now_ns > mtime && now_ns - mtime > max_age_ns) {
            victims.push_back(de.path());
        }
    }

    size_t removed = 0;
    std::lock_guard<std::mutex> lk(mutex_);
    for (const auto& p : victims) {
        std::error_code rm_ec;
        if (fs::remove(p, rm_ec)) {
            ++removed;
            LOG_DEBUG("Purged resume record " + p.string());
        } else if (rm_ec) {
            LOG_WARN("Cannot purge " + p.string() + ": " + rm_ec.message());
        }
    }
    if (removed > 0) {
        LOG_INFO("Purged " + std::to_string(removed) + " resume record(s) older than " +
                 std::to_string(max_age_s / 86400) + " day(s)");
    }
    return removed;
}
