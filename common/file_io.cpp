// ============================================================
// file_io.cpp -- File I/O implementation
// ============================================================

#include "file_io.hpp"
#include <vector>
#include <fstream>
#include <sstream>
#include <cstring>
#include <stdexcept>
#include <string>
#include <atomic>
#include <algorithm>
#include <filesystem>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <time.h>

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + strerror(errno));
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap failed: " + path);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    madvise(p, std::min((size_t)size_, (size_t)4*1024*1024), MADV_WILLNEED);
    data_ = static_cast<const char*>(p);
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    size_ = 0;
}

// ============================================================
// Utility functions
// ============================================================

std::optional<FileStat> file_io::stat_file(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return std::nullopt;
    if (!S_ISREG(st.st_mode)) return std::nullopt;
    FileStat fst;
    fst.size = (u64)st.st_size;
#if defined(__APPLE__)
    fst.mtime_ns = (u64)st.st_mtimespec.tv_sec * 1000000000ULL + (u64)st.st_mtimespec.tv_nsec;
#else
    fst.mtime_ns = (u64)st.st_mtim.tv_sec * 1000000000ULL + (u64)st.st_mtim.tv_nsec;
#endif
    return fst;
}

void file_io::set_mtime(const std::string& path, u64 mtime_ns) {
    struct timespec ts[2];
    ts[0].tv_sec  = (time_t)(mtime_ns / 1000000000ULL);
    ts[0].tv_nsec = (long)(mtime_ns % 1000000000ULL);
    ts[1] = ts[0];
    if (utimensat(AT_FDCWD, path.c_str(), ts, 0) != 0) {
        throw std::runtime_error("utimensat failed: " + path + ": " + strerror(errno));
    }
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

u64 file_io::get_file_size(const std::string& path) {
    auto st = stat_file(path);
    return st ? st->size : 0;
}

u64 file_io::get_mtime_ns(const std::string& path) {
    auto st = stat_file(path);
    return st ? st->mtime_ns : 0;
}

std::optional<std::string> file_io::read_text_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return std::nullopt;
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void file_io::atomic_write(const std::string& path, const std::string& content) {
    ensure_parent_dirs(path);

    // Unique per process and per call so concurrent writers never share a temp file
    static std::atomic<u64> counter{0};
    std::string tmp = path + ".tmp." + std::to_string(::getpid()) + "." +
                      std::to_string(counter.fetch_add(1));

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        throw std::runtime_error("Cannot create " + tmp + ": " + strerror(errno));
    }
    const char* p = content.data();
    size_t remain = content.size();
    while (remain > 0) {
        ssize_t w = ::write(fd, p, remain);
        if (w < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            throw std::runtime_error("write failed: " + tmp + ": " + strerror(err));
        }
        p += w;
        remain -= (size_t)w;
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        throw std::runtime_error("fsync failed: " + tmp + ": " + strerror(err));
    }
    ::close(fd);

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        throw std::runtime_error("rename failed: " + tmp + " -> " + path + ": " + strerror(err));
    }
}

std::string file_io::normalize_path(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec) return fs::path(path).lexically_normal().string();
    return abs.lexically_normal().string();
}
