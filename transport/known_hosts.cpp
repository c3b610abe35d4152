// ============================================================
// known_hosts.cpp -- Locked, append-only access to known_hosts
// ============================================================

#include "known_hosts.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"

#include <stdexcept>

#include <sys/file.h>
#include <sys/stat.h>

static std::mutex& known_hosts_mutex() {
    static std::mutex m;
    return m;
}

static void write_all(int fd, const char* p, size_t len, const std::string& path) {
    while (len > 0) {
        ssize_t w = ::write(fd, p, len);
        if (w < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("cannot append to " + path + ": " + strerror(errno));
        }
        p += w;
        len -= (size_t)w;
    }
}

KnownHostsFile::KnownHostsFile(const std::string& path)
    : guard_(known_hosts_mutex()), path_(path) {
    try {
        file_io::ensure_parent_dirs(path_);
    } catch (const std::exception& e) {
        LOG_DEBUG("known_hosts directory: " + std::string(e.what()));
    }
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        open_error_ = strerror(errno);
        return;
    }
    int rc;
    do {
        rc = ::flock(fd_, LOCK_EX);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
        LOG_DEBUG("flock " + path_ + " failed: " + strerror(errno));
    }
}

KnownHostsFile::~KnownHostsFile() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

void KnownHostsFile::append(const std::string& line) {
    if (fd_ < 0) {
        throw std::runtime_error("cannot open " + path_ + ": " + open_error_);
    }
    if (line.empty()) return;

    std::string out;
    struct stat st{};
    if (::fstat(fd_, &st) == 0 && st.st_size > 0) {
        char last = '\n';
        if (::pread(fd_, &last, 1, st.st_size - 1) == 1 && last != '\n') out += '\n';
    }
    out += line;
    if (out.back() != '\n') out += '\n';
    write_all(fd_, out.data(), out.size(), path_);
}
