// ============================================================
// proxy_command.cpp -- ssh_config ProxyCommand / ProxyJump transport
// ============================================================

#include "proxy_command.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"

#include <csignal>

#include <sys/socket.h>
#include <sys/wait.h>

ProxyCommand::~ProxyCommand() {
    close();
}

std::string ProxyCommand::expand(const std::string& tmpl, const std::string& host,
                                 u16 port, const std::string& user) {
    std::string out;
    out.reserve(tmpl.size() + host.size());
    for (size_t i = 0; i < tmpl.size(); ++i) {
        if (tmpl[i] != '%' || i + 1 == tmpl.size()) {
            out += tmpl[i];
            continue;
        }
        char tok = tmpl[++i];
        switch (tok) {
            case 'h': out += host; break;
            case 'p': out += std::to_string(port); break;
            case 'r': out += user; break;
            case '%': out += '%'; break;
            default:
                out += '%';
                out += tok;
                break;
        }
    }
    return out;
}

std::string ProxyCommand::from_jump(const std::string& jump) {
    size_t comma = jump.find(',');
    std::string hop  = jump.substr(0, comma);
    std::string rest = comma == std::string::npos ? "" : jump.substr(comma + 1);

    std::string user, host, port;
    size_t at = hop.rfind('@');
    if (at != std::string::npos) {
        user = hop.substr(0, at);
        hop  = hop.substr(at + 1);
    }
    if (!hop.empty() && hop[0] == '[') {
        size_t close_br = hop.find(']');
        host = hop.substr(1, close_br == std::string::npos ? std::string::npos : close_br - 1);
        if (close_br != std::string::npos && close_br + 1 < hop.size() && hop[close_br + 1] == ':') {
            port = hop.substr(close_br + 2);
        }
    } else {
        size_t colon = hop.rfind(':');
        host = hop.substr(0, colon);
        if (colon != std::string::npos) port = hop.substr(colon + 1);
    }

    std::string cmd = "ssh";
    if (!rest.empty()) cmd += " -J " + rest;
    if (!user.empty()) cmd += " -l " + user;
    if (!port.empty()) cmd += " -p " + port;
    cmd += " -W '[%h]:%p' " + host;
    return cmd;
}

void ProxyCommand::start(const std::string& command) {
    close();
    int sv[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
        throw ConnectionError("proxy: socketpair failed: " + socket_error_str(errno));
    }
    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(sv[0]);
        ::close(sv[1]);
        throw ConnectionError("proxy: fork failed: " + socket_error_str(err));
    }
    if (pid == 0) {
        // dup2 clears close-on-exec on the copies
        ::dup2(sv[1], STDIN_FILENO);
        ::dup2(sv[1], STDOUT_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execl("/bin/sh", "sh", "-c", command.c_str(), (char*)nullptr);
        ::_exit(127);
    }
    ::close(sv[1]);
    fd_  = sv[0];
    pid_ = pid;
    LOG_DEBUG("proxy: started '" + command + "' (pid " + std::to_string(pid) + ")");
}

void ProxyCommand::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
    if (pid_ > 0) {
        ::kill(pid_, SIGTERM);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        pid_ = -1;
    }
}
