// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "errors.hpp"
#include <cstring>
#include <string>

#include <poll.h>

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
#if defined(__linux__)
    int idle = 60, intvl = 10, cnt = 3;
    setsockopt(fd_, IPPROTO_TCP, TCP_KEEPIDLE,  &idle,  sizeof(idle));
    setsockopt(fd_, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
    setsockopt(fd_, IPPROTO_TCP, TCP_KEEPCNT,   &cnt,   sizeof(cnt));
#endif
}

// Non-blocking connect bounded by poll(); restores blocking mode on success.
// Returns 0 or the errno of the failure (ETIMEDOUT on expiry).
static int connect_with_timeout(socket_t fd, const sockaddr* addr, socklen_t len, int timeout_ms) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (timeout_ms > 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, addr, len);
    if (rc != 0 && errno == EINPROGRESS && timeout_ms > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int pr;
        do {
            pr = ::poll(&pfd, 1, timeout_ms);
        } while (pr < 0 && errno == EINTR);
        if (pr == 0) return ETIMEDOUT;
        if (pr < 0) return errno;
        int so_err = 0;
        socklen_t so_len = sizeof(so_err);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &so_len);
        if (so_err != 0) return so_err;
        rc = 0;
    } else if (rc != 0) {
        return errno;
    }

    fcntl(fd, F_SETFL, flags);
    return 0;
}

void TcpSocket::connect(const std::string& host, u16 port, int timeout_ms) {
    close();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string port_str = std::to_string(port);
    addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        throw ConnectionError("cannot resolve " + host + ": " + gai_strerror(gai));
    }

    std::string last_err = "no addresses";
    for (addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
        socket_t s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == INVALID_SOCKET_VAL) {
            last_err = socket_error_str(last_socket_error());
            continue;
        }
        int err = connect_with_timeout(s, rp->ai_addr, rp->ai_addrlen, timeout_ms);
        if (err == 0) {
            fd_ = s;
            freeaddrinfo(res);
            tune();
            return;
        }
        last_err = (err == ETIMEDOUT) ? "timed out after " + std::to_string(timeout_ms) + " ms"
                                      : socket_error_str(err);
        CLOSE_SOCKET(s);
    }
    freeaddrinfo(res);
    throw ConnectionError("connect to " + host + ":" + port_str + " failed: " + last_err);
}

std::string TcpSocket::peer_addr() const {
    sockaddr_storage peer{};
    socklen_t len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) != 0) return "?";
    char host[NI_MAXHOST] = {0};
    char serv[NI_MAXSERV] = {0};
    if (getnameinfo((sockaddr*)&peer, len, host, sizeof(host), serv, sizeof(serv),
                    NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
        return "?";
    }
    return std::string(host) + ":" + serv;
}
