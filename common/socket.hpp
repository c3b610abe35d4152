#pragma once

// ============================================================
// socket.hpp -- RAII TCP client socket
// ============================================================

#include "platform.hpp"
#include <string>

class TcpSocket {
public:
    TcpSocket() = default;
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Resolve 'host' (name or literal, v4 or v6) and connect, trying each
    // address in turn. Gives up after timeout_ms per address (0 = OS default).
    // Throws ConnectionError.
    void connect(const std::string& host, u16 port, int timeout_ms);

    // Apply keepalive / nodelay tuning
    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    // Get peer address as string
    std::string peer_addr() const;

private:
    socket_t fd_{INVALID_SOCKET_VAL};
};
