#pragma once

// ============================================================
// proxy_command.hpp -- ssh_config ProxyCommand / ProxyJump transport
//
// The command runs under /bin/sh with one end of a socketpair as its
// stdin and stdout; the SSH session speaks over the other end.
// ============================================================

#include "../common/platform.hpp"
#include <string>

class ProxyCommand {
public:
    ProxyCommand() = default;
    ~ProxyCommand();

    ProxyCommand(const ProxyCommand&) = delete;
    ProxyCommand& operator=(const ProxyCommand&) = delete;

    // Substitute %h (host), %p (port), %r (user) and %%
    static std::string expand(const std::string& tmpl, const std::string& host,
                              u16 port, const std::string& user);

    // ProxyJump "[user@]host[:port][,next...]" as the equivalent command
    static std::string from_jump(const std::string& jump);

    // Spawn 'command' (already expanded). Throws ConnectionError.
    void start(const std::string& command);

    bool running() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t fd() const { return fd_; }

    // Close our end and reap the child
    void close();

private:
    socket_t fd_{INVALID_SOCKET_VAL};
    pid_t    pid_{-1};
};
