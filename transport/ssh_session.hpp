#pragma once

// ============================================================
// ssh_session.hpp -- RemoteSession over libssh2 (SFTP + exec)
// ============================================================

#include "proxy_command.hpp"
#include "remote_session.hpp"
#include "../common/socket.hpp"
#include <memory>
#include <string>

typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP    LIBSSH2_SFTP;

struct SshOptions {
    std::string known_hosts{"~/.ssh/known_hosts"};
    bool        verify_host_key{true};   // accept-new when true, off when false
    int         exec_timeout_s{300};
    size_t      chunk_size{1024 * 1024};
};

class SshSession : public RemoteSession {
public:
    // Connect, verify the host key and authenticate with the candidates
    // in order. Throws ConnectionError or AuthenticationExhausted.
    static std::unique_ptr<SshSession> connect(const ResolvedTarget& target,
                                               const SshOptions& opts);

    ~SshSession() override;

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    std::string host() const override { return label_; }

    std::optional<u64> remote_size(const std::string& remote_path) override;

    u64 transfer_file(const std::string& local_path,
                      const std::string& remote_path,
                      u64 start_offset,
                      const ChunkAckFn& on_ack) override;

    ExecResult execute_remote(const std::string& command) override;

    void close() override;

    // Methods tried during authentication, in order
    const std::vector<std::string>& attempted() const { return attempted_; }

private:
    SshSession(const ResolvedTarget& target, const SshOptions& opts);

    void handshake();
    void verify_host_key();
    void authenticate();
    bool try_candidate(const CredentialCandidate& c, const std::string& offered);
    bool try_password(const std::string& secret, const std::string& offered);
    bool session_alive() const;
    socket_t transport_fd() const { return proxy_.running() ? proxy_.fd() : sock_.native(); }

    LIBSSH2_SFTP* sftp();
    void make_remote_dirs(const std::string& dir);
    std::string last_error() const;

    ResolvedTarget target_;
    SshOptions     opts_;
    std::string    label_;
    TcpSocket      sock_;
    ProxyCommand   proxy_;
    LIBSSH2_SESSION* session_{nullptr};
    LIBSSH2_SFTP*    sftp_{nullptr};
    std::vector<std::string> attempted_;
};

class SshSessionOpener : public SessionOpener {
public:
    explicit SshSessionOpener(SshOptions opts) : opts_(std::move(opts)) {}

    std::unique_ptr<RemoteSession> open(const ResolvedTarget& target) override {
        return SshSession::connect(target, opts_);
    }

private:
    SshOptions opts_;
};
