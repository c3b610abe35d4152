#pragma once

// ============================================================
// remote_session.hpp -- Authenticated connection to one target
//
// A session is owned by exactly one scheduler worker and never
// shared. Implementations close on destruction.
// ============================================================

#include "target.hpp"
#include "../common/platform.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

struct ExecResult {
    int         exit_code{-1};
    std::string stdout_text;
    std::string stderr_text;
};

// Called after every acknowledged chunk with the total acknowledged
// size of the remote file (start offset included)
using ChunkAckFn = std::function<void(u64 total_acked)>;

class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // "user@host:port" for log lines
    virtual std::string host() const = 0;

    // Size of a remote file; nullopt when it does not exist
    virtual std::optional<u64> remote_size(const std::string& remote_path) = 0;

    // Upload local_path[start_offset..] to remote_path at the same offset.
    // Creates missing remote parent directories. Returns the bytes sent in
    // this call. Throws TransferError.
    virtual u64 transfer_file(const std::string& local_path,
                              const std::string& remote_path,
                              u64 start_offset,
                              const ChunkAckFn& on_ack) = 0;

    // Run one shell command and wait for it to exit. Throws ExecutionError
    // when the command cannot be run to completion.
    virtual ExecResult execute_remote(const std::string& command) = 0;

    virtual void close() = 0;
};

class SessionOpener {
public:
    virtual ~SessionOpener() = default;

    // Connect and authenticate. Throws ConnectionError or
    // AuthenticationExhausted.
    virtual std::unique_ptr<RemoteSession> open(const ResolvedTarget& target) = 0;
};
