#pragma once

// In-process RemoteSession / SessionOpener used by the upload and
// scheduler tests. "Remote" files live under a local directory.

#include "common/errors.hpp"
#include "common/file_io.hpp"
#include "transport/remote_session.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

struct FakeRemote {
    std::string root;                       // remote "/" maps here
    u64         chunk_size{1000};
    u64         fail_after{0};              // 0 = never; else throw once offset reaches it
    int         transfer_delay_ms{0};
    ExecResult  exec_result{0, "", ""};
    bool        exec_throws{false};

    std::set<std::string> auth_fail_hosts;  // alias -> AuthenticationExhausted
    std::set<std::string> refuse_hosts;     // alias -> ConnectionError

    std::mutex               mutex;
    int                      active{0};
    int                      peak{0};
    int                      opened{0};
    std::vector<std::string> commands;
    std::vector<u64>         start_offsets;

    std::string local_for(const std::string& remote_path) const {
        return root + remote_path;
    }
};

class FakeSession : public RemoteSession {
public:
    FakeSession(FakeRemote& remote, std::string host) : remote_(remote), host_(std::move(host)) {}

    ~FakeSession() override { close(); }

    std::string host() const override { return host_; }

    std::optional<u64> remote_size(const std::string& remote_path) override {
        auto st = file_io::stat_file(remote_.local_for(remote_path));
        if (!st) return std::nullopt;
        return st->size;
    }

    u64 transfer_file(const std::string& local_path, const std::string& remote_path,
                      u64 start_offset, const ChunkAckFn& on_ack) override {
        {
            std::lock_guard<std::mutex> lk(remote_.mutex);
            remote_.start_offsets.push_back(start_offset);
        }
        std::ifstream in(local_path, std::ios::binary);
        if (!in) throw TransferError("cannot open " + local_path);
        in.seekg(0, std::ios::end);
        u64 total = (u64)in.tellg();
        in.seekg((std::streamoff)start_offset);

        std::string dst = remote_.local_for(remote_path);
        file_io::ensure_parent_dirs(dst);
        if (start_offset == 0) {
            std::ofstream trunc(dst, std::ios::binary | std::ios::trunc);
        }
        std::fstream out(dst, std::ios::binary | std::ios::in | std::ios::out);
        if (!out) throw TransferError("cannot open remote " + remote_path);
        out.seekp((std::streamoff)start_offset);

        u64 offset = start_offset;
        std::vector<char> buf((size_t)remote_.chunk_size);
        while (offset < total) {
            if (remote_.fail_after && offset >= remote_.fail_after) {
                out.flush();
                throw TransferError("connection dropped", offset - start_offset);
            }
            u64 n = std::min<u64>(remote_.chunk_size, total - offset);
            in.read(buf.data(), (std::streamsize)n);
            out.write(buf.data(), (std::streamsize)n);
            out.flush();
            offset += n;
            if (remote_.transfer_delay_ms) {
                std::this_thread::sleep_for(std::chrono::milliseconds(remote_.transfer_delay_ms));
            }
            if (on_ack) on_ack(offset);
        }
        return offset - start_offset;
    }

    ExecResult execute_remote(const std::string& command) override {
        {
            std::lock_guard<std::mutex> lk(remote_.mutex);
            remote_.commands.push_back(command);
        }
        if (remote_.exec_throws) throw ExecutionError("channel closed", "partial", "");
        return remote_.exec_result;
    }

    void close() override {
        if (closed_) return;
        closed_ = true;
        std::lock_guard<std::mutex> lk(remote_.mutex);
        --remote_.active;
    }

private:
    FakeRemote& remote_;
    std::string host_;
    bool        closed_{false};
};

class FakeOpener : public SessionOpener {
public:
    explicit FakeOpener(FakeRemote& remote) : remote_(remote) {}

    std::unique_ptr<RemoteSession> open(const ResolvedTarget& target) override {
        if (remote_.refuse_hosts.count(target.alias)) {
            throw ConnectionError("connect to " + target.alias + " refused");
        }
        if (remote_.auth_fail_hosts.count(target.alias)) {
            std::vector<std::string> tried;
            for (const auto& c : target.candidates) tried.push_back(c.describe());
            throw AuthenticationExhausted(target.alias, tried);
        }
        {
            std::lock_guard<std::mutex> lk(remote_.mutex);
            ++remote_.opened;
            ++remote_.active;
            remote_.peak = std::max(remote_.peak, remote_.active);
        }
        return std::unique_ptr<RemoteSession>(new FakeSession(remote_, target.username + "@" + target.alias));
    }

private:
    FakeRemote& remote_;
};
