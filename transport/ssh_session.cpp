// ============================================================
// ssh_session.cpp -- libssh2 session: handshake, auth, SFTP, exec
// ============================================================

#include "ssh_session.hpp"
#include "known_hosts.hpp"
#include "ssh_agent.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <vector>

#include <poll.h>

// libssh2_init is not thread-safe; run it once per process
static void libssh2_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        int rc = libssh2_init(0);
        if (rc != 0) {
            throw ConnectionError("libssh2_init failed (rc=" + std::to_string(rc) + ")");
        }
        std::atexit([] { libssh2_exit(); });
    });
}

// keyboard-interactive: answer every prompt with the password in *abstract
static void kbdint_callback(const char* /*name*/, int /*name_len*/,
                            const char* /*instruction*/, int /*instruction_len*/,
                            int num_prompts,
                            const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                            LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                            void** abstract) {
    if (!abstract || !*abstract) return;
    const std::string* secret = static_cast<const std::string*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        // libssh2 releases the responses with free()
        char* buf = static_cast<char*>(std::malloc(secret->size() + 1));
        if (!buf) {
            responses[i].text = nullptr;
            responses[i].length = 0;
            continue;
        }
        std::memcpy(buf, secret->data(), secret->size());
        buf[secret->size()] = '\0';
        responses[i].text = buf;
        responses[i].length = (unsigned int)secret->size();
    }
}

static bool method_offered(const std::string& offered, const char* method) {
    // offered is a comma separated list; an empty list means "unknown"
    if (offered.empty()) return true;
    std::string needle = method;
    size_t pos = 0;
    while (pos <= offered.size()) {
        size_t comma = offered.find(',', pos);
        if (comma == std::string::npos) comma = offered.size();
        if (offered.compare(pos, comma - pos, needle) == 0) return true;
        pos = comma + 1;
    }
    return false;
}

// ============================================================
// Lifecycle
// ============================================================

SshSession::SshSession(const ResolvedTarget& target, const SshOptions& opts)
    : target_(target), opts_(opts) {
    target_.timeout_s = utils::clamp(target_.timeout_s, 1, MAX_TIMEOUT_S);
    label_ = target_.username + "@" + target_.alias;
    if (target_.port != 22) label_ += ":" + std::to_string(target_.port);
}

std::unique_ptr<SshSession> SshSession::connect(const ResolvedTarget& target,
                                                const SshOptions& opts) {
    libssh2_global_init();
    std::unique_ptr<SshSession> s(new SshSession(target, opts));

    std::string via;
    if (!target.proxy_command.empty()) {
        std::string cmd = ProxyCommand::expand(target.proxy_command, target.hostname,
                                               target.port, target.username);
        LOG_DEBUG("[" + s->label_ + "] connecting through proxy: " + cmd);
        s->proxy_.start(cmd);
        via = "via proxy";
    } else {
        LOG_DEBUG("[" + s->label_ + "] connecting to " + target.hostname + ":" +
                  std::to_string(target.port));
        // timeout_s is clamped to MAX_TIMEOUT_S, so the millisecond value fits an int
        s->sock_.connect(target.hostname, target.port, s->target_.timeout_s * 1000);
        via = s->sock_.peer_addr();
    }
    s->handshake();
    s->verify_host_key();
    s->authenticate();
    LOG_INFO("[" + s->label_ + "] connected (" + via + ")");
    return s;
}

SshSession::~SshSession() {
    close();
}

void SshSession::close() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "cargoline: closing");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    sock_.close();
    proxy_.close();
}

std::string SshSession::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    int code = libssh2_session_last_error(session_, &msg, &len, 0);
    std::string out = (msg && len > 0) ? std::string(msg, (size_t)len) : std::string("unknown error");
    return out + " (rc=" + std::to_string(code) + ")";
}

bool SshSession::session_alive() const {
    int err = libssh2_session_last_errno(session_);
    return err != LIBSSH2_ERROR_SOCKET_DISCONNECT &&
           err != LIBSSH2_ERROR_SOCKET_SEND &&
           err != LIBSSH2_ERROR_SOCKET_RECV &&
           err != LIBSSH2_ERROR_TIMEOUT;
}

void SshSession::handshake() {
    session_ = libssh2_session_init();
    if (!session_) {
        throw ConnectionError("[" + label_ + "] libssh2_session_init failed");
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, (long)target_.timeout_s * 1000L);
    if (libssh2_session_handshake(session_, transport_fd()) != 0) {
        throw ConnectionError("[" + label_ + "] SSH handshake failed: " + last_error());
    }
}

// ============================================================
// Host key (accept-new)
// ============================================================

void SshSession::verify_host_key() {
    if (!opts_.verify_host_key) {
        LOG_WARN("[" + label_ + "] host key verification disabled");
        return;
    }

    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key) {
        throw ConnectionError("[" + label_ + "] server sent no host key");
    }

    int alg = 0;
    switch (key_type) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:       alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA; break;
        case LIBSSH2_HOSTKEY_TYPE_DSS:       alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521; break;
        case LIBSSH2_HOSTKEY_TYPE_ED25519:   alg = LIBSSH2_KNOWNHOST_KEY_ED25519; break;
        default:                             alg = LIBSSH2_KNOWNHOST_KEY_UNKNOWN; break;
    }

    std::string kh_path = utils::expand_user(opts_.known_hosts);
    // Held across read, check and append so concurrent sessions see each other's entries
    KnownHostsFile kh_file(kh_path);

    LIBSSH2_KNOWNHOSTS* kh = libssh2_knownhost_init(session_);
    if (!kh) {
        throw ConnectionError("[" + label_ + "] cannot initialise known_hosts");
    }
    std::error_code ec;
    if (fs::exists(kh_path, ec)) {
        if (libssh2_knownhost_readfile(kh, kh_path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
            LOG_WARN("[" + label_ + "] cannot parse " + kh_path + ", treating as empty");
        }
    }

    struct libssh2_knownhost* found = nullptr;
    int mask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    int check = libssh2_knownhost_checkp(kh, target_.hostname.c_str(), target_.port,
                                         key, key_len, mask, &found);

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(kh);
        return;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        libssh2_knownhost_free(kh);
        throw ConnectionError("[" + label_ + "] host key for " + target_.hostname +
                              " does not match " + kh_path + " (possible man-in-the-middle)");
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_FAILURE) {
        libssh2_knownhost_free(kh);
        throw ConnectionError("[" + label_ + "] host key check failed: " + last_error());
    }

    // Not found: trust on first use and append the single new entry
    std::string entry_host = target_.hostname;
    if (target_.port != 22) entry_host = "[" + entry_host + "]:" + std::to_string(target_.port);
    struct libssh2_knownhost* added = nullptr;
    int rc = libssh2_knownhost_addc(kh, entry_host.c_str(), nullptr, key, key_len,
                                    nullptr, 0, mask, &added);
    std::string line;
    if (rc == 0) {
        std::vector<char> buf(8192);
        size_t out_len = 0;
        rc = libssh2_knownhost_writeline(kh, added, buf.data(), buf.size(), &out_len,
                                         LIBSSH2_KNOWNHOST_FILE_OPENSSH);
        if (rc == 0) line.assign(buf.data(), out_len);
    }
    libssh2_knownhost_free(kh);
    if (rc != 0) {
        LOG_WARN("[" + label_ + "] accepted new host key but could not format it (rc=" +
                 std::to_string(rc) + ")");
        return;
    }
    try {
        kh_file.append(line);
        LOG_INFO("[" + label_ + "] added host key for " + entry_host + " to " + kh_path);
    } catch (const std::exception& e) {
        LOG_WARN("[" + label_ + "] accepted new host key but could not record it: " +
                 std::string(e.what()));
    }
}

// ============================================================
// Authentication
// ============================================================

void SshSession::authenticate() {
    const std::string& user = target_.username;
    // Asking for the method list performs "none" authentication
    char* list = libssh2_userauth_list(session_, user.c_str(), (unsigned int)user.size());
    if (!list && libssh2_userauth_authenticated(session_)) {
        attempted_.push_back("none");
        LOG_INFO("[" + label_ + "] server accepted \"none\" authentication");
        return;
    }
    if (!list && !session_alive()) {
        throw ConnectionError("[" + label_ + "] connection lost before authentication: " + last_error());
    }
    std::string offered = list ? list : "";
    LOG_DEBUG("[" + label_ + "] server offers: " + offered);

    for (const auto& c : target_.candidates) {
        if (try_candidate(c, offered)) {
            LOG_DEBUG("[" + label_ + "] authenticated via " + c.describe());
            return;
        }
        if (!session_alive()) {
            LOG_WARN("[" + label_ + "] server closed the connection during authentication");
            break;
        }
    }
    throw AuthenticationExhausted(label_, attempted_);
}

bool SshSession::try_candidate(const CredentialCandidate& c, const std::string& offered) {
    const std::string& user = target_.username;
    switch (c.kind) {
        case CredentialKind::KEY_FILE:
        case CredentialKind::DISCOVERED_KEY:
        case CredentialKind::SSH_CONFIG_IDENTITY: {
            if (!method_offered(offered, "publickey")) return false;
            attempted_.push_back(c.describe());
            int rc = libssh2_userauth_publickey_fromfile(session_, user.c_str(), nullptr,
                                                         c.path.c_str(), nullptr);
            if (rc == 0) return true;
            LOG_DEBUG("[" + label_ + "] publickey " + c.path + " rejected: " + last_error());
            return false;
        }
        case CredentialKind::AGENT:
            if (!method_offered(offered, "publickey")) return false;
            return agent_userauth(session_, user, label_, attempted_);
        case CredentialKind::PASSWORD:
            return try_password(c.secret, offered);
        case CredentialKind::NO_CREDENTIAL:
            // "none" was already refused by the method list query
            attempted_.push_back("none");
            return false;
    }
    return false;
}

bool SshSession::try_password(const std::string& secret, const std::string& offered) {
    const std::string& user = target_.username;
    if (method_offered(offered, "password")) {
        attempted_.push_back("password");
        int rc = libssh2_userauth_password(session_, user.c_str(), secret.c_str());
        if (rc == 0) return true;
        LOG_DEBUG("[" + label_ + "] password rejected: " + last_error());
        if (!session_alive()) return false;
    }
    if (!offered.empty() && method_offered(offered, "keyboard-interactive")) {
        attempted_.push_back("keyboard-interactive");
        void** abs = libssh2_session_abstract(session_);
        void* saved = abs ? *abs : nullptr;
        if (abs) *abs = const_cast<std::string*>(&secret);
        int rc = libssh2_userauth_keyboard_interactive(session_, user.c_str(), kbdint_callback);
        if (abs) *abs = saved;
        if (rc == 0) return true;
        LOG_DEBUG("[" + label_ + "] keyboard-interactive rejected: " + last_error());
    }
    return false;
}

// ============================================================
// SFTP
// ============================================================

LIBSSH2_SFTP* SshSession::sftp() {
    if (sftp_) return sftp_;
    if (!session_) throw TransferError("[" + label_ + "] session is closed");
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        throw TransferError("[" + label_ + "] cannot start SFTP subsystem: " + last_error());
    }
    return sftp_;
}

std::optional<u64> SshSession::remote_size(const std::string& remote_path) {
    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    int rc = libssh2_sftp_stat_ex(sftp(), remote_path.c_str(), (unsigned int)remote_path.size(),
                                  LIBSSH2_SFTP_STAT, &attrs);
    if (rc != 0) {
        if (libssh2_sftp_last_error(sftp_) == LIBSSH2_FX_NO_SUCH_FILE) return std::nullopt;
        if (!session_alive()) {
            throw TransferError("[" + label_ + "] stat " + remote_path + " failed: " + last_error());
        }
        return std::nullopt;
    }
    if (!(attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)) return std::nullopt;
    return (u64)attrs.filesize;
}

void SshSession::make_remote_dirs(const std::string& dir) {
    if (dir.empty() || dir == "/" || dir == ".") return;
    std::string prefix;
    size_t pos = 0;
    if (dir[0] == '/') {
        prefix = "/";
        pos = 1;
    }
    while (pos <= dir.size()) {
        size_t slash = dir.find('/', pos);
        if (slash == std::string::npos) slash = dir.size();
        std::string part = dir.substr(pos, slash - pos);
        pos = slash + 1;
        if (part.empty()) continue;
        if (!prefix.empty() && prefix.back() != '/') prefix += "/";
        prefix += part;

        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        if (libssh2_sftp_stat_ex(sftp(), prefix.c_str(), (unsigned int)prefix.size(),
                                 LIBSSH2_SFTP_STAT, &attrs) == 0) {
            continue;
        }
        if (libssh2_sftp_mkdir(sftp_, prefix.c_str(), 0755) != 0) {
            // A concurrent mkdir may have won
            if (libssh2_sftp_stat_ex(sftp_, prefix.c_str(), (unsigned int)prefix.size(),
                                     LIBSSH2_SFTP_STAT, &attrs) != 0) {
                throw TransferError("[" + label_ + "] cannot create remote directory " + prefix +
                                    ": " + last_error());
            }
        } else {
            LOG_DEBUG("[" + label_ + "] created remote directory " + prefix);
        }
    }
}

u64 SshSession::transfer_file(const std::string& local_path,
                              const std::string& remote_path,
                              u64 start_offset,
                              const ChunkAckFn& on_ack) {
    std::unique_ptr<file_io::MmapReader> reader;
    try {
        reader.reset(new file_io::MmapReader(local_path));
    } catch (const std::exception& e) {
        throw TransferError("[" + label_ + "] " + std::string(e.what()));
    }
    u64 total = reader->size();
    if (start_offset > total) {
        throw TransferError("[" + label_ + "] resume offset " + std::to_string(start_offset) +
                            " beyond local size " + std::to_string(total));
    }

    size_t slash = remote_path.find_last_of('/');
    if (slash != std::string::npos && slash > 0) {
        make_remote_dirs(remote_path.substr(0, slash));
    }

    unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT;
    if (start_offset == 0) flags |= LIBSSH2_FXF_TRUNC;
    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open_ex(sftp(), remote_path.c_str(),
                                                   (unsigned int)remote_path.size(), flags, 0644,
                                                   LIBSSH2_SFTP_OPENFILE);
    if (!fh) {
        throw TransferError("[" + label_ + "] cannot open remote " + remote_path + ": " + last_error());
    }
    if (start_offset > 0) libssh2_sftp_seek64(fh, (libssh2_uint64_t)start_offset);

    u64 offset = start_offset;
    while (offset < total) {
        const char* p = reader->chunk_ptr(offset);
        u64 len = reader->chunk_len(offset, opts_.chunk_size);
        u64 remain = len;
        while (remain > 0) {
            ssize_t w = libssh2_sftp_write(fh, p, (size_t)remain);
            if (w < 0) {
                std::string err = last_error();
                libssh2_sftp_close(fh);
                throw TransferError("[" + label_ + "] write to " + remote_path + " failed at " +
                                    std::to_string(offset) + ": " + err, offset - start_offset);
            }
            p += w;
            remain -= (u64)w;
        }
        offset += len;
        if (on_ack) on_ack(offset);
    }

    if (libssh2_sftp_close(fh) != 0) {
        throw TransferError("[" + label_ + "] closing " + remote_path + " failed: " + last_error(),
                            offset - start_offset);
    }
    return offset - start_offset;
}

// ============================================================
// Remote execution
// ============================================================

ExecResult SshSession::execute_remote(const std::string& command) {
    if (!session_) throw ExecutionError("[" + label_ + "] session is closed");

    LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(session_);
    if (!ch) {
        throw ExecutionError("[" + label_ + "] cannot open channel: " + last_error());
    }
    if (libssh2_channel_exec(ch, command.c_str()) != 0) {
        std::string err = last_error();
        libssh2_channel_free(ch);
        throw ExecutionError("[" + label_ + "] exec failed: " + err);
    }

    // Drain stdout and stderr together so neither window stalls the command
    ExecResult res;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(opts_.exec_timeout_s);
    libssh2_session_set_blocking(session_, 0);
    char buf[16384];
    bool failed = false;
    std::string why;
    for (;;) {
        bool progressed = false;
        ssize_t n = libssh2_channel_read(ch, buf, sizeof(buf));
        if (n > 0) {
            res.stdout_text.append(buf, (size_t)n);
            progressed = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            failed = true;
            why = last_error();
            break;
        }
        ssize_t e = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
        if (e > 0) {
            res.stderr_text.append(buf, (size_t)e);
            progressed = true;
        } else if (e < 0 && e != LIBSSH2_ERROR_EAGAIN) {
            failed = true;
            why = last_error();
            break;
        }
        if (libssh2_channel_eof(ch)) break;
        if (progressed) continue;

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            failed = true;
            why = "timed out after " + std::to_string(opts_.exec_timeout_s) + "s";
            break;
        }
        pollfd pfd{};
        pfd.fd = transport_fd();
        int dir = libssh2_session_block_directions(session_);
        if (dir & LIBSSH2_SESSION_BLOCK_INBOUND)  pfd.events |= POLLIN;
        if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) pfd.events |= POLLOUT;
        if (pfd.events == 0) pfd.events = POLLIN;
        int wait_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        ::poll(&pfd, 1, wait_ms < 1000 ? wait_ms : 1000);
    }
    libssh2_session_set_blocking(session_, 1);

    if (failed) {
        libssh2_channel_free(ch);
        throw ExecutionError("[" + label_ + "] remote command did not complete: " + why,
                             res.stdout_text, res.stderr_text);
    }

    libssh2_channel_close(ch);
    libssh2_channel_wait_closed(ch);
    res.exit_code = libssh2_channel_get_exit_status(ch);
    libssh2_channel_free(ch);
    LOG_DEBUG("[" + label_ + "] remote command exited with " + std::to_string(res.exit_code));
    return res;
}
