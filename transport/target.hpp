#pragma once

// ============================================================
// target.hpp -- Remote endpoints and their transport options
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>
#include <optional>

// Upper bound for connect/handshake timeouts, in seconds
constexpr int MAX_TIMEOUT_S = 86400;

// Connection/auth settings. Used per target and as the global
// transport-level defaults; every field is optional so the resolver
// can tell "not configured" from "configured".
struct TransportOptions {
    std::optional<std::string> user;
    std::optional<u16>         port;
    std::optional<std::string> key_file;
    std::optional<std::string> password;
    std::optional<bool>        allow_agent;
    std::optional<bool>        look_for_keys;
    std::optional<int>         timeout_s;
};

// One remote endpoint, immutable during a run
struct Target {
    std::string      host;      // address or ssh_config alias
    TransportOptions options;   // per-target overrides

    // "user@host:port" with whatever is known
    std::string label() const {
        std::string s;
        if (options.user) s += *options.user + "@";
        s += host;
        if (options.port) s += ":" + std::to_string(*options.port);
        return s;
    }
};

enum class CredentialKind {
    KEY_FILE,             // explicit key file (per-target or global)
    AGENT,                // keys offered by ssh-agent
    DISCOVERED_KEY,       // id_* found in the key directory
    PASSWORD,
    SSH_CONFIG_IDENTITY,  // IdentityFile from the ssh client config
    NO_CREDENTIAL,        // default username, "none" authentication
};

inline const char* credential_kind_str(CredentialKind k) {
    switch (k) {
        case CredentialKind::KEY_FILE:            return "key_file";
        case CredentialKind::AGENT:               return "agent";
        case CredentialKind::DISCOVERED_KEY:      return "discovered_key";
        case CredentialKind::PASSWORD:            return "password";
        case CredentialKind::SSH_CONFIG_IDENTITY: return "ssh_config_identity";
        case CredentialKind::NO_CREDENTIAL:       return "none";
    }
    return "?";
}

struct CredentialCandidate {
    CredentialKind kind;
    std::string    path;     // key file path (key kinds only)
    std::string    secret;   // password (PASSWORD only)

    // Diagnostic name, never contains the secret
    std::string describe() const {
        switch (kind) {
            case CredentialKind::KEY_FILE:
            case CredentialKind::DISCOVERED_KEY:
            case CredentialKind::SSH_CONFIG_IDENTITY:
                return "publickey:" + path;
            case CredentialKind::AGENT:         return "agent";
            case CredentialKind::PASSWORD:      return "password";
            case CredentialKind::NO_CREDENTIAL: return "none";
        }
        return "?";
    }
};

// Everything needed to open a session to one target
struct ResolvedTarget {
    std::string alias;       // Target::host as configured
    std::string hostname;    // after ssh_config HostName
    u16         port{22};
    std::string username;
    int         timeout_s{10};
    std::string proxy_command;   // unexpanded; empty means direct TCP
    std::vector<CredentialCandidate> candidates;  // in attempt order
    std::vector<std::string>         skipped;     // configured keys missing on disk
};
