// ============================================================
// credentials.cpp -- Credential resolver
// ============================================================

#include "credentials.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>

static const char* kDefaultUser = "root";
static const u16   kDefaultPort = 22;
static const int   kDefaultTimeoutS = 10;

static bool key_present(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

static bool has_key(const std::vector<CredentialCandidate>& list, const std::string& path) {
    return std::any_of(list.begin(), list.end(), [&](const CredentialCandidate& c) {
        return !c.path.empty() && c.path == path;
    });
}

CredentialResolver::CredentialResolver(std::string key_dir)
    : key_dir_(utils::expand_user(key_dir)) {}

const std::vector<std::string>& CredentialResolver::discoverable_key_names() {
    static const std::vector<std::string> names = {
        "id_rsa", "id_ecdsa", "id_ed25519", "id_dsa",
    };
    return names;
}

ResolvedTarget CredentialResolver::resolve(const Target& target,
                                           const TransportOptions& global,
                                           const SshConfig* ssh_config) const {
    const TransportOptions& local = target.options;
    SshHostEntry sc;
    if (ssh_config) sc = ssh_config->lookup(target.host);

    ResolvedTarget rt;
    rt.alias    = target.host;
    rt.hostname = sc.hostname ? *sc.hostname : target.host;
    rt.proxy_command = sc.proxy();

    if (local.user)       rt.username = *local.user;
    else if (global.user) rt.username = *global.user;
    else if (sc.user)     rt.username = *sc.user;
    else                  rt.username = kDefaultUser;

    if (local.port)       rt.port = *local.port;
    else if (global.port) rt.port = *global.port;
    else if (sc.port)     rt.port = *sc.port;
    else                  rt.port = kDefaultPort;

    if (local.timeout_s)       rt.timeout_s = *local.timeout_s;
    else if (global.timeout_s) rt.timeout_s = *global.timeout_s;
    else                       rt.timeout_s = kDefaultTimeoutS;
    if (rt.timeout_s < 1 || rt.timeout_s > MAX_TIMEOUT_S) {
        int clamped = utils::clamp(rt.timeout_s, 1, MAX_TIMEOUT_S);
        LOG_WARN("[" + target.label() + "] timeout " + std::to_string(rt.timeout_s) + "s out of range, using " +
                 std::to_string(clamped) + "s");
        rt.timeout_s = clamped;
    }

    // ---- explicit key: per-target beats global, both must exist ----
    bool explicit_key = false;
    auto consider_key = [&](const std::optional<std::string>& key, const char* scope) {
        if (!key || key->empty() || explicit_key) return;
        std::string path = utils::expand_user(*key);
        if (key_present(path)) {
            rt.candidates.push_back({CredentialKind::KEY_FILE, path, {}});
            explicit_key = true;
        } else {
            LOG_WARN("[" + target.host + "] " + scope + " key file " + path +
                     " not found, skipping");
            rt.skipped.push_back(path);
        }
    };
    consider_key(local.key_file, "per-target");
    consider_key(global.key_file, "global");

    std::optional<std::string> password;
    if (local.password)       password = local.password;
    else if (global.password) password = global.password;

    // ---- ssh_config identities only when nothing more specific matched ----
    if (!explicit_key && !password) {
        for (const auto& id : sc.identity_files) {
            if (has_key(rt.candidates, id)) continue;
            if (key_present(id)) {
                rt.candidates.push_back({CredentialKind::SSH_CONFIG_IDENTITY, id, {}});
            } else {
                LOG_DEBUG("[" + target.host + "] IdentityFile " + id + " not found");
            }
        }
    }

    bool allow_agent = local.allow_agent.value_or(global.allow_agent.value_or(true));
    if (allow_agent) {
        rt.candidates.push_back({CredentialKind::AGENT, {}, {}});
    }

    bool look_for_keys = local.look_for_keys.value_or(global.look_for_keys.value_or(true));
    if (look_for_keys) {
        for (const auto& name : discoverable_key_names()) {
            std::string path = (fs::path(key_dir_) / name).string();
            if (has_key(rt.candidates, path)) continue;
            if (key_present(path)) {
                rt.candidates.push_back({CredentialKind::DISCOVERED_KEY, path, {}});
            }
        }
    }

    if (password) {
        rt.candidates.push_back({CredentialKind::PASSWORD, {}, *password});
    }

    if (rt.candidates.empty()) {
        rt.candidates.push_back({CredentialKind::NO_CREDENTIAL, {}, {}});
    }

    std::string order;
    for (const auto& c : rt.candidates) {
        if (!order.empty()) order += ", ";
        order += c.describe();
    }
    LOG_DEBUG("[" + target.host + "] " + rt.username + "@" + rt.hostname + ":" +
              std::to_string(rt.port) + " candidates: " + order);
    return rt;
}
