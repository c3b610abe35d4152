#pragma once

// ============================================================
// credentials.hpp -- Credential resolution for one target
//
// Turns a Target plus the global transport options and the SSH
// client config into the identity (user/host/port) and the
// ordered list of credential candidates to try. Pure apart from
// existence checks on key files.
// ============================================================

#include "target.hpp"
#include "ssh_config.hpp"
#include <string>
#include <vector>

class CredentialResolver {
public:
    // key_dir: where id_rsa & co. are discovered (default "~/.ssh")
    explicit CredentialResolver(std::string key_dir = "~/.ssh");

    // Keys probed in key_dir, in this order
    static const std::vector<std::string>& discoverable_key_names();

    // Resolve 'target'. 'ssh_config' may be null.
    // Never throws for missing keys; they are logged and listed in skipped.
    ResolvedTarget resolve(const Target& target,
                           const TransportOptions& global,
                           const SshConfig* ssh_config) const;

    const std::string& key_dir() const { return key_dir_; }

private:
    std::string key_dir_;
};
