#pragma once

// ============================================================
// ssh_config.hpp -- OpenSSH client config lookup table
//
// Only the keywords that shape a connection are kept:
// Host, HostName, User, Port, IdentityFile, ProxyCommand, ProxyJump.
// Everything else is ignored. Loaded once per run.
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>
#include <optional>

struct SshHostEntry {
    std::optional<std::string> hostname;
    std::optional<std::string> user;
    std::optional<u16>         port;
    std::vector<std::string>   identity_files;  // '~' already expanded
    std::optional<std::string> proxy_command;   // raw, %-tokens unexpanded
    std::optional<std::string> proxy_jump;      // "none" disables either

    bool empty() const {
        return !hostname && !user && !port && identity_files.empty() &&
               !proxy_command && !proxy_jump;
    }

    // Command to reach the host through, "" for a direct connection.
    // Whichever of ProxyCommand / ProxyJump was set first wins.
    std::string proxy() const;
};

class SshConfig {
public:
    SshConfig() = default;

    // Parse a config file. A missing file yields an empty table.
    // Throws std::runtime_error on an unreadable file or a bad Port.
    static SshConfig load(const std::string& path);

    // Parse config text ('origin' names the source in error messages)
    static SshConfig parse(const std::string& text, const std::string& origin = "<string>");

    // Merge every block matching 'alias', first value wins per keyword
    SshHostEntry lookup(const std::string& alias) const;

    size_t block_count() const { return blocks_.size(); }

    // OpenSSH-style glob with '*' and '?'
    static bool pattern_match(const std::string& pattern, const std::string& text);

private:
    struct Block {
        std::vector<std::string> patterns;   // "!" prefix negates
        SshHostEntry             entry;
    };

    static bool block_matches(const Block& b, const std::string& alias);

    std::vector<Block> blocks_;
};
