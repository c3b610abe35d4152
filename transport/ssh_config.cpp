// ============================================================
// ssh_config.cpp -- OpenSSH client config parser
// ============================================================

#include "ssh_config.hpp"
#include "proxy_command.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <sstream>
#include <stdexcept>

// Split "Keyword value", "Keyword=value" or "Keyword = value"
static bool split_keyword(const std::string& line, std::string& key, std::string& value) {
    size_t i = 0;
    while (i < line.size() && line[i] != ' ' && line[i] != '\t' && line[i] != '=') ++i;
    key = line.substr(0, i);
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
    if (i < line.size() && line[i] == '=') ++i;
    value = utils::trim(line.substr(i));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return !key.empty();
}

SshConfig SshConfig::load(const std::string& path) {
    std::string expanded = utils::expand_user(path);
    std::error_code ec;
    if (!fs::exists(expanded, ec)) {
        LOG_DEBUG("SSH config not found at " + expanded);
        return SshConfig();
    }
    auto text = file_io::read_text_file(expanded);
    if (!text) {
        throw std::runtime_error("cannot read SSH config " + expanded);
    }
    SshConfig cfg = parse(*text, expanded);
    LOG_INFO("Loaded SSH config from " + expanded + " (" +
             std::to_string(cfg.block_count()) + " host blocks)");
    return cfg;
}

SshConfig SshConfig::parse(const std::string& text, const std::string& origin) {
    SshConfig cfg;
    // Options before the first Host line apply to every host
    cfg.blocks_.push_back(Block{{"*"}, {}});

    std::istringstream in(text);
    std::string raw;
    int line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        std::string line = utils::trim(raw);
        if (line.empty() || line[0] == '#') continue;

        std::string key, value;
        if (!split_keyword(line, key, value)) continue;
        key = utils::to_lower(key);
        Block& cur = cfg.blocks_.back();

        if (key == "host") {
            Block b;
            std::istringstream ps(value);
            std::string pat;
            while (ps >> pat) b.patterns.push_back(pat);
            cfg.blocks_.push_back(std::move(b));
        } else if (key == "hostname") {
            if (!cur.entry.hostname) cur.entry.hostname = value;
        } else if (key == "user") {
            if (!cur.entry.user) cur.entry.user = value;
        } else if (key == "port") {
            u64 p = 0;
            try {
                p = utils::parse_u64(value);
            } catch (const std::logic_error&) {
                p = 0;
            }
            if (p > 65535 || !utils::validate_port((int)p)) {
                throw std::runtime_error(origin + ":" + std::to_string(line_no) +
                                         ": invalid Port '" + value + "'");
            }
            if (!cur.entry.port) cur.entry.port = (u16)p;
        } else if (key == "proxycommand" || key == "proxyjump") {
            // The two are exclusive: the first one seen in a block wins
            if (!cur.entry.proxy_command && !cur.entry.proxy_jump) {
                if (key == "proxycommand") cur.entry.proxy_command = value;
                else                       cur.entry.proxy_jump = value;
            }
        } else if (key == "identityfile") {
            cur.entry.identity_files.push_back(utils::expand_user(value));
        } else if (key == "match") {
            LOG_DEBUG(origin + ":" + std::to_string(line_no) + ": Match blocks are not supported, ignored");
            cfg.blocks_.push_back(Block{});   // no patterns: never matches
        }
    }
    return cfg;
}

bool SshConfig::pattern_match(const std::string& pattern, const std::string& text) {
    size_t p = 0, t = 0;
    size_t star_p = std::string::npos, star_t = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' ||
            utils::to_lower(std::string(1, pattern[p])) == utils::to_lower(std::string(1, text[t])))) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star_p = p++;
            star_t = t;
        } else if (star_p != std::string::npos) {
            p = star_p + 1;
            t = ++star_t;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

bool SshConfig::block_matches(const Block& b, const std::string& alias) {
    bool matched = false;
    for (const auto& pat : b.patterns) {
        if (!pat.empty() && pat[0] == '!') {
            if (pattern_match(pat.substr(1), alias)) return false;
        } else if (pattern_match(pat, alias)) {
            matched = true;
        }
    }
    return matched;
}

SshHostEntry SshConfig::lookup(const std::string& alias) const {
    SshHostEntry out;
    for (const auto& b : blocks_) {
        if (!block_matches(b, alias)) continue;
        const SshHostEntry& e = b.entry;
        if (!out.hostname && e.hostname) out.hostname = e.hostname;
        if (!out.user && e.user)         out.user = e.user;
        if (!out.port && e.port)         out.port = e.port;
        for (const auto& id : e.identity_files) out.identity_files.push_back(id);
        if (!out.proxy_command && !out.proxy_jump) {
            out.proxy_command = e.proxy_command;
            out.proxy_jump    = e.proxy_jump;
        }
    }
    // "%h" in HostName stands for the alias itself
    if (out.hostname) {
        std::string h = *out.hostname;
        size_t pos;
        while ((pos = h.find("%h")) != std::string::npos) h.replace(pos, 2, alias);
        out.hostname = h;
    }
    return out;
}

std::string SshHostEntry::proxy() const {
    if (proxy_command) {
        return utils::to_lower(*proxy_command) == "none" ? "" : *proxy_command;
    }
    if (proxy_jump) {
        return utils::to_lower(*proxy_jump) == "none" ? "" : ProxyCommand::from_jump(*proxy_jump);
    }
    return "";
}
