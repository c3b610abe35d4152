// ============================================================
// run_config.cpp -- JSON run configuration loader
// ============================================================

#include "run_config.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <nlohmann/json.hpp>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace {

[[noreturn]] void bad(const std::string& where, const std::string& what) {
    throw std::runtime_error("config: " + where + ": " + what);
}

// Expand every string value below 'j' in place
void expand_tree(json& j, const EnvMap& vars) {
    if (j.is_string()) {
        j = EnvLayers::expand(j.get<std::string>(), vars);
    } else if (j.is_object() || j.is_array()) {
        for (auto& child : j) expand_tree(child, vars);
    }
}

std::optional<std::string> opt_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_string()) bad(where + "." + key, "expected a string");
    return j[key].get<std::string>();
}

// Numbers may arrive as strings after variable expansion
std::optional<i64> opt_int(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    const json& v = j[key];
    if (v.is_number_unsigned()) {
        if (v.get<u64>() > (u64)std::numeric_limits<i64>::max()) bad(where + "." + key, "out of range");
        return (i64)v.get<u64>();
    }
    if (v.is_number_integer()) return v.get<i64>();
    if (v.is_string()) {
        u64 n = 0;
        try {
            n = utils::parse_u64(v.get<std::string>());
        } catch (const std::logic_error&) {
            bad(where + "." + key, "expected an integer, got '" + v.get<std::string>() + "'");
        }
        if (n > (u64)std::numeric_limits<i64>::max()) bad(where + "." + key, "out of range");
        return (i64)n;
    }
    bad(where + "." + key, "expected an integer");
}

std::optional<bool> opt_bool(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    const json& v = j[key];
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_string()) {
        try {
            return utils::parse_bool(v.get<std::string>());
        } catch (const std::invalid_argument& e) {
            bad(where + "." + key, e.what());
        }
    }
    bad(where + "." + key, "expected a boolean");
}

TransportOptions parse_options(const json& j, const std::string& where) {
    TransportOptions o;
    if (j.is_null()) return o;
    if (!j.is_object()) bad(where, "expected an object");
    o.user     = opt_string(j, "user", where);
    o.key_file = opt_string(j, "key_file", where);
    o.password = opt_string(j, "password", where);
    o.allow_agent   = opt_bool(j, "allow_agent", where);
    o.look_for_keys = opt_bool(j, "look_for_keys", where);
    if (auto p = opt_int(j, "port", where)) {
        if (*p > 65535 || !utils::validate_port((int)*p)) bad(where + ".port", "out of range");
        o.port = (u16)*p;
    }
    if (auto t = opt_int(j, "timeout", where)) {
        if (*t < 1 || *t > MAX_TIMEOUT_S) {
            bad(where + ".timeout", "must be between 1 and " + std::to_string(MAX_TIMEOUT_S) + " seconds");
        }
        o.timeout_s = (int)*t;
    }
    return o;
}

// Fields set in 'src' replace those in 'dst'
void overlay(TransportOptions& dst, const TransportOptions& src) {
    if (src.user)          dst.user = src.user;
    if (src.port)          dst.port = src.port;
    if (src.key_file)      dst.key_file = src.key_file;
    if (src.password)      dst.password = src.password;
    if (src.allow_agent)   dst.allow_agent = src.allow_agent;
    if (src.look_for_keys) dst.look_for_keys = src.look_for_keys;
    if (src.timeout_s)     dst.timeout_s = src.timeout_s;
}

PostAction parse_post(const json& j, const std::string& where) {
    if (j.is_null()) return std::monostate{};
    if (!j.is_object()) bad(where, "expected an object");
    // {"type": ..., "options": {...}} nests the command one level down
    const json& body = (j.contains("options") && j["options"].is_object()) ? j["options"] : j;
    auto cmd = opt_string(body, "command", where);
    if (!cmd) bad(where, "'command' is required");
    RemoteCommand rc;
    rc.command       = *cmd;
    rc.use_sudo      = opt_bool(body, "use_sudo", where).value_or(false);
    rc.sudo_password = opt_string(body, "sudo_password", where);
    return rc;
}

const json& member_or_null(const json& j, const char* key) {
    static const json null_value;
    if (j.is_object() && j.contains(key)) return j[key];
    return null_value;
}

} // namespace

RunConfig RunConfig::load(const std::string& path) {
    auto text = file_io::read_text_file(path);
    if (!text) {
        throw std::runtime_error("config: cannot read " + path);
    }
    std::string base = fs::path(file_io::normalize_path(path)).parent_path().string();
    RunConfig cfg = parse(*text, base, EnvLayers::process_env());
    cfg.config_path = path;
    LOG_INFO("Loaded configuration from " + path + " (" + std::to_string(cfg.targets.size()) +
             " target(s))");
    return cfg;
}

RunConfig RunConfig::parse(const std::string& text, const std::string& base_dir,
                           const EnvMap& process_env) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("config: invalid JSON: ") + e.what());
    }
    if (!doc.is_object()) bad("<root>", "expected an object");

    RunConfig cfg;

    // ---- environment layers ----
    EnvLayers layers;
    layers.push("process", process_env);

    const json& files = member_or_null(doc, "env_files");
    if (!files.is_null()) {
        if (!files.is_array()) bad("env_files", "expected an array");
        EnvMap from_files;
        for (const auto& f : files) {
            if (!f.is_string()) bad("env_files", "expected strings");
            std::string p = utils::expand_user(EnvLayers::expand(f.get<std::string>(), process_env));
            if (fs::path(p).is_relative() && !base_dir.empty()) p = (fs::path(base_dir) / p).string();
            for (auto& kv : EnvLayers::load_file(p)) from_files[kv.first] = kv.second;
        }
        layers.push("env_files", std::move(from_files));
    }

    const json& direct = member_or_null(doc, "env");
    if (!direct.is_null()) {
        if (!direct.is_object()) bad("env", "expected an object");
        EnvMap m;
        for (auto it = direct.begin(); it != direct.end(); ++it) {
            if (it.value().is_string())      m[it.key()] = it.value().get<std::string>();
            else if (!it.value().is_null())  m[it.key()] = it.value().dump();
        }
        layers.push("env", std::move(m));
    }
    cfg.env = layers.merged();

    // ---- expand everything but the layers themselves ----
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (it.key() == "env" || it.key() == "env_files") continue;
        expand_tree(it.value(), cfg.env);
    }

    if (auto s = opt_string(doc, "state_dir", "state_dir")) cfg.state_dir = *s;

    const json& art = member_or_null(doc, "artifact");
    if (!art.is_null()) {
        if (!art.is_object()) bad("artifact", "expected an object");
        cfg.artifact.local_path  = opt_string(art, "local_path", "artifact").value_or("");
        cfg.artifact.remote_path = opt_string(art, "remote_path", "artifact").value_or("");
        cfg.artifact.source      = opt_string(art, "source", "artifact").value_or("");
    }

    const json& transport = member_or_null(doc, "transport");
    if (!transport.is_null()) {
        if (!transport.is_object()) bad("transport", "expected an object");
        cfg.transport = parse_options(member_or_null(transport, "options"), "transport.options");
        if (auto s = opt_string(transport, "ssh_config", "transport"))  cfg.ssh_config = *s;
        if (auto s = opt_string(transport, "known_hosts", "transport")) cfg.known_hosts = *s;
    }

    const json& resume = member_or_null(doc, "resume");
    if (!resume.is_null()) {
        if (auto d = opt_int(resume, "retention_days", "resume")) {
            if (*d <= 0) bad("resume.retention_days", "must be positive");
            cfg.retention_days = (int)*d;
        }
    }

    cfg.post = parse_post(member_or_null(doc, "post_instructions"), "post_instructions");

    // ---- targets ----
    const json& targets = member_or_null(doc, "targets");
    if (!targets.is_null()) {
        if (!targets.is_array()) bad("targets", "expected an array");
        for (size_t i = 0; i < targets.size(); ++i) {
            const json& t = targets[i];
            std::string where = "targets[" + std::to_string(i) + "]";
            if (!t.is_object()) bad(where, "expected an object");
            auto host = opt_string(t, "host", where);
            if (!host || host->empty()) {
                LOG_WARN("Target " + std::to_string(i) + " has no 'host', skipping");
                continue;
            }

            TargetConfig tc;
            tc.target.host = *host;
            // Lowest: fields on the target itself
            TransportOptions opts = parse_options(t, where);
            overlay(opts, parse_options(member_or_null(member_or_null(t, "transport"), "options"),
                                        where + ".transport.options"));
            overlay(opts, parse_options(member_or_null(t, "ssh_options"), where + ".ssh_options"));
            tc.target.options = opts;
            tc.post = parse_post(member_or_null(t, "post_instructions"), where + ".post_instructions");
            cfg.targets.push_back(std::move(tc));
        }
    }
    return cfg;
}

std::vector<std::string> RunConfig::validate() const {
    std::vector<std::string> problems;
    if (targets.empty()) problems.push_back("no targets specified");
    if (artifact.local_path.empty()) problems.push_back("artifact.local_path is required");
    if (artifact.remote_path.empty()) problems.push_back("artifact.remote_path is required");
    if (!artifact.source.empty() && artifact.source == artifact.local_path) {
        problems.push_back("artifact.source and artifact.local_path must differ");
    }
    for (const auto& t : targets) {
        const auto* rc = std::get_if<RemoteCommand>(&t.post);
        if (rc && utils::trim(rc->command).empty()) {
            problems.push_back("empty post_instructions command for " + t.target.host);
        }
    }
    return problems;
}
