#pragma once

// ============================================================
// run_config.hpp -- JSON run configuration
//
// Environment layers are resolved first (process env, env_files,
// "env"), then every string in the document is expanded, then the
// targets are built.
// ============================================================

#include "env_layers.hpp"
#include "post_action.hpp"
#include "../transport/target.hpp"
#include <string>
#include <vector>

struct ArtifactConfig {
    std::string local_path;
    std::string remote_path;
    std::string source;        // optional tarball to compress into local_path
};

struct TargetConfig {
    Target     target;
    PostAction post;           // per-target override, monostate when unset
};

struct RunConfig {
    std::string      config_path;
    EnvMap           env;                    // merged layers
    std::string      state_dir{"~/.cargoline"};
    ArtifactConfig   artifact;
    TransportOptions transport;              // global options
    std::string      ssh_config{"~/.ssh/config"};
    std::string      known_hosts{"~/.ssh/known_hosts"};
    int              retention_days{7};
    PostAction       post;                   // global post action
    std::vector<TargetConfig> targets;

    // Read and parse a file. Throws std::runtime_error.
    static RunConfig load(const std::string& path);

    // Parse JSON text. Relative env_files resolve against base_dir.
    static RunConfig parse(const std::string& text, const std::string& base_dir,
                           const EnvMap& process_env);

    // Human-readable problems; empty when the config is usable
    std::vector<std::string> validate() const;
};
