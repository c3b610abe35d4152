#pragma once

// ============================================================
// env_layers.hpp -- Ordered environment layers and $VAR expansion
// ============================================================

#include <map>
#include <string>
#include <utility>
#include <vector>

using EnvMap = std::map<std::string, std::string>;

// Layers merged in push order; a later layer overrides an earlier one
class EnvLayers {
public:
    void push(std::string name, EnvMap layer) {
        layers_.emplace_back(std::move(name), std::move(layer));
    }

    EnvMap merged() const;

    size_t size() const { return layers_.size(); }

    // Snapshot of the process environment
    static EnvMap process_env();

    // KEY=VALUE lines, '#' comments, optional matching quotes around the
    // value. A missing file logs a warning and yields an empty map.
    static EnvMap load_file(const std::string& path);

    // Expand $VAR, ${VAR}, ${VAR:-default} and ${VAR:?message}.
    // Unknown plain references are left untouched. Throws
    // std::runtime_error when a ${VAR:?} variable is unset.
    static std::string expand(const std::string& value, const EnvMap& vars);

private:
    std::vector<std::pair<std::string, EnvMap>> layers_;
};
