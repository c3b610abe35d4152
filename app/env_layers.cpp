// ============================================================
// env_layers.cpp -- Environment layers
// ============================================================

#include "env_layers.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <sstream>
#include <stdexcept>

extern char** environ;

EnvMap EnvLayers::merged() const {
    EnvMap out;
    for (const auto& layer : layers_) {
        for (const auto& kv : layer.second) out[kv.first] = kv.second;
    }
    return out;
}

EnvMap EnvLayers::process_env() {
    EnvMap out;
    for (char** e = environ; e && *e; ++e) {
        std::string kv = *e;
        size_t eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        out[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    return out;
}

EnvMap EnvLayers::load_file(const std::string& path) {
    EnvMap out;
    std::string expanded = utils::expand_user(path);
    auto text = file_io::read_text_file(expanded);
    if (!text) {
        LOG_WARN("Environment file not found: " + expanded);
        return out;
    }

    std::istringstream in(*text);
    std::string raw;
    int line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        std::string line = utils::trim(raw);
        if (line.empty() || line[0] == '#') continue;
        if (line.compare(0, 7, "export ") == 0) line = utils::trim(line.substr(7));

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("Invalid line in " + expanded + ":" + std::to_string(line_no) + ", skipped");
            continue;
        }
        std::string key   = utils::trim(line.substr(0, eq));
        std::string value = utils::trim(line.substr(eq + 1));
        if (!value.empty() && (value[0] == '"' || value[0] == '\'')) {
            char q = value[0];
            if (value.size() >= 2 && value.back() == q) {
                value = value.substr(1, value.size() - 2);
            } else {
                LOG_WARN("Unclosed quote in " + expanded + ":" + std::to_string(line_no));
            }
        }
        if (!key.empty()) out[key] = value;
    }
    LOG_DEBUG("Loaded " + std::to_string(out.size()) + " variable(s) from " + expanded);
    return out;
}

static bool is_name_start(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

static bool is_name_char(char c) {
    return is_name_start(c) || (c >= '0' && c <= '9');
}

std::string EnvLayers::expand(const std::string& value, const EnvMap& vars) {
    std::string out;
    out.reserve(value.size());
    size_t i = 0;
    while (i < value.size()) {
        char c = value[i];
        if (c != '$' || i + 1 >= value.size()) {
            out += c;
            ++i;
            continue;
        }

        if (value[i + 1] == '{') {
            size_t close = value.find('}', i + 2);
            if (close == std::string::npos) {
                out += value.substr(i);
                break;
            }
            std::string expr = value.substr(i + 2, close - i - 2);
            std::string whole = value.substr(i, close - i + 1);
            i = close + 1;

            size_t op = expr.find(":-");
            if (op != std::string::npos) {
                std::string name = utils::trim(expr.substr(0, op));
                auto it = vars.find(name);
                out += (it != vars.end()) ? it->second : expr.substr(op + 2);
                continue;
            }
            op = expr.find(":?");
            if (op != std::string::npos) {
                std::string name = utils::trim(expr.substr(0, op));
                auto it = vars.find(name);
                if (it == vars.end()) {
                    throw std::runtime_error("Required variable not set: " + name +
                                             " (" + expr.substr(op + 2) + ")");
                }
                out += it->second;
                continue;
            }
            auto it = vars.find(expr);
            out += (it != vars.end()) ? it->second : whole;
            continue;
        }

        if (is_name_start(value[i + 1])) {
            size_t j = i + 1;
            while (j < value.size() && is_name_char(value[j])) ++j;
            std::string name = value.substr(i + 1, j - i - 1);
            auto it = vars.find(name);
            out += (it != vars.end()) ? it->second : value.substr(i, j - i);
            i = j;
            continue;
        }

        out += c;
        ++i;
    }
    return out;
}
