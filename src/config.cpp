#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace toolhost {

nlohmann::json Config::defaults_json() {
    return {
        {"tools", nlohmann::json::object()},
        {"tool_dir", ""},
        {"redact", nlohmann::json::array()},
        {"timeouts", {
            {"jsonrpc_startup_ms", 10000},
            {"mcp_startup_ms", 15000},
            {"startup_grace_ms", 50},
            {"shutdown_grace_ms", 3000}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_timeout(const nlohmann::json& t, const char* key, uint32_t& out) {
    if (!t.contains(key)) return;
    if (!t[key].is_number_unsigned()) {
        throw std::runtime_error(std::string("config: timeouts.") + key +
                                 " must be a non-negative integer");
    }
    out = t[key].get<uint32_t>();
}

std::string Config::default_path() {
    if (const char* v = std::getenv("TOOLHOST_CONFIG")) {
        if (*v) return v;
    }
    return expand_home("~/.toolhost/config.json");
}

Config Config::load() {
    return load_from(default_path());
}

Config Config::load_from(const std::string& path) {
    nlohmann::json j = defaults_json();

    std::ifstream file(path);
    if (file.is_open()) {
        nlohmann::json original = nlohmann::json::parse(file, nullptr, false);
        if (original.is_discarded() || !original.is_object()) {
            std::cerr << "[config] warning: " << path << " is not a JSON object, using defaults\n";
        } else {
            j = merge_defaults(original, defaults_json());
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    return cfg;
}

Config Config::from_json(const nlohmann::json& input) {
    nlohmann::json j = merge_defaults(input.is_object() ? input : nlohmann::json::object(),
                                      defaults_json());
    Config cfg;

    if (j["tools"].is_object()) {
        for (auto& [alias, path] : j["tools"].items()) {
            if (!path.is_string()) {
                throw std::runtime_error("config: tools." + alias + " must be a path string");
            }
            cfg.tools[alias] = path.get<std::string>();
        }
    }

    if (j["tool_dir"].is_string())
        cfg.tool_dir = j["tool_dir"].get<std::string>();

    if (j["redact"].is_array()) {
        for (const auto& rule : j["redact"]) {
            if (!rule.is_object() || !rule.contains("pattern") || !rule["pattern"].is_string()) {
                throw std::runtime_error("config: each redact rule needs a string \"pattern\"");
            }
            RedactionRule r;
            r.pattern = rule["pattern"].get<std::string>();
            if (rule.contains("replace") && rule["replace"].is_string())
                r.replace = rule["replace"].get<std::string>();
            cfg.redact.push_back(std::move(r));
        }
    }
    try {
        compile_redaction_rules(cfg.redact);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("config: ") + e.what());
    }

    if (j["timeouts"].is_object()) {
        const auto& t = j["timeouts"];
        read_timeout(t, "jsonrpc_startup_ms", cfg.timeouts.jsonrpc_startup_ms);
        read_timeout(t, "mcp_startup_ms", cfg.timeouts.mcp_startup_ms);
        read_timeout(t, "startup_grace_ms", cfg.timeouts.startup_grace_ms);
        read_timeout(t, "shutdown_grace_ms", cfg.timeouts.shutdown_grace_ms);
    }
    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* v = std::getenv("TOOLHOST_TOOL_DIR"))
        tool_dir = v;
    if (const char* v = std::getenv("TOOLHOST_SHUTDOWN_GRACE_MS")) {
        std::string s = trim(v);
        if (!is_all_digits(s) || s.size() > 9) {
            throw std::runtime_error("TOOLHOST_SHUTDOWN_GRACE_MS must be a number of milliseconds");
        }
        timeouts.shutdown_grace_ms = static_cast<uint32_t>(std::stoul(s));
    }
}

} // namespace toolhost
