#pragma once
#include "redaction.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace toolhost {

struct TimeoutConfig {
    uint32_t jsonrpc_startup_ms = 10000;
    uint32_t mcp_startup_ms = 15000;
    uint32_t startup_grace_ms = 50;
    uint32_t shutdown_grace_ms = 3000;
};

struct Config {
    std::map<std::string, std::string> tools;  // alias -> definition path
    std::string tool_dir;
    std::vector<RedactionRule> redact;
    TimeoutConfig timeouts;

    // $TOOLHOST_CONFIG, else ~/.toolhost/config.json, then env overrides
    static Config load();

    // Missing file -> defaults; malformed file -> defaults with a warning.
    // Env overrides applied. Throws std::runtime_error on invalid values.
    static Config load_from(const std::string& path);

    // Throws std::runtime_error on invalid values. No env overrides.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // TOOLHOST_TOOL_DIR, TOOLHOST_SHUTDOWN_GRACE_MS
    void apply_env_overrides();

    static std::string default_path();
};

} // namespace toolhost
