#include "cancel.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "tool_executor.hpp"
#include "version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

static std::atomic<toolhost::CancelToken*> g_cancel{nullptr};

static void signal_handler(int /*sig*/) {
    if (auto* token = g_cancel.load()) token->cancel();
}

static void print_usage() {
    std::cout << "Usage: toolhost [options] COMMAND\n"
              << "\n"
              << "Commands:\n"
              << "  --list                   List registered tools and their actions\n"
              << "  --validate ALIAS.ACTION  Check a prospective call without running it\n"
              << "  --run ALIAS.ACTION       Execute an action and print the result as JSON\n"
              << "\n"
              << "Options:\n"
              << "  --tool ALIAS=PATH        Register a tool definition (repeatable)\n"
              << "  --arg NAME=VALUE         Action argument (repeatable)\n"
              << "  --var NAME=VALUE         Ambient template variable (repeatable)\n"
              << "  --approved               Run an action that requires approval\n"
              << "  --timeout MS             Cancel the call after MS milliseconds\n"
              << "  --config PATH            Use PATH instead of the default config file\n"
              << "  -v, --version            Print version\n"
              << "  -h, --help               Show this help\n"
              << "\n"
              << "Exit status: 0 success, 1 error, 2 approval required.\n"
              << "\n"
              << "Environment variables:\n"
              << "  TOOLHOST_CONFIG             Config file (default: ~/.toolhost/config.json)\n"
              << "  TOOLHOST_TOOL_DIR           Base directory for relative tool paths\n"
              << "  TOOLHOST_SHUTDOWN_GRACE_MS  Grace period before workers are killed\n";
}

static bool split_pair(const char* text, std::string& key, std::string& value) {
    const char* eq = std::strchr(text, '=');
    if (eq == nullptr || eq == text) return false;
    key.assign(text, eq);
    value.assign(eq + 1);
    return true;
}

static bool split_target(const std::string& target, std::string& alias, std::string& action) {
    auto dot = target.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == target.size()) return false;
    alias = target.substr(0, dot);
    action = target.substr(dot + 1);
    return true;
}

static nlohmann::json result_to_json(const toolhost::ActionResult& r) {
    nlohmann::json out = {
        {"stdout", r.stdout_text},
        {"stderr", r.stderr_text},
        {"exit_code", r.exit_code},
        {"captures", r.captures},
        {"duration_ms", r.duration.count()},
        {"requires_approval", r.requires_approval},
        {"approval_min", r.approval_min},
        {"args", r.redacted_args},
    };
    if (r.usage) {
        out["usage"] = {
            {"prompt_tokens", r.usage->prompt_tokens},
            {"completion_tokens", r.usage->completion_tokens},
            {"total_tokens", r.usage->total_tokens},
            {"model", r.usage->model},
            {"estimated_cost", r.usage->estimated_cost},
        };
    }
    return out;
}

static nlohmann::json catalog_to_json(const toolhost::CapabilityCatalog& catalog) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& alias : catalog.aliases()) {
        auto def = catalog.get(alias);
        if (!def) continue;
        nlohmann::json actions = nlohmann::json::object();
        for (const auto& [name, action] : def->actions) {
            nlohmann::json args = nlohmann::json::array();
            for (const auto& [arg_name, spec] : action.args) {
                args.push_back(arg_name + (spec.required ? "" : "?"));
            }
            actions[name] = {{"description", action.description}, {"args", args}};
        }
        out[alias] = {
            {"name", def->name},
            {"transport", toolhost::transport_mode_name(def->transport)},
            {"source", catalog.source(alias)},
            {"actions", actions},
        };
    }
    return out;
}

int main(int argc, char* argv[]) try {
    enum class Command { None, List, Validate, Run };
    Command command = Command::None;
    std::string target;
    std::string config_path;
    std::vector<std::pair<std::string, std::string>> extra_tools;
    toolhost::ArgMap args;
    toolhost::ArgMap vars;
    bool approved = false;
    long timeout_ms = 0;

    for (int i = 1; i < argc; i++) {
        std::string key;
        std::string value;
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            std::cout << "toolhost " << toolhost::kVersion << "\n";
            return 0;
        } else if (std::strcmp(argv[i], "--list") == 0) {
            command = Command::List;
        } else if (std::strcmp(argv[i], "--validate") == 0 && i + 1 < argc) {
            command = Command::Validate;
            target = argv[++i];
        } else if (std::strcmp(argv[i], "--run") == 0 && i + 1 < argc) {
            command = Command::Run;
            target = argv[++i];
        } else if (std::strcmp(argv[i], "--tool") == 0 && i + 1 < argc &&
                   split_pair(argv[i + 1], key, value)) {
            extra_tools.emplace_back(key, value);
            ++i;
        } else if (std::strcmp(argv[i], "--arg") == 0 && i + 1 < argc &&
                   split_pair(argv[i + 1], key, value)) {
            args[key] = value;
            ++i;
        } else if (std::strcmp(argv[i], "--var") == 0 && i + 1 < argc &&
                   split_pair(argv[i + 1], key, value)) {
            vars[key] = value;
            ++i;
        } else if (std::strcmp(argv[i], "--approved") == 0) {
            approved = true;
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout_ms = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (command == Command::None) {
        print_usage();
        return 1;
    }

    std::string alias;
    std::string action;
    if (command != Command::List && !split_target(target, alias, action)) {
        std::cerr << "Error: expected ALIAS.ACTION, got \"" << target << "\"\n";
        return 1;
    }

    auto config = config_path.empty() ? toolhost::Config::load()
                                      : toolhost::Config::load_from(config_path);
    toolhost::ToolExecutor executor(config);
    executor.load_configured_tools(config);
    for (const auto& [tool_alias, path] : extra_tools) {
        executor.load(tool_alias, path);
    }

    if (command == Command::List) {
        std::cout << catalog_to_json(executor.catalog()).dump(2) << "\n";
        return 0;
    }

    if (command == Command::Validate) {
        auto problems = executor.validate_step(alias, action, args);
        std::cout << nlohmann::json{{"problems", problems}}.dump(2) << "\n";
        return problems.empty() ? 0 : 1;
    }

    toolhost::CancelToken cancel;
    if (timeout_ms > 0) cancel.set_timeout(std::chrono::milliseconds(timeout_ms));
    g_cancel.store(&cancel);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int rc = 0;
    try {
        auto result = approved ? executor.execute_approved(alias, action, args, vars, &cancel)
                               : executor.execute(alias, action, args, vars, &cancel);
        std::cout << result_to_json(result).dump(2) << "\n";
        rc = result.requires_approval ? 2 : 0;
    } catch (const toolhost::ToolError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    executor.shutdown_all();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_cancel.store(nullptr);
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
