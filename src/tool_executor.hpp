#pragma once
#include "arg_resolver.hpp"
#include "cancel.hpp"
#include "catalog.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "process_supervisor.hpp"
#include "result_normalizer.hpp"
#include "transport.hpp"

#include <memory>
#include <string>
#include <vector>

namespace toolhost {

// Entry point for callers: resolves alias/action against the catalog,
// validates args, applies the approval gate, dispatches to the transport
// chosen by the definition and normalizes the output.
class ToolExecutor {
public:
    explicit ToolExecutor(const Config& config = Config{});
    ~ToolExecutor();
    ToolExecutor(const ToolExecutor&) = delete;
    ToolExecutor& operator=(const ToolExecutor&) = delete;

    // Registers every tool listed in the config. Throws DefinitionError
    // on the first definition that fails.
    void load_configured_tools(const Config& config);

    void load(const std::string& alias, const std::string& path);
    void register_builtin(const std::string& alias, ToolDefinition definition);

    // Gated: returns a pending-approval result without running anything
    // when the action requires approval.
    ActionResult execute(const std::string& alias, const std::string& action,
                         const ArgMap& args, const ArgMap& vars = {},
                         const CancelToken* cancel = nullptr);

    // Same validation, no gate.
    ActionResult execute_approved(const std::string& alias, const std::string& action,
                                  const ArgMap& args, const ArgMap& vars = {},
                                  const CancelToken* cancel = nullptr);

    // Problems with a prospective call; empty when it looks runnable.
    std::vector<std::string> validate_step(const std::string& alias, const std::string& action,
                                           const ArgMap& args) const;

    // Throws ToolError for unknown alias/action.
    bool is_read_only(const std::string& alias, const std::string& action) const;

    bool shutdown(const std::string& alias);
    void shutdown_all();

    CapabilityCatalog& catalog() { return catalog_; }
    const CapabilityCatalog& catalog() const { return catalog_; }
    ProcessSupervisor& supervisor() { return supervisor_; }

    void set_event_bus(EventBus* bus);

private:
    ActionResult run(const std::string& alias, const std::string& action, const ArgMap& args,
                     const ArgMap& vars, const CancelToken* cancel, bool gated);
    Transport& transport_for(TransportMode mode);

    CapabilityCatalog catalog_;
    ProcessSupervisor supervisor_;
    ResultNormalizer normalizer_;
    std::unique_ptr<Transport> transports_[3];  // indexed by TransportMode
    EventBus* event_bus_ = nullptr;
};

} // namespace toolhost
