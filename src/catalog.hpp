#pragma once
#include "tool_definition.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolhost {

// Alias -> loaded tool definition.
// Definitions are immutable once registered; re-registering an alias swaps
// in a new shared_ptr, so readers holding the old one are unaffected.
// All methods are thread-safe.
class CapabilityCatalog {
public:
    static constexpr const char* kBuiltinSource = "<builtin>";

    // Parse, validate and register. Relative paths resolve against base_dir.
    // Throws DefinitionError; the previous entry (if any) is kept on failure.
    void load(const std::string& alias, const std::string& path);

    // Validate and register an in-memory definition. Throws DefinitionError.
    void register_builtin(const std::string& alias, ToolDefinition definition);

    // nullptr when the alias is unknown
    std::shared_ptr<const ToolDefinition> get(const std::string& alias) const;
    std::string source(const std::string& alias) const;
    bool contains(const std::string& alias) const;
    std::vector<std::string> aliases() const;  // sorted
    size_t size() const;

    void set_base_dir(const std::string& dir);
    std::string resolve_path(const std::string& path) const;

    void clear();

private:
    struct Entry {
        std::shared_ptr<const ToolDefinition> definition;
        std::string source;
    };

    void put(const std::string& alias, ToolDefinition definition, const std::string& source);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    uint64_t next_generation_ = 1;
    std::string base_dir_;
};

} // namespace toolhost
