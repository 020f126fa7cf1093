#include "catalog.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>

namespace toolhost {

void CapabilityCatalog::set_base_dir(const std::string& dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    base_dir_ = expand_home(dir);
}

std::string CapabilityCatalog::resolve_path(const std::string& path) const {
    std::string expanded = expand_home(path);
    std::lock_guard<std::mutex> lock(mutex_);
    if (expanded.empty() || expanded[0] == '/' || base_dir_.empty()) return expanded;
    if (base_dir_.back() == '/') return base_dir_ + expanded;
    return base_dir_ + "/" + expanded;
}

void CapabilityCatalog::load(const std::string& alias, const std::string& path) {
    std::string resolved = resolve_path(path);
    // Parse and validate outside the lock
    ToolDefinition def = load_tool_file(resolved);
    put(alias, std::move(def), resolved);
}

void CapabilityCatalog::register_builtin(const std::string& alias, ToolDefinition definition) {
    put(alias, finalize_definition(std::move(definition), kBuiltinSource), kBuiltinSource);
}

void CapabilityCatalog::put(const std::string& alias, ToolDefinition definition,
                            const std::string& source) {
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        definition.generation = next_generation_++;
        auto shared = std::make_shared<const ToolDefinition>(std::move(definition));
        auto it = entries_.find(alias);
        replaced = it != entries_.end();
        entries_[alias] = Entry{std::move(shared), source};
    }
    if (replaced) {
        std::cerr << "[catalog] reloaded \"" << alias << "\" from " << source << std::endl;
    }
}

std::shared_ptr<const ToolDefinition> CapabilityCatalog::get(const std::string& alias) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(alias);
    return it == entries_.end() ? nullptr : it->second.definition;
}

std::string CapabilityCatalog::source(const std::string& alias) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(alias);
    return it == entries_.end() ? std::string() : it->second.source;
}

bool CapabilityCatalog::contains(const std::string& alias) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(alias) > 0;
}

std::vector<std::string> CapabilityCatalog::aliases() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names.reserve(entries_.size());
        for (const auto& [alias, entry] : entries_) names.push_back(alias);
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t CapabilityCatalog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void CapabilityCatalog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace toolhost
