#include "process_supervisor.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iostream>

namespace toolhost {

ProcessSupervisor::~ProcessSupervisor() {
    shutdown_all();
}

namespace {

// A caller still holding the pre-reload definition must not retire the
// worker spawned for the reloaded one.
bool supersedes(const std::shared_ptr<const ToolDefinition>& requested,
                const std::shared_ptr<const ToolDefinition>& live) {
    if (requested == live) return false;
    if (!requested || !live) return true;
    return requested->generation >= live->generation;
}

} // namespace

std::shared_ptr<PersistentProcess> ProcessSupervisor::acquire(
    const std::string& alias, const std::shared_ptr<const ToolDefinition>& definition,
    const Factory& factory, const CancelToken* cancel) {
    std::shared_ptr<PersistentProcess> proc;
    std::shared_ptr<PersistentProcess> crashed;
    std::shared_ptr<PersistentProcess> stale;
    bool created = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(alias);
        if (it != processes_.end()) {
            if (it->second->state() == ProcessState::Dead) {
                crashed = it->second;
                processes_.erase(it);
            } else if (supersedes(definition, it->second->definition())) {
                stale = it->second;
                processes_.erase(it);
            } else {
                proc = it->second;
            }
        }
        if (!proc) {
            proc = factory();
            processes_[alias] = proc;
            created = true;
        }
    }

    if (crashed) announce_retired(crashed, "crashed");
    if (stale) retire(stale, "stale");

    if (!created) {
        proc->wait_ready(cancel);
        return proc;
    }

    try {
        proc->start(cancel);
    } catch (...) {
        erase_if_same(alias, proc);
        throw;
    }

    ProcessSpawnedEvent ev;
    ev.alias = alias;
    ev.transport = proc->transport_name();
    ev.pid = proc->pid();
    publish_to(event_bus_, ev);
    return proc;
}

bool ProcessSupervisor::erase_if_same(const std::string& alias,
                                      const std::shared_ptr<PersistentProcess>& proc) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(alias);
    if (it == processes_.end() || it->second != proc) return false;
    processes_.erase(it);
    return true;
}

void ProcessSupervisor::discard(const std::string& alias,
                                const std::shared_ptr<PersistentProcess>& proc) {
    if (!erase_if_same(alias, proc)) return;
    proc->kill();
    announce_retired(proc, "crashed");
}

bool ProcessSupervisor::shutdown(const std::string& alias) {
    std::shared_ptr<PersistentProcess> proc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(alias);
        if (it == processes_.end()) return false;
        proc = it->second;
        processes_.erase(it);
    }
    retire(proc, "shutdown");
    return true;
}

void ProcessSupervisor::shutdown_all() {
    std::unordered_map<std::string, std::shared_ptr<PersistentProcess>> procs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        procs.swap(processes_);
    }
    for (auto& entry : procs) {
        try {
            retire(entry.second, "shutdown");
        } catch (const std::exception& e) {
            std::cerr << "[supervisor] shutdown of \"" << entry.first << "\" failed: " << e.what()
                      << std::endl;
            entry.second->kill();
        }
    }
}

void ProcessSupervisor::retire(const std::shared_ptr<PersistentProcess>& proc, const char* reason) {
    std::cerr << "[supervisor] shutting down \"" << proc->alias() << "\" (" << reason
              << ", pid " << proc->pid() << ")" << std::endl;
    proc->shutdown(shutdown_grace_);
    announce_retired(proc, reason);
}

void ProcessSupervisor::announce_retired(const std::shared_ptr<PersistentProcess>& proc,
                                         const char* reason) {
    if (std::string(reason) == "crashed") {
        std::cerr << "[supervisor] \"" << proc->alias() << "\" worker (pid " << proc->pid()
                  << ") is gone; next call respawns" << std::endl;
    }
    ProcessRetiredEvent ev;
    ev.alias = proc->alias();
    ev.pid = proc->pid();
    ev.reason = reason;
    publish_to(event_bus_, ev);
}

std::shared_ptr<PersistentProcess> ProcessSupervisor::find(const std::string& alias) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(alias);
    return it == processes_.end() ? nullptr : it->second;
}

std::vector<std::string> ProcessSupervisor::aliases() const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : processes_) out.push_back(entry.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

size_t ProcessSupervisor::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.size();
}

} // namespace toolhost
