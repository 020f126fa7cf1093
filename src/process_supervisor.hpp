#pragma once
#include "cancel.hpp"
#include "event_bus.hpp"
#include "persistent_process.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolhost {

// Holds at most one PersistentProcess per alias.
//
// acquire() takes the map lock only long enough to reuse or register a
// handle; spawning and handshakes run outside it. Dead entries are
// noticed lazily on the next acquire and replaced once.
class ProcessSupervisor {
public:
    using Factory = std::function<std::shared_ptr<PersistentProcess>()>;

    ProcessSupervisor() = default;
    ~ProcessSupervisor();
    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Returns a Ready process for alias. A live entry built from an older
    // definition generation is retired first (hot reload); one built from a
    // newer generation is reused.
    std::shared_ptr<PersistentProcess> acquire(const std::string& alias,
                                               const std::shared_ptr<const ToolDefinition>& definition,
                                               const Factory& factory,
                                               const CancelToken* cancel);

    // Drop `proc` if it is still the entry for alias. Used after a call
    // saw the worker die.
    void discard(const std::string& alias, const std::shared_ptr<PersistentProcess>& proc);

    // Graceful then forced. Returns false when no entry existed.
    bool shutdown(const std::string& alias);

    // Never throws; safe when some or all workers are already dead.
    void shutdown_all();

    std::shared_ptr<PersistentProcess> find(const std::string& alias) const;
    std::vector<std::string> aliases() const;
    size_t size() const;

    void set_shutdown_grace(std::chrono::milliseconds grace) { shutdown_grace_ = grace; }
    std::chrono::milliseconds shutdown_grace() const { return shutdown_grace_; }
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

private:
    bool erase_if_same(const std::string& alias, const std::shared_ptr<PersistentProcess>& proc);
    void retire(const std::shared_ptr<PersistentProcess>& proc, const char* reason);
    void announce_retired(const std::shared_ptr<PersistentProcess>& proc, const char* reason);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<PersistentProcess>> processes_;
    std::chrono::milliseconds shutdown_grace_{3000};
    EventBus* event_bus_ = nullptr;
};

} // namespace toolhost
