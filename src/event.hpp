#pragma once
#include <chrono>
#include <map>
#include <string>
#include <sys/types.h>

namespace toolhost {

// Tag-dispatched events, no RTTI. Published by value on the caller's
// stack; handlers must copy anything they keep.

struct Event {
    const char* type_tag;
};

namespace event_tags {
    constexpr const char* ActionStarted    = "ActionStarted";
    constexpr const char* ActionCompleted  = "ActionCompleted";
    constexpr const char* ApprovalRequired = "ApprovalRequired";
    constexpr const char* ProcessSpawned   = "ProcessSpawned";
    constexpr const char* ProcessRetired   = "ProcessRetired";
} // namespace event_tags

struct ActionStartedEvent : Event {
    static constexpr const char* TAG = event_tags::ActionStarted;
    std::string alias;
    std::string action;
    std::string transport;
    std::map<std::string, std::string> args;  // already redacted

    ActionStartedEvent() { type_tag = TAG; }
};

struct ActionCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::ActionCompleted;
    std::string alias;
    std::string action;
    bool success = false;
    int exit_code = 0;
    std::chrono::milliseconds duration{0};
    std::string error;  // what() of the failure, empty on success

    ActionCompletedEvent() { type_tag = TAG; }
};

// The only event a gated call produces.
struct ApprovalRequiredEvent : Event {
    static constexpr const char* TAG = event_tags::ApprovalRequired;
    std::string alias;
    std::string action;
    int approval_min = 0;

    ApprovalRequiredEvent() { type_tag = TAG; }
};

struct ProcessSpawnedEvent : Event {
    static constexpr const char* TAG = event_tags::ProcessSpawned;
    std::string alias;
    std::string transport;
    pid_t pid = -1;

    ProcessSpawnedEvent() { type_tag = TAG; }
};

struct ProcessRetiredEvent : Event {
    static constexpr const char* TAG = event_tags::ProcessRetired;
    std::string alias;
    pid_t pid = -1;
    std::string reason;  // crashed | shutdown | stale

    ProcessRetiredEvent() { type_tag = TAG; }
};

} // namespace toolhost
