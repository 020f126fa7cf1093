#pragma once
#include "cancel.hpp"
#include "subprocess.hpp"
#include "tool_definition.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

namespace toolhost {

enum class ProcessState { Spawning, Ready, Dead };

const char* process_state_name(ProcessState state);

struct WorkerLaunch {
    std::string alias;
    std::string binary;  // as declared; resolved on start()
    std::vector<std::string> argv;
    std::shared_ptr<const ToolDefinition> definition;
    std::chrono::milliseconds startup_timeout{10000};
};

// One long-lived worker process speaking line-delimited JSON on
// stdin/stdout. Owned by the ProcessSupervisor.
//
// Lifecycle: Spawning -> Ready -> Dead, or Spawning -> Dead. Exactly one
// caller runs start(); anyone else who obtained the handle while it was
// Spawning blocks in wait_ready(). Exit is observed through the
// subprocess done fd and reported lazily by state().
class PersistentProcess {
public:
    explicit PersistentProcess(WorkerLaunch launch);
    virtual ~PersistentProcess();
    PersistentProcess(const PersistentProcess&) = delete;
    PersistentProcess& operator=(const PersistentProcess&) = delete;

    // Spawn and run the transport handshake. On any failure the child is
    // killed, the state becomes Dead and the error propagates.
    void start(const CancelToken* cancel);

    // Throws ProcessExited if startup failed, CallCancelled on cancel.
    void wait_ready(const CancelToken* cancel);

    virtual void shutdown(std::chrono::milliseconds grace) = 0;
    virtual const char* transport_name() const = 0;

    void kill();
    // SIGINT; false if there is no child to signal
    bool interrupt();
    ProcessState state() const;
    bool alive() const { return state() != ProcessState::Dead; }
    pid_t pid() const;
    bool wait_exit(std::chrono::milliseconds timeout);

    const std::string& alias() const { return launch_.alias; }
    const std::string& binary() const { return launch_.binary; }
    const std::shared_ptr<const ToolDefinition>& definition() const { return launch_.definition; }

protected:
    virtual void handshake(const CancelToken* cancel, Clock::time_point deadline) = 0;
    virtual std::string log_tag() const = 0;

    // Serialized write of one message line. Throws ProcessExited.
    void send(const nlohmann::json& msg);

    // Next stdout line. Exit -> ProcessExited; cancel -> kill + CallCancelled;
    // deadline -> StartupTimeout mentioning `waiting_for`.
    std::string read_line(const CancelToken* cancel, const Deadline& deadline,
                          const std::string& waiting_for);

    // Forward remaining stderr lines to std::cerr until the worker exits.
    void start_stderr_drain(std::unique_ptr<LineReader> reader);

    Subprocess& subprocess() { return *proc_; }
    int64_t next_id() { return ++last_id_; }

    // Held for a full request/response round trip
    std::mutex call_mutex_;
    WorkerLaunch launch_;

private:
    void settle(ProcessState state);

    std::unique_ptr<Subprocess> proc_;
    std::unique_ptr<LineReader> stdout_reader_;
    std::thread stderr_thread_;
    std::atomic<int64_t> last_id_{0};

    mutable std::mutex state_mutex_;
    ProcessState state_ = ProcessState::Spawning;
    int settled_pipe_[2] = {-1, -1};  // write end closed once startup settles
};

} // namespace toolhost
