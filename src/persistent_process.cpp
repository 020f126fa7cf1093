#include "persistent_process.hpp"
#include "errors.hpp"
#include "jsonrpc.hpp"
#include "util.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <unistd.h>

namespace toolhost {

const char* process_state_name(ProcessState state) {
    switch (state) {
        case ProcessState::Spawning: return "spawning";
        case ProcessState::Ready: return "ready";
        case ProcessState::Dead: return "dead";
    }
    return "dead";
}

PersistentProcess::PersistentProcess(WorkerLaunch launch) : launch_(std::move(launch)) {
    if (::pipe2(settled_pipe_, O_CLOEXEC) != 0) {
        throw ToolError(std::string("worker state pipe: ") + std::strerror(errno));
    }
}

PersistentProcess::~PersistentProcess() {
    if (proc_) {
        proc_->signal(SIGKILL);
        proc_->wait_exit();
    }
    if (stderr_thread_.joinable()) stderr_thread_.join();
    if (settled_pipe_[0] >= 0) ::close(settled_pipe_[0]);
    if (settled_pipe_[1] >= 0) ::close(settled_pipe_[1]);
}

void PersistentProcess::settle(ProcessState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
    if (settled_pipe_[1] >= 0) {
        ::close(settled_pipe_[1]);
        settled_pipe_[1] = -1;
    }
}

void PersistentProcess::start(const CancelToken* cancel) {
    std::lock_guard<std::mutex> call_lock(call_mutex_);
    try {
        std::string path = resolve_binary(launch_.binary);
        std::cerr << "[" << transport_name() << "] spawning \"" << launch_.alias << "\": "
                  << path << (launch_.argv.empty() ? "" : " ") << join(launch_.argv, " ")
                  << std::endl;

        auto proc = Subprocess::spawn(path, launch_.argv);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            proc_ = std::move(proc);
        }
        stdout_reader_ = std::make_unique<LineReader>(proc_->stdout_fd());

        handshake(cancel, Clock::now() + launch_.startup_timeout);

        if (proc_->exited()) {
            throw ProcessExited(launch_.binary + " exited during startup (exit code " +
                                std::to_string(proc_->exit_code()) + ")");
        }
    } catch (...) {
        kill();
        settle(ProcessState::Dead);
        throw;
    }
    settle(ProcessState::Ready);
}

void PersistentProcess::wait_ready(const CancelToken* cancel) {
    WaitStatus st = wait_readable(settled_pipe_[0], -1, cancel, std::nullopt);
    if (st == WaitStatus::Cancelled) {
        throw CallCancelled("cancelled while waiting for \"" + launch_.alias + "\" to start");
    }
    ProcessState s = state();
    if (s != ProcessState::Ready) {
        throw ProcessExited("worker for \"" + launch_.alias + "\" failed to start");
    }
}

void PersistentProcess::kill() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (proc_) proc_->signal(SIGKILL);
}

bool PersistentProcess::interrupt() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!proc_ || proc_->exited()) return false;
    proc_->signal(SIGINT);
    return true;
}

ProcessState PersistentProcess::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != ProcessState::Dead && proc_ && proc_->exited()) return ProcessState::Dead;
    return state_;
}

pid_t PersistentProcess::pid() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return proc_ ? proc_->pid() : -1;
}

bool PersistentProcess::wait_exit(std::chrono::milliseconds timeout) {
    Subprocess* proc = nullptr;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        proc = proc_.get();
    }
    return proc == nullptr || proc->wait_exit(timeout);
}

void PersistentProcess::send(const nlohmann::json& msg) {
    Subprocess* proc = nullptr;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        proc = proc_.get();
    }
    if (proc == nullptr) throw ProcessExited(launch_.binary + " was never started");
    if (!proc->write_all(jsonrpc::encode(msg) + "\n")) {
        throw ProcessExited("write to " + launch_.binary + " failed: worker has exited");
    }
}

std::string PersistentProcess::read_line(const CancelToken* cancel, const Deadline& deadline,
                                         const std::string& waiting_for) {
    std::string line;
    switch (stdout_reader_->read_line(line, proc_->done_fd(), cancel, deadline)) {
        case WaitStatus::Ready:
            return line;
        case WaitStatus::Exited:
            throw ProcessExited(launch_.binary + " exited while waiting for " + waiting_for);
        case WaitStatus::Cancelled:
            kill();
            throw CallCancelled("cancelled while waiting for " + waiting_for + "; " +
                                launch_.binary + " killed");
        case WaitStatus::TimedOut:
            break;
    }
    throw StartupTimeout(launch_.binary + " did not answer " + waiting_for + " within " +
                         std::to_string(launch_.startup_timeout.count()) + "ms");
}

void PersistentProcess::start_stderr_drain(std::unique_ptr<LineReader> reader) {
    int done = proc_->done_fd();
    std::string tag = log_tag();
    stderr_thread_ = std::thread([reader = std::move(reader), done, tag]() {
        std::string line;
        try {
            while (reader->read_line(line, done, nullptr, std::nullopt) == WaitStatus::Ready) {
                std::cerr << ("  [" + tag + "] " + line + "\n");
            }
        } catch (const std::exception& e) {
            std::cerr << ("  [" + tag + "] stderr reader stopped: " + e.what() + "\n");
        }
    });
}

} // namespace toolhost
