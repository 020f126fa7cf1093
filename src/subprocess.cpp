#include "subprocess.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolhost {

namespace {

constexpr std::array<const char*, 3> kBinaryAliasSuffixes = {".sh", ".cmd", ".exe"};

bool is_executable_file(const std::string& path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(path.c_str(), X_OK) == 0;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Writes to a dead worker must fail with EPIPE instead of killing the host.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

} // namespace

std::string find_executable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return is_executable_file(name) ? name : "";
    }
    const char* env = std::getenv("PATH");
    std::string search = (env && *env) ? env : "/usr/local/bin:/usr/bin:/bin";
    for (auto dir : split(search, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) return candidate;
    }
    return "";
}

std::string resolve_binary(const std::string& name) {
    std::string trimmed = trim(name);
    std::string found = find_executable(trimmed);
    if (!found.empty()) return found;
    if (!trimmed.empty()) {
        for (const char* suffix : kBinaryAliasSuffixes) {
            found = find_executable(trimmed + suffix);
            if (!found.empty()) return found;
        }
    }
    throw BinaryNotFound(trimmed);
}

WaitStatus wait_readable(int fd, int done_fd, const CancelToken* cancel, const Deadline& deadline) {
    Deadline cancel_deadline = cancel ? cancel->deadline() : std::nullopt;
    while (true) {
        if (cancel && (cancel->cancelled() || cancel->expired())) return WaitStatus::Cancelled;

        struct pollfd fds[3];
        fds[0].fd = fd;                          fds[0].events = POLLIN; fds[0].revents = 0;
        fds[1].fd = done_fd;                     fds[1].events = POLLIN; fds[1].revents = 0;
        fds[2].fd = cancel ? cancel->fd() : -1;  fds[2].events = POLLIN; fds[2].revents = 0;

        int timeout = poll_timeout_ms(earliest(deadline, cancel_deadline));
        int ret = ::poll(fds, 3, timeout);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw ToolError(std::string("poll failed: ") + std::strerror(errno));
        }
        if (fds[2].revents != 0) return WaitStatus::Cancelled;
        if (fds[0].revents != 0) return WaitStatus::Ready;
        if (fds[1].revents != 0) return WaitStatus::Exited;
        if (ret == 0) {
            if (cancel && cancel->expired()) return WaitStatus::Cancelled;
            if (deadline && Clock::now() >= *deadline) return WaitStatus::TimedOut;
        }
    }
}

// ── Subprocess ──────────────────────────────────────────────────

std::unique_ptr<Subprocess> Subprocess::spawn(const std::string& path,
                                              const std::vector<std::string>& args) {
    ignore_sigpipe();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    int done_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe, done_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(done_pipe, O_CLOEXEC) != 0) {
        int e = errno;
        close_all();
        throw ToolError("spawn " + path + ": pipe failed: " + std::strerror(e));
    }

    // argv is built before fork; the child only makes async-signal-safe calls
    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(path);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        close_all();
        throw ToolError("spawn " + path + ": fork failed: " + std::strerror(e));
    }

    if (pid == 0) {
        std::signal(SIGPIPE, SIG_DFL);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execv(path.c_str(), argv.data());
        int e = errno;
        ssize_t n = ::write(exec_pipe[1], &e, sizeof(e));
        (void)n;
        _exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // EOF on the exec pipe means execv succeeded (CLOEXEC closed it)
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n > 0) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_all();
        if (child_errno == ENOENT || child_errno == EACCES) throw BinaryNotFound(path);
        throw ToolError("exec " + path + ": " + std::strerror(child_errno));
    }

    auto proc = std::make_unique<Subprocess>(Token{});
    proc->pid_ = pid;
    proc->stdin_fd_ = in_pipe[1];
    proc->stdout_fd_ = out_pipe[0];
    proc->stderr_fd_ = err_pipe[0];
    proc->done_pipe_[0] = done_pipe[0];
    proc->done_pipe_[1] = done_pipe[1];
    Subprocess* raw = proc.get();
    proc->reaper_ = std::thread([raw]() { raw->reap(); });
    return proc;
}

Subprocess::~Subprocess() {
    signal(SIGKILL);
    if (reaper_.joinable()) reaper_.join();
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_fd(done_pipe_[0]);
    close_fd(done_pipe_[1]);
}

void Subprocess::reap() {
    // Wait without reaping first: while the child is a zombie its pid
    // cannot be reused, so signal() under mutex_ never hits a stranger.
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0 && errno == EINTR) {
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid_, &status, 0);
        } while (r < 0 && errno == EINTR);
        exited_ = true;
        status_ = status;
        close_fd(done_pipe_[1]);
    }
    exited_cv_.notify_all();
}

bool Subprocess::write_all(const std::string& data) {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    if (stdin_fd_ < 0) return false;
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

void Subprocess::close_stdin() {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    close_fd(stdin_fd_);
}

void Subprocess::signal(int sig) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exited_ && pid_ > 0) ::kill(pid_, sig);
}

bool Subprocess::exited() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exited_;
}

bool Subprocess::wait_exit(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return exited_cv_.wait_for(lock, timeout, [this] { return exited_; });
}

void Subprocess::wait_exit() {
    std::unique_lock<std::mutex> lock(mutex_);
    exited_cv_.wait(lock, [this] { return exited_; });
}

int Subprocess::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exited_) return -1;
    if (WIFEXITED(status_)) return WEXITSTATUS(status_);
    if (WIFSIGNALED(status_)) return 128 + WTERMSIG(status_);
    return -1;
}

// ── LineReader ──────────────────────────────────────────────────

WaitStatus LineReader::read_line(std::string& line, int done_fd, const CancelToken* cancel,
                                 const Deadline& deadline) {
    std::array<char, 4096> chunk;
    while (true) {
        size_t pos = buffer_.find('\n');
        if (pos != std::string::npos) {
            line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return WaitStatus::Ready;
        }
        if (eof_) {
            if (!buffer_.empty()) {
                line.swap(buffer_);
                buffer_.clear();
                return WaitStatus::Ready;
            }
            return WaitStatus::Exited;
        }

        WaitStatus st = wait_readable(fd_, done_fd, cancel, deadline);
        if (st != WaitStatus::Ready) return st;

        ssize_t n = ::read(fd_, chunk.data(), chunk.size());
        if (n > 0) {
            buffer_.append(chunk.data(), static_cast<size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            eof_ = true;
        }
    }
}

} // namespace toolhost
