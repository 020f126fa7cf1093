#pragma once
#include "cancel.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

namespace toolhost {

// Locate an executable: paths containing '/' are taken as-is, bare names
// are searched on PATH. Returns an empty string when nothing matches.
std::string find_executable(const std::string& name);

// find_executable, then the same name with each platform alias suffix.
// Throws BinaryNotFound.
std::string resolve_binary(const std::string& name);

enum class WaitStatus {
    Ready,      // fd readable (data or EOF)
    Exited,     // done_fd fired before fd had anything
    Cancelled,  // token fired or its deadline passed
    TimedOut,   // local deadline passed
};

// Block on fd, done_fd, the token and both deadlines at once. Negative
// fds and a null token are ignored.
WaitStatus wait_readable(int fd, int done_fd, const CancelToken* cancel, const Deadline& deadline);

// Child process with stdin/stdout/stderr pipes. A reaper thread waits for
// the child and closes the write end of the done pipe, so done_fd()
// becomes readable exactly when the child has exited.
class Subprocess {
public:
    // Inherits the environment. Throws BinaryNotFound if exec fails with
    // ENOENT/EACCES, ToolError for other spawn failures.
    static std::unique_ptr<Subprocess> spawn(const std::string& path,
                                             const std::vector<std::string>& args);

    // Only spawn() can name this, so only spawn() can construct.
    struct Token {
    private:
        friend class Subprocess;
        Token() {}
    };
    explicit Subprocess(Token) {}
    ~Subprocess();
    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }
    int done_fd() const { return done_pipe_[0]; }

    // False once the child has closed its stdin (EPIPE) or on any other write error.
    bool write_all(const std::string& data);
    void close_stdin();

    // No-op after the child has been reaped.
    void signal(int sig);

    bool exited() const;
    bool wait_exit(std::chrono::milliseconds timeout);
    void wait_exit();
    // Exit status, or 128 + signal number when killed. -1 while running.
    int exit_code() const;

private:
    void reap();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int done_pipe_[2] = {-1, -1};

    std::mutex stdin_mutex_;
    mutable std::mutex mutex_;
    std::condition_variable exited_cv_;
    bool exited_ = false;
    int status_ = 0;
    std::thread reaper_;
};

// Newline framing over a non-owned fd. Lines come back without the
// trailing "\n" or "\r\n".
class LineReader {
public:
    explicit LineReader(int fd) : fd_(fd) {}

    // Ready with `line` set, Exited at EOF, otherwise the wait outcome.
    WaitStatus read_line(std::string& line, int done_fd, const CancelToken* cancel,
                         const Deadline& deadline);

private:
    int fd_;
    std::string buffer_;
    bool eof_ = false;
};

} // namespace toolhost
