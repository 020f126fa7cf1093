#include "stdio_transport.hpp"
#include "../errors.hpp"
#include "../subprocess.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace toolhost {

namespace {

// Append whatever is readable; closes the stream on EOF or error.
void drain(int fd, short revents, std::string& out, bool& open) {
    if (!open || revents == 0) return;
    std::array<char, 4096> buffer;
    ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n > 0) {
        out.append(buffer.data(), static_cast<size_t>(n));
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        open = false;
    }
}

[[noreturn]] void abandon(Subprocess& proc, const std::string& binary) {
    proc.signal(SIGKILL);
    proc.wait_exit();
    throw CallCancelled("cancelled; " + binary + " (pid " + std::to_string(proc.pid()) +
                        ") killed");
}

} // namespace

RawOutput StdioTransport::invoke(const ActionCall& call) {
    const ToolDefinition& def = *call.definition;
    const ToolAction& action = *call.action;
    if (action.argv.empty()) {
        throw ProtocolError("action has no argv for stdio transport");
    }

    const std::string& binary = def.effective_binary(action);
    std::string path = resolve_binary(binary);
    std::vector<std::string> argv =
        resolve_argv(action.argv, merge_template_data(call.vars, call.args));

    auto proc = Subprocess::spawn(path, argv);
    proc->close_stdin();

    const CancelToken* cancel = call.cancel;
    Deadline deadline = cancel ? cancel->deadline() : std::nullopt;

    RawOutput out;
    bool out_open = true;
    bool err_open = true;
    while (out_open || err_open) {
        struct pollfd fds[3];
        fds[0].fd = out_open ? proc->stdout_fd() : -1; fds[0].events = POLLIN; fds[0].revents = 0;
        fds[1].fd = err_open ? proc->stderr_fd() : -1; fds[1].events = POLLIN; fds[1].revents = 0;
        fds[2].fd = cancel ? cancel->fd() : -1;        fds[2].events = POLLIN; fds[2].revents = 0;

        int ret = ::poll(fds, 3, poll_timeout_ms(deadline));
        if (ret < 0) {
            if (errno == EINTR) continue;
            int e = errno;
            proc->signal(SIGKILL);
            throw ToolError(std::string("poll failed: ") + std::strerror(e));
        }
        if (fds[2].revents != 0 || (ret == 0 && cancel && cancel->expired())) {
            abandon(*proc, binary);
        }
        drain(proc->stdout_fd(), fds[0].revents, out.stdout_text, out_open);
        drain(proc->stderr_fd(), fds[1].revents, out.stderr_text, err_open);
    }

    // Streams closed; the child may still be running
    if (wait_readable(proc->done_fd(), -1, cancel, std::nullopt) == WaitStatus::Cancelled) {
        abandon(*proc, binary);
    }
    proc->wait_exit();
    out.exit_code = proc->exit_code();
    return out;
}

} // namespace toolhost
