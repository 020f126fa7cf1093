#include "cancel.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <unistd.h>

namespace toolhost {

CancelToken::CancelToken() {
    if (::pipe2(pipe_, O_CLOEXEC | O_NONBLOCK) != 0) {
        throw ToolError(std::string("cancel token: pipe failed: ") + std::strerror(errno));
    }
}

CancelToken::~CancelToken() {
    if (pipe_[0] >= 0) ::close(pipe_[0]);
    if (pipe_[1] >= 0) ::close(pipe_[1]);
}

void CancelToken::cancel() {
    if (cancelled_.exchange(true)) return;
    char b = 1;
    ssize_t n = ::write(pipe_[1], &b, 1);
    (void)n;  // pipe is non-blocking and only ever gets one byte
}

void CancelToken::set_deadline(Clock::time_point deadline) {
    int64_t ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                     deadline.time_since_epoch()).count();
    deadline_ns_.store(ns == 0 ? 1 : ns);
}

void CancelToken::set_timeout(std::chrono::milliseconds timeout) {
    set_deadline(Clock::now() + timeout);
}

Deadline CancelToken::deadline() const {
    int64_t ns = deadline_ns_.load();
    if (ns == 0) return std::nullopt;
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(
        std::chrono::nanoseconds(ns)));
}

bool CancelToken::expired() const {
    auto d = deadline();
    return d && Clock::now() >= *d;
}

Deadline earliest(const Deadline& a, const Deadline& b) {
    if (!a) return b;
    if (!b) return a;
    return std::min(*a, *b);
}

int poll_timeout_ms(const Deadline& deadline) {
    if (!deadline) return -1;
    auto now = Clock::now();
    if (now >= *deadline) return 0;
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now).count() + 1;
    if (remaining > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    return static_cast<int>(remaining);
}

} // namespace toolhost
