#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace toolhost {

using Clock = std::chrono::steady_clock;
using Deadline = std::optional<Clock::time_point>;

// Caller-side cancellation: an optional deadline plus a pipe that becomes
// readable once cancel() fires, so blocking poll() loops can watch it.
class CancelToken {
public:
    CancelToken();
    ~CancelToken();
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    // Async-signal-safe.
    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    void set_deadline(Clock::time_point deadline);
    void set_timeout(std::chrono::milliseconds timeout);
    Deadline deadline() const;
    bool expired() const;

    // Readable after cancel().
    int fd() const { return pipe_[0]; }

private:
    int pipe_[2] = {-1, -1};
    std::atomic<bool> cancelled_{false};
    std::atomic<int64_t> deadline_ns_{0};  // steady clock epoch offset, 0 = none
};

// Earliest of two optional deadlines.
Deadline earliest(const Deadline& a, const Deadline& b);

// poll() timeout in ms for a deadline: -1 without one, 0 once passed.
int poll_timeout_ms(const Deadline& deadline);

} // namespace toolhost
