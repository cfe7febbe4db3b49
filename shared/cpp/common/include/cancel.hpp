#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

// Shared between a run and whoever may cancel it (server, CLI signal handler).
// Also carries the run deadline: once it passes, cancelled() reports true.
class CancelToken {
public:
    using clock = std::chrono::steady_clock;

    void cancel();
    void set_deadline(clock::time_point deadline);

    bool cancelled() const;
    bool cancel_requested() const { return cancelled_.load(); }
    bool deadline_passed() const;

    // Time left until the deadline, if one is set (never negative).
    std::optional<std::chrono::milliseconds> remaining() const;

    // Sleeps for up to `d`. Returns false if the token was cancelled before
    // or during the wait.
    bool wait_for(std::chrono::milliseconds d) const;

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
    std::optional<clock::time_point> deadline_;
};
