#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Cancellation shared between a caller (or a signal handler) and the waits of
// one launch. Waiters re-check the flag at least every 100 ms.
class CancellationToken {
public:
    // Sets the flag and wakes waiters. Not for use in a signal handler.
    void cancel();

    // Only stores the lock-free flag, so it is async-signal-safe. Waiters
    // notice it on their next 100 ms wake.
    void request_cancel() noexcept { cancelled_.store(true); }

    bool is_cancelled() const { return cancelled_.load(); }

    // Blocks for up to duration. Returns false if cancelled before it elapsed.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    static_assert(std::atomic<bool>::is_always_lock_free, "signal handlers need a lock-free flag");

    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;

    // Returns false when the token was cancelled before duration elapsed.
    virtual bool sleep_for(std::chrono::milliseconds duration, const CancellationToken& token) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override;
    bool sleep_for(std::chrono::milliseconds duration, const CancellationToken& token) override;
};
