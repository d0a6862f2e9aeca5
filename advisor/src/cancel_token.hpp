#pragma once

#include <atomic>
#include <chrono>
#include <memory>

// Request-scoped deadline plus an explicit cancel flag. Shared between the
// request thread and whoever may cancel it (server shutdown).
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken() : deadline_(Clock::time_point::max()) {}
    explicit CancelToken(std::chrono::milliseconds timeout)
        : deadline_(Clock::now() + timeout) {}

    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_; }
    bool expired() const { return Clock::now() >= deadline_; }
    bool should_stop() const { return cancelled() || expired(); }

    std::chrono::milliseconds remaining() const {
        if (deadline_ == Clock::time_point::max()) {
            return std::chrono::milliseconds::max();
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    // Throws CancelledError when cancel() was called
    void throw_if_cancelled() const;

private:
    Clock::time_point deadline_;
    std::atomic<bool> cancelled_{false};
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;
