#pragma once
#include <atomic>
#include <chrono>
#include <mutex>

namespace RedditDash {

// Shared stop signal for one aggregation cycle. Trips when cancel() is
// called, when the deadline passes, or when the parent flag trips.
class CancellationFlag {
public:
    using Clock = std::chrono::steady_clock;

    CancellationFlag();
    explicit CancellationFlag(const CancellationFlag* parent);

    void cancel();
    bool isCancelled() const;
    bool deadlineExpired() const;

    void setDeadline(Clock::time_point deadline);
    void setTimeout(std::chrono::milliseconds timeout);

private:
    const CancellationFlag* parent_;
    std::atomic<bool> cancelled_;
    mutable std::mutex mutex_;
    bool hasDeadline_;
    Clock::time_point deadline_;
};

}
