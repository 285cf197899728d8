#include "utils/CancellationFlag.hpp"

namespace RedditDash {

CancellationFlag::CancellationFlag() : parent_(nullptr), cancelled_(false), hasDeadline_(false) {}

CancellationFlag::CancellationFlag(const CancellationFlag* parent)
    : parent_(parent), cancelled_(false), hasDeadline_(false) {}

void CancellationFlag::cancel() { cancelled_ = true; }

bool CancellationFlag::isCancelled() const {
    if (cancelled_) return true;
    if (deadlineExpired()) return true;
    return parent_ && parent_->isCancelled();
}

bool CancellationFlag::deadlineExpired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hasDeadline_ && Clock::now() >= deadline_;
}

void CancellationFlag::setDeadline(Clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    deadline_ = deadline;
    hasDeadline_ = true;
}

void CancellationFlag::setTimeout(std::chrono::milliseconds timeout) {
    setDeadline(Clock::now() + timeout);
}

}
