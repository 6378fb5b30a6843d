#include "PermitLimiter.hpp"
#include <stdexcept>

namespace Fanout {

PermitLimiter::PermitLimiter(size_t capacity) : capacity_(capacity), available_(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("PermitLimiter capacity must be positive");
    }
}

void PermitLimiter::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    // Queued waiters have priority over the free count.
    if (available_ > 0 && waiters_.empty()) {
        --available_;
        return;
    }

    Waiter self;
    waiters_.push_back(&self);
    self.cv.wait(lock, [&self] { return self.granted; });
}

bool PermitLimiter::TryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (available_ > 0 && waiters_.empty()) {
        --available_;
        return true;
    }
    return false;
}

void PermitLimiter::Release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!waiters_.empty()) {
        // Hand-off: the permit goes to the head waiter, available_ is untouched.
        Waiter* next = waiters_.front();
        waiters_.pop_front();
        next->granted = true;
        // Notify under the lock; the waiter's stack frame owns the cv.
        next->cv.notify_one();
        return;
    }
    if (available_ >= capacity_) {
        throw std::logic_error("PermitLimiter released more permits than it holds");
    }
    ++available_;
}

size_t PermitLimiter::Available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

size_t PermitLimiter::Waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

}
