#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include "../interfaces/IPermitLimiter.hpp"

namespace Fanout {

    // Counting semaphore with a FIFO wait queue. A released permit is handed
    // straight to the oldest waiter, so a late caller can never overtake one
    // that is already blocked.
    class PermitLimiter : public IPermitLimiter {
    public:
        explicit PermitLimiter(size_t capacity);
        ~PermitLimiter() override = default;

        PermitLimiter(const PermitLimiter&) = delete;
        PermitLimiter& operator=(const PermitLimiter&) = delete;

        void Acquire() override;
        bool TryAcquire() override;
        void Release() override;

        size_t Capacity() const { return capacity_; }
        size_t Available() const;
        size_t Waiting() const;

    private:
        struct Waiter {
            std::condition_variable cv;
            bool granted = false;
        };

        const size_t capacity_;
        size_t available_;
        std::deque<Waiter*> waiters_;
        mutable std::mutex mutex_;
    };

    // Releases one permit on scope exit unless released or dismissed earlier.
    class PermitGuard {
    public:
        explicit PermitGuard(IPermitLimiter& limiter) : limiter_(&limiter) {}
        ~PermitGuard() { Release(); }

        PermitGuard(const PermitGuard&) = delete;
        PermitGuard& operator=(const PermitGuard&) = delete;
        PermitGuard(PermitGuard&& other) noexcept : limiter_(other.limiter_) { other.limiter_ = nullptr; }

        void Release() {
            if (limiter_) {
                limiter_->Release();
                limiter_ = nullptr;
            }
        }

    private:
        IPermitLimiter* limiter_;
    };
}
