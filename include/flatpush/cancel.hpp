#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace flatpush {

/// Clock and delay source for retry backoff and job polling.
class Waiter {
public:
    virtual ~Waiter() = default;

    virtual std::chrono::steady_clock::time_point now() const = 0;

    /// Block for `delay`. Returns false if cancelled before it elapsed.
    virtual bool wait_for(std::chrono::milliseconds delay) = 0;

    virtual bool cancelled() const = 0;
};

/// Real-time waiter whose waits can be interrupted from another thread.
class CancellableWaiter : public Waiter {
public:
    std::chrono::steady_clock::time_point now() const override {
        return std::chrono::steady_clock::now();
    }

    bool wait_for(std::chrono::milliseconds delay) override {
        std::unique_lock lock(mutex_);
        return !cv_.wait_for(lock, delay, [this] { return cancelled_; });
    }

    bool cancelled() const override {
        std::lock_guard lock(mutex_);
        return cancelled_;
    }

    void cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

}  // namespace flatpush
