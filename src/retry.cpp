#include "flatpush/retry.hpp"
#include "flatpush/log.hpp"

#include <algorithm>
#include <cmath>

namespace flatpush {

std::chrono::milliseconds retry_backoff_ceiling(const RetryPolicy& policy, unsigned attempt) {
    const double exponent = attempt > 0 ? static_cast<double>(attempt - 1) : 0.0;
    const double max_secs = static_cast<double>(policy.max_wait.count());
    const double secs = std::min(max_secs, policy.multiplier * std::pow(2.0, exponent));
    return std::chrono::milliseconds(static_cast<int64_t>(std::max(0.0, secs) * 1000.0));
}

RetryState::RetryState(const RetryPolicy& policy, Waiter& waiter, std::string what,
                       std::function<void()> on_retry)
    : policy_(policy)
    , waiter_(waiter)
    , what_(std::move(what))
    , on_retry_(std::move(on_retry))
    , start_(waiter.now())
    , rng_(std::random_device{}()) {}

bool RetryState::next_attempt(const std::exception& error) {
    if (waiter_.now() - start_ >= policy_.max_elapsed) {
        log_debug("%s: giving up after %u attempts", what_.c_str(), attempt_);
        return false;
    }

    const auto ceiling = retry_backoff_ceiling(policy_, attempt_);
    std::uniform_int_distribution<int64_t> dist(0, ceiling.count());
    const auto delay = std::chrono::milliseconds(dist(rng_));

    log_warn("%s failed (attempt %u): %s; retrying in %.1fs", what_.c_str(), attempt_,
             error.what(), static_cast<double>(delay.count()) / 1000.0);
    if (on_retry_) on_retry_();

    if (!waiter_.wait_for(delay)) {
        throw CancelledError("Cancelled while waiting to retry " + what_);
    }
    ++attempt_;
    return true;
}

}  // namespace flatpush
