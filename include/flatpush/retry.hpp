#pragma once

#include "flatpush/cancel.hpp"
#include "flatpush/constants.hpp"
#include "flatpush/errors.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <random>
#include <string>

namespace flatpush {

struct RetryPolicy {
    // No new attempt starts once this much time has passed since the first one
    std::chrono::seconds max_elapsed{constants::RETRY_MAX_ELAPSED_SECONDS};
    // Upper bound of a single backoff delay
    std::chrono::seconds max_wait{constants::RETRY_MAX_WAIT_SECONDS};
    double multiplier = constants::RETRY_MULTIPLIER;
};

/// Upper bound of the random delay before retry number `attempt` (1-based):
/// min(max_wait, multiplier * 2^(attempt-1)).
std::chrono::milliseconds retry_backoff_ceiling(const RetryPolicy& policy, unsigned attempt);

/// Bookkeeping for one retried call.
class RetryState {
public:
    RetryState(const RetryPolicy& policy, Waiter& waiter, std::string what,
               std::function<void()> on_retry = {});

    /// Called after attempt failed with a retryable error. Returns false when
    /// the time budget is exhausted; otherwise sleeps a jittered backoff and
    /// returns true. Throws CancelledError if the sleep is interrupted.
    bool next_attempt(const std::exception& error);

private:
    RetryPolicy policy_;
    Waiter& waiter_;
    std::string what_;
    std::function<void()> on_retry_;
    std::chrono::steady_clock::time_point start_;
    unsigned attempt_ = 1;
    std::mt19937 rng_;
};

/// Run `fn` until it succeeds, retrying API errors and transient transport
/// errors with randomized exponential backoff. When the budget is exhausted
/// the last error is rethrown unchanged.
template <typename Fn>
auto call_with_retry(const RetryPolicy& policy, Waiter& waiter, const std::string& what,
                     Fn&& fn, std::function<void()> on_retry = {}) -> decltype(fn()) {
    RetryState state(policy, waiter, what, std::move(on_retry));
    while (true) {
        try {
            return fn();
        } catch (const ApiError& e) {
            if (!state.next_attempt(e)) throw;
        } catch (const TransportError& e) {
            if (!e.transient() || !state.next_attempt(e)) throw;
        }
    }
}

}  // namespace flatpush
