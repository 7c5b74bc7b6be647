#pragma once

#include "flatpush/cancel.hpp"
#include "flatpush/net/http.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace flatpush {

class MetricsExporter;

// Remote job status values
enum class JobStatus : int {
    Queued = 0,
    Running = 1,
    Succeeded = 2,
    // Anything above Succeeded is a failure
};

inline bool job_is_terminal(int status) { return status >= static_cast<int>(JobStatus::Succeeded); }
inline bool job_succeeded(int status) { return status == static_cast<int>(JobStatus::Succeeded); }

/// Delay before the next poll given how many polls in a row returned no new
/// log output: <=1 -> 1s, <5 -> 3s, <15 -> 5s, <30 -> 10s, otherwise 60s.
std::chrono::seconds poll_delay(int iterations_since_change);

/// A job's `results` field is a JSON document serialized into a string;
/// replace it with its decoded value. No-op when absent or not a string.
void reparse_job_results(nlohmann::json& job);

/// Follows a job resource until it reaches a terminal status, streaming its
/// log to `out` as it grows.
class JobWatcher {
public:
    JobWatcher(net::HttpTransport& transport, Waiter& waiter, std::string token, std::ostream& out);

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    // Wall clock used for start_after reporting (tests pin it)
    void set_wall_clock(std::function<std::chrono::system_clock::time_point()> clock) {
        wall_clock_ = std::move(clock);
    }

    /// Poll `job_url` until the job finishes. Returns the final job document
    /// with `results` decoded. Throws FailedJobError on a failed job, ApiError
    /// after more than 5 consecutive non-200 answers, CancelledError when the
    /// waiter is cancelled.
    nlohmann::json follow(const std::string& job_url);

    // Log bytes printed so far (the next request's log-offset)
    uint64_t printed_length() const { return printed_len_; }
    int polls() const { return polls_; }

private:
    net::HttpTransport& transport_;
    Waiter& waiter_;
    std::string token_;
    std::ostream& out_;
    MetricsExporter* metrics_ = nullptr;
    std::function<std::chrono::system_clock::time_point()> wall_clock_;

    uint64_t printed_len_ = 0;
    int polls_ = 0;
};

}  // namespace flatpush
