#include "flatpush/job_watcher.hpp"
#include "flatpush/api.hpp"
#include "flatpush/constants.hpp"
#include "flatpush/errors.hpp"
#include "flatpush/log.hpp"
#include "flatpush/metrics.hpp"

namespace flatpush {

std::chrono::seconds poll_delay(int iterations_since_change) {
    if (iterations_since_change <= 1) return std::chrono::seconds(1);
    if (iterations_since_change < 5) return std::chrono::seconds(3);
    if (iterations_since_change < 15) return std::chrono::seconds(5);
    if (iterations_since_change < 30) return std::chrono::seconds(10);
    return std::chrono::seconds(60);
}

void reparse_job_results(nlohmann::json& job) {
    if (!job.is_object()) return;
    auto it = job.find("results");
    if (it == job.end() || !it->is_string()) return;
    auto parsed = nlohmann::json::parse(it->get<std::string>(), nullptr, false);
    if (!parsed.is_discarded()) {
        *it = std::move(parsed);
    }
}

JobWatcher::JobWatcher(net::HttpTransport& transport, Waiter& waiter, std::string token,
                       std::ostream& out)
    : transport_(transport)
    , waiter_(waiter)
    , token_(std::move(token))
    , out_(out)
    , wall_clock_([] { return std::chrono::system_clock::now(); }) {}

nlohmann::json JobWatcher::follow(const std::string& job_url) {
    bool reported_delay = false;
    int old_status = 0;
    int iterations_since_change = 0;
    int error_iterations = 0;

    while (true) {
        auto request = make_json_request(net::HttpMethod::GET, job_url, token_,
                                         {{"log-offset", printed_len_}});
        auto response = transport_.execute(request);
        ++polls_;
        if (metrics_) metrics_->job_polls_total().Increment();

        if (response.is_network_error) {
            if (!response.connection_reset) {
                throw TransportError(job_url, response.error, false);
            }
            // Servers drop idle sessions between polls; just poll again
            log_debug("Connection reset while polling %s, retrying", job_url.c_str());
        } else if (response.status_code == 200) {
            error_iterations = 0;
            auto job = response_json(response);
            const int status = job.value("status", 0);

            if (status == 0 && !reported_delay) {
                reported_delay = true;
                auto start_after = job.find("start_after");
                if (start_after != job.end() && start_after->is_object() &&
                    start_after->contains("secs_since_epoch") &&
                    (*start_after)["secs_since_epoch"].is_number()) {
                    const auto when = (*start_after)["secs_since_epoch"].get<double>();
                    const auto now = std::chrono::duration<double>(
                        wall_clock_().time_since_epoch()).count();
                    if (when > now) {
                        out_ << "Waiting " << static_cast<int64_t>(when - now)
                             << " seconds before starting job\n" << std::flush;
                    }
                }
            }

            if (status > 0 && old_status == 0) {
                out_ << "/ Job was started\n" << std::flush;
            }
            old_status = status;

            const auto log = job.value("log", std::string());
            if (!log.empty()) {
                iterations_since_change = 0;
                size_t start = 0;
                while (start < log.size()) {
                    auto nl = log.find('\n', start);
                    auto end = nl == std::string::npos ? log.size() : nl + 1;
                    out_ << "| " << log.substr(start, end - start);
                    start = end;
                }
                out_ << std::flush;
                printed_len_ += log.size();
            } else {
                ++iterations_since_change;
            }

            if (job_is_terminal(status)) {
                if (job_succeeded(status)) {
                    out_ << "\\ Job completed successfully\n" << std::flush;
                } else {
                    out_ << "\\ Job failed\n" << std::flush;
                    reparse_job_results(job);
                    job["location"] = job_url;
                    throw FailedJobError(std::move(job));
                }
                reparse_job_results(job);
                return job;
            }
        } else {
            ++error_iterations;
            if (error_iterations <= constants::JOB_POLL_MAX_ERRORS) {
                log_warn("Unexpected response %d getting job log, ignoring", response.status_code);
            } else {
                throw ApiError(job_url, response.status_code, response.body_string());
            }
        }

        if (!waiter_.wait_for(poll_delay(iterations_since_change))) {
            throw CancelledError("Cancelled while waiting for job " + job_url);
        }
    }
}

}  // namespace flatpush
