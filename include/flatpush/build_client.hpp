#pragma once

#include "flatpush/cancel.hpp"
#include "flatpush/net/http.hpp"
#include "flatpush/retry.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace flatpush {

class MetricsExporter;

struct CommitOptions {
    std::optional<std::string> end_of_life;
    std::optional<std::string> end_of_life_rebase;
    std::optional<int> token_type;
};

struct CreateBuildOptions {
    std::optional<std::string> app_id;
    std::optional<bool> public_download;
    std::optional<std::string> build_log_url;
};

/// True for the answer a publish call gets when the build was already
/// published: status 400 with `"current-state": "published"` in the body.
bool is_already_published(const net::HttpResponse& response);

/// Client for the build service REST API.
///
/// Every call goes through call_with_retry(); job polling goes through
/// JobWatcher, which handles its own errors. Copies share the transport,
/// waiter and metrics, so with_token() is cheap.
class BuildClient {
public:
    BuildClient(net::HttpTransport& transport, Waiter& waiter, std::string token,
                RetryPolicy policy = {});

    /// Same client, authenticating with another token.
    BuildClient with_token(std::string token) const;

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }
    MetricsExporter* metrics() const { return metrics_; }

    // Stream that job logs are written to while waiting
    void set_job_output(std::ostream& out) { job_out_ = &out; }

    const std::string& token() const { return token_; }
    Waiter& waiter() const { return *waiter_; }

    // --- Objects ---

    /// Members of `wanted` the build does not have yet, queried in chunks of
    /// at most 2000 names.
    std::vector<std::string> missing_objects(const std::string& build_url,
                                             const std::vector<std::string>& wanted);

    /// One multipart request carrying `parts`.
    void upload_files(const std::string& build_url, const std::vector<net::FilePart>& parts);

    // --- Build ---

    nlohmann::json create_ref(const std::string& build_url, const std::string& ref,
                              const std::string& commit);
    nlohmann::json add_extra_ids(const std::string& build_url, const std::vector<std::string>& ids);
    nlohmann::json get_build(const std::string& build_url);

    /// Start the commit job. Returns the job (followed to completion when
    /// `wait`), with decoded results and its `location`.
    nlohmann::json commit_build(const std::string& build_url, const CommitOptions& options, bool wait);

    /// Start the publish job; an already published build yields an empty object.
    nlohmann::json publish_build(const std::string& build_url, bool wait);

    /// Follow up on the repo update job a publish job queued, if any: waited
    /// for when `wait`, fetched once otherwise. Empty object when there is none.
    nlohmann::json follow_update_job(const std::string& build_url, const nlohmann::json& publish_job,
                                     bool wait);

    nlohmann::json purge_build(const std::string& build_url);

    nlohmann::json create_build(const std::string& manager_url, const std::string& repo,
                                const CreateBuildOptions& options);

    /// Mint a token restricted to `scope`, valid for `duration_secs`.
    nlohmann::json create_token(const std::string& manager_url, const std::string& name,
                                const std::string& subject, const std::vector<std::string>& scope,
                                uint64_t duration_secs);

    // --- Jobs ---

    nlohmann::json get_job(const std::string& job_url);
    nlohmann::json wait_for_job(const std::string& job_url);

private:
    // Send `request` with retries. A non-200 answer for which `accept`
    // returns true is handed back instead of raising ApiError.
    net::HttpResponse send(const net::HttpRequest& request, const std::string& what,
                           bool (*accept)(const net::HttpResponse&) = nullptr);

    net::HttpTransport* transport_;
    Waiter* waiter_;
    std::string token_;
    RetryPolicy policy_;
    MetricsExporter* metrics_ = nullptr;
    std::ostream* job_out_ = &std::cout;
};

}  // namespace flatpush
