#include "flatpush/build_client.hpp"
#include "flatpush/api.hpp"
#include "flatpush/constants.hpp"
#include "flatpush/errors.hpp"
#include "flatpush/gzip.hpp"
#include "flatpush/job_watcher.hpp"
#include "flatpush/log.hpp"
#include "flatpush/metrics.hpp"

#include <algorithm>
#include <optional>

namespace flatpush {

namespace {

nlohmann::json optional_string(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

// "abc.filez" -> "filez"
std::string part_kind(const std::string& filename) {
    auto dot = filename.rfind('.');
    return dot == std::string::npos ? std::string("unknown") : filename.substr(dot + 1);
}

}  // namespace

bool is_already_published(const net::HttpResponse& response) {
    if (response.is_network_error || response.status_code != 400) return false;
    auto body = nlohmann::json::parse(response.body.begin(), response.body.end(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) return false;
    auto it = body.find("current-state");
    return it != body.end() && it->is_string() && it->get<std::string>() == "published";
}

BuildClient::BuildClient(net::HttpTransport& transport, Waiter& waiter, std::string token,
                         RetryPolicy policy)
    : transport_(&transport)
    , waiter_(&waiter)
    , token_(std::move(token))
    , policy_(policy) {}

BuildClient BuildClient::with_token(std::string token) const {
    BuildClient copy(*this);
    copy.token_ = std::move(token);
    return copy;
}

net::HttpResponse BuildClient::send(const net::HttpRequest& request, const std::string& what,
                                    bool (*accept)(const net::HttpResponse&)) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->api_call_duration());

    auto on_retry = [this] {
        if (metrics_) metrics_->api_retries_total().Increment();
    };

    try {
        auto response = call_with_retry(policy_, *waiter_, what, [&] {
            auto response = transport_->execute(request);
            if (accept && accept(response)) {
                return response;
            }
            check_response(request.url, response);
            return response;
        }, on_retry);
        if (metrics_) metrics_->api_calls_success().Increment();
        return response;
    } catch (...) {
        if (metrics_) metrics_->api_calls_failure().Increment();
        throw;
    }
}

// --- Objects ---

std::vector<std::string> BuildClient::missing_objects(const std::string& build_url,
                                                      const std::vector<std::string>& wanted) {
    std::vector<std::string> missing;
    const std::string url = build_url + "/missing_objects";

    for (size_t start = 0; start < wanted.size(); start += constants::MISSING_OBJECTS_CHUNK) {
        const size_t end = std::min(wanted.size(), start + constants::MISSING_OBJECTS_CHUNK);
        nlohmann::json body = {
            {"wanted", std::vector<std::string>(wanted.begin() + start, wanted.begin() + end)},
        };

        net::HttpRequest request;
        request.method = net::HttpMethod::POST;
        request.url = url;
        request.headers.set_bearer_token(token_);
        request.headers.set_content_type("application/json");
        request.headers.set("Content-Encoding", "gzip");
        request.body = gzip_compress(body.dump());

        if (metrics_) metrics_->missing_queries_total().Increment();
        auto response = send(request, "missing_objects");
        auto result = response_json(response);
        for (const auto& name : result.value("missing", nlohmann::json::array())) {
            missing.push_back(name.get<std::string>());
        }
        log_debug("missing_objects: %zu of %zu objects missing", missing.size(), end);
    }
    return missing;
}

void BuildClient::upload_files(const std::string& build_url,
                               const std::vector<net::FilePart>& parts) {
    if (parts.empty()) return;

    uint64_t total_size = 0;
    for (const auto& part : parts) total_size += part.size;
    log_info("Uploading %zu files (%llu bytes)", parts.size(),
             static_cast<unsigned long long>(total_size));

    net::HttpRequest request;
    request.method = net::HttpMethod::POST;
    request.url = build_url + "/upload";
    request.headers.set_bearer_token(token_);
    request.parts = parts;

    {
        std::optional<ScopedTimer> timer;
        if (metrics_) timer.emplace(metrics_->upload_batch_duration());
        send(request, "upload");
    }

    if (metrics_) {
        metrics_->upload_batches_total().Increment();
        metrics_->upload_bytes_total().Increment(static_cast<double>(total_size));
        for (const auto& part : parts) {
            metrics_->objects_uploaded(part_kind(part.filename)).Increment();
        }
    }
}

// --- Build ---

nlohmann::json BuildClient::create_ref(const std::string& build_url, const std::string& ref,
                                       const std::string& commit) {
    log_info("Queuing build of %s (commit %s)", ref.c_str(), commit.c_str());
    auto request = make_json_request(net::HttpMethod::POST, build_url + "/build_ref", token_,
                                     {{"ref", ref}, {"commit", commit}});
    return response_json(send(request, "build_ref"));
}

nlohmann::json BuildClient::add_extra_ids(const std::string& build_url,
                                          const std::vector<std::string>& ids) {
    log_info("Adding extra ids %zu", ids.size());
    auto request = make_json_request(net::HttpMethod::POST, build_url + "/add_extra_ids", token_,
                                     {{"ids", ids}});
    return response_json(send(request, "add_extra_ids"));
}

nlohmann::json BuildClient::get_build(const std::string& build_url) {
    net::HttpRequest request;
    request.method = net::HttpMethod::GET;
    request.url = build_url;
    request.headers.set_bearer_token(token_);
    return response_json(send(request, "get_build"));
}

nlohmann::json BuildClient::commit_build(const std::string& build_url,
                                         const CommitOptions& options, bool wait) {
    log_info("Committing build %s", build_url.c_str());
    nlohmann::json body = {
        {"endoflife", optional_string(options.end_of_life)},
        {"endoflife_rebase", optional_string(options.end_of_life_rebase)},
    };
    if (options.token_type) {
        body["token_type"] = *options.token_type;
    }

    auto response = send(make_json_request(net::HttpMethod::POST, build_url + "/commit", token_, body),
                         "commit");
    auto job = response_json(response);
    auto job_url = response.headers.get("Location").value_or("");

    if (wait && !job_url.empty()) {
        log_info("Waiting for commit job");
        job = wait_for_job(job_url);
    }
    reparse_job_results(job);
    job["location"] = job_url;
    return job;
}

nlohmann::json BuildClient::publish_build(const std::string& build_url, bool wait) {
    log_info("Publishing build %s", build_url.c_str());
    auto response = send(make_json_request(net::HttpMethod::POST, build_url + "/publish", token_,
                                           nlohmann::json::object()),
                         "publish", &is_already_published);
    if (response.status_code == 400) {
        log_info("The build has been already published");
        return nlohmann::json::object();
    }

    auto job = response_json(response);
    auto job_url = response.headers.get("Location").value_or("");

    if (wait && !job_url.empty()) {
        log_info("Waiting for publish job");
        job = wait_for_job(job_url);
    }
    reparse_job_results(job);
    job["location"] = job_url;
    return job;
}

nlohmann::json BuildClient::follow_update_job(const std::string& build_url,
                                              const nlohmann::json& publish_job, bool wait) {
    auto results = publish_job.find("results");
    if (results == publish_job.end() || !results->is_object()) return nlohmann::json::object();
    auto id = results->find("update-repo-job");
    if (id == results->end() || !id->is_number_integer()) return nlohmann::json::object();

    const auto update_id = id->get<int64_t>();
    log_info("Queued repo update job %lld", static_cast<long long>(update_id));

    const auto update_url = net::build_url_to_api(build_url) + "/job/" + std::to_string(update_id);
    nlohmann::json update_job;
    if (wait) {
        log_info("Waiting for repo update job");
        update_job = wait_for_job(update_url);
    } else {
        update_job = get_job(update_url);
    }
    reparse_job_results(update_job);
    update_job["location"] = update_url;
    return update_job;
}

nlohmann::json BuildClient::purge_build(const std::string& build_url) {
    log_info("Purging build %s", build_url.c_str());
    auto request = make_json_request(net::HttpMethod::POST, build_url + "/purge", token_,
                                     nlohmann::json::object());
    return response_json(send(request, "purge"));
}

nlohmann::json BuildClient::create_build(const std::string& manager_url, const std::string& repo,
                                         const CreateBuildOptions& options) {
    nlohmann::json body = {{"repo", repo}};
    if (options.app_id) body["app-id"] = *options.app_id;
    if (options.public_download) body["public-download"] = *options.public_download;
    if (options.build_log_url) body["build-log-url"] = *options.build_log_url;

    const auto url = net::url_join(manager_url, "api/v1/build");
    auto response = send(make_json_request(net::HttpMethod::POST, url, token_, body), "create");
    auto build = response_json(response);
    build["location"] = response.headers.get("Location").value_or("");
    return build;
}

nlohmann::json BuildClient::create_token(const std::string& manager_url, const std::string& name,
                                         const std::string& subject,
                                         const std::vector<std::string>& scope,
                                         uint64_t duration_secs) {
    const auto url = net::url_join(manager_url, "api/v1/token_subset");
    nlohmann::json body = {
        {"name", name},
        {"sub", subject},
        {"scope", scope},
        {"duration", duration_secs},
    };
    return response_json(send(make_json_request(net::HttpMethod::POST, url, token_, body),
                              "token_subset"));
}

// --- Jobs ---

nlohmann::json BuildClient::get_job(const std::string& job_url) {
    auto request = make_json_request(net::HttpMethod::GET, job_url, token_, nlohmann::json::object());
    return response_json(send(request, "get_job"));
}

nlohmann::json BuildClient::wait_for_job(const std::string& job_url) {
    JobWatcher watcher(*transport_, *waiter_, token_, *job_out_);
    watcher.set_metrics(metrics_);
    return watcher.follow(job_url);
}

}  // namespace flatpush
