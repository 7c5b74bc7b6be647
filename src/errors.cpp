#include "flatpush/errors.hpp"

namespace flatpush {

namespace {

std::string api_error_message(const std::string& url, int status, const nlohmann::json& body) {
    return "Api call to " + url + " failed with status " + std::to_string(status) +
           ", details: " + body.dump();
}

nlohmann::json parse_error_body(int status, const std::string& body_text) {
    auto body = nlohmann::json::parse(body_text, nullptr, false);
    if (body.is_discarded()) {
        return ApiError::default_body(status);
    }
    return body;
}

}  // namespace

// --- ApiError ---

ApiError::ApiError(std::string url, int status, const std::string& body_text)
    : ApiError(std::move(url), parse_error_body(status, body_text), status) {}

ApiError::ApiError(std::string url, nlohmann::json body, int status)
    : std::runtime_error(api_error_message(url, status, body))
    , url_(std::move(url))
    , status_(status)
    , body_(std::move(body)) {}

nlohmann::json ApiError::default_body(int status) {
    return {
        {"status", status},
        {"error-type", "no-error"},
        {"message", "No json error details from server"},
    };
}

nlohmann::json ApiError::to_json() const {
    return {
        {"type", "api"},
        {"url", url_},
        {"status_code", status_},
        {"details", body_},
    };
}

// --- TransportError ---

TransportError::TransportError(std::string url, const std::string& message, bool transient)
    : std::runtime_error("Request to " + url + " failed: " + message)
    , url_(std::move(url))
    , transient_(transient) {}

// --- FailedJobError ---

FailedJobError::FailedJobError(nlohmann::json job)
    : std::runtime_error("Job failed")
    , job_(std::move(job)) {}

// --- CommandResult ---

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

nlohmann::json result_to_json(const CommandResult& result) {
    return std::visit(overloaded{
        [](const Success& s) -> nlohmann::json { return s.data; },
        [](const ApiFailure& f) -> nlohmann::json {
            return {{"type", "api"}, {"url", f.url}, {"status_code", f.status}, {"details", f.body}};
        },
        [](const UsageFailure& f) -> nlohmann::json {
            return {{"type", "usage"}, {"details", {{"message", f.message}}}};
        },
        [](const JobFailure& f) -> nlohmann::json {
            return {{"type", "job"}, {"job", f.job}};
        },
        [](const InternalFailure& f) -> nlohmann::json {
            return {{"type", "exception"}, {"details", {{"error-type", f.kind}, {"message", f.message}}}};
        },
    }, result);
}

std::string result_message(const CommandResult& result) {
    return std::visit(overloaded{
        [](const Success&) -> std::string { return {}; },
        [](const ApiFailure& f) -> std::string {
            return api_error_message(f.url, f.status, f.body);
        },
        [](const UsageFailure& f) -> std::string { return "Usage error: " + f.message; },
        [](const JobFailure& f) -> std::string {
            std::string where = f.job.contains("location") && f.job["location"].is_string()
                ? " " + f.job["location"].get<std::string>() : std::string();
            return "Job failed:" + where;
        },
        [](const InternalFailure& f) -> std::string {
            return "Unexpected exception " + f.kind + ": " + f.message;
        },
    }, result);
}

int result_exit_code(const CommandResult& result) {
    return std::holds_alternative<Success>(result) ? 0 : 1;
}

}  // namespace flatpush
