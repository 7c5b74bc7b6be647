#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <variant>

namespace flatpush {

/// Caller misconfiguration: bad arguments, unreadable repository, missing token.
/// Never retried.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Non-2xx answer from the build service.
class ApiError : public std::runtime_error {
public:
    /// @param body_text  Raw response body; parsed as JSON when possible,
    ///                   otherwise replaced by default_body(status).
    ApiError(std::string url, int status, const std::string& body_text);

    const std::string& url() const { return url_; }
    int status() const { return status_; }
    const nlohmann::json& body() const { return body_; }

    nlohmann::json to_json() const;

    static nlohmann::json default_body(int status);

private:
    ApiError(std::string url, nlohmann::json body, int status);

    std::string url_;
    int status_;
    nlohmann::json body_;
};

/// libcurl-level failure (no HTTP status was received).
class TransportError : public std::runtime_error {
public:
    TransportError(std::string url, const std::string& message, bool transient);

    const std::string& url() const { return url_; }

    // Connection reset, timeout or refused connect; worth retrying
    bool transient() const { return transient_; }

private:
    std::string url_;
    bool transient_;
};

/// A remote job reached a failed terminal status.
class FailedJobError : public std::runtime_error {
public:
    explicit FailedJobError(nlohmann::json job);

    const nlohmann::json& job() const { return job_; }

private:
    nlohmann::json job_;
};

/// A wait was interrupted by a cancellation request.
class CancelledError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// --- Command outcomes ---

struct Success {
    nlohmann::json data;
};

struct ApiFailure {
    std::string url;
    int status = 0;
    nlohmann::json body;
};

struct UsageFailure {
    std::string message;
};

struct JobFailure {
    nlohmann::json job;
};

struct InternalFailure {
    std::string kind;
    std::string message;
};

using CommandResult = std::variant<Success, ApiFailure, UsageFailure, JobFailure, InternalFailure>;

/// Structured representation written to --output / --print-output.
nlohmann::json result_to_json(const CommandResult& result);

/// Human readable one-line description (empty for Success).
std::string result_message(const CommandResult& result);

/// Process exit code: 0 for Success, 1 otherwise.
int result_exit_code(const CommandResult& result);

}  // namespace flatpush
