#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flatpush::net {

// HTTP methods
enum class HttpMethod {
    GET,
    POST
};

/// libcurl failures worth retrying: a dropped connection, a timeout or a
/// refused connect. `curl_code` is a CURLcode.
bool is_transient_error(int curl_code);

/// The subset of is_transient_error where the peer dropped an established
/// connection.
bool is_connection_reset(int curl_code);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    void set_bearer_token(const std::string& token);

    std::optional<std::string> content_type() const;

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

/// One named file in a multipart/form-data upload.
/// The file is opened only when the transport starts sending this part.
struct FilePart {
    std::string filename;            // Remote name of the part
    std::filesystem::path path;      // Local file to stream
    uint64_t size = 0;
};

// HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Multipart upload parts; when non-empty `body` is ignored
    std::vector<FilePart> parts;

    // Set JSON body
    void set_json_body(const std::string& json);

    std::string body_string() const;
};

// HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
    bool connection_reset = false;  // Peer dropped the connection mid-exchange
    bool transient = false;         // Worth retrying: reset, timeout or refused connect
};

// HTTP client configuration
struct HttpClientConfig {
    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{15};

    std::chrono::milliseconds default_connect_timeout{30000};
    std::chrono::milliseconds default_total_timeout{300000};

    // Response size limits (0 = unlimited)
    size_t max_response_size = 64 * 1024 * 1024;

    // Read block used when streaming multipart file parts
    size_t upload_block_size = 64 * 1024;

    bool verify_ssl = true;
    std::string ca_bundle;  // Empty = system default

    std::string user_agent = "flatpush/1.0";

    // libcurl verbose tracing (for debugging)
    bool verbose = false;
};

/// Anything able to perform one HTTP exchange.
/// The push pipeline talks to the build service only through this seam.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

// libcurl-backed transport holding one long-lived session
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request) override;

    const HttpClientConfig& config() const;

    struct Stats {
        size_t total_requests = 0;
        size_t failed_requests = 0;
        uint64_t bytes_sent = 0;
    };
    Stats stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// URL parsing helper
struct ParsedUrl {
    std::string scheme;   // http, https
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;
    std::string fragment;
    std::string userinfo; // user:password

    std::string to_string() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

/// Resolve `relative` against `base` the way a browser resolves a relative
/// link: the last path segment of `base` is replaced unless it ends in '/'.
std::string url_join(const std::string& base, const std::string& relative);

/// API root of a build URL: `<api>/build/<id>` -> `<api>`.
std::string build_url_to_api(const std::string& build_url);

/// Manager root of a build URL: `<manager>/api/v1/build/<id>` -> `<manager>/`.
std::string build_url_to_manager(const std::string& build_url);

/// Last path segment of a build URL (the build id).
std::string build_url_id(const std::string& build_url);

}  // namespace flatpush::net
