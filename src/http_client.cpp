#include "flatpush/net/http.hpp"
#include "flatpush/lazy_file.hpp"
#include "flatpush/log.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <sstream>

namespace flatpush::net {

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

void HttpHeaders::set_bearer_token(const std::string& token) {
    set("Authorization", "Bearer " + token);
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

void HttpRequest::set_json_body(const std::string& json) {
    body = std::vector<uint8_t>(json.begin(), json.end());
    headers.set_content_type("application/json");
}

std::string HttpRequest::body_string() const {
    return std::string(body.begin(), body.end());
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t pos = 0;

    // Scheme
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    pos = scheme_end + 3;

    // Userinfo (optional)
    size_t at_pos = url.find('@', pos);
    size_t slash_pos = url.find('/', pos);
    if (at_pos != std::string::npos && (slash_pos == std::string::npos || at_pos < slash_pos)) {
        result.userinfo = url.substr(pos, at_pos - pos);
        pos = at_pos + 1;
    }

    // Host and port
    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) {
        return std::nullopt;
    }
    size_t colon_pos = host_port.rfind(':');

    // Check for IPv6 address
    if (host_port.front() == '[') {
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) {
            return std::nullopt;
        }
        result.host = host_port.substr(1, bracket_end - 1);
        if (bracket_end + 1 < host_port.size() && host_port[bracket_end + 1] == ':') {
            try {
                result.port = std::stoi(host_port.substr(bracket_end + 2));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else if (colon_pos != std::string::npos) {
        result.host = host_port.substr(0, colon_pos);
        try {
            result.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        result.host = host_port;
    }

    pos = host_end;

    // Path
    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    // Query
    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = url.size();
        }
        result.query = url.substr(pos + 1, query_end - pos - 1);
        pos = query_end;
    }

    // Fragment
    if (pos < url.size() && url[pos] == '#') {
        result.fragment = url.substr(pos + 1);
    }

    return result;
}

std::string ParsedUrl::to_string() const {
    std::ostringstream oss;
    oss << scheme << "://";

    if (!userinfo.empty()) {
        oss << userinfo << "@";
    }

    if (host.find(':') != std::string::npos) {
        // IPv6
        oss << "[" << host << "]";
    } else {
        oss << host;
    }

    if (port != 0) {
        oss << ":" << port;
    }

    oss << path;

    if (!query.empty()) {
        oss << "?" << query;
    }

    if (!fragment.empty()) {
        oss << "#" << fragment;
    }

    return oss.str();
}

std::string url_join(const std::string& base, const std::string& relative) {
    if (relative.find("://") != std::string::npos) {
        return relative;
    }
    auto parsed = ParsedUrl::parse(base);
    if (!parsed) {
        return base + relative;
    }
    parsed->query.clear();
    parsed->fragment.clear();

    if (!relative.empty() && relative.front() == '/') {
        parsed->path = relative;
    } else {
        size_t last_slash = parsed->path.rfind('/');
        std::string dir = (last_slash == std::string::npos)
            ? "/"
            : parsed->path.substr(0, last_slash + 1);
        parsed->path = dir + relative;
    }
    return parsed->to_string();
}

// Strip the last path segment, ignoring one trailing slash
static std::string path_dirname(const std::string& path) {
    size_t slash = path.rfind('/');
    if (slash == std::string::npos) return "";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

std::string build_url_to_api(const std::string& build_url) {
    auto parsed = ParsedUrl::parse(build_url);
    if (!parsed) {
        return build_url;
    }
    parsed->path = path_dirname(path_dirname(parsed->path));
    if (parsed->path == "/") parsed->path.clear();
    parsed->query.clear();
    parsed->fragment.clear();
    return parsed->to_string();
}

std::string build_url_to_manager(const std::string& build_url) {
    auto parsed = ParsedUrl::parse(build_url);
    if (!parsed) {
        return build_url;
    }
    // <manager>/api/v1/build/<id>
    auto path = parsed->path;
    for (int i = 0; i < 4; ++i) path = path_dirname(path);
    if (path.empty() || path.back() != '/') path += '/';
    parsed->path = path;
    parsed->query.clear();
    parsed->fragment.clear();
    return parsed->to_string();
}

std::string build_url_id(const std::string& build_url) {
    auto parsed = ParsedUrl::parse(build_url);
    std::string path = parsed ? parsed->path : build_url;
    while (!path.empty() && path.back() == '/') path.pop_back();
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// ============================================================================
// CURL callback functions
// ============================================================================

// Context for bounded response accumulation
struct WriteCallbackContext {
    std::vector<uint8_t>* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    // Check if adding this data would exceed the limit
    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Return 0 to signal error and abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    // Remove trailing CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // Skip empty lines and status line
    if (line.empty() || line.starts_with("HTTP/")) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        value = (start == std::string::npos) ? std::string() : value.substr(start);

        headers->add(name, value);
    }

    return bytes;
}

// MIME part body: lazily opened file streamed in fixed blocks
static size_t part_read_callback(char* buffer, size_t size, size_t nitems, void* arg) {
    auto* reader = static_cast<LazyFileReader*>(arg);
    ssize_t n = reader->read(buffer, size * nitems);
    if (n < 0) {
        log_error("upload: %s", reader->error().c_str());
        return CURL_READFUNC_ABORT;
    }
    return static_cast<size_t>(n);
}

static int part_seek_callback(void* arg, curl_off_t offset, int origin) {
    auto* reader = static_cast<LazyFileReader*>(arg);
    if (offset == 0 && origin == SEEK_SET) {
        reader->rewind();
        return CURL_SEEKFUNC_OK;
    }
    return CURL_SEEKFUNC_CANTSEEK;
}

bool is_connection_reset(int curl_code) {
    switch (static_cast<CURLcode>(curl_code)) {
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return true;
        default:
            return false;
    }
}

bool is_transient_error(int curl_code) {
    switch (static_cast<CURLcode>(curl_code)) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_CONNECT:
            return true;
        default:
            return is_connection_reset(curl_code);
    }
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        // Initialize CURL globally (thread-safe)
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        // One easy handle for the whole session; curl_easy_reset keeps its
        // connection cache so consecutive calls reuse the same connection.
        handle_ = curl_easy_init();
    }

    ~Impl() {
        if (handle_) {
            curl_easy_cleanup(handle_);
        }
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        std::lock_guard<std::mutex> lock(handle_mutex_);
        CURL* curl = handle_;
        if (!curl) {
            response.error = "Failed to initialize libcurl handle";
            response.is_network_error = true;
            return response;
        }
        curl_easy_reset(curl);

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        // Headers
        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        // Suppress "Expect: 100-continue" on large bodies
        headers_list = curl_slist_append(headers_list, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        // Request body
        curl_mime* mime = nullptr;
        std::vector<std::unique_ptr<LazyFileReader>> readers;
        uint64_t bytes_out = 0;

        if (!request.parts.empty()) {
            mime = curl_mime_init(curl);
            readers.reserve(request.parts.size());
            for (const auto& part : request.parts) {
                readers.push_back(std::make_unique<LazyFileReader>(
                    part.path, part.size, config_.upload_block_size));
                curl_mimepart* mp = curl_mime_addpart(mime);
                curl_mime_name(mp, "file");
                curl_mime_filename(mp, part.filename.c_str());
                curl_mime_type(mp, "application/octet-stream");
                curl_mime_data_cb(mp, static_cast<curl_off_t>(part.size),
                                  part_read_callback, part_seek_callback,
                                  nullptr, readers.back().get());
                bytes_out += part.size;
            }
            curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
            curl_easy_setopt(curl, CURLOPT_UPLOAD_BUFFERSIZE,
                             static_cast<long>(config_.upload_block_size));
        } else {
            switch (request.method) {
                case HttpMethod::GET:
                    if (request.body.empty()) {
                        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                    } else {
                        // The job endpoints take a JSON body on GET
                        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "GET");
                    }
                    break;
                case HttpMethod::POST:
                    curl_easy_setopt(curl, CURLOPT_POST, 1L);
                    break;
            }
            if (!request.body.empty() || request.method == HttpMethod::POST) {
                // A null POSTFIELDS would make libcurl read the body from stdin
                static const char empty_body[] = "";
                const void* data = request.body.empty()
                    ? static_cast<const void*>(empty_body)
                    : static_cast<const void*>(request.body.data());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
            }
            bytes_out = request.body.size();
        }

        // Response callbacks with bounded size
        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{&response_body, config_.max_response_size, 0, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        // Timeouts
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config_.default_connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(config_.default_total_timeout.count()));

        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE,
                             static_cast<long>(config_.tcp_keepalive_idle.count()));
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL,
                             static_cast<long>(config_.tcp_keepalive_interval.count()));
        }

        if (config_.verify_ssl) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            static bool ssl_warning_shown = false;
            if (!ssl_warning_shown) {
                log_warn("SSL verification disabled via configuration");
                ssl_warning_shown = true;
            }
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }
        if (!config_.ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle.c_str());
        }

        // Location headers of commit/publish/create are part of the API
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        // Execute
        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        auto end_time = std::chrono::steady_clock::now();

        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.total_requests++;

            if (res == CURLE_OK) {
                long code = 0;
                curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
                response.status_code = static_cast<int>(code);
                response.body = std::move(response_body);
                stats_.bytes_sent += bytes_out;
            } else if (res == CURLE_WRITE_ERROR && write_ctx.size_exceeded) {
                response.error = "Response body exceeded maximum size limit of " +
                                 std::to_string(config_.max_response_size) + " bytes";
                response.is_network_error = true;
                stats_.failed_requests++;
            } else {
                response.error = curl_easy_strerror(res);
                response.is_network_error = true;
                response.connection_reset = is_connection_reset(res);
                response.transient = is_transient_error(res);
                stats_.failed_requests++;
            }
        }

        if (mime) {
            curl_easy_setopt(curl, CURLOPT_MIMEPOST, nullptr);
            curl_mime_free(mime);
        }
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
        curl_slist_free_all(headers_list);

        return response;
    }

    const HttpClientConfig& config() const { return config_; }

    Stats stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        return stats_;
    }

private:
    HttpClientConfig config_;
    CURL* handle_ = nullptr;
    std::mutex handle_mutex_;
    mutable std::mutex stats_mutex_;
    Stats stats_;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

HttpClient::Stats HttpClient::stats() const {
    return impl_->stats();
}

}  // namespace flatpush::net
