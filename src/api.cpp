#include "flatpush/api.hpp"
#include "flatpush/errors.hpp"

namespace flatpush {

net::HttpRequest make_json_request(net::HttpMethod method, const std::string& url,
                                   const std::string& token, const nlohmann::json& body) {
    net::HttpRequest request;
    request.method = method;
    request.url = url;
    request.headers.set_bearer_token(token);
    request.set_json_body(body.dump());
    return request;
}

void check_transport(const std::string& url, const net::HttpResponse& response) {
    if (response.is_network_error) {
        throw TransportError(url, response.error, response.transient);
    }
}

void check_response(const std::string& url, const net::HttpResponse& response) {
    check_transport(url, response);
    if (response.status_code != 200) {
        throw ApiError(url, response.status_code, response.body_string());
    }
}

nlohmann::json response_json(const net::HttpResponse& response) {
    if (response.body.empty()) {
        return nlohmann::json::object();
    }
    return nlohmann::json::parse(response.body.begin(), response.body.end());
}

}  // namespace flatpush
