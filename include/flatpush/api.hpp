#pragma once

#include "flatpush/net/http.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace flatpush {

/// Bearer-authenticated request with a JSON body.
net::HttpRequest make_json_request(net::HttpMethod method, const std::string& url,
                                   const std::string& token, const nlohmann::json& body);

/// Throws TransportError when no HTTP answer was received and ApiError for
/// any status other than 200.
void check_response(const std::string& url, const net::HttpResponse& response);

/// Throws TransportError when no HTTP answer was received.
void check_transport(const std::string& url, const net::HttpResponse& response);

/// Decode the response body; an empty body decodes to an empty object.
nlohmann::json response_json(const net::HttpResponse& response);

}  // namespace flatpush
