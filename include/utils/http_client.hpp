#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/result.hpp"

namespace pbot {

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::string body;
    std::vector<std::string> headers;  // "Name: value"
    long timeout_ms{30000};
};

struct HttpResponse {
    long status{0};
    std::string body;
};

/**
 * Blocking libcurl transport. Transport failures and 429/5xx come back as
 * TRANSIENT errors, other non-2xx statuses as REJECTED. Clients take the
 * transport by reference so tests can substitute a canned one.
 */
class HttpClient {
public:
    HttpClient();
    virtual ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    virtual Result<HttpResponse> send(const HttpRequest& request);

    Result<HttpResponse> get(const std::string& url,
                             std::vector<std::string> headers = {},
                             long timeout_ms = 30000);
    Result<HttpResponse> post(const std::string& url,
                              const std::string& body,
                              std::vector<std::string> headers = {},
                              long timeout_ms = 30000);
};

// Parse a response body; INVALID_DATA on malformed JSON
Result<nlohmann::json> parse_json_body(const HttpResponse& response, const std::string& context);

// Percent-encode a query parameter value
std::string url_encode(const std::string& value);

} // namespace pbot
