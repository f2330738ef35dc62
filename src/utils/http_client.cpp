#include "utils/http_client.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <mutex>
#include <cctype>

namespace pbot {

namespace {
    size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
        size_t total_size = size * nmemb;
        output->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    std::once_flag curl_init_flag;

    std::string excerpt(const std::string& body, size_t max_len = 200) {
        if (body.size() <= max_len) return body;
        return body.substr(0, max_len) + "...";
    }
}

HttpClient::HttpClient() {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

HttpClient::~HttpClient() = default;

Result<HttpResponse> HttpClient::send(const HttpRequest& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Error::transient("Failed to initialize CURL");
    }

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (request.method == "POST") {
        headers = curl_slist_append(headers, "Content-Type: application/json");
    }
    for (const auto& h : request.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return Error::transient(request.method + " " + request.url + ": " + curl_easy_strerror(res));
    }

    if (response.status < 200 || response.status >= 300) {
        spdlog::debug("{} {} -> {} {}", request.method, request.url, response.status, excerpt(response.body));
        auto err = Error::from_http_status(response.status, request.method + " " + request.url);
        err.message += " " + excerpt(response.body);
        return err;
    }

    return response;
}

Result<HttpResponse> HttpClient::get(const std::string& url,
                                     std::vector<std::string> headers,
                                     long timeout_ms) {
    HttpRequest req;
    req.method = "GET";
    req.url = url;
    req.headers = std::move(headers);
    req.timeout_ms = timeout_ms;
    return send(req);
}

Result<HttpResponse> HttpClient::post(const std::string& url,
                                      const std::string& body,
                                      std::vector<std::string> headers,
                                      long timeout_ms) {
    HttpRequest req;
    req.method = "POST";
    req.url = url;
    req.body = body;
    req.headers = std::move(headers);
    req.timeout_ms = timeout_ms;
    return send(req);
}

Result<nlohmann::json> parse_json_body(const HttpResponse& response, const std::string& context) {
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        return Error::invalid_data(context + ": invalid JSON response (" + e.what() + ")");
    }
}

std::string url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace pbot
