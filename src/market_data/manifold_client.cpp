#include "market_data/manifold_client.hpp"
#include "market_data/market_adapter.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace pbot {

Result<BetFill> parse_bet_response(const nlohmann::json& j, const std::string& context) {
    if (!j.is_object()) {
        return Error::invalid_data(context + ": expected a JSON object");
    }

    BetFill fill;
    fill.bet_id = j.value("betId", j.value("id", ""));
    if (fill.bet_id.empty()) {
        return Error::invalid_data(context + ": response has no bet id");
    }
    if (j.contains("shares") && j["shares"].is_number()) {
        fill.shares = std::abs(j["shares"].get<double>());
    }
    if (j.contains("amount") && j["amount"].is_number()) {
        fill.amount = j["amount"].get<double>();
    }
    return fill;
}

ManifoldClient::ManifoldClient(const ConnectionConfig& connection,
                               const std::string& api_key,
                               HttpClient& http,
                               time_utils::RateLimiter& limiter)
    : connection_(connection)
    , api_key_(api_key)
    , http_(http)
    , limiter_(limiter)
{
    retry_.max_attempts = connection_.retry_max_attempts;
    retry_.base_delay = std::chrono::milliseconds(connection_.retry_base_delay_ms);
}

Result<nlohmann::json> ManifoldClient::get_json(const std::string& path,
                                                const std::map<std::string, std::string>& params) {
    std::string url = connection_.manifold_api_url + path;
    char sep = '?';
    for (const auto& [k, v] : params) {
        url += sep + url_encode(k) + "=" + url_encode(v);
        sep = '&';
    }

    auto response = with_retry([&] {
        limiter_.acquire();
        return http_.get(url, {"Authorization: Key " + api_key_}, connection_.request_timeout_ms);
    }, retry_, "Manifold GET " + path);
    if (!response) return response.error();

    return parse_json_body(response.value(), "Manifold " + path);
}

Result<nlohmann::json> ManifoldClient::post_json(const std::string& path, const nlohmann::json& body) {
    std::string url = connection_.manifold_api_url + path;
    std::string payload = body.dump();

    auto response = with_retry([&] {
        limiter_.acquire();
        return http_.post(url, payload, {"Authorization: Key " + api_key_}, connection_.request_timeout_ms);
    }, retry_, "Manifold POST " + path);
    if (!response) return response.error();

    return parse_json_body(response.value(), "Manifold POST " + path);
}

Result<VenueAccount> ManifoldClient::get_me() {
    auto j = get_json("/me");
    if (!j) return j.error();

    try {
        VenueAccount account;
        account.id = j.value().value("id", "");
        account.username = j.value().value("username", "");
        j.value().at("balance").get_to(account.balance);
        return account;
    } catch (const nlohmann::json::exception& e) {
        return Error::invalid_data(std::string("Manifold /me: ") + e.what());
    }
}

Result<std::vector<MarketSnapshot>> ManifoldClient::search_markets(int limit) {
    auto j = get_json("/search-markets", {
        {"filter", "open"},
        {"contractType", "BINARY"},
        {"sort", "liquidity"},
        {"limit", std::to_string(limit)}
    });
    if (!j) return j.error();
    if (!j.value().is_array()) {
        return Error::invalid_data("Manifold /search-markets: expected a JSON array");
    }

    std::vector<MarketSnapshot> markets;
    for (const auto& item : j.value()) {
        try {
            markets.push_back(parse_manifold_market(item));
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Skipping malformed Manifold market: {}", e.what());
        }
    }
    return markets;
}

Result<MarketSnapshot> ManifoldClient::get_market(const std::string& market_id) {
    auto j = get_json("/market/" + url_encode(market_id));
    if (!j) return j.error();

    try {
        return parse_manifold_market(j.value());
    } catch (const nlohmann::json::exception& e) {
        return Error::invalid_data("Manifold /market/" + market_id + ": " + e.what());
    }
}

Result<BetFill> ManifoldClient::place_bet(const std::string& market_id, Direction outcome, Amount amount) {
    nlohmann::json body = {
        {"contractId", market_id},
        {"outcome", direction_to_string(outcome)},
        {"amount", std::lround(amount)}
    };
    auto j = post_json("/bet", body);
    if (!j) return j.error();
    return parse_bet_response(j.value(), "Manifold /bet");
}

Result<BetFill> ManifoldClient::sell_shares(const std::string& market_id, Direction outcome) {
    nlohmann::json body = {{"outcome", direction_to_string(outcome)}};
    auto j = post_json("/market/" + url_encode(market_id) + "/sell", body);
    if (!j) return j.error();
    return parse_bet_response(j.value(), "Manifold sell");
}

} // namespace pbot
