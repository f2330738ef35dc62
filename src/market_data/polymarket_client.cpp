#include "market_data/polymarket_client.hpp"
#include "utils/crypto.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <future>
#include <cctype>

namespace pbot {

namespace {
    // Gamma encodes arrays as JSON strings: "[\"Yes\",\"No\"]"
    std::vector<std::string> parse_string_array(const nlohmann::json& item, const char* key) {
        std::vector<std::string> out;
        if (!item.contains(key)) return out;

        nlohmann::json arr = item.at(key);
        if (arr.is_string()) {
            arr = nlohmann::json::parse(arr.get<std::string>(), nullptr, false);
        }
        if (!arr.is_array()) return out;

        for (const auto& v : arr) {
            if (v.is_string()) out.push_back(v.get<std::string>());
            else if (v.is_number()) out.push_back(v.dump());
        }
        return out;
    }

    double number_field(const nlohmann::json& item, const char* key) {
        if (!item.contains(key)) return 0.0;
        const auto& v = item.at(key);
        if (v.is_number()) return v.get<double>();
        if (v.is_string()) {
            try {
                return std::stod(v.get<std::string>());
            } catch (const std::exception&) {
                return 0.0;
            }
        }
        return 0.0;
    }

    std::string string_field(const nlohmann::json& item, const char* key, const char* alt) {
        if (item.contains(key) && item.at(key).is_string()) return item.at(key).get<std::string>();
        if (item.contains(alt) && item.at(alt).is_string()) return item.at(alt).get<std::string>();
        return "";
    }

    std::optional<double> parse_price(const std::string& s) {
        try {
            size_t pos = 0;
            double v = std::stod(s, &pos);
            if (pos != s.size()) return std::nullopt;
            return v;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    std::vector<PriceLevel> parse_levels(const nlohmann::json& j, const char* key) {
        std::vector<PriceLevel> levels;
        if (!j.contains(key) || !j.at(key).is_array()) return levels;

        for (const auto& lvl : j.at(key)) {
            PriceLevel level;
            level.price = number_field(lvl, "price");
            level.size = number_field(lvl, "size");
            if (level.price > 0 && level.size > 0) {
                levels.push_back(level);
            }
        }
        return levels;
    }

    std::string request_path(const std::string& url) {
        auto pos = url.find("://");
        if (pos != std::string::npos) {
            auto slash_pos = url.find('/', pos + 3);
            if (slash_pos != std::string::npos) {
                return url.substr(slash_pos);
            }
        }
        return url;
    }

    bool is_fok_kill_message(const std::string& msg) {
        std::string lower = msg;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower.find("fully filled") != std::string::npos ||
               lower.find("no match") != std::string::npos ||
               lower.find("not enough liquidity") != std::string::npos;
    }
}

// Free functions

std::vector<PolymarketMarket> parse_gamma_markets(const nlohmann::json& j,
                                                  int64_t now_ms,
                                                  const PolymarketConfig& config) {
    std::vector<PolymarketMarket> markets;
    if (!j.is_array()) return markets;

    for (const auto& item : j) {
        if (!item.is_object()) continue;

        auto outcomes = parse_string_array(item, "outcomes");
        auto prices = parse_string_array(item, "outcomePrices");
        if (outcomes.size() != 2 || prices.size() != 2) continue;

        auto yes_price = parse_price(prices[0]);
        auto no_price = parse_price(prices[1]);
        if (!yes_price || !no_price) continue;

        PolymarketMarket m;
        m.condition_id = string_field(item, "conditionId", "condition_id");
        m.question = item.value("question", "");
        m.slug = string_field(item, "slug", "market_slug");
        m.description = item.contains("description") && item["description"].is_string()
                            ? item["description"].get<std::string>() : "";
        m.yes_price = *yes_price;
        m.no_price = *no_price;

        // Token ids: either a tokens array or clobTokenIds in outcome order
        if (item.contains("tokens") && item["tokens"].is_array()) {
            for (const auto& token : item["tokens"]) {
                std::string outcome = token.value("outcome", "");
                std::string token_id = token.value("token_id", "");
                if (outcome == "Yes") m.yes_token_id = token_id;
                else if (outcome == "No") m.no_token_id = token_id;
            }
        } else {
            auto ids = parse_string_array(item, "clobTokenIds");
            if (ids.size() == 2 && outcomes[0] == "Yes" && outcomes[1] == "No") {
                m.yes_token_id = ids[0];
                m.no_token_id = ids[1];
            }
        }
        if (m.condition_id.empty() || m.yes_token_id.empty() || m.no_token_id.empty()) continue;

        m.volume_24hr = number_field(item, "volume24hr");
        m.liquidity = number_field(item, "liquidityNum");
        if (m.volume_24hr < config.min_volume_24hr) continue;
        if (m.liquidity < config.min_liquidity) continue;

        std::string end_date = item.value("endDate", "");
        if (end_date.empty()) continue;
        try {
            m.end_date_ms = time_utils::iso8601_to_epoch_ms(end_date);
        } catch (const std::invalid_argument&) {
            continue;
        }
        int64_t until_end = m.end_date_ms - now_ms;
        if (until_end < 0 || until_end > config.max_time_to_end_ms) continue;

        markets.push_back(std::move(m));
    }

    return markets;
}

OrderBook parse_order_book(const nlohmann::json& j, const std::string& token_id) {
    OrderBook book(token_id);
    book.apply_snapshot(parse_levels(j, "bids"), parse_levels(j, "asks"));
    return book;
}

std::vector<PolymarketMarket> filter_polymarket_markets(const std::vector<PolymarketMarket>& markets,
                                                        const PolymarketConfig& config) {
    std::vector<PolymarketMarket> out;
    for (const auto& m : markets) {
        if (m.yes_price >= config.min_price && m.yes_price <= config.max_price) {
            out.push_back(m);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const PolymarketMarket& a, const PolymarketMarket& b) {
        return a.end_date_ms < b.end_date_ms;
    });
    return out;
}

std::vector<PolymarketMarket> enrich_with_effective_prices(const std::vector<PolymarketMarket>& markets,
                                                           double usdc_amount,
                                                           PolymarketDataClient& client) {
    std::vector<PolymarketMarket> out;

    for (const auto& m : markets) {
        auto yes_future = std::async(std::launch::async,
                                     [&client, &m] { return client.fetch_order_book(m.yes_token_id); });
        auto no_future = std::async(std::launch::async,
                                    [&client, &m] { return client.fetch_order_book(m.no_token_id); });
        auto yes_book = yes_future.get();
        auto no_book = no_future.get();

        if (!yes_book || !no_book) {
            const auto& err = !yes_book ? yes_book.error() : no_book.error();
            spdlog::warn("Book read failed for {}: {}; keeping quoted prices", m.condition_id, err.message);
            out.push_back(m);
            continue;
        }

        auto yes_eff = yes_book.value().effective_buy_price(usdc_amount);
        auto no_eff = no_book.value().effective_buy_price(usdc_amount);
        if (!yes_eff && !no_eff) {
            spdlog::debug("Dropping {}: no depth for {} USDC on either side", m.condition_id, usdc_amount);
            continue;
        }

        PolymarketMarket enriched = m;
        enriched.yes_price = yes_eff.value_or(m.yes_price);
        enriched.no_price = no_eff.value_or(m.no_price);
        out.push_back(std::move(enriched));
    }

    return out;
}

FokOrderResult parse_fok_response(const nlohmann::json& j) {
    FokOrderResult r;
    r.order_id = j.value("orderID", j.value("orderId", ""));
    r.status = j.value("status", "");

    bool success = j.value("success", !r.order_id.empty());
    std::string error = j.value("errorMsg", "");

    r.filled = success && !r.order_id.empty() && (r.status.empty() || r.status == "matched");
    if (!r.filled) {
        if (r.order_id.empty()) r.order_id = "no-fill";
        if (r.status.empty()) r.status = error.empty() ? "no-fill" : error;
        return r;
    }

    // For a BUY the taking side is the shares received
    double taking = 0.0;
    if (j.contains("takingAmount")) {
        const auto& t = j["takingAmount"];
        if (t.is_number()) taking = t.get<double>();
        else if (t.is_string()) taking = parse_price(t.get<std::string>()).value_or(0.0);
    }
    if (taking > 0) r.shares = taking;

    return r;
}

// PolymarketClient

PolymarketClient::PolymarketClient(const ConnectionConfig& connection,
                                   const PolymarketConfig& config,
                                   HttpClient& http,
                                   time_utils::RateLimiter& limiter)
    : connection_(connection)
    , config_(config)
    , http_(http)
    , limiter_(limiter)
{
    retry_.max_attempts = connection_.retry_max_attempts;
    retry_.base_delay = std::chrono::milliseconds(connection_.retry_base_delay_ms);
    spdlog::debug("PolymarketClient initialized: gamma={} clob={}",
                  connection_.polymarket_gamma_url, connection_.polymarket_clob_url);
}

void PolymarketClient::set_api_credentials(const std::string& key,
                                           const std::string& secret,
                                           const std::string& passphrase,
                                           const std::string& address) {
    api_key_ = key;
    api_secret_ = secret;
    api_passphrase_ = passphrase;
    address_ = address;
}

std::string PolymarketClient::generate_l2_signature(const std::string& timestamp,
                                                    const std::string& method,
                                                    const std::string& path,
                                                    const std::string& body) const {
    std::string message = timestamp + method + request_path(path) + body;
    auto decoded = crypto::base64_decode(api_secret_);
    std::string key(decoded.begin(), decoded.end());
    return crypto::hmac_sha256(key, message);
}

std::vector<std::string> PolymarketClient::l2_headers(const std::string& method,
                                                      const std::string& path,
                                                      const std::string& body) const {
    std::string timestamp = std::to_string(time_utils::epoch_ms() / 1000);
    std::vector<std::string> headers = {
        "POLY_API_KEY: " + api_key_,
        "POLY_TIMESTAMP: " + timestamp,
        "POLY_SIGNATURE: " + generate_l2_signature(timestamp, method, path, body),
        "POLY_PASSPHRASE: " + api_passphrase_
    };
    if (!address_.empty()) {
        headers.push_back("POLY_ADDRESS: " + address_);
    }
    return headers;
}

Result<std::vector<PolymarketMarket>> PolymarketClient::fetch_markets() {
    std::string url = connection_.polymarket_gamma_url + "/markets?closed=false&active=true&limit=200";

    auto response = with_retry([&] {
        limiter_.acquire();
        return http_.get(url, {"User-Agent: predictbot/1.0"}, connection_.gamma_timeout_ms);
    }, retry_, "Gamma markets");
    if (!response) return response.error();

    auto j = parse_json_body(response.value(), "Gamma markets");
    if (!j) return j.error();
    if (!j.value().is_array()) {
        return Error::invalid_data("Gamma markets: expected a JSON array");
    }

    auto markets = parse_gamma_markets(j.value(), time_utils::epoch_ms(), config_);
    spdlog::info("Fetched {} raw markets from Polymarket, {} binary candidates",
                 j.value().size(), markets.size());
    return markets;
}

Result<OrderBook> PolymarketClient::fetch_order_book(const std::string& token_id) {
    std::string url = connection_.polymarket_clob_url + "/book?token_id=" + url_encode(token_id);

    auto response = with_retry([&] {
        limiter_.acquire();
        return http_.get(url, {}, connection_.book_timeout_ms);
    }, retry_, "CLOB book");
    if (!response) return response.error();

    auto j = parse_json_body(response.value(), "CLOB book " + token_id);
    if (!j) return j.error();

    return parse_order_book(j.value(), token_id);
}

Result<FokOrderResult> PolymarketClient::place_fok_order(const std::string& token_id,
                                                         Amount usdc_amount,
                                                         double price) {
    if (!has_credentials()) {
        return Error::configuration("Polymarket API credentials not set");
    }
    if (token_id.empty()) {
        return Error::invalid_data("Polymarket order without token id");
    }

    nlohmann::json order_body = {
        {"order", {
            {"tokenID", token_id},
            {"side", "BUY"},
            {"price", fmt::format("{:.4f}", price)},
            {"amount", fmt::format("{:.2f}", usdc_amount)},
            {"signatureType", config_.signature_type}
        }},
        {"owner", api_key_},
        {"orderType", "FOK"}
    };
    std::string body = order_body.dump();
    std::string url = connection_.polymarket_clob_url + "/order";

    // Orders are never retried: a timeout may still have filled
    limiter_.acquire();
    auto response = http_.post(url, body, l2_headers("POST", url, body), connection_.request_timeout_ms);
    if (!response) {
        if (response.error().kind == ErrorKind::REJECTED && is_fok_kill_message(response.error().message)) {
            FokOrderResult killed;
            killed.order_id = "no-fill";
            killed.status = "killed";
            return killed;
        }
        return response.error();
    }

    auto j = parse_json_body(response.value(), "CLOB order");
    if (!j) return j.error();

    auto result = parse_fok_response(j.value());
    spdlog::info("FOK order {} on {}: status={} filled={}",
                 result.order_id, token_id, result.status, result.filled);
    return result;
}

} // namespace pbot
