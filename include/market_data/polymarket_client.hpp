#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "common/result.hpp"
#include "config/config.hpp"
#include "market_data/venue_client.hpp"
#include "utils/http_client.hpp"
#include "utils/retry.hpp"
#include "utils/time_utils.hpp"

namespace pbot {

/**
 * Polymarket REST client.
 *
 * Market discovery comes from the Gamma API, depth from the CLOB /book
 * endpoint (both unauthenticated). Orders go to CLOB /order with L2 HMAC
 * headers (POLY_API_KEY, POLY_TIMESTAMP, POLY_SIGNATURE, POLY_PASSPHRASE).
 */
class PolymarketClient : public PolymarketDataClient, public OrderBookVenueClient {
public:
    PolymarketClient(const ConnectionConfig& connection,
                     const PolymarketConfig& config,
                     HttpClient& http,
                     time_utils::RateLimiter& limiter);

    // Market discovery (Gamma)
    Result<std::vector<PolymarketMarket>> fetch_markets() override;

    // Order book (CLOB REST)
    Result<OrderBook> fetch_order_book(const std::string& token_id) override;

    // Fill-or-kill BUY; requires credentials
    Result<FokOrderResult> place_fok_order(const std::string& token_id,
                                           Amount usdc_amount,
                                           double price) override;

    void set_api_credentials(const std::string& key,
                             const std::string& secret,
                             const std::string& passphrase,
                             const std::string& address = "");
    bool has_credentials() const { return !api_key_.empty() && !api_secret_.empty(); }

    // HMAC over timestamp + method + path + body, keyed by the base64 secret
    std::string generate_l2_signature(const std::string& timestamp,
                                      const std::string& method,
                                      const std::string& path,
                                      const std::string& body) const;

private:
    ConnectionConfig connection_;
    PolymarketConfig config_;
    HttpClient& http_;
    time_utils::RateLimiter& limiter_;
    RetryPolicy retry_;

    std::string api_key_;
    std::string api_secret_;
    std::string api_passphrase_;
    std::string address_;

    std::vector<std::string> l2_headers(const std::string& method,
                                        const std::string& path,
                                        const std::string& body) const;
};

// Gamma market list -> binary markets with both token ids, volume and
// liquidity at or above the minimums, ending within max_time_to_end_ms
std::vector<PolymarketMarket> parse_gamma_markets(const nlohmann::json& j,
                                                  int64_t now_ms,
                                                  const PolymarketConfig& config);

// CLOB /book response (string prices and sizes) -> OrderBook
OrderBook parse_order_book(const nlohmann::json& j, const std::string& token_id);

// Yes price inside [min_price, max_price], soonest end date first
std::vector<PolymarketMarket> filter_polymarket_markets(const std::vector<PolymarketMarket>& markets,
                                                        const PolymarketConfig& config);

/**
 * Replace quoted prices with the effective fill price for usdc_amount.
 * Both books of a market are read in parallel. A market is dropped when
 * neither side can fill; a failed book read keeps the quoted prices.
 */
std::vector<PolymarketMarket> enrich_with_effective_prices(const std::vector<PolymarketMarket>& markets,
                                                           double usdc_amount,
                                                           PolymarketDataClient& client);

// Classify a CLOB order response body
FokOrderResult parse_fok_response(const nlohmann::json& j);

} // namespace pbot
