#pragma once

#include <string>
#include <vector>
#include <map>
#include "common/result.hpp"
#include "config/config.hpp"
#include "market_data/venue_client.hpp"
#include "utils/http_client.hpp"
#include "utils/retry.hpp"
#include "utils/time_utils.hpp"

namespace pbot {

/**
 * Manifold Markets REST client (pooled-liquidity venue).
 * Every request passes through the injected rate limiter and the retry
 * wrapper; auth is "Authorization: Key <api key>".
 */
class ManifoldClient : public PooledVenueClient {
public:
    ManifoldClient(const ConnectionConfig& connection,
                   const std::string& api_key,
                   HttpClient& http,
                   time_utils::RateLimiter& limiter);

    Result<VenueAccount> get_me() override;
    Result<std::vector<MarketSnapshot>> search_markets(int limit) override;
    Result<MarketSnapshot> get_market(const std::string& market_id) override;
    Result<BetFill> place_bet(const std::string& market_id, Direction outcome, Amount amount) override;
    Result<BetFill> sell_shares(const std::string& market_id, Direction outcome) override;

private:
    ConnectionConfig connection_;
    std::string api_key_;
    HttpClient& http_;
    time_utils::RateLimiter& limiter_;
    RetryPolicy retry_;

    Result<nlohmann::json> get_json(const std::string& path,
                                    const std::map<std::string, std::string>& params = {});
    Result<nlohmann::json> post_json(const std::string& path, const nlohmann::json& body);
};

// /bet and /sell responses -> BetFill
Result<BetFill> parse_bet_response(const nlohmann::json& j, const std::string& context);

} // namespace pbot
