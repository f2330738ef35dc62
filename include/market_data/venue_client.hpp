#pragma once

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include "common/types.hpp"
#include "common/result.hpp"
#include "market_data/order_book.hpp"

namespace pbot {

struct VenueAccount {
    std::string id;
    std::string username;
    double balance{0.0};
};

// Pooled-venue fill: shares are reported when the venue returns them
struct BetFill {
    std::string bet_id;
    std::optional<double> shares;
    double amount{0.0};
};

/**
 * Pooled-liquidity venue (market-maker formula, no order book).
 */
class PooledVenueClient {
public:
    virtual ~PooledVenueClient() = default;

    virtual Result<VenueAccount> get_me() = 0;
    virtual Result<std::vector<MarketSnapshot>> search_markets(int limit) = 0;
    virtual Result<MarketSnapshot> get_market(const std::string& market_id) = 0;
    virtual Result<BetFill> place_bet(const std::string& market_id, Direction outcome, Amount amount) = 0;
    // Sell the whole position held in one outcome
    virtual Result<BetFill> sell_shares(const std::string& market_id, Direction outcome) = 0;
};

// Fill-or-kill outcome. filled=false is a valid non-fill, not an error.
struct FokOrderResult {
    std::string order_id;
    std::string status;
    bool filled{false};
    std::optional<double> shares;
};

/**
 * Authenticated order placement on the order-book venue.
 */
class OrderBookVenueClient {
public:
    virtual ~OrderBookVenueClient() = default;

    // BUY usdc_amount of token_id at no worse than price
    virtual Result<FokOrderResult> place_fok_order(const std::string& token_id,
                                                   Amount usdc_amount,
                                                   double price) = 0;
};

/**
 * Venue-specific market record for the order-book venue. Token ids stay
 * here; the core only sees the MarketSnapshot built from it.
 */
struct PolymarketMarket {
    std::string condition_id;
    std::string question;
    std::string slug;
    std::string description;
    double yes_price{0.0};
    double no_price{0.0};
    std::string yes_token_id;
    std::string no_token_id;
    double volume_24hr{0.0};
    double liquidity{0.0};
    int64_t end_date_ms{0};

    const std::string& token_for(Direction d) const {
        return d == Direction::YES ? yes_token_id : no_token_id;
    }

    // Ask for the side, effective after depth enrichment
    double price_for(Direction d) const {
        return d == Direction::YES ? yes_price : no_price;
    }
};

/**
 * Unauthenticated market discovery and depth reads for the order-book venue.
 */
class PolymarketDataClient {
public:
    virtual ~PolymarketDataClient() = default;

    virtual Result<std::vector<PolymarketMarket>> fetch_markets() = 0;
    virtual Result<OrderBook> fetch_order_book(const std::string& token_id) = 0;
};

} // namespace pbot
