#pragma once

#include <map>
#include <vector>
#include <optional>
#include <functional>
#include "common/types.hpp"

namespace pbot {

/**
 * Sweep asks (any order) for a BUY of usdc_amount. Returns the average
 * price per share, or nullopt when the book cannot fill the whole amount.
 * Levels with a non-positive price or size are ignored.
 */
std::optional<double> effective_buy_price(const std::vector<PriceLevel>& asks, double usdc_amount);

/**
 * Snapshot order book for one outcome token. Built from a REST depth
 * read, not maintained from a stream, so it is a plain value type.
 */
class OrderBook {
public:
    explicit OrderBook(const std::string& token_id);

    // Full snapshot update
    void apply_snapshot(const std::vector<PriceLevel>& bids,
                        const std::vector<PriceLevel>& asks);

    std::optional<PriceLevel> best_bid() const;
    std::optional<PriceLevel> best_ask() const;
    double mid_price() const;

    std::vector<PriceLevel> bids() const;   // Highest first
    std::vector<PriceLevel> asks() const;   // Lowest first

    // USDC needed to lift every ask
    double ask_depth_usdc() const;

    std::optional<double> effective_buy_price(double usdc_amount) const;

    bool empty() const;
    const std::string& token_id() const { return token_id_; }

private:
    std::string token_id_;

    // Bids sorted descending (highest first)
    std::map<double, double, std::greater<double>> bids_;
    // Asks sorted ascending (lowest first)
    std::map<double, double> asks_;
};

} // namespace pbot
