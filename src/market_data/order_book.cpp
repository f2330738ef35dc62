#include "market_data/order_book.hpp"
#include <algorithm>
#include <cmath>

namespace pbot {

std::optional<double> effective_buy_price(const std::vector<PriceLevel>& asks, double usdc_amount) {
    if (!(usdc_amount > 0)) return std::nullopt;

    std::vector<PriceLevel> sorted;
    sorted.reserve(asks.size());
    for (const auto& level : asks) {
        if (std::isfinite(level.price) && std::isfinite(level.size) &&
            level.price > 0 && level.size > 0) {
            sorted.push_back(level);
        }
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const PriceLevel& a, const PriceLevel& b) { return a.price < b.price; });

    double remaining = usdc_amount;
    double total_shares = 0.0;

    for (const auto& level : sorted) {
        double capacity_usdc = level.price * level.size;
        if (remaining <= capacity_usdc) {
            total_shares += remaining / level.price;
            remaining = 0.0;
            break;
        }
        total_shares += level.size;
        remaining -= capacity_usdc;
    }

    if (remaining > 0 || total_shares <= 0) return std::nullopt;
    return usdc_amount / total_shares;
}

OrderBook::OrderBook(const std::string& token_id)
    : token_id_(token_id)
{
}

void OrderBook::apply_snapshot(const std::vector<PriceLevel>& bids,
                               const std::vector<PriceLevel>& asks) {
    bids_.clear();
    for (const auto& level : bids) {
        if (level.price > 0.0 && level.size > 0.0) {
            bids_[level.price] += level.size;
        }
    }

    asks_.clear();
    for (const auto& level : asks) {
        if (level.price > 0.0 && level.size > 0.0) {
            asks_[level.price] += level.size;
        }
    }
}

std::optional<PriceLevel> OrderBook::best_bid() const {
    if (bids_.empty()) return std::nullopt;
    auto it = bids_.begin();
    return PriceLevel{it->first, it->second};
}

std::optional<PriceLevel> OrderBook::best_ask() const {
    if (asks_.empty()) return std::nullopt;
    auto it = asks_.begin();
    return PriceLevel{it->first, it->second};
}

double OrderBook::mid_price() const {
    auto bid = best_bid();
    auto ask = best_ask();
    if (!bid || !ask) return 0.0;
    return (bid->price + ask->price) / 2.0;
}

std::vector<PriceLevel> OrderBook::bids() const {
    std::vector<PriceLevel> result;
    for (const auto& [price, size] : bids_) {
        result.push_back({price, size});
    }
    return result;
}

std::vector<PriceLevel> OrderBook::asks() const {
    std::vector<PriceLevel> result;
    for (const auto& [price, size] : asks_) {
        result.push_back({price, size});
    }
    return result;
}

double OrderBook::ask_depth_usdc() const {
    double total = 0.0;
    for (const auto& [price, size] : asks_) {
        total += price * size;
    }
    return total;
}

std::optional<double> OrderBook::effective_buy_price(double usdc_amount) const {
    return pbot::effective_buy_price(asks(), usdc_amount);
}

bool OrderBook::empty() const {
    return bids_.empty() && asks_.empty();
}

} // namespace pbot
