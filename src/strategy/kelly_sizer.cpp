#include "strategy/kelly_sizer.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace pbot {

namespace {
    constexpr double MIN_PRICE = 0.01;
    constexpr double MAX_PRICE = 0.99;
}

void require_probability(double p, const char* what) {
    if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
        throw std::invalid_argument(std::string(what) + " outside [0, 1]: " + std::to_string(p));
    }
}

double compute_edge(Probability estimate, Probability market_prob) {
    require_probability(estimate, "estimate");
    require_probability(market_prob, "market probability");
    return std::abs(estimate - market_prob);
}

Direction choose_direction(Probability estimate, Probability market_prob) {
    return estimate > market_prob ? Direction::YES : Direction::NO;
}

double kelly_fraction(Probability estimate, Probability market_prob, Direction direction) {
    require_probability(estimate, "estimate");
    require_probability(market_prob, "market probability");

    double m = std::clamp(market_prob, MIN_PRICE, MAX_PRICE);
    double b = 0.0;
    double p = 0.0;

    if (direction == Direction::YES) {
        b = (1.0 - m) / m;
        p = estimate;
    } else {
        b = m / (1.0 - m);
        p = 1.0 - estimate;
    }

    double q = 1.0 - p;
    double f = (b * p - q) / b;
    return std::max(0.0, f);
}

KellySizer::KellySizer(const StrategyConfig& config)
    : config_(config)
{
}

Amount KellySizer::max_bet_for(Venue venue) const {
    switch (venue) {
        case Venue::MANIFOLD:
            return config_.max_bet_amount;
        case Venue::POLYMARKET:
            return std::min(config_.max_bet_amount, config_.poly_max_bet_amount);
    }
    return config_.max_bet_amount;
}

Amount KellySizer::round_to_unit(Amount amount) const {
    double unit = config_.min_unit > 0 ? config_.min_unit : 1.0;
    return std::round(amount / unit) * unit;
}

Amount KellySizer::size_bet(double full_kelly, Amount bankroll, Venue venue, double liquidity) const {
    Amount bet = full_kelly * config_.kelly_fraction * bankroll;

    bet = std::min(bet, bankroll * config_.max_position_pct);
    bet = std::min(bet, max_bet_for(venue));

    if (venue_mechanism(venue) == Mechanism::POOLED_LIQUIDITY && liquidity > 0) {
        bet = std::min(bet, config_.max_impact_pct * 2.0 * liquidity);
    }

    return std::max(0.0, round_to_unit(bet));
}

SizingResult KellySizer::size_plain(Probability estimate, Probability market_prob,
                                    Direction direction, Amount bankroll, Venue venue) const {
    SizingResult result;
    result.kelly = kelly_fraction(estimate, market_prob, direction);
    result.effective_prob = market_prob;
    result.iterations = 1;
    result.stake = result.kelly > 0 ? size_bet(result.kelly, bankroll, venue) : 0.0;
    return result;
}

SizingResult KellySizer::size_with_slippage(Probability estimate, Probability market_prob,
                                            Direction direction, Amount bankroll,
                                            double liquidity) const {
    if (!std::isfinite(liquidity) || liquidity <= 0.0) {
        throw std::invalid_argument("pooled market liquidity must be positive: " + std::to_string(liquidity));
    }

    SizingResult result;
    result.effective_prob = market_prob;

    Amount bet = 0.0;
    int max_rounds = std::max(1, config_.max_slippage_iterations);

    for (int i = 0; i < max_rounds; ++i) {
        result.iterations = i + 1;

        // Buying pushes the price against us
        double slippage = bet / (4.0 * liquidity);
        if (direction == Direction::YES) {
            result.effective_prob = std::min(MAX_PRICE, market_prob + slippage);
        } else {
            result.effective_prob = std::max(MIN_PRICE, market_prob - slippage);
        }

        result.kelly = kelly_fraction(estimate, result.effective_prob, direction);
        if (result.kelly <= 0) {
            result.kelly = 0.0;
            result.stake = 0.0;
            return result;
        }

        Amount new_bet = size_bet(result.kelly, bankroll, Venue::MANIFOLD, liquidity);
        if (i > 0) {
            new_bet = std::min(bet, round_to_unit((bet + new_bet) / 2.0));
        }
        if (std::abs(new_bet - bet) < 1.0) break;
        bet = new_bet;
        result.stakes.push_back(bet);
    }

    result.stake = bet;
    spdlog::debug("Slippage sizing: stake={} kelly={:.4f} eff_prob={:.4f} rounds={}",
                  result.stake, result.kelly, result.effective_prob, result.iterations);
    return result;
}

SizingResult KellySizer::size(Probability estimate, const MarketSnapshot& market,
                              Direction direction, Amount bankroll, Venue venue) const {
    switch (venue_mechanism(venue)) {
        case Mechanism::ORDER_BOOK:
            return size_plain(estimate, market.probability, direction, bankroll, venue);
        case Mechanism::POOLED_LIQUIDITY:
            return size_with_slippage(estimate, market.probability, direction, bankroll, market.liquidity);
    }
    return size_plain(estimate, market.probability, direction, bankroll, venue);
}

} // namespace pbot
