#pragma once

#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"

namespace pbot {

// Throws std::invalid_argument unless p is a finite value in [0, 1]
void require_probability(double p, const char* what);

// |estimate - market|
double compute_edge(Probability estimate, Probability market_prob);

// YES when the estimate is above the market, NO otherwise
Direction choose_direction(Probability estimate, Probability market_prob);

/**
 * Full Kelly fraction for a binary contract priced at market_prob.
 *
 * YES: b = (1-m)/m, p = estimate
 * NO:  b = m/(1-m), p = 1 - estimate
 * f = (b*p - (1-p)) / b, floored at 0
 *
 * m is clamped to [0.01, 0.99].
 */
double kelly_fraction(Probability estimate, Probability market_prob, Direction direction);

struct SizingResult {
    Amount stake{0.0};
    double kelly{0.0};             // Full Kelly at the effective price
    Probability effective_prob{0.0};
    int iterations{0};
    std::vector<Amount> stakes;    // Stake after each round that moved it
};

/**
 * Turns a Kelly fraction into a stake under the configured risk limits.
 *
 * Order-book venues are sized once at the quoted price. Pooled venues
 * iterate: stake -> slippage (stake / 4L) -> shifted price -> Kelly ->
 * stake, until the stake moves by less than one unit or the round limit
 * is hit. After the first round the stake steps halfway toward the Kelly
 * stake and never rises, so the sequence is non-increasing. A non-positive
 * Kelly at any round ends with zero stake.
 */
class KellySizer {
public:
    explicit KellySizer(const StrategyConfig& config);

    // Fractional Kelly -> position cap -> venue cap -> impact cap -> round -> floor
    Amount size_bet(double full_kelly, Amount bankroll, Venue venue, double liquidity = 0.0) const;

    SizingResult size_plain(Probability estimate, Probability market_prob,
                            Direction direction, Amount bankroll, Venue venue) const;

    SizingResult size_with_slippage(Probability estimate, Probability market_prob,
                                    Direction direction, Amount bankroll, double liquidity) const;

    // Dispatch on the venue's mechanism
    SizingResult size(Probability estimate, const MarketSnapshot& market,
                      Direction direction, Amount bankroll, Venue venue) const;

    Amount max_bet_for(Venue venue) const;

    const StrategyConfig& config() const { return config_; }

private:
    StrategyConfig config_;

    Amount round_to_unit(Amount amount) const;
};

} // namespace pbot
