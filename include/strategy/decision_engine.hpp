#pragma once

#include <string>
#include "common/types.hpp"
#include "config/config.hpp"
#include "persistence/records.hpp"
#include "strategy/kelly_sizer.hpp"

namespace pbot {

/**
 * Decision classifier.
 *
 * Gates, first failure wins:
 * 1. edge < edge_threshold                         -> SKIP_LOW_EDGE (no direction)
 * 2. confidence "low", not finance/sports question  -> SKIP_LOW_CONFIDENCE (no direction)
 * 3. direction + sizing (venue mechanism picks the sizer)
 * 4. Kelly <= 0                                     -> SKIP_NEGATIVE_KELLY
 * 5. stake < 1 unit                                 -> SKIP_LOW_EDGE
 * 6. BET
 *
 * Every path produces a fully populated DecisionRecord.
 */
class DecisionEngine {
public:
    explicit DecisionEngine(const StrategyConfig& config);

    // Throws std::invalid_argument when the estimate or market price is not a probability
    DecisionRecord decide(const MarketSnapshot& market,
                          const Estimate& estimate,
                          Amount bankroll,
                          Venue venue) const;

    // Audit record for a market whose estimation failed
    DecisionRecord error_decision(const MarketSnapshot& market,
                                  Venue venue,
                                  const std::string& error) const;

    const KellySizer& sizer() const { return sizer_; }

private:
    StrategyConfig config_;
    KellySizer sizer_;

    DecisionRecord base_record(const MarketSnapshot& market, Venue venue) const;
};

// Two-line console summary of a decision
void log_decision(const DecisionRecord& d);

} // namespace pbot
