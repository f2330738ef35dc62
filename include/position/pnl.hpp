#pragma once

#include <optional>
#include "common/types.hpp"

namespace pbot {

/**
 * P&L helpers shared by the reconciler, the monitor and the seller.
 *
 * When the venue reported a share count it is authoritative. Without it
 * the entry probability stands in for the fill price, which drifts from
 * the exact figure whenever the real fill moved the price.
 */

// Realized value of the outcome: 1 for YES, 0 for NO, the partial value
// (default 0.5) for MKT. Not defined for CANCEL.
double outcome_value(ResolutionOutcome outcome, std::optional<double> resolution_probability);

// Direction matches the outcome; for MKT, YES wins above 0.5 and NO below.
// CANCEL never wins.
bool compute_won(Direction direction, ResolutionOutcome outcome, double actual);

double compute_realized_pnl(Direction direction,
                            Amount amount,
                            Probability entry_prob,
                            ResolutionOutcome outcome,
                            bool won,
                            std::optional<double> shares = std::nullopt,
                            std::optional<double> resolution_probability = std::nullopt);

double compute_unrealized_pnl(Direction direction,
                              Amount amount,
                              Probability entry_prob,
                              Probability current_prob,
                              std::optional<double> shares = std::nullopt);

// Profit if the market goes all the way to our side
double compute_max_payout(Direction direction,
                          Amount amount,
                          Probability entry_prob,
                          std::optional<double> shares = std::nullopt);

// (estimate - actual)^2
double brier_contribution(Probability estimate, double actual);

} // namespace pbot
