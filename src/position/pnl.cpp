#include "position/pnl.hpp"
#include <algorithm>

namespace pbot {

namespace {
    constexpr double MKT_DEFAULT = 0.5;
    constexpr double MIN_ENTRY = 0.01;
    constexpr double MAX_ENTRY = 0.99;

    bool has_shares(const std::optional<double>& shares) {
        return shares && *shares > 0.0;
    }

    // Keeps the approximation finite for entries recorded at 0 or 1
    double entry(Probability p) {
        return std::clamp(p, MIN_ENTRY, MAX_ENTRY);
    }
}

double outcome_value(ResolutionOutcome outcome, std::optional<double> resolution_probability) {
    switch (outcome) {
        case ResolutionOutcome::YES: return 1.0;
        case ResolutionOutcome::NO: return 0.0;
        case ResolutionOutcome::MKT: return resolution_probability.value_or(MKT_DEFAULT);
        case ResolutionOutcome::CANCEL: return 0.0;
    }
    return 0.0;
}

bool compute_won(Direction direction, ResolutionOutcome outcome, double actual) {
    switch (outcome) {
        case ResolutionOutcome::YES:
            return direction == Direction::YES;
        case ResolutionOutcome::NO:
            return direction == Direction::NO;
        case ResolutionOutcome::MKT:
            return direction == Direction::YES ? actual > 0.5 : actual < 0.5;
        case ResolutionOutcome::CANCEL:
            return false;
    }
    return false;
}

double compute_realized_pnl(Direction direction,
                            Amount amount,
                            Probability entry_prob,
                            ResolutionOutcome outcome,
                            bool won,
                            std::optional<double> shares,
                            std::optional<double> resolution_probability) {
    if (outcome == ResolutionOutcome::CANCEL) {
        return 0.0;
    }

    if (outcome == ResolutionOutcome::MKT) {
        double p = resolution_probability.value_or(MKT_DEFAULT);
        if (has_shares(shares)) {
            return direction == Direction::YES ? *shares * p - amount
                                               : *shares * (1.0 - p) - amount;
        }
        double m = entry(entry_prob);
        return direction == Direction::YES ? amount * (p - m) / m
                                           : amount * (m - p) / (1.0 - m);
    }

    if (has_shares(shares)) {
        return won ? *shares - amount : -amount;
    }

    if (!won) {
        return -amount;
    }
    double m = entry(entry_prob);
    return direction == Direction::YES ? amount * (1.0 - m) / m
                                       : amount * m / (1.0 - m);
}

double compute_unrealized_pnl(Direction direction,
                              Amount amount,
                              Probability entry_prob,
                              Probability current_prob,
                              std::optional<double> shares) {
    if (has_shares(shares)) {
        return direction == Direction::YES ? *shares * current_prob - amount
                                           : *shares * (1.0 - current_prob) - amount;
    }
    double m = entry(entry_prob);
    return direction == Direction::YES ? amount * (current_prob - m) / m
                                       : amount * (m - current_prob) / (1.0 - m);
}

double compute_max_payout(Direction direction,
                          Amount amount,
                          Probability entry_prob,
                          std::optional<double> shares) {
    if (has_shares(shares)) {
        return *shares - amount;
    }
    double m = entry(entry_prob);
    return direction == Direction::YES ? amount * (1.0 - m) / m
                                       : amount * m / (1.0 - m);
}

double brier_contribution(Probability estimate, double actual) {
    double d = estimate - actual;
    return d * d;
}

} // namespace pbot
