#include "common/types.hpp"

namespace pbot {

std::optional<Direction> direction_from_string(const std::string& s) {
    if (s == "YES") return Direction::YES;
    if (s == "NO") return Direction::NO;
    return std::nullopt;
}

std::optional<Venue> venue_from_string(const std::string& s) {
    if (s == "manifold") return Venue::MANIFOLD;
    if (s == "polymarket") return Venue::POLYMARKET;
    return std::nullopt;
}

Confidence confidence_from_string(const std::string& s) {
    if (s == "low") return Confidence::LOW;
    if (s == "medium") return Confidence::MEDIUM;
    if (s == "high") return Confidence::HIGH;
    return Confidence::UNKNOWN;
}

std::optional<DecisionAction> action_from_string(const std::string& s) {
    if (s == "BET") return DecisionAction::BET;
    if (s == "SKIP_LOW_EDGE") return DecisionAction::SKIP_LOW_EDGE;
    if (s == "SKIP_NEGATIVE_KELLY") return DecisionAction::SKIP_NEGATIVE_KELLY;
    if (s == "SKIP_LOW_CONFIDENCE") return DecisionAction::SKIP_LOW_CONFIDENCE;
    if (s == "SKIP_ERROR") return DecisionAction::SKIP_ERROR;
    return std::nullopt;
}

std::optional<ResolutionOutcome> outcome_from_string(const std::string& s) {
    if (s == "YES") return ResolutionOutcome::YES;
    if (s == "NO") return ResolutionOutcome::NO;
    if (s == "MKT") return ResolutionOutcome::MKT;
    if (s == "CANCEL") return ResolutionOutcome::CANCEL;
    return std::nullopt;
}

} // namespace pbot
