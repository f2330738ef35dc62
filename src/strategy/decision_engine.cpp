#include "strategy/decision_engine.hpp"
#include "strategy/market_category.hpp"
#include "utils/crypto.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>

namespace pbot {

namespace {
    constexpr size_t MAX_DESCRIPTION_CHARS = 2000;
    constexpr double MIN_STAKE_UNITS = 1.0;
}

DecisionEngine::DecisionEngine(const StrategyConfig& config)
    : config_(config)
    , sizer_(config)
{
}

DecisionRecord DecisionEngine::base_record(const MarketSnapshot& market, Venue venue) const {
    DecisionRecord d;
    d.trace_id = crypto::generate_uuid();
    d.timestamp = time_utils::now_iso8601();
    d.market_id = market.id;
    d.question = market.question;
    d.market_url = market.url;
    d.market_prob = market.probability;
    d.liquidity = market.liquidity;
    d.close_time = market.close_time_ms > 0 ? time_utils::to_iso8601(market.close_time_ms) : "";
    d.bettor_count = market.bettor_count;
    d.description = market.description.substr(0, MAX_DESCRIPTION_CHARS);
    d.venue = venue;
    d.effective_prob = market.probability;
    return d;
}

DecisionRecord DecisionEngine::decide(const MarketSnapshot& market,
                                      const Estimate& estimate,
                                      Amount bankroll,
                                      Venue venue) const {
    double edge = compute_edge(estimate.probability, market.probability);

    DecisionRecord d = base_record(market, venue);
    d.estimate = estimate.probability;
    d.confidence = estimate.confidence;
    d.reasoning = estimate.reasoning;
    d.edge = edge;

    if (edge < config_.edge_threshold) {
        d.action = DecisionAction::SKIP_LOW_EDGE;
        return d;
    }

    // Low confidence is only acted on when a structured data source backs the question
    if (estimate.confidence == Confidence::LOW &&
        !is_finance_market(market.question) && !is_sports_market(market.question)) {
        d.action = DecisionAction::SKIP_LOW_CONFIDENCE;
        return d;
    }

    Direction direction = choose_direction(estimate.probability, market.probability);
    SizingResult sizing = sizer_.size(estimate.probability, market, direction, bankroll, venue);

    d.direction = direction;
    d.kelly_fraction = sizing.kelly;
    d.effective_prob = sizing.effective_prob;

    if (sizing.kelly <= 0) {
        d.action = DecisionAction::SKIP_NEGATIVE_KELLY;
        return d;
    }

    if (sizing.stake < MIN_STAKE_UNITS * config_.min_unit) {
        d.action = DecisionAction::SKIP_LOW_EDGE;
        return d;
    }

    d.stake = sizing.stake;
    d.action = DecisionAction::BET;
    return d;
}

DecisionRecord DecisionEngine::error_decision(const MarketSnapshot& market,
                                              Venue venue,
                                              const std::string& error) const {
    DecisionRecord d = base_record(market, venue);
    d.estimate = 0.0;
    d.confidence = Confidence::LOW;
    d.reasoning = "Error: " + error;
    d.edge = 0.0;
    d.action = DecisionAction::SKIP_ERROR;
    return d;
}

void log_decision(const DecisionRecord& d) {
    std::string question = d.question.substr(0, 60);
    std::string dir = d.direction ? direction_to_string(*d.direction) : "-";

    switch (d.action) {
        case DecisionAction::BET:
            spdlog::info(">>> BET {} {} on \"{}\"", d.stake, dir, question);
            spdlog::info("    market={:.1f}% estimate={:.1f}% edge={:.1f}% kelly={:.3f} conf={} venue={}",
                         d.market_prob * 100, d.estimate * 100, d.edge * 100, d.kelly_fraction,
                         confidence_to_string(d.confidence), venue_to_string(d.venue));
            break;
        case DecisionAction::SKIP_LOW_EDGE:
        case DecisionAction::SKIP_NEGATIVE_KELLY:
        case DecisionAction::SKIP_LOW_CONFIDENCE:
            spdlog::info("--- {} \"{}\"", action_to_string(d.action), question);
            spdlog::info("    market={:.1f}% estimate={:.1f}% edge={:.1f}% conf={}",
                         d.market_prob * 100, d.estimate * 100, d.edge * 100,
                         confidence_to_string(d.confidence));
            break;
        case DecisionAction::SKIP_ERROR:
            spdlog::warn("--- SKIP_ERROR \"{}\"", question);
            spdlog::warn("    {}", d.reasoning);
            break;
    }
}

} // namespace pbot
