#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace pbot {

/**
 * Append-only record types. Each stream is joined to the others only by
 * trace_id; a record is written once and never modified.
 */

// One per analyzed market, including every skip
struct DecisionRecord {
    std::string trace_id;
    std::string timestamp;          // ISO 8601
    std::string market_id;
    std::string question;
    std::string market_url;
    Probability market_prob{0.0};
    double liquidity{0.0};
    std::string close_time;         // ISO 8601
    int bettor_count{0};
    std::string description;

    Probability estimate{0.0};
    Confidence confidence{Confidence::LOW};
    std::string reasoning;

    double edge{0.0};
    std::optional<Direction> direction;
    double kelly_fraction{0.0};
    Probability effective_prob{0.0};
    Amount stake{0.0};
    DecisionAction action{DecisionAction::SKIP_ERROR};
    Venue venue{Venue::MANIFOLD};
    std::string order_token_id;     // Outcome token for order-book venues
    Probability order_price{0.0};   // Ask of the chosen side's token, 0 when unknown

    bool is_bet() const { return action == DecisionAction::BET; }
};

enum class TradeSide {
    BUY,
    SELL
};

inline std::string trade_side_to_string(TradeSide s) {
    return s == TradeSide::BUY ? "BUY" : "SELL";
}

// success: order_id set (shares when the venue reports them); failure: error set
struct ExecutionResult {
    bool success{false};
    std::string order_id;
    std::optional<double> shares;
    bool filled{true};              // false for a fill-or-kill order that did not fill
    std::string error;

    static ExecutionResult ok(std::string order_id,
                              std::optional<double> shares = std::nullopt,
                              bool filled = true) {
        ExecutionResult r;
        r.success = true;
        r.order_id = std::move(order_id);
        r.shares = shares;
        r.filled = filled;
        return r;
    }

    static ExecutionResult failure(std::string error) {
        ExecutionResult r;
        r.success = false;
        r.filled = false;
        r.error = std::move(error);
        return r;
    }
};

// One per order attempt
struct ExecutionRecord {
    std::string trace_id;
    std::string timestamp;
    std::string market_id;
    std::string question;
    TradeSide side{TradeSide::BUY};
    Direction direction{Direction::YES};
    Amount amount{0.0};
    Probability market_prob{0.0};   // Entry probability
    Probability estimate{0.0};
    double edge{0.0};
    Venue venue{Venue::MANIFOLD};
    std::string token_id;
    bool dry_run{true};
    ExecutionResult result;

    // Counts as an open position until resolved or sold
    bool is_live_fill() const {
        return !dry_run && result.success && result.filled && side == TradeSide::BUY;
    }
};

// Exactly one per trace_id
struct ResolutionRecord {
    std::string trace_id;
    std::string resolved_at;
    std::string market_id;
    std::string question;
    ResolutionOutcome outcome{ResolutionOutcome::CANCEL};
    std::optional<double> resolution_probability;  // MKT only
    Direction direction{Direction::YES};
    Probability estimate{0.0};
    Probability market_prob_at_bet{0.0};
    double edge{0.0};
    Confidence confidence{Confidence::UNKNOWN};
    Amount amount{0.0};
    bool won{false};
    double pnl{0.0};
    double brier_score{0.0};
    Venue venue{Venue::MANIFOLD};
};

// Mark-to-market telemetry, many per trace_id
struct PositionSnapshot {
    std::string trace_id;
    std::string timestamp;
    std::string market_id;
    std::string question;
    Direction direction{Direction::YES};
    Amount amount{0.0};
    Probability estimate{0.0};
    Probability entry_prob{0.0};
    Probability current_prob{0.0};
    double unrealized_pnl{0.0};
};

// JSON serialization. from_json throws nlohmann::json::exception or
// std::invalid_argument on records that do not parse.
void to_json(nlohmann::json& j, const DecisionRecord& r);
void from_json(const nlohmann::json& j, DecisionRecord& r);

void to_json(nlohmann::json& j, const ExecutionRecord& r);
void from_json(const nlohmann::json& j, ExecutionRecord& r);

void to_json(nlohmann::json& j, const ResolutionRecord& r);
void from_json(const nlohmann::json& j, ResolutionRecord& r);

void to_json(nlohmann::json& j, const PositionSnapshot& r);
void from_json(const nlohmann::json& j, PositionSnapshot& r);

} // namespace pbot
