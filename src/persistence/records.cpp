#include "persistence/records.hpp"
#include <stdexcept>

namespace pbot {

namespace {
    Direction parse_direction(const nlohmann::json& j, const char* key) {
        auto d = direction_from_string(j.at(key).get<std::string>());
        if (!d) throw std::invalid_argument(std::string("bad direction in field ") + key);
        return *d;
    }

    Venue parse_venue(const nlohmann::json& j) {
        // Records written before the second venue existed carry no venue
        if (!j.contains("venue")) return Venue::MANIFOLD;
        auto v = venue_from_string(j.at("venue").get<std::string>());
        if (!v) throw std::invalid_argument("bad venue: " + j.at("venue").dump());
        return *v;
    }

    void put_optional(nlohmann::json& j, const char* key, const std::optional<double>& v) {
        if (v) j[key] = *v; else j[key] = nullptr;
    }

    std::optional<double> get_optional(const nlohmann::json& j, const char* key) {
        if (j.contains(key) && j.at(key).is_number()) return j.at(key).get<double>();
        return std::nullopt;
    }
}

void to_json(nlohmann::json& j, const DecisionRecord& r) {
    j = nlohmann::json{
        {"trace_id", r.trace_id},
        {"timestamp", r.timestamp},
        {"market_id", r.market_id},
        {"question", r.question},
        {"market_url", r.market_url},
        {"market_prob", r.market_prob},
        {"liquidity", r.liquidity},
        {"close_time", r.close_time},
        {"bettor_count", r.bettor_count},
        {"description", r.description},
        {"estimate", r.estimate},
        {"confidence", confidence_to_string(r.confidence)},
        {"reasoning", r.reasoning},
        {"edge", r.edge},
        {"kelly_fraction", r.kelly_fraction},
        {"effective_prob", r.effective_prob},
        {"stake", r.stake},
        {"action", action_to_string(r.action)},
        {"venue", venue_to_string(r.venue)}
    };
    if (r.direction) j["direction"] = direction_to_string(*r.direction);
    else j["direction"] = nullptr;
    if (!r.order_token_id.empty()) j["order_token_id"] = r.order_token_id;
    if (r.order_price > 0.0) j["order_price"] = r.order_price;
}

void from_json(const nlohmann::json& j, DecisionRecord& r) {
    j.at("trace_id").get_to(r.trace_id);
    r.timestamp = j.value("timestamp", "");
    j.at("market_id").get_to(r.market_id);
    r.question = j.value("question", "");
    r.market_url = j.value("market_url", "");
    r.market_prob = j.value("market_prob", 0.0);
    r.liquidity = j.value("liquidity", 0.0);
    r.close_time = j.value("close_time", "");
    r.bettor_count = j.value("bettor_count", 0);
    r.description = j.value("description", "");
    r.estimate = j.value("estimate", 0.0);
    r.confidence = confidence_from_string(j.value("confidence", ""));
    r.reasoning = j.value("reasoning", "");
    r.edge = j.value("edge", 0.0);
    r.kelly_fraction = j.value("kelly_fraction", 0.0);
    r.effective_prob = j.value("effective_prob", 0.0);
    r.stake = j.value("stake", 0.0);

    auto action = action_from_string(j.at("action").get<std::string>());
    if (!action) throw std::invalid_argument("bad action: " + j.at("action").dump());
    r.action = *action;

    r.venue = parse_venue(j);
    r.order_token_id = j.value("order_token_id", "");
    r.order_price = j.value("order_price", 0.0);

    if (j.contains("direction") && j.at("direction").is_string()) {
        r.direction = parse_direction(j, "direction");
    } else {
        r.direction.reset();
    }
}

void to_json(nlohmann::json& j, const ExecutionRecord& r) {
    nlohmann::json result;
    if (r.result.success) {
        result["order_id"] = r.result.order_id;
        put_optional(result, "shares", r.result.shares);
        result["filled"] = r.result.filled;
    } else {
        result["error"] = r.result.error;
    }

    j = nlohmann::json{
        {"trace_id", r.trace_id},
        {"timestamp", r.timestamp},
        {"market_id", r.market_id},
        {"question", r.question},
        {"side", trade_side_to_string(r.side)},
        {"direction", direction_to_string(r.direction)},
        {"amount", r.amount},
        {"market_prob", r.market_prob},
        {"estimate", r.estimate},
        {"edge", r.edge},
        {"venue", venue_to_string(r.venue)},
        {"dry_run", r.dry_run},
        {"result", result}
    };
    if (!r.token_id.empty()) j["token_id"] = r.token_id;
}

void from_json(const nlohmann::json& j, ExecutionRecord& r) {
    j.at("trace_id").get_to(r.trace_id);
    r.timestamp = j.value("timestamp", "");
    j.at("market_id").get_to(r.market_id);
    r.question = j.value("question", "");
    r.side = j.value("side", "BUY") == "SELL" ? TradeSide::SELL : TradeSide::BUY;
    r.direction = parse_direction(j, "direction");
    j.at("amount").get_to(r.amount);
    r.market_prob = j.value("market_prob", 0.0);
    r.estimate = j.value("estimate", 0.0);
    r.edge = j.value("edge", 0.0);
    r.venue = parse_venue(j);
    r.token_id = j.value("token_id", "");
    r.dry_run = j.value("dry_run", true);

    const auto& res = j.at("result");
    if (res.contains("error") && res.at("error").is_string()) {
        r.result = ExecutionResult::failure(res.at("error").get<std::string>());
    } else {
        r.result = ExecutionResult::ok(res.value("order_id", ""),
                                       get_optional(res, "shares"),
                                       res.value("filled", true));
    }
}

void to_json(nlohmann::json& j, const ResolutionRecord& r) {
    j = nlohmann::json{
        {"trace_id", r.trace_id},
        {"resolved_at", r.resolved_at},
        {"market_id", r.market_id},
        {"question", r.question},
        {"outcome", outcome_to_string(r.outcome)},
        {"direction", direction_to_string(r.direction)},
        {"estimate", r.estimate},
        {"market_prob_at_bet", r.market_prob_at_bet},
        {"edge", r.edge},
        {"confidence", confidence_to_string(r.confidence)},
        {"amount", r.amount},
        {"won", r.won},
        {"pnl", r.pnl},
        {"brier_score", r.brier_score},
        {"venue", venue_to_string(r.venue)}
    };
    put_optional(j, "resolution_probability", r.resolution_probability);
}

void from_json(const nlohmann::json& j, ResolutionRecord& r) {
    j.at("trace_id").get_to(r.trace_id);
    r.resolved_at = j.value("resolved_at", "");
    r.market_id = j.value("market_id", "");
    r.question = j.value("question", "");

    auto outcome = outcome_from_string(j.at("outcome").get<std::string>());
    if (!outcome) throw std::invalid_argument("bad outcome: " + j.at("outcome").dump());
    r.outcome = *outcome;

    r.resolution_probability = get_optional(j, "resolution_probability");
    r.direction = parse_direction(j, "direction");
    r.estimate = j.value("estimate", 0.0);
    r.market_prob_at_bet = j.value("market_prob_at_bet", 0.0);
    r.edge = j.value("edge", 0.0);
    r.confidence = confidence_from_string(j.value("confidence", ""));
    r.amount = j.value("amount", 0.0);
    r.won = j.value("won", false);
    r.pnl = j.value("pnl", 0.0);
    r.brier_score = j.value("brier_score", 0.0);
    r.venue = parse_venue(j);
}

void to_json(nlohmann::json& j, const PositionSnapshot& r) {
    j = nlohmann::json{
        {"trace_id", r.trace_id},
        {"timestamp", r.timestamp},
        {"market_id", r.market_id},
        {"question", r.question},
        {"direction", direction_to_string(r.direction)},
        {"amount", r.amount},
        {"estimate", r.estimate},
        {"entry_prob", r.entry_prob},
        {"current_prob", r.current_prob},
        {"unrealized_pnl", r.unrealized_pnl}
    };
}

void from_json(const nlohmann::json& j, PositionSnapshot& r) {
    j.at("trace_id").get_to(r.trace_id);
    r.timestamp = j.value("timestamp", "");
    r.market_id = j.value("market_id", "");
    r.question = j.value("question", "");
    r.direction = parse_direction(j, "direction");
    r.amount = j.value("amount", 0.0);
    r.estimate = j.value("estimate", 0.0);
    r.entry_prob = j.value("entry_prob", 0.0);
    r.current_prob = j.value("current_prob", 0.0);
    r.unrealized_pnl = j.value("unrealized_pnl", 0.0);
}

} // namespace pbot
