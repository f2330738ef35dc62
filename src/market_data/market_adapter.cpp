#include "market_data/market_adapter.hpp"

namespace pbot {

MarketSnapshot to_market_snapshot(const PolymarketMarket& market) {
    MarketSnapshot s;
    s.id = market.condition_id;
    s.question = market.question;
    s.url = "https://polymarket.com/event/" + market.slug;
    s.description = market.description;
    s.creator = "polymarket";
    s.outcome_type = "BINARY";
    s.probability = market.yes_price;
    s.liquidity = market.liquidity;
    s.volume = market.volume_24hr;
    s.close_time_ms = market.end_date_ms;
    s.bettor_count = 0;
    s.mechanism = Mechanism::ORDER_BOOK;
    s.is_resolved = false;
    return s;
}

std::string extract_rich_text(const nlohmann::json& node) {
    if (!node.is_object()) return "";
    if (node.value("type", "") == "text" && node.contains("text") && node["text"].is_string()) {
        return node["text"].get<std::string>();
    }
    std::string out;
    if (node.contains("content") && node["content"].is_array()) {
        for (const auto& child : node["content"]) {
            std::string text = extract_rich_text(child);
            if (!out.empty()) out += ' ';
            out += text;
        }
    }
    return out;
}

MarketSnapshot parse_manifold_market(const nlohmann::json& j) {
    MarketSnapshot s;
    j.at("id").get_to(s.id);
    j.at("question").get_to(s.question);
    s.url = j.value("url", "");
    s.creator = j.value("creatorUsername", "");
    s.outcome_type = j.value("outcomeType", "");
    s.probability = j.value("probability", 0.0);
    s.liquidity = j.value("totalLiquidity", 0.0);
    s.volume = j.value("volume", 0.0);
    s.close_time_ms = j.value("closeTime", int64_t{0});
    s.bettor_count = j.value("uniqueBettorCount", 0);
    s.mechanism = Mechanism::POOLED_LIQUIDITY;
    s.is_resolved = j.value("isResolved", false);

    if (j.contains("resolution") && j["resolution"].is_string()) {
        s.resolution = j["resolution"].get<std::string>();
    }
    if (j.contains("resolutionProbability") && j["resolutionProbability"].is_number()) {
        s.resolution_probability = j["resolutionProbability"].get<double>();
    }

    if (j.contains("textDescription") && j["textDescription"].is_string()) {
        s.description = j["textDescription"].get<std::string>();
    } else if (j.contains("description")) {
        const auto& d = j["description"];
        if (d.is_string()) s.description = d.get<std::string>();
        else if (d.is_object()) s.description = extract_rich_text(d);
    }

    return s;
}

} // namespace pbot
