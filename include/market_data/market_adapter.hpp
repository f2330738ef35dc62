#pragma once

#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "market_data/venue_client.hpp"

namespace pbot {

// Order-book market -> venue-neutral snapshot (probability = yes price)
MarketSnapshot to_market_snapshot(const PolymarketMarket& market);

// Manifold market JSON -> venue-neutral snapshot. Throws
// nlohmann::json::exception when id or question is missing.
MarketSnapshot parse_manifold_market(const nlohmann::json& j);

// Flatten a TipTap rich-text document into plain text
std::string extract_rich_text(const nlohmann::json& node);

} // namespace pbot
