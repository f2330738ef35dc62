#include "strategy/market_filter.hpp"
#include "strategy/market_category.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace pbot {

MarketFilter::MarketFilter(const FilterConfig& config)
    : config_(config)
{
}

bool MarketFilter::is_eligible(const MarketSnapshot& market, int64_t now_ms) const {
    if (market.outcome_type != "BINARY") return false;
    if (market.is_resolved) return false;
    if (market.liquidity < config_.min_liquidity) return false;

    int64_t time_to_close = market.close_time_ms - now_ms;
    if (time_to_close < config_.min_time_to_close_ms) return false;
    if (time_to_close > config_.max_time_to_close_ms) return false;

    if (market.bettor_count < config_.min_bettors) return false;

    return true;
}

double MarketFilter::resolution_speed_score(const MarketSnapshot& market, int64_t now_ms) const {
    int64_t time_to_close = market.close_time_ms - now_ms;

    double time_score = 0.0;
    if (time_to_close <= config_.fast_window_ms) {
        time_score = 50.0;
    } else if (time_to_close <= config_.max_time_to_close_ms) {
        double span = static_cast<double>(config_.max_time_to_close_ms - config_.fast_window_ms);
        if (span > 0) {
            time_score = 50.0 * (1.0 - static_cast<double>(time_to_close - config_.fast_window_ms) / span);
        }
    }

    double pattern_score = matches_fast_resolution_pattern(market.question) ? 30.0 : 0.0;

    double liquidity_score = std::min(20.0, market.liquidity / 5000.0 * 20.0);

    return time_score + pattern_score + liquidity_score;
}

std::vector<MarketSnapshot> MarketFilter::filter(const std::vector<MarketSnapshot>& markets,
                                                 int64_t now_ms,
                                                 bool sort_by_speed) const {
    std::vector<MarketSnapshot> eligible;
    for (const auto& m : markets) {
        if (is_eligible(m, now_ms)) {
            eligible.push_back(m);
        }
    }

    if (sort_by_speed) {
        std::vector<std::pair<double, size_t>> scored;
        scored.reserve(eligible.size());
        for (size_t i = 0; i < eligible.size(); ++i) {
            scored.emplace_back(resolution_speed_score(eligible[i], now_ms), i);
        }
        std::stable_sort(scored.begin(), scored.end(),
                         [](const auto& a, const auto& b) { return a.first > b.first; });

        std::vector<MarketSnapshot> sorted;
        sorted.reserve(eligible.size());
        for (const auto& [score, idx] : scored) {
            sorted.push_back(std::move(eligible[idx]));
        }
        eligible = std::move(sorted);
    }

    spdlog::debug("MarketFilter: {} of {} markets eligible", eligible.size(), markets.size());
    return eligible;
}

} // namespace pbot
