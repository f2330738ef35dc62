#pragma once

#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"

namespace pbot {

/**
 * Eligibility filter for pooled-venue markets.
 *
 * A market is eligible when it is BINARY, unresolved, has liquidity at or
 * above the minimum, closes within [min_time_to_close, max_time_to_close]
 * of now (both bounds inclusive), and has at least min_bettors bettors.
 *
 * Resolution-speed score (0-100):
 * - time: 50 inside the fast window, linear decay to 0 at max_time_to_close
 * - pattern: 30 when the question looks fast-resolving
 * - liquidity: min(20, liquidity / 5000 * 20)
 *
 * All methods are pure; "now" is always passed in.
 */
class MarketFilter {
public:
    explicit MarketFilter(const FilterConfig& config);

    bool is_eligible(const MarketSnapshot& market, int64_t now_ms) const;

    double resolution_speed_score(const MarketSnapshot& market, int64_t now_ms) const;

    // Eligible subset, highest speed score first when sort_by_speed is set
    std::vector<MarketSnapshot> filter(const std::vector<MarketSnapshot>& markets,
                                       int64_t now_ms,
                                       bool sort_by_speed = true) const;

private:
    FilterConfig config_;
};

} // namespace pbot
