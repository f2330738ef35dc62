#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "common/result.hpp"
#include "market_data/chain_reader.hpp"
#include "market_data/venue_client.hpp"
#include "persistence/records.hpp"
#include "persistence/record_store.hpp"

namespace pbot {

/**
 * Venue-reported state of one market. outcome is set only when resolved.
 */
struct ResolutionStatus {
    bool resolved{false};
    std::optional<ResolutionOutcome> outcome;
    std::optional<double> resolution_probability;  // MKT only

    static ResolutionStatus pending() { return ResolutionStatus{}; }
    static ResolutionStatus settled(ResolutionOutcome o, std::optional<double> p = std::nullopt) {
        return ResolutionStatus{true, o, p};
    }
};

/**
 * Polled-venue status from a market snapshot. Unresolved (or resolved
 * without a resolution string) is pending; an unknown resolution string
 * is INVALID_DATA.
 */
Result<ResolutionStatus> status_from_market(const MarketSnapshot& market);

/**
 * Build the resolution record for one trade. CANCEL gives won=false,
 * pnl=0 and brier=0.
 */
ResolutionRecord build_resolution(const ExecutionRecord& trade,
                                  ResolutionOutcome outcome,
                                  std::optional<double> resolution_probability,
                                  Confidence confidence);

/**
 * Resolution reconciler.
 *
 * Walks every open position (live, filled, not sold, not yet resolved),
 * asks the venue whether its market has resolved and appends exactly one
 * ResolutionRecord per newly resolved trace id.
 *
 * - Pooled venue: polled market status.
 * - Order-book venue: payoutDenominator != 0 on the settlement contract,
 *   YES wins iff numerator(0) > numerator(1). The two numerator reads run
 *   in parallel and each condition is read at most once per run.
 *
 * Per-item failures are logged and counted; the trade stays open and is
 * retried on the next run.
 */
class ResolutionReconciler {
public:
    struct Summary {
        int checked{0};
        int resolved{0};
        int pending{0};
        int failed{0};
        std::vector<ResolutionRecord> records;
    };

    ResolutionReconciler(RecordStore& store,
                         PooledVenueClient* pooled_client,
                         ChainReader* chain_reader);

    Summary reconcile();

    // Exposed for tests; uses the per-run condition cache
    Result<ResolutionStatus> check_condition(const std::string& condition_id);
    Result<ResolutionStatus> check_pooled(const std::string& market_id);

private:
    RecordStore& store_;
    PooledVenueClient* pooled_client_;
    ChainReader* chain_reader_;

    std::map<std::string, ResolutionStatus> condition_cache_;

    Result<ResolutionStatus> check(const ExecutionRecord& trade);
};

} // namespace pbot
