#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "common/result.hpp"
#include "config/config.hpp"
#include "estimation/probability_estimator.hpp"
#include "execution/execution_dispatcher.hpp"
#include "market_data/venue_client.hpp"
#include "persistence/record_store.hpp"
#include "strategy/decision_engine.hpp"
#include "strategy/market_filter.hpp"

namespace pbot {

struct ScanSummary {
    int fetched{0};
    int eligible{0};
    int held_skipped{0};
    int analyzed{0};
    int bets{0};
    int errors{0};
    Amount bankroll{0.0};
    std::vector<DecisionRecord> decisions;
    DispatchSummary dispatch;
};

/**
 * Calibration feedback for the estimator, built from the resolution log.
 * nullopt until enough resolutions exist.
 */
std::optional<std::string> load_calibration_feedback(const RecordStore& store);

/**
 * One scan run: discover markets, filter, estimate, classify, persist every
 * decision and dispatch the bets.
 *
 * A failure that only concerns one market (fetch, estimate, invalid
 * probability) becomes a SKIP_ERROR decision; failures that make the whole
 * run meaningless (account, market list) are returned as errors.
 */
class MarketScanner {
public:
    MarketScanner(const Config& config,
                  RecordStore& store,
                  ProbabilityEstimator& estimator,
                  ExecutionDispatcher& dispatcher);

    // Pooled venue: bankroll is the account balance
    Result<ScanSummary> scan_pooled(PooledVenueClient& client);

    // Order-book venue: prices come from book depth, bankroll is 10x the per-bet cap
    Result<ScanSummary> scan_order_book(PolymarketDataClient& client);

    // Estimate and classify one market; never throws for per-market failures
    DecisionRecord analyze(const MarketSnapshot& market,
                           Amount bankroll,
                           Venue venue,
                           const std::optional<std::string>& feedback);

private:
    Config config_;
    RecordStore& store_;
    ProbabilityEstimator& estimator_;
    ExecutionDispatcher& dispatcher_;
    DecisionEngine engine_;
    MarketFilter filter_;

    std::set<std::string> held_markets(Venue venue) const;
    void record(ScanSummary& summary, const DecisionRecord& decision);
    void finish(ScanSummary& summary);
};

} // namespace pbot
