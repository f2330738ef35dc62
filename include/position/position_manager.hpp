#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "market_data/venue_client.hpp"
#include "persistence/records.hpp"
#include "persistence/record_store.hpp"

namespace pbot {

/**
 * Open positions are live, filled BUY executions whose trace id has
 * neither a resolution nor a successful SELL. A trace id appears at most
 * once in the result (first execution wins).
 */
std::vector<ExecutionRecord> select_open_positions(const std::vector<ExecutionRecord>& executions,
                                                   const std::set<std::string>& resolved_trace_ids);

// Market ids held by open positions, optionally restricted to one venue
std::set<std::string> held_market_ids(const std::vector<ExecutionRecord>& open_positions,
                                      std::optional<Venue> venue = std::nullopt);

// Mark-to-market view of one position at the current probability
struct PositionValuation {
    Probability current_prob{0.0};
    double unrealized_pnl{0.0};
    double max_payout{0.0};
    double payout_ratio{0.0};   // unrealized / max payout, 0 when max payout <= 0
};

PositionValuation value_position(const ExecutionRecord& trade, Probability current_prob);

enum class ExitReason {
    TAKE_PROFIT,
    STOP_LOSS,
    NEAR_CERTAIN_LOSS
};

inline std::string exit_reason_to_string(ExitReason r) {
    switch (r) {
        case ExitReason::TAKE_PROFIT: return "TAKE_PROFIT";
        case ExitReason::STOP_LOSS: return "STOP_LOSS";
        case ExitReason::NEAR_CERTAIN_LOSS: return "NEAR_CERTAIN_LOSS";
    }
    return "UNKNOWN";
}

struct ExitSignal {
    ExitReason reason{ExitReason::TAKE_PROFIT};
    std::string detail;
};

/**
 * Exit rules, checked in order with the last match winning:
 * take profit at >= 70% of max payout, stop loss when losing more than
 * half the stake, near-certain loss when the market sits beyond 5/95
 * against our side.
 */
std::optional<ExitSignal> evaluate_exit(const ExecutionRecord& trade, const PositionValuation& valuation);

struct DriftLine {
    ExecutionRecord trade;
    PositionSnapshot snapshot;
    double drift{0.0};          // Market move toward our side since entry
    std::optional<int64_t> held_ms;  // Entry to latest snapshot
};

struct MonitorReport {
    static constexpr int MIN_POSITIONS_FOR_SIGNAL = 5;
    static constexpr double CONTRARIAN_WARNING = 0.4;
    static constexpr double STRONG_SIGNAL = 0.7;

    int open_positions{0};
    std::vector<DriftLine> lines;
    double total_unrealized_pnl{0.0};
    int moving_our_way{0};

    int measured() const { return static_cast<int>(lines.size()); }
    double agreement_rate() const;
    bool contrarian_warning() const;
    bool strong_signal() const;
};

// Latest snapshot per open position (ISO timestamps compare lexicographically)
MonitorReport build_monitor_report(const std::vector<ExecutionRecord>& open_positions,
                                   const std::vector<PositionSnapshot>& snapshots);

std::string format_monitor_report(const MonitorReport& report);

struct SellCandidate {
    ExecutionRecord trade;
    PositionValuation valuation;
    ExitSignal signal;
};

struct SellSummary {
    int evaluated{0};
    int sold{0};
    int failed{0};
    std::vector<SellCandidate> candidates;
};

struct SnapshotSummary {
    int recorded{0};
    int failed{0};
};

/**
 * Open-position bookkeeping for the pooled-liquidity venue: mark-to-market
 * snapshots, drift monitoring and rule-based exits.
 */
class PositionManager {
public:
    PositionManager(RecordStore& store, PooledVenueClient& client);

    std::vector<ExecutionRecord> open_positions() const;
    std::vector<ExecutionRecord> open_positions(Venue venue) const;

    // One snapshot per open pooled position whose market is still unresolved
    SnapshotSummary record_snapshots();

    MonitorReport monitor() const;

    // DRY_RUN only lists candidates; LIVE sells them and appends SELL records
    SellSummary sell(TradingMode mode);

private:
    RecordStore& store_;
    PooledVenueClient& client_;

    ExecutionRecord sell_record(const SellCandidate& candidate, const BetFill& fill) const;
};

} // namespace pbot
