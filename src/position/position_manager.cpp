#include "position/position_manager.hpp"
#include "position/pnl.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>
#include <map>
#include <stdexcept>

namespace pbot {

namespace {
    constexpr double TAKE_PROFIT_RATIO = 0.7;
    constexpr double STOP_LOSS_FRACTION = 0.5;
    constexpr double NEAR_CERTAIN_LOW = 0.05;
    constexpr double NEAR_CERTAIN_HIGH = 0.95;

    std::string short_question(const std::string& q, size_t n = 50) {
        return q.size() <= n ? q : q.substr(0, n);
    }

    std::string signed_amount(double v) {
        return v >= 0 ? fmt::format("+{:.1f}", v) : fmt::format("{:.1f}", v);
    }

    std::optional<int64_t> span_between(const std::string& from, const std::string& to) {
        if (from.empty() || to.empty()) return std::nullopt;
        try {
            return time_utils::iso8601_to_epoch_ms(to) - time_utils::iso8601_to_epoch_ms(from);
        } catch (const std::invalid_argument& e) {
            spdlog::debug("Holding time unavailable: {}", e.what());
            return std::nullopt;
        }
    }
}

std::vector<ExecutionRecord> select_open_positions(const std::vector<ExecutionRecord>& executions,
                                                   const std::set<std::string>& resolved_trace_ids) {
    std::set<std::string> sold;
    for (const auto& e : executions) {
        if (e.side == TradeSide::SELL && e.result.success) {
            sold.insert(e.trace_id);
        }
    }

    std::vector<ExecutionRecord> open;
    std::set<std::string> seen;
    for (const auto& e : executions) {
        if (!e.is_live_fill()) continue;
        if (sold.count(e.trace_id) || resolved_trace_ids.count(e.trace_id)) continue;
        if (!seen.insert(e.trace_id).second) continue;
        open.push_back(e);
    }
    return open;
}

std::set<std::string> held_market_ids(const std::vector<ExecutionRecord>& open_positions,
                                      std::optional<Venue> venue) {
    std::set<std::string> ids;
    for (const auto& p : open_positions) {
        if (venue && p.venue != *venue) continue;
        ids.insert(p.market_id);
    }
    return ids;
}

PositionValuation value_position(const ExecutionRecord& trade, Probability current_prob) {
    PositionValuation v;
    v.current_prob = current_prob;
    v.unrealized_pnl = compute_unrealized_pnl(trade.direction, trade.amount, trade.market_prob,
                                              current_prob, trade.result.shares);
    v.max_payout = compute_max_payout(trade.direction, trade.amount, trade.market_prob,
                                      trade.result.shares);
    v.payout_ratio = v.max_payout > 0 ? v.unrealized_pnl / v.max_payout : 0.0;
    return v;
}

std::optional<ExitSignal> evaluate_exit(const ExecutionRecord& trade, const PositionValuation& v) {
    std::optional<ExitSignal> signal;

    if (v.payout_ratio >= TAKE_PROFIT_RATIO) {
        signal = ExitSignal{ExitReason::TAKE_PROFIT,
                            fmt::format("captured {:.0f}% of max payout", v.payout_ratio * 100)};
    }

    if (v.unrealized_pnl < -trade.amount * STOP_LOSS_FRACTION) {
        signal = ExitSignal{ExitReason::STOP_LOSS,
                            fmt::format("losing {:.0f}% of wager", -v.unrealized_pnl / trade.amount * 100)};
    }

    bool against_yes = trade.direction == Direction::YES && v.current_prob < NEAR_CERTAIN_LOW;
    bool against_no = trade.direction == Direction::NO && v.current_prob > NEAR_CERTAIN_HIGH;
    if (against_yes || against_no) {
        signal = ExitSignal{ExitReason::NEAR_CERTAIN_LOSS,
                            fmt::format("market at {:.1f}%, we're {}", v.current_prob * 100,
                                        direction_to_string(trade.direction))};
    }

    return signal;
}

double MonitorReport::agreement_rate() const {
    return lines.empty() ? 0.0 : static_cast<double>(moving_our_way) / lines.size();
}

bool MonitorReport::contrarian_warning() const {
    return measured() >= MIN_POSITIONS_FOR_SIGNAL && agreement_rate() < CONTRARIAN_WARNING;
}

bool MonitorReport::strong_signal() const {
    return measured() >= MIN_POSITIONS_FOR_SIGNAL && agreement_rate() > STRONG_SIGNAL;
}

MonitorReport build_monitor_report(const std::vector<ExecutionRecord>& open_positions,
                                   const std::vector<PositionSnapshot>& snapshots) {
    std::map<std::string, const PositionSnapshot*> latest;
    for (const auto& s : snapshots) {
        auto it = latest.find(s.trace_id);
        if (it == latest.end() || s.timestamp > it->second->timestamp) {
            latest[s.trace_id] = &s;
        }
    }

    MonitorReport report;
    report.open_positions = static_cast<int>(open_positions.size());

    for (const auto& trade : open_positions) {
        auto it = latest.find(trade.trace_id);
        if (it == latest.end()) continue;

        const PositionSnapshot& snap = *it->second;
        double sign = trade.direction == Direction::YES ? 1.0 : -1.0;
        double drift = (snap.current_prob - trade.market_prob) * sign;

        report.total_unrealized_pnl += snap.unrealized_pnl;
        if (drift > 0) report.moving_our_way++;
        report.lines.push_back(DriftLine{trade, snap, drift,
                                         span_between(trade.timestamp, snap.timestamp)});
    }
    return report;
}

std::string format_monitor_report(const MonitorReport& report) {
    std::string s = fmt::format("\n=== Portfolio Monitor ({} positions) ===\n\n", report.open_positions);

    for (const auto& line : report.lines) {
        s += fmt::format("  {} {} | {} | drift: {}{:.1f}pts",
                         direction_to_string(line.trade.direction),
                         short_question(line.trade.question),
                         signed_amount(line.snapshot.unrealized_pnl),
                         line.drift >= 0 ? "+" : "", line.drift * 100);
        if (line.held_ms) s += " | held " + time_utils::format_span_ms(*line.held_ms);
        s += "\n";
    }

    s += "\n  --- Aggregate ---\n";
    s += fmt::format("  Unrealized P&L: {}\n", signed_amount(report.total_unrealized_pnl));
    s += fmt::format("  Drift agreement: {:.0f}% ({}/{} positions moving our way)\n",
                     report.agreement_rate() * 100, report.moving_our_way, report.measured());

    if (report.contrarian_warning()) {
        s += "  WARNING: Markets consistently moving against estimates. Consider being less contrarian.\n";
    } else if (report.strong_signal()) {
        s += "  Strong signal: markets confirming estimates.\n";
    }
    return s;
}

PositionManager::PositionManager(RecordStore& store, PooledVenueClient& client)
    : store_(store)
    , client_(client)
{
}

std::vector<ExecutionRecord> PositionManager::open_positions() const {
    return select_open_positions(store_.load_executions(), store_.resolved_trace_ids());
}

std::vector<ExecutionRecord> PositionManager::open_positions(Venue venue) const {
    std::vector<ExecutionRecord> result;
    for (auto& p : open_positions()) {
        if (p.venue == venue) result.push_back(std::move(p));
    }
    return result;
}

SnapshotSummary PositionManager::record_snapshots() {
    SnapshotSummary summary;
    auto open = open_positions(Venue::MANIFOLD);
    if (open.empty()) return summary;

    spdlog::info("Recording snapshots for {} open positions...", open.size());

    for (const auto& trade : open) {
        auto market = client_.get_market(trade.market_id);
        if (!market) {
            spdlog::debug("Snapshot skipped for {}: {}", trade.market_id, market.error().message);
            summary.failed++;
            continue;
        }
        if (market.value().is_resolved) continue;

        auto v = value_position(trade, market.value().probability);

        PositionSnapshot snap;
        snap.trace_id = trade.trace_id;
        snap.timestamp = time_utils::now_iso8601();
        snap.market_id = trade.market_id;
        snap.question = trade.question;
        snap.direction = trade.direction;
        snap.amount = trade.amount;
        snap.estimate = trade.estimate;
        snap.entry_prob = trade.market_prob;
        snap.current_prob = v.current_prob;
        snap.unrealized_pnl = v.unrealized_pnl;

        store_.append_snapshot(snap);
        summary.recorded++;
    }

    spdlog::info("Recorded {} snapshots ({} failed)", summary.recorded, summary.failed);
    return summary;
}

MonitorReport PositionManager::monitor() const {
    return build_monitor_report(open_positions(), store_.load_snapshots());
}

SellSummary PositionManager::sell(TradingMode mode) {
    SellSummary summary;
    auto open = open_positions(Venue::MANIFOLD);

    if (open.empty()) {
        spdlog::info("No open positions to evaluate.");
        return summary;
    }
    spdlog::info("Evaluating {} open positions...", open.size());

    for (const auto& trade : open) {
        auto market = client_.get_market(trade.market_id);
        if (!market) {
            spdlog::error("Error checking {}: {}", trade.market_id, market.error().message);
            summary.failed++;
            continue;
        }
        summary.evaluated++;

        const auto& m = market.value();
        if (m.is_resolved) {
            spdlog::info("  {} already resolved ({}), skip sell", short_question(trade.question), m.resolution);
            continue;
        }

        auto v = value_position(trade, m.probability);
        auto signal = evaluate_exit(trade, v);
        if (!signal) {
            spdlog::info("  HOLD: {} | {} {:.0f} | {} ({:.0f}% of max)",
                         short_question(trade.question), direction_to_string(trade.direction),
                         trade.amount, signed_amount(v.unrealized_pnl), v.payout_ratio * 100);
            continue;
        }
        summary.candidates.push_back(SellCandidate{trade, v, *signal});
    }

    if (summary.candidates.empty()) {
        spdlog::info("No positions to sell.");
        return summary;
    }

    spdlog::info("--- Sell Candidates ---");
    for (const auto& c : summary.candidates) {
        spdlog::info("  SELL: {} | {} {:.0f} | {} | {}: {}",
                     short_question(c.trade.question), direction_to_string(c.trade.direction),
                     c.trade.amount, signed_amount(c.valuation.unrealized_pnl),
                     exit_reason_to_string(c.signal.reason), c.signal.detail);
    }

    if (mode == TradingMode::DRY_RUN) {
        spdlog::info("[DRY-RUN] Would sell {} positions.", summary.candidates.size());
        return summary;
    }

    for (const auto& c : summary.candidates) {
        auto fill = client_.sell_shares(c.trade.market_id, c.trade.direction);
        if (!fill) {
            spdlog::error("Failed to sell {}: {}", c.trade.market_id, fill.error().message);
            summary.failed++;
            continue;
        }
        store_.append_execution(sell_record(c, fill.value()));
        summary.sold++;
        spdlog::info("  Sold {} on {} ({}): {}", direction_to_string(c.trade.direction),
                     short_question(c.trade.question), signed_amount(c.valuation.unrealized_pnl),
                     exit_reason_to_string(c.signal.reason));
    }

    spdlog::info("Sold {}/{} positions.", summary.sold, summary.candidates.size());
    return summary;
}

ExecutionRecord PositionManager::sell_record(const SellCandidate& c, const BetFill& fill) const {
    ExecutionRecord r;
    r.trace_id = c.trade.trace_id;
    r.timestamp = time_utils::now_iso8601();
    r.market_id = c.trade.market_id;
    r.question = c.trade.question;
    r.side = TradeSide::SELL;
    r.direction = c.trade.direction;
    r.amount = c.trade.amount;
    r.market_prob = c.valuation.current_prob;
    r.estimate = c.trade.estimate;
    r.edge = c.trade.edge;
    r.venue = c.trade.venue;
    r.token_id = c.trade.token_id;
    r.dry_run = false;
    r.result = ExecutionResult::ok(fill.bet_id, fill.shares);
    return r;
}

} // namespace pbot
