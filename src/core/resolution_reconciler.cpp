#include "core/resolution_reconciler.hpp"
#include "position/pnl.hpp"
#include "position/position_manager.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <future>

namespace pbot {

Result<ResolutionStatus> status_from_market(const MarketSnapshot& market) {
    if (!market.is_resolved || market.resolution.empty()) {
        return ResolutionStatus::pending();
    }

    auto outcome = outcome_from_string(market.resolution);
    if (!outcome) {
        return Error::invalid_data(fmt::format("Unknown resolution '{}' for market {}",
                                               market.resolution, market.id));
    }
    return ResolutionStatus::settled(*outcome, market.resolution_probability);
}

ResolutionRecord build_resolution(const ExecutionRecord& trade,
                                  ResolutionOutcome outcome,
                                  std::optional<double> resolution_probability,
                                  Confidence confidence) {
    ResolutionRecord r;
    r.trace_id = trade.trace_id;
    r.resolved_at = time_utils::now_iso8601();
    r.market_id = trade.market_id;
    r.question = trade.question;
    r.outcome = outcome;
    if (outcome == ResolutionOutcome::MKT) {
        r.resolution_probability = resolution_probability;
    }
    r.direction = trade.direction;
    r.estimate = trade.estimate;
    r.market_prob_at_bet = trade.market_prob;
    r.edge = trade.edge;
    r.confidence = confidence;
    r.amount = trade.amount;
    r.venue = trade.venue;

    if (outcome == ResolutionOutcome::CANCEL) {
        r.won = false;
        r.pnl = 0.0;
        r.brier_score = 0.0;
        return r;
    }

    double actual = outcome_value(outcome, resolution_probability);
    r.won = compute_won(trade.direction, outcome, actual);
    r.pnl = compute_realized_pnl(trade.direction, trade.amount, trade.market_prob, outcome,
                                 r.won, trade.result.shares, resolution_probability);
    r.brier_score = brier_contribution(trade.estimate, actual);
    return r;
}

ResolutionReconciler::ResolutionReconciler(RecordStore& store,
                                           PooledVenueClient* pooled_client,
                                           ChainReader* chain_reader)
    : store_(store)
    , pooled_client_(pooled_client)
    , chain_reader_(chain_reader)
{
}

ResolutionReconciler::Summary ResolutionReconciler::reconcile() {
    Summary summary;
    condition_cache_.clear();

    auto resolved_ids = store_.resolved_trace_ids();
    auto unresolved = select_open_positions(store_.load_executions(), resolved_ids);

    spdlog::info("Found {} unresolved bets to check", unresolved.size());
    if (unresolved.empty()) {
        return summary;
    }

    std::map<std::string, Confidence> confidence_by_trace;
    for (const auto& d : store_.load_decisions()) {
        confidence_by_trace.emplace(d.trace_id, d.confidence);
    }

    for (const auto& trade : unresolved) {
        summary.checked++;

        auto status = check(trade);
        if (!status) {
            spdlog::warn("  ! Failed to check {} ({}): {}", trade.market_id,
                         error_kind_to_string(status.error().kind), status.error().message);
            summary.failed++;
            continue;
        }

        const auto& s = status.value();
        if (!s.resolved || !s.outcome) {
            summary.pending++;
            continue;
        }

        auto it = confidence_by_trace.find(trade.trace_id);
        Confidence confidence = it != confidence_by_trace.end() ? it->second : Confidence::UNKNOWN;

        auto record = build_resolution(trade, *s.outcome, s.resolution_probability, confidence);
        try {
            store_.append_resolution(record);
        } catch (const std::exception& e) {
            spdlog::error("Failed to persist resolution for {}: {}", trade.trace_id, e.what());
            summary.failed++;
            continue;
        }

        spdlog::info("  {} {} -> {} | PnL: {}{:.2f}",
                     record.won ? "+" : "-",
                     trade.question.substr(0, 60),
                     outcome_to_string(record.outcome),
                     record.pnl >= 0 ? "+" : "", record.pnl);
        summary.resolved++;
        summary.records.push_back(std::move(record));
    }

    spdlog::info("Resolution batch: {} checked, {} resolved, {} pending, {} failed",
                 summary.checked, summary.resolved, summary.pending, summary.failed);
    return summary;
}

Result<ResolutionStatus> ResolutionReconciler::check(const ExecutionRecord& trade) {
    switch (venue_mechanism(trade.venue)) {
        case Mechanism::POOLED_LIQUIDITY:
            return check_pooled(trade.market_id);
        case Mechanism::ORDER_BOOK:
            return check_condition(trade.market_id);
    }
    return Error::configuration("Unsupported venue " + venue_to_string(trade.venue));
}

Result<ResolutionStatus> ResolutionReconciler::check_pooled(const std::string& market_id) {
    if (!pooled_client_) {
        return Error::configuration("No pooled venue client configured");
    }
    auto market = pooled_client_->get_market(market_id);
    if (!market) {
        return market.error();
    }
    return status_from_market(market.value());
}

Result<ResolutionStatus> ResolutionReconciler::check_condition(const std::string& condition_id) {
    auto cached = condition_cache_.find(condition_id);
    if (cached != condition_cache_.end()) {
        return cached->second;
    }
    if (!chain_reader_) {
        return Error::configuration("No chain reader configured");
    }

    auto denominator = chain_reader_->payout_denominator(condition_id);
    if (!denominator) {
        return denominator.error();
    }

    ResolutionStatus status = ResolutionStatus::pending();
    if (!denominator.value().is_zero()) {
        auto yes_future = std::async(std::launch::async, [this, &condition_id] {
            return chain_reader_->payout_numerator(condition_id, 0);
        });
        auto no_future = std::async(std::launch::async, [this, &condition_id] {
            return chain_reader_->payout_numerator(condition_id, 1);
        });
        auto yes = yes_future.get();
        auto no = no_future.get();

        if (!yes) return yes.error();
        if (!no) return no.error();

        status = ResolutionStatus::settled(
            yes.value() > no.value() ? ResolutionOutcome::YES : ResolutionOutcome::NO);
    }

    condition_cache_[condition_id] = status;
    return status;
}

} // namespace pbot
