#include "core/market_scanner.hpp"
#include "calibration/calibration.hpp"
#include "calibration/feedback.hpp"
#include "market_data/market_adapter.hpp"
#include "market_data/polymarket_client.hpp"
#include "position/position_manager.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>

namespace pbot {

std::optional<std::string> load_calibration_feedback(const RecordStore& store) {
    auto resolutions = store.load_resolutions();
    if (resolutions.empty()) {
        return std::nullopt;
    }
    auto feedback = format_feedback(compute_calibration(resolutions));
    if (feedback) {
        spdlog::info("Loaded calibration feedback from {} resolved bets", resolutions.size());
    }
    return feedback;
}

MarketScanner::MarketScanner(const Config& config,
                             RecordStore& store,
                             ProbabilityEstimator& estimator,
                             ExecutionDispatcher& dispatcher)
    : config_(config)
    , store_(store)
    , estimator_(estimator)
    , dispatcher_(dispatcher)
    , engine_(config.strategy)
    , filter_(config.filter)
{
}

DecisionRecord MarketScanner::analyze(const MarketSnapshot& market,
                                      Amount bankroll,
                                      Venue venue,
                                      const std::optional<std::string>& feedback) {
    auto estimate = estimator_.estimate(market, "", feedback);
    if (!estimate) {
        spdlog::error("Failed to analyze market {}: {}", market.id, estimate.error().message);
        return engine_.error_decision(market, venue, estimate.error().message);
    }

    try {
        return engine_.decide(market, estimate.value(), bankroll, venue);
    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid data for market {}: {}", market.id, e.what());
        return engine_.error_decision(market, venue, e.what());
    }
}

std::set<std::string> MarketScanner::held_markets(Venue venue) const {
    auto open = select_open_positions(store_.load_executions(), store_.resolved_trace_ids());
    return held_market_ids(open, venue);
}

void MarketScanner::record(ScanSummary& summary, const DecisionRecord& decision) {
    log_decision(decision);
    store_.append_decision(decision);

    summary.analyzed++;
    switch (decision.action) {
        case DecisionAction::BET:
            summary.bets++;
            break;
        case DecisionAction::SKIP_ERROR:
            summary.errors++;
            break;
        case DecisionAction::SKIP_LOW_EDGE:
        case DecisionAction::SKIP_NEGATIVE_KELLY:
        case DecisionAction::SKIP_LOW_CONFIDENCE:
            break;
    }
    summary.decisions.push_back(decision);
}

void MarketScanner::finish(ScanSummary& summary) {
    spdlog::info("--- Summary ---");
    spdlog::info("Analyzed: {} ({} errors)", summary.analyzed, summary.errors);
    spdlog::info("Bets identified: {}", summary.bets);

    if (summary.bets > 0) {
        summary.dispatch = dispatcher_.execute_all(summary.decisions);
        spdlog::info("Bets executed: {}/{}", summary.dispatch.succeeded, summary.dispatch.attempted);
    } else {
        spdlog::info("No bets to place this run.");
    }
}

Result<ScanSummary> MarketScanner::scan_pooled(PooledVenueClient& client) {
    ScanSummary summary;
    auto feedback = load_calibration_feedback(store_);

    auto me = client.get_me();
    if (!me) return me.error();

    summary.bankroll = me.value().balance;
    spdlog::info("User: {} | Balance: {:.0f}", me.value().username, summary.bankroll);
    if (summary.bankroll < config_.strategy.min_bankroll) {
        return Error::rejected(fmt::format("Balance {:.2f} below minimum {:.2f}",
                                           summary.bankroll, config_.strategy.min_bankroll));
    }

    auto held = held_markets(Venue::MANIFOLD);
    if (!held.empty()) {
        spdlog::info("Skipping {} markets with existing positions", held.size());
    }

    spdlog::info("Searching for markets...");
    auto markets = client.search_markets(config_.filter.search_limit);
    if (!markets) return markets.error();
    summary.fetched = static_cast<int>(markets.value().size());

    auto eligible = filter_.filter(markets.value(), time_utils::epoch_ms());
    summary.eligible = static_cast<int>(eligible.size());

    std::vector<MarketSnapshot> candidates;
    for (auto& m : eligible) {
        if (held.count(m.id)) {
            summary.held_skipped++;
            continue;
        }
        if (static_cast<int>(candidates.size()) >= config_.filter.max_markets_per_run) break;
        candidates.push_back(std::move(m));
    }
    spdlog::info("Fetched {} markets, {} pass filters, analyzing {}",
                 summary.fetched, summary.eligible, candidates.size());

    for (const auto& lite : candidates) {
        auto full = client.get_market(lite.id);
        if (!full) {
            spdlog::error("Failed to fetch market {}: {}", lite.id, full.error().message);
            record(summary, engine_.error_decision(lite, Venue::MANIFOLD, full.error().message));
            continue;
        }
        record(summary, analyze(full.value(), summary.bankroll, Venue::MANIFOLD, feedback));
    }

    finish(summary);
    return summary;
}

Result<ScanSummary> MarketScanner::scan_order_book(PolymarketDataClient& client) {
    ScanSummary summary;
    const auto& poly = config_.polymarket;
    auto feedback = load_calibration_feedback(store_);

    spdlog::info("Fetching Polymarket markets...");
    auto markets = client.fetch_markets();
    if (!markets) return markets.error();
    summary.fetched = static_cast<int>(markets.value().size());

    auto filtered = filter_polymarket_markets(markets.value(), poly);
    summary.eligible = static_cast<int>(filtered.size());

    auto held = held_markets(Venue::POLYMARKET);
    std::vector<PolymarketMarket> candidates;
    for (auto& m : filtered) {
        if (held.count(m.condition_id)) {
            summary.held_skipped++;
            continue;
        }
        if (static_cast<int>(candidates.size()) >= poly.max_markets_per_run * 2) break;
        candidates.push_back(std::move(m));
    }
    if (summary.held_skipped > 0) {
        spdlog::info("Skipping {} markets with existing positions", summary.held_skipped);
    }

    spdlog::info("Fetching orderbook depth for {} markets...", candidates.size());
    auto priced = enrich_with_effective_prices(candidates, config_.strategy.poly_max_bet_amount, client);
    if (static_cast<int>(priced.size()) > poly.max_markets_per_run) {
        priced.resize(poly.max_markets_per_run);
    }
    spdlog::info("{}/{} markets have fillable depth, analyzing {}",
                 priced.size(), candidates.size(), priced.size());

    summary.bankroll = config_.strategy.poly_max_bet_amount * 10;

    for (const auto& m : priced) {
        auto decision = analyze(to_market_snapshot(m), summary.bankroll, Venue::POLYMARKET, feedback);
        if (decision.direction) {
            decision.order_token_id = m.token_for(*decision.direction);
            decision.order_price = m.price_for(*decision.direction);
        }
        record(summary, decision);
    }

    finish(summary);
    return summary;
}

} // namespace pbot
