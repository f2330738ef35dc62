#include "execution/execution_dispatcher.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace pbot {

double order_price_for(const DecisionRecord& decision) {
    double price = decision.order_price;
    if (price <= 0.0) {
        // No side ask recorded: derive it from the YES price
        double yes_price = decision.effective_prob;
        price = decision.direction == Direction::NO ? 1.0 - yes_price : yes_price;
    }
    return std::clamp(price, 0.01, 0.99);
}

ExecutionDispatcher::ExecutionDispatcher(TradingMode mode,
                                         RecordStore& store,
                                         PooledVenueClient* pooled_client,
                                         OrderClientFactory order_client_factory)
    : mode_(mode)
    , store_(store)
    , pooled_client_(pooled_client)
    , order_client_factory_(std::move(order_client_factory))
{
    spdlog::info("ExecutionDispatcher initialized in {} mode", mode_to_string(mode_));
}

std::optional<ExecutionRecord> ExecutionDispatcher::execute(const DecisionRecord& decision) {
    if (!decision.is_bet() || !decision.direction) {
        return std::nullopt;
    }

    ExecutionRecord record;
    record.trace_id = decision.trace_id;
    record.timestamp = time_utils::now_iso8601();
    record.market_id = decision.market_id;
    record.question = decision.question;
    record.side = TradeSide::BUY;
    record.direction = *decision.direction;
    record.amount = decision.stake;
    record.market_prob = decision.market_prob;
    record.estimate = decision.estimate;
    record.edge = decision.edge;
    record.venue = decision.venue;
    record.token_id = decision.order_token_id;
    record.dry_run = mode_ == TradingMode::DRY_RUN;

    switch (mode_) {
        case TradingMode::DRY_RUN:
            spdlog::info("[DRY-RUN] Would bet {:.2f} on {} ({}) for {}",
                         record.amount, direction_to_string(record.direction),
                         venue_to_string(record.venue), record.market_id);
            record.result = ExecutionResult::ok("dry-run");
            break;

        case TradingMode::LIVE:
            switch (venue_mechanism(decision.venue)) {
                case Mechanism::POOLED_LIQUIDITY:
                    record.result = place_pooled(decision);
                    break;
                case Mechanism::ORDER_BOOK:
                    record.result = place_order_book(decision);
                    break;
            }
            break;
    }

    if (!record.result.success) {
        spdlog::error("Bet failed on {}: {}", record.market_id, record.result.error);
    } else if (!record.result.filled) {
        spdlog::warn("Order {} on {} did not fill", record.result.order_id, record.market_id);
    } else if (!record.dry_run) {
        spdlog::info("Bet placed: {} {:.2f} on {} (order {})",
                     direction_to_string(record.direction), record.amount,
                     record.market_id, record.result.order_id);
    }

    persist(record);
    return record;
}

DispatchSummary ExecutionDispatcher::execute_all(const std::vector<DecisionRecord>& decisions) {
    DispatchSummary summary;

    for (const auto& decision : decisions) {
        auto record = execute(decision);
        if (!record) continue;

        summary.attempted++;
        if (record->result.success) {
            summary.succeeded++;
            if (!record->result.filled) summary.unfilled++;
        } else {
            summary.failed++;
        }
        summary.records.push_back(std::move(*record));
    }

    spdlog::info("Execution batch: {} attempted, {} succeeded ({} unfilled), {} failed",
                 summary.attempted, summary.succeeded, summary.unfilled, summary.failed);
    return summary;
}

ExecutionResult ExecutionDispatcher::place_pooled(const DecisionRecord& decision) {
    if (!pooled_client_) {
        return ExecutionResult::failure("No client configured for venue " + venue_to_string(decision.venue));
    }

    auto fill = pooled_client_->place_bet(decision.market_id, *decision.direction, decision.stake);
    if (!fill) {
        return ExecutionResult::failure(fill.error().message);
    }
    return ExecutionResult::ok(fill.value().bet_id, fill.value().shares);
}

ExecutionResult ExecutionDispatcher::place_order_book(const DecisionRecord& decision) {
    auto* client = order_client();
    if (!client) {
        return ExecutionResult::failure(order_client_error_);
    }
    if (decision.order_token_id.empty()) {
        return ExecutionResult::failure("Missing order token id for " + decision.market_id);
    }

    double price = order_price_for(decision);
    auto order = client->place_fok_order(decision.order_token_id, decision.stake, price);
    if (!order) {
        return ExecutionResult::failure(order.error().message);
    }

    const auto& o = order.value();
    return ExecutionResult::ok(o.order_id, o.shares, o.filled);
}

OrderBookVenueClient* ExecutionDispatcher::order_client() {
    if (!factory_called_) {
        factory_called_ = true;
        if (!order_client_factory_) {
            order_client_error_ = "No order-book client configured";
        } else {
            auto created = order_client_factory_();
            if (created && created.value()) {
                order_client_ = std::move(created).value();
            } else if (created) {
                order_client_error_ = "Order-book client factory returned no client";
            } else {
                order_client_error_ = "Order-book client unavailable: " + created.error().message;
                spdlog::error("{}", order_client_error_);
            }
        }
    }
    return order_client_.get();
}

void ExecutionDispatcher::persist(const ExecutionRecord& record) {
    try {
        store_.append_execution(record);
    } catch (const std::exception& e) {
        spdlog::error("Failed to persist execution {} ({}): {}",
                      record.trace_id, record.result.success ? "placed" : "failed", e.what());
    }
}

} // namespace pbot
