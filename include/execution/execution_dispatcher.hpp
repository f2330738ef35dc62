#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "common/result.hpp"
#include "market_data/venue_client.hpp"
#include "persistence/records.hpp"
#include "persistence/record_store.hpp"

namespace pbot {

struct DispatchSummary {
    int attempted{0};
    int succeeded{0};
    int failed{0};
    int unfilled{0};  // Successful fill-or-kill orders that did not fill
    std::vector<ExecutionRecord> records;
};

/**
 * Turns BET decisions into orders and writes exactly one ExecutionRecord
 * per attempt. Venue failures end up in the record, never as exceptions.
 *
 * The authenticated order-book client is created lazily, at most once per
 * dispatcher, the first time an order-book BET needs it.
 */
class ExecutionDispatcher {
public:
    using OrderClientFactory = std::function<Result<std::unique_ptr<OrderBookVenueClient>>()>;

    ExecutionDispatcher(TradingMode mode,
                        RecordStore& store,
                        PooledVenueClient* pooled_client,
                        OrderClientFactory order_client_factory);

    // Non-BET decisions are ignored (nullopt)
    std::optional<ExecutionRecord> execute(const DecisionRecord& decision);

    DispatchSummary execute_all(const std::vector<DecisionRecord>& decisions);

    TradingMode mode() const { return mode_; }

private:
    TradingMode mode_;
    RecordStore& store_;
    PooledVenueClient* pooled_client_;
    OrderClientFactory order_client_factory_;

    bool factory_called_{false};
    std::unique_ptr<OrderBookVenueClient> order_client_;
    std::string order_client_error_;

    ExecutionResult place_pooled(const DecisionRecord& decision);
    ExecutionResult place_order_book(const DecisionRecord& decision);
    OrderBookVenueClient* order_client();

    void persist(const ExecutionRecord& record);
};

// Limit price for a fill-or-kill BUY of the decision's side: the side's
// recorded ask when present, clamped to [0.01, 0.99]
double order_price_for(const DecisionRecord& decision);

} // namespace pbot
