#include <gtest/gtest.h>
#include "core/market_scanner.hpp"
#include "test_fakes.hpp"

using namespace pbot;
using namespace pbot::testing_support;

class MarketScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<RecordStore>(dir_.str());
    }

    void offer(const MarketSnapshot& m) {
        client_.search_result.push_back(m);
        client_.markets[m.id] = m;
    }

    Result<ScanSummary> scan_pooled(TradingMode mode = TradingMode::DRY_RUN) {
        ExecutionDispatcher dispatcher(mode, *store_, &client_, nullptr);
        MarketScanner scanner(config_, *store_, estimator_, dispatcher);
        return scanner.scan_pooled(client_);
    }

    Config config_;
    TempDir dir_;
    std::unique_ptr<RecordStore> store_;
    FakePooledClient client_;
    FakeEstimator estimator_;
};

TEST_F(MarketScannerTest, Pooled_EveryMarketGetsADecision) {
    offer(make_market("bet", 0.30));
    offer(make_market("flat", 0.50));
    offer(make_market("broken", 0.40));
    auto lite_only = make_market("vanished", 0.40);
    client_.search_result.push_back(lite_only);

    estimator_.by_market["bet"] = Estimate{0.60, Confidence::MEDIUM, "mispriced"};
    estimator_.errors["broken"] = Error::transient("estimator timeout");

    auto result = scan_pooled();
    ASSERT_TRUE(result.ok());
    const auto& s = result.value();
    EXPECT_EQ(s.fetched, 4);
    EXPECT_EQ(s.analyzed, 4);
    EXPECT_EQ(s.bets, 1);
    EXPECT_EQ(s.errors, 2);
    EXPECT_DOUBLE_EQ(s.bankroll, 1000.0);

    auto decisions = store_->load_decisions();
    ASSERT_EQ(decisions.size(), 4u);
    for (const auto& d : decisions) {
        EXPECT_FALSE(d.trace_id.empty());
        if (d.market_id == "bet") {
            EXPECT_EQ(d.action, DecisionAction::BET);
            EXPECT_DOUBLE_EQ(d.stake, 50.0);
        } else if (d.market_id == "flat") {
            EXPECT_EQ(d.action, DecisionAction::SKIP_LOW_EDGE);
        } else {
            EXPECT_EQ(d.action, DecisionAction::SKIP_ERROR);
        }
    }

    // Dry run still records the attempt, with no venue call
    EXPECT_EQ(s.dispatch.attempted, 1);
    EXPECT_TRUE(client_.bets.empty());
    auto execs = store_->load_executions();
    ASSERT_EQ(execs.size(), 1u);
    EXPECT_TRUE(execs[0].dry_run);
}

TEST_F(MarketScannerTest, Pooled_LivePlacesBet) {
    offer(make_market("bet", 0.30));
    estimator_.by_market["bet"] = Estimate{0.60, Confidence::HIGH, ""};

    auto result = scan_pooled(TradingMode::LIVE);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(client_.bets.size(), 1u);
    EXPECT_EQ(client_.bets[0].first, "bet");

    auto execs = store_->load_executions();
    ASSERT_EQ(execs.size(), 1u);
    EXPECT_TRUE(execs[0].is_live_fill());
    EXPECT_EQ(execs[0].trace_id, result.value().decisions[0].trace_id);
}

TEST_F(MarketScannerTest, Pooled_InvalidEstimateBecomesError) {
    offer(make_market("m1", 0.30));
    estimator_.by_market["m1"] = Estimate{1.4, Confidence::HIGH, ""};

    auto result = scan_pooled();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().errors, 1);
    EXPECT_EQ(result.value().decisions[0].action, DecisionAction::SKIP_ERROR);
}

TEST_F(MarketScannerTest, Pooled_HeldMarketsSkipped) {
    offer(make_market("held", 0.30));
    offer(make_market("free", 0.30));
    store_->append_execution(make_execution("old", "held"));

    auto result = scan_pooled();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().held_skipped, 1);
    ASSERT_EQ(result.value().analyzed, 1);
    EXPECT_EQ(result.value().decisions[0].market_id, "free");
}

TEST_F(MarketScannerTest, Pooled_IneligibleFilteredOut) {
    auto closing = make_market("closing", 0.30);
    closing.close_time_ms = now_ms() + 10 * 60 * 1000;
    auto thin = make_market("thin", 0.30, 50.0);
    offer(closing);
    offer(thin);
    offer(make_market("ok", 0.30));

    auto result = scan_pooled();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().eligible, 1);
    EXPECT_EQ(result.value().analyzed, 1);
}

TEST_F(MarketScannerTest, Pooled_RespectsMaxMarketsPerRun) {
    config_.filter.max_markets_per_run = 2;
    for (int i = 0; i < 5; ++i) offer(make_market("m" + std::to_string(i), 0.5));

    auto result = scan_pooled();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().analyzed, 2);
    EXPECT_EQ(client_.get_market_calls, 2);
}

TEST_F(MarketScannerTest, Pooled_LowBalanceAborts) {
    client_.account.balance = 5.0;
    offer(make_market("m1", 0.30));

    auto result = scan_pooled();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::REJECTED);
    EXPECT_TRUE(store_->load_decisions().empty());
}

TEST_F(MarketScannerTest, Pooled_SearchFailureAborts) {
    client_.search_error = Error::transient("HTTP 503", 503);
    auto result = scan_pooled();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().http_status, 503);
}

TEST_F(MarketScannerTest, Pooled_FeedbackPassedOnceEnoughResolutions) {
    offer(make_market("m1", 0.5));
    auto first = scan_pooled();
    ASSERT_TRUE(first.ok());
    ASSERT_EQ(estimator_.feedback_seen.size(), 1u);
    EXPECT_FALSE(estimator_.feedback_seen[0].has_value());

    for (int i = 0; i < 10; ++i) {
        ResolutionRecord r;
        r.trace_id = "r" + std::to_string(i);
        r.direction = Direction::YES;
        r.estimate = 0.7;
        r.outcome = i < 7 ? ResolutionOutcome::YES : ResolutionOutcome::NO;
        r.won = i < 7;
        r.amount = 10.0;
        store_->append_resolution(r);
    }

    auto second = scan_pooled();
    ASSERT_TRUE(second.ok());
    ASSERT_EQ(estimator_.feedback_seen.size(), 2u);
    ASSERT_TRUE(estimator_.feedback_seen[1].has_value());
    EXPECT_NE(estimator_.feedback_seen[1]->find("Your Past Performance"), std::string::npos);
}

TEST_F(MarketScannerTest, LoadCalibrationFeedback_EmptyStore) {
    EXPECT_FALSE(load_calibration_feedback(*store_).has_value());
}

class OrderBookScanTest : public MarketScannerTest {
protected:
    PolymarketMarket poly_market(const std::string& cid, double yes_price, int64_t ends_in_ms) {
        PolymarketMarket m;
        m.condition_id = cid;
        m.question = "Will the test event happen (" + cid + ")?";
        m.slug = cid;
        m.yes_price = yes_price;
        m.no_price = 1.0 - yes_price;
        m.yes_token_id = cid + "-yes";
        m.no_token_id = cid + "-no";
        m.volume_24hr = 5000.0;
        m.liquidity = 5000.0;
        m.end_date_ms = now_ms() + ends_in_ms;
        data_.asks[m.yes_token_id] = {{yes_price, 1000.0}};
        data_.asks[m.no_token_id] = {{1.0 - yes_price, 1000.0}};
        return m;
    }

    ExecutionDispatcher::OrderClientFactory factory() {
        return [this]() -> Result<std::unique_ptr<OrderBookVenueClient>> {
            auto client = std::make_unique<FakeOrderClient>();
            order_client_ = client.get();
            return std::unique_ptr<OrderBookVenueClient>(std::move(client));
        };
    }

    FakePolymarketData data_;
    FakeOrderClient* order_client_{nullptr};
};

TEST_F(OrderBookScanTest, BetsWithTokenForChosenSide) {
    data_.markets.push_back(poly_market("0xaaa", 0.30, 2 * ONE_DAY_MS));
    estimator_.by_market["0xaaa"] = Estimate{0.60, Confidence::MEDIUM, ""};

    ExecutionDispatcher dispatcher(TradingMode::LIVE, *store_, nullptr, factory());
    MarketScanner scanner(config_, *store_, estimator_, dispatcher);
    auto result = scanner.scan_order_book(data_);

    ASSERT_TRUE(result.ok());
    const auto& s = result.value();
    EXPECT_DOUBLE_EQ(s.bankroll, 50.0);
    ASSERT_EQ(s.decisions.size(), 1u);
    const auto& d = s.decisions[0];
    EXPECT_EQ(d.action, DecisionAction::BET);
    EXPECT_EQ(d.venue, Venue::POLYMARKET);
    EXPECT_EQ(d.order_token_id, "0xaaa-yes");
    EXPECT_DOUBLE_EQ(d.stake, 5.0);

    ASSERT_NE(order_client_, nullptr);
    ASSERT_EQ(order_client_->orders.size(), 1u);
    EXPECT_EQ(std::get<0>(order_client_->orders[0]), "0xaaa-yes");
    EXPECT_NEAR(std::get<2>(order_client_->orders[0]), 0.30, 1e-9);
}

TEST_F(OrderBookScanTest, NoSideUsesNoToken) {
    data_.markets.push_back(poly_market("0xbbb", 0.70, 2 * ONE_DAY_MS));
    estimator_.by_market["0xbbb"] = Estimate{0.30, Confidence::HIGH, ""};

    ExecutionDispatcher dispatcher(TradingMode::DRY_RUN, *store_, nullptr, factory());
    MarketScanner scanner(config_, *store_, estimator_, dispatcher);
    auto result = scanner.scan_order_book(data_);

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().decisions.size(), 1u);
    EXPECT_EQ(result.value().decisions[0].order_token_id, "0xbbb-no");
    EXPECT_EQ(order_client_, nullptr);
}

TEST_F(OrderBookScanTest, NoOrderPricedAtNoAskNotYesComplement) {
    auto m = poly_market("0xccc", 0.32, 2 * ONE_DAY_MS);
    m.no_price = 0.70;
    data_.asks[m.no_token_id] = {{0.70, 1000.0}};
    data_.markets.push_back(m);
    estimator_.by_market["0xccc"] = Estimate{0.10, Confidence::HIGH, ""};

    ExecutionDispatcher dispatcher(TradingMode::LIVE, *store_, nullptr, factory());
    MarketScanner scanner(config_, *store_, estimator_, dispatcher);
    auto result = scanner.scan_order_book(data_);

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().decisions.size(), 1u);
    const auto& d = result.value().decisions[0];
    EXPECT_EQ(d.action, DecisionAction::BET);
    ASSERT_TRUE(d.direction.has_value());
    EXPECT_EQ(*d.direction, Direction::NO);
    EXPECT_DOUBLE_EQ(d.order_price, 0.70);

    ASSERT_NE(order_client_, nullptr);
    ASSERT_EQ(order_client_->orders.size(), 1u);
    EXPECT_EQ(std::get<0>(order_client_->orders[0]), "0xccc-no");
    EXPECT_GE(std::get<2>(order_client_->orders[0]), 0.70 - 1e-9);
}

TEST_F(OrderBookScanTest, ExtremePricesAndEmptyBooksDropped) {
    data_.markets.push_back(poly_market("0xlow", 0.02, 2 * ONE_DAY_MS));
    auto empty = poly_market("0xempty", 0.40, 2 * ONE_DAY_MS);
    data_.asks[empty.yes_token_id].clear();
    data_.asks[empty.no_token_id].clear();
    data_.markets.push_back(empty);
    data_.markets.push_back(poly_market("0xok", 0.40, 3 * ONE_DAY_MS));

    ExecutionDispatcher dispatcher(TradingMode::DRY_RUN, *store_, nullptr, factory());
    MarketScanner scanner(config_, *store_, estimator_, dispatcher);
    auto result = scanner.scan_order_book(data_);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().fetched, 3);
    EXPECT_EQ(result.value().eligible, 2);
    ASSERT_EQ(result.value().analyzed, 1);
    EXPECT_EQ(result.value().decisions[0].market_id, "0xok");
}

TEST_F(OrderBookScanTest, HeldConditionsSkipped) {
    data_.markets.push_back(poly_market("0xheld", 0.40, 2 * ONE_DAY_MS));
    store_->append_execution(make_execution("old", "0xheld", Direction::YES, 5.0, 0.4, Venue::POLYMARKET));

    ExecutionDispatcher dispatcher(TradingMode::DRY_RUN, *store_, nullptr, factory());
    MarketScanner scanner(config_, *store_, estimator_, dispatcher);
    auto result = scanner.scan_order_book(data_);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().held_skipped, 1);
    EXPECT_EQ(result.value().analyzed, 0);
}
