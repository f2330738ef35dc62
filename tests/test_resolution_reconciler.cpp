#include <gtest/gtest.h>
#include "core/resolution_reconciler.hpp"
#include "test_fakes.hpp"

using namespace pbot;
using namespace pbot::testing_support;

class ResolutionReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<RecordStore>(dir_.str());
    }

    void set_resolved(const std::string& id, const std::string& resolution,
                      std::optional<double> prob = std::nullopt) {
        auto m = make_market(id, 0.5);
        m.is_resolved = true;
        m.resolution = resolution;
        m.resolution_probability = prob;
        pooled_.markets[id] = m;
    }

    void set_open(const std::string& id) {
        pooled_.markets[id] = make_market(id, 0.5);
    }

    ResolutionReconciler reconciler() {
        return ResolutionReconciler(*store_, &pooled_, &chain_);
    }

    TempDir dir_;
    std::unique_ptr<RecordStore> store_;
    FakePooledClient pooled_;
    FakeChainReader chain_;
};

TEST_F(ResolutionReconcilerTest, StatusFromMarket) {
    auto open = make_market("m1", 0.5);
    ASSERT_TRUE(status_from_market(open).ok());
    EXPECT_FALSE(status_from_market(open).value().resolved);

    open.is_resolved = true;  // resolved flag without a resolution string
    EXPECT_FALSE(status_from_market(open).value().resolved);

    open.resolution = "MKT";
    open.resolution_probability = 0.7;
    auto mkt = status_from_market(open);
    ASSERT_TRUE(mkt.ok());
    EXPECT_EQ(*mkt.value().outcome, ResolutionOutcome::MKT);
    EXPECT_DOUBLE_EQ(*mkt.value().resolution_probability, 0.7);

    open.resolution = "MAYBE";
    auto bad = status_from_market(open);
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().kind, ErrorKind::INVALID_DATA);
}

TEST_F(ResolutionReconcilerTest, BuildResolution_WonWithShares) {
    auto trade = make_execution("t1", "m1", Direction::YES, 50.0, 0.5);
    trade.result = ExecutionResult::ok("bet-1", 100.0);

    auto r = build_resolution(trade, ResolutionOutcome::YES, std::nullopt, Confidence::HIGH);
    EXPECT_TRUE(r.won);
    EXPECT_DOUBLE_EQ(r.pnl, 50.0);
    EXPECT_NEAR(r.brier_score, 0.09, 1e-12);
    EXPECT_EQ(r.confidence, Confidence::HIGH);
    EXPECT_FALSE(r.resolution_probability.has_value());
    EXPECT_DOUBLE_EQ(r.market_prob_at_bet, 0.5);
}

TEST_F(ResolutionReconcilerTest, BuildResolution_Lost) {
    auto trade = make_execution("t1", "m1", Direction::YES, 50.0, 0.5);
    trade.result = ExecutionResult::ok("bet-1", 100.0);

    auto r = build_resolution(trade, ResolutionOutcome::NO, std::nullopt, Confidence::MEDIUM);
    EXPECT_FALSE(r.won);
    EXPECT_DOUBLE_EQ(r.pnl, -50.0);
    EXPECT_NEAR(r.brier_score, 0.49, 1e-12);
}

TEST_F(ResolutionReconcilerTest, BuildResolution_Cancel) {
    auto trade = make_execution("t1", "m1", Direction::YES, 50.0, 0.5);
    auto r = build_resolution(trade, ResolutionOutcome::CANCEL, std::nullopt, Confidence::MEDIUM);
    EXPECT_FALSE(r.won);
    EXPECT_DOUBLE_EQ(r.pnl, 0.0);
    EXPECT_DOUBLE_EQ(r.brier_score, 0.0);
}

TEST_F(ResolutionReconcilerTest, BuildResolution_MktKeepsProbability) {
    auto trade = make_execution("t1", "m1", Direction::YES, 10.0, 0.5);
    auto r = build_resolution(trade, ResolutionOutcome::MKT, 0.8, Confidence::MEDIUM);
    ASSERT_TRUE(r.resolution_probability.has_value());
    EXPECT_DOUBLE_EQ(*r.resolution_probability, 0.8);
    EXPECT_TRUE(r.won);
    EXPECT_NEAR(r.brier_score, 0.01, 1e-12);
}

TEST_F(ResolutionReconcilerTest, Reconcile_PooledResolvesAndJoinsConfidence) {
    store_->append_execution(make_execution("t1", "m1"));
    store_->append_execution(make_execution("t2", "m2"));
    DecisionRecord d;
    d.trace_id = "t1";
    d.market_id = "m1";
    d.confidence = Confidence::HIGH;
    d.action = DecisionAction::BET;
    store_->append_decision(d);

    set_resolved("m1", "YES");
    set_resolved("m2", "NO");

    auto summary = reconciler().reconcile();
    EXPECT_EQ(summary.checked, 2);
    EXPECT_EQ(summary.resolved, 2);

    auto resolutions = store_->load_resolutions();
    ASSERT_EQ(resolutions.size(), 2u);
    EXPECT_EQ(resolutions[0].trace_id, "t1");
    EXPECT_EQ(resolutions[0].confidence, Confidence::HIGH);
    EXPECT_TRUE(resolutions[0].won);
    // No decision record for t2
    EXPECT_EQ(resolutions[1].confidence, Confidence::UNKNOWN);
    EXPECT_FALSE(resolutions[1].won);
}

TEST_F(ResolutionReconcilerTest, Reconcile_Idempotent) {
    store_->append_execution(make_execution("t1", "m1"));
    set_resolved("m1", "YES");

    auto first = reconciler().reconcile();
    EXPECT_EQ(first.resolved, 1);

    pooled_.get_market_calls = 0;
    auto second = reconciler().reconcile();
    EXPECT_EQ(second.checked, 0);
    EXPECT_EQ(second.resolved, 0);
    EXPECT_EQ(pooled_.get_market_calls, 0);
    EXPECT_EQ(store_->load_resolutions().size(), 1u);
}

TEST_F(ResolutionReconcilerTest, Reconcile_PendingAndFailuresStayOpen) {
    store_->append_execution(make_execution("t1", "m1"));
    store_->append_execution(make_execution("t2", "m2"));
    store_->append_execution(make_execution("t3", "m3"));
    set_open("m1");
    pooled_.market_errors["m2"] = Error::transient("timeout");
    auto weird = make_market("m3", 0.5);
    weird.is_resolved = true;
    weird.resolution = "MAYBE";
    pooled_.markets["m3"] = weird;

    auto summary = reconciler().reconcile();
    EXPECT_EQ(summary.checked, 3);
    EXPECT_EQ(summary.pending, 1);
    EXPECT_EQ(summary.failed, 2);
    EXPECT_EQ(summary.resolved, 0);
    EXPECT_TRUE(store_->load_resolutions().empty());

    set_resolved("m1", "YES");
    pooled_.market_errors.clear();
    set_resolved("m2", "CANCEL");
    set_resolved("m3", "NO");
    auto retry = reconciler().reconcile();
    EXPECT_EQ(retry.resolved, 3);
}

TEST_F(ResolutionReconcilerTest, Reconcile_SkipsDryRunFailedAndSold) {
    auto dry = make_execution("t1", "m1");
    dry.dry_run = true;
    auto failed = make_execution("t2", "m2");
    failed.result = ExecutionResult::failure("rejected");
    auto sold_buy = make_execution("t3", "m3");
    auto sold = make_execution("t3", "m3");
    sold.side = TradeSide::SELL;
    sold.result = ExecutionResult::ok("sell-1");
    auto unfilled = make_execution("t4", "c4", Direction::YES, 5.0, 0.5, Venue::POLYMARKET);
    unfilled.result = ExecutionResult::ok("no-fill", std::nullopt, false);

    for (const auto& e : {dry, failed, sold_buy, sold, unfilled}) store_->append_execution(e);
    for (const char* id : {"m1", "m2", "m3"}) set_resolved(id, "YES");

    auto summary = reconciler().reconcile();
    EXPECT_EQ(summary.checked, 0);
    EXPECT_EQ(chain_.denominator_calls.load(), 0);
}

TEST_F(ResolutionReconcilerTest, Reconcile_OrderBookFromChain) {
    store_->append_execution(make_execution("t1", "0xcond1", Direction::YES, 5.0, 0.4, Venue::POLYMARKET));
    store_->append_execution(make_execution("t2", "0xcond2", Direction::YES, 5.0, 0.4, Venue::POLYMARKET));
    store_->append_execution(make_execution("t3", "0xcond3", Direction::NO, 5.0, 0.4, Venue::POLYMARKET));
    chain_.payouts["0xcond1"] = {1, 1, 0};
    chain_.payouts["0xcond2"] = {0, 0, 0};
    chain_.payouts["0xcond3"] = {1, 0, 1};

    auto summary = reconciler().reconcile();
    EXPECT_EQ(summary.resolved, 2);
    EXPECT_EQ(summary.pending, 1);

    auto resolutions = store_->load_resolutions();
    ASSERT_EQ(resolutions.size(), 2u);
    EXPECT_EQ(resolutions[0].outcome, ResolutionOutcome::YES);
    EXPECT_TRUE(resolutions[0].won);
    EXPECT_EQ(resolutions[0].venue, Venue::POLYMARKET);
    EXPECT_EQ(resolutions[1].outcome, ResolutionOutcome::NO);
    EXPECT_TRUE(resolutions[1].won);
    EXPECT_EQ(pooled_.get_market_calls, 0);
}

TEST_F(ResolutionReconcilerTest, Reconcile_ConditionReadOncePerRun) {
    store_->append_execution(make_execution("t1", "0xcond", Direction::YES, 5.0, 0.4, Venue::POLYMARKET));
    store_->append_execution(make_execution("t2", "0xcond", Direction::NO, 5.0, 0.6, Venue::POLYMARKET));
    chain_.payouts["0xcond"] = {1, 1, 0};

    auto summary = reconciler().reconcile();
    EXPECT_EQ(summary.resolved, 2);
    EXPECT_EQ(chain_.denominator_calls.load(), 1);
    EXPECT_EQ(chain_.numerator_calls.load(), 2);
}

TEST_F(ResolutionReconcilerTest, Reconcile_PendingConditionCachedToo) {
    store_->append_execution(make_execution("t1", "0xcond", Direction::YES, 5.0, 0.4, Venue::POLYMARKET));
    store_->append_execution(make_execution("t2", "0xcond", Direction::NO, 5.0, 0.6, Venue::POLYMARKET));

    auto summary = reconciler().reconcile();
    EXPECT_EQ(summary.pending, 2);
    EXPECT_EQ(chain_.denominator_calls.load(), 1);
    EXPECT_EQ(chain_.numerator_calls.load(), 0);
}

TEST_F(ResolutionReconcilerTest, Reconcile_ChainErrorCountsAsFailure) {
    store_->append_execution(make_execution("t1", "0xcond", Direction::YES, 5.0, 0.4, Venue::POLYMARKET));
    chain_.error = Error::transient("rpc down");

    auto summary = reconciler().reconcile();
    EXPECT_EQ(summary.failed, 1);
    EXPECT_TRUE(store_->load_resolutions().empty());
}

TEST_F(ResolutionReconcilerTest, MissingCollaborators_AreConfigurationErrors) {
    ResolutionReconciler bare(*store_, nullptr, nullptr);
    auto pooled = bare.check_pooled("m1");
    ASSERT_FALSE(pooled.ok());
    EXPECT_EQ(pooled.error().kind, ErrorKind::CONFIGURATION);

    auto chain = bare.check_condition("0xcond");
    ASSERT_FALSE(chain.ok());
    EXPECT_EQ(chain.error().kind, ErrorKind::CONFIGURATION);
}
