#include <gtest/gtest.h>
#include "strategy/decision_engine.hpp"
#include <stdexcept>
#include "test_fakes.hpp"

using namespace pbot;
using namespace pbot::testing_support;

class DecisionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Caps out of the way so the Kelly stake shows through
        config_.max_bet_amount = 1000.0;
        config_.poly_max_bet_amount = 1000.0;
    }

    Estimate estimate(Probability p, Confidence c = Confidence::MEDIUM) {
        return Estimate{p, c, "because"};
    }

    StrategyConfig config_;
};

TEST_F(DecisionEngineTest, LargeEdge_Bets) {
    DecisionEngine engine(config_);
    auto market = make_market("m1", 0.30);

    auto d = engine.decide(market, estimate(0.60), 1000.0, Venue::POLYMARKET);

    EXPECT_EQ(d.action, DecisionAction::BET);
    ASSERT_TRUE(d.direction.has_value());
    EXPECT_EQ(*d.direction, Direction::YES);
    EXPECT_DOUBLE_EQ(d.stake, 107.0);
    EXPECT_NEAR(d.edge, 0.30, 1e-12);
    EXPECT_NEAR(d.kelly_fraction, 0.428571, 1e-6);
    EXPECT_EQ(d.venue, Venue::POLYMARKET);
    EXPECT_EQ(d.reasoning, "because");
    EXPECT_FALSE(d.trace_id.empty());
    EXPECT_FALSE(d.timestamp.empty());
    EXPECT_EQ(d.market_id, "m1");
}

TEST_F(DecisionEngineTest, SmallEdge_SkipsWithoutDirection) {
    DecisionEngine engine(config_);
    auto d = engine.decide(make_market("m1", 0.30), estimate(0.32), 1000.0, Venue::POLYMARKET);

    EXPECT_EQ(d.action, DecisionAction::SKIP_LOW_EDGE);
    EXPECT_FALSE(d.direction.has_value());
    EXPECT_DOUBLE_EQ(d.stake, 0.0);
    EXPECT_NEAR(d.edge, 0.02, 1e-12);
}

TEST_F(DecisionEngineTest, EdgeExactlyAtThreshold_Proceeds) {
    config_.edge_threshold = 0.25;
    DecisionEngine engine(config_);
    auto d = engine.decide(make_market("m1", 0.25), estimate(0.50), 1000.0, Venue::POLYMARKET);
    EXPECT_EQ(d.action, DecisionAction::BET);
}

TEST_F(DecisionEngineTest, LowConfidenceGeneralQuestion_Skips) {
    DecisionEngine engine(config_);
    auto d = engine.decide(make_market("m1", 0.30), estimate(0.60, Confidence::LOW), 1000.0, Venue::MANIFOLD);

    EXPECT_EQ(d.action, DecisionAction::SKIP_LOW_CONFIDENCE);
    EXPECT_FALSE(d.direction.has_value());
    EXPECT_DOUBLE_EQ(d.stake, 0.0);
}

TEST_F(DecisionEngineTest, LowConfidenceFinanceQuestion_StillBets) {
    DecisionEngine engine(config_);
    auto market = make_market("m1", 0.30);
    market.question = "Will NVDA close above $150 on Friday?";

    auto d = engine.decide(market, estimate(0.60, Confidence::LOW), 1000.0, Venue::POLYMARKET);
    EXPECT_EQ(d.action, DecisionAction::BET);
}

TEST_F(DecisionEngineTest, NoBet_StakeAtMostPositionCap) {
    DecisionEngine engine(config_);
    auto d = engine.decide(make_market("m1", 0.80), estimate(0.10, Confidence::HIGH), 1000.0, Venue::POLYMARKET);

    EXPECT_EQ(d.action, DecisionAction::BET);
    ASSERT_TRUE(d.direction.has_value());
    EXPECT_EQ(*d.direction, Direction::NO);
    EXPECT_LE(d.stake, 1000.0 * config_.max_position_pct);
}

TEST_F(DecisionEngineTest, PooledImpactKillsStake_NegativeKelly) {
    config_.edge_threshold = 0.005;
    config_.max_bet_amount = 50.0;
    DecisionEngine engine(config_);

    auto d = engine.decide(make_market("m1", 0.30, 10.0), estimate(0.31), 1000.0, Venue::MANIFOLD);

    EXPECT_EQ(d.action, DecisionAction::SKIP_NEGATIVE_KELLY);
    EXPECT_DOUBLE_EQ(d.stake, 0.0);
    EXPECT_TRUE(d.direction.has_value());
}

TEST_F(DecisionEngineTest, StakeRoundsToZero_SkipsLowEdge) {
    config_.edge_threshold = 0.05;
    DecisionEngine engine(config_);

    // kelly 0.0857 * 0.25 * 20 = 0.43 -> rounds to 0
    auto d = engine.decide(make_market("m1", 0.30), estimate(0.36), 20.0, Venue::POLYMARKET);

    EXPECT_EQ(d.action, DecisionAction::SKIP_LOW_EDGE);
    EXPECT_GT(d.kelly_fraction, 0.0);
    EXPECT_DOUBLE_EQ(d.stake, 0.0);
}

TEST_F(DecisionEngineTest, PooledVenue_RecordsEffectivePrice) {
    config_.max_bet_amount = 50.0;
    DecisionEngine engine(config_);

    auto d = engine.decide(make_market("m1", 0.30, 1000.0), estimate(0.60), 1000.0, Venue::MANIFOLD);

    EXPECT_EQ(d.action, DecisionAction::BET);
    EXPECT_DOUBLE_EQ(d.stake, 50.0);
    EXPECT_GT(d.effective_prob, 0.30);
}

TEST_F(DecisionEngineTest, InvalidProbability_Throws) {
    DecisionEngine engine(config_);
    EXPECT_THROW(engine.decide(make_market("m1", 1.5), estimate(0.6), 1000.0, Venue::MANIFOLD),
                 std::invalid_argument);
    EXPECT_THROW(engine.decide(make_market("m1", 0.3), estimate(-0.2), 1000.0, Venue::MANIFOLD),
                 std::invalid_argument);
}

TEST_F(DecisionEngineTest, ErrorDecision_FullyPopulated) {
    DecisionEngine engine(config_);
    auto d = engine.error_decision(make_market("m1", 0.40), Venue::MANIFOLD, "timeout");

    EXPECT_EQ(d.action, DecisionAction::SKIP_ERROR);
    EXPECT_EQ(d.reasoning, "Error: timeout");
    EXPECT_FALSE(d.direction.has_value());
    EXPECT_DOUBLE_EQ(d.market_prob, 0.40);
    EXPECT_FALSE(d.trace_id.empty());
}

TEST_F(DecisionEngineTest, TraceIdsAreUnique) {
    DecisionEngine engine(config_);
    auto market = make_market("m1", 0.30);
    auto a = engine.decide(market, estimate(0.60), 1000.0, Venue::POLYMARKET);
    auto b = engine.decide(market, estimate(0.60), 1000.0, Venue::POLYMARKET);
    EXPECT_NE(a.trace_id, b.trace_id);
}
