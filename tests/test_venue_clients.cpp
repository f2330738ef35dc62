#include <gtest/gtest.h>
#include "market_data/manifold_client.hpp"
#include "market_data/polymarket_client.hpp"
#include "utils/crypto.hpp"
#include <algorithm>
#include "test_fakes.hpp"

using namespace pbot;
using namespace pbot::testing_support;

class CryptoTest : public ::testing::Test {};

TEST_F(CryptoTest, HmacSha256_UrlSafeBase64) {
    // RFC 4231 test case 2
    EXPECT_EQ(crypto::hmac_sha256("Jefe", "what do ya want for nothing?"),
              "W9zBRr9gdU5qBCQmCJV1x1oAPwidJzmDnexYuWTsOEM=");
}

TEST_F(CryptoTest, Base64DecodeAcceptsBothAlphabets) {
    auto standard = crypto::base64_decode("+/8=");
    auto url_safe = crypto::base64_decode("-_8=");
    EXPECT_EQ(standard, url_safe);
    EXPECT_EQ(standard, (std::vector<uint8_t>{0xfb, 0xff}));
    EXPECT_EQ(crypto::base64_encode(standard), "+/8=");
    EXPECT_EQ(crypto::base64url_encode(standard), "-_8=");
}

TEST_F(CryptoTest, UuidV4Format) {
    auto a = crypto::generate_uuid();
    auto b = crypto::generate_uuid();
    EXPECT_NE(a, b);
    ASSERT_EQ(a.size(), 36u);
    EXPECT_EQ(a[8], '-');
    EXPECT_EQ(a[13], '-');
    EXPECT_EQ(a[14], '4');
    EXPECT_NE(std::string("89ab").find(a[19]), std::string::npos);
}

class ManifoldClientTest : public ::testing::Test {
protected:
    ManifoldClientTest()
        : limiter_(1000, std::chrono::minutes(1))
        , client_(fast_connection(), "mkey", http_, limiter_)
    {}

    const std::string& base() const { return connection_.manifold_api_url; }

    ConnectionConfig connection_;
    CannedHttp http_;
    time_utils::RateLimiter limiter_;
    ManifoldClient client_;
};

TEST_F(ManifoldClientTest, GetMe) {
    http_.reply_json({{"id", "u1"}, {"username", "bot"}, {"balance", 812.5}});

    auto me = client_.get_me();
    ASSERT_TRUE(me.ok());
    EXPECT_EQ(me.value().username, "bot");
    EXPECT_DOUBLE_EQ(me.value().balance, 812.5);

    ASSERT_EQ(http_.requests.size(), 1u);
    EXPECT_EQ(http_.requests[0].url, base() + "/me");
    EXPECT_EQ(http_.requests[0].headers, std::vector<std::string>{"Authorization: Key mkey"});
}

TEST_F(ManifoldClientTest, GetMe_MissingBalanceIsInvalidData) {
    http_.reply_json({{"id", "u1"}});
    auto me = client_.get_me();
    ASSERT_FALSE(me.ok());
    EXPECT_EQ(me.error().kind, ErrorKind::INVALID_DATA);
}

TEST_F(ManifoldClientTest, SearchMarkets_SkipsMalformed) {
    http_.reply_json(nlohmann::json::array({
        {{"id", "m1"}, {"question", "Q1"}, {"probability", 0.3}},
        {{"question", "no id"}},
        {{"id", "m2"}, {"question", "Q2"}, {"probability", 0.6}}
    }));

    auto markets = client_.search_markets(50);
    ASSERT_TRUE(markets.ok());
    ASSERT_EQ(markets.value().size(), 2u);
    EXPECT_EQ(markets.value()[1].id, "m2");
    EXPECT_EQ(http_.requests[0].url,
              base() + "/search-markets?contractType=BINARY&filter=open&limit=50&sort=liquidity");
}

TEST_F(ManifoldClientTest, GetMarket_EncodesId) {
    http_.reply_json({{"id", "a b"}, {"question", "Q"}});
    ASSERT_TRUE(client_.get_market("a b").ok());
    EXPECT_EQ(http_.requests[0].url, base() + "/market/a%20b");
}

TEST_F(ManifoldClientTest, PlaceBet_RoundsAmount) {
    http_.reply_json({{"betId", "bet-1"}, {"shares", 31.2}, {"amount", 13}});

    auto fill = client_.place_bet("m1", Direction::NO, 12.6);
    ASSERT_TRUE(fill.ok());
    EXPECT_EQ(fill.value().bet_id, "bet-1");

    const auto& req = http_.requests[0];
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.url, base() + "/bet");
    auto body = nlohmann::json::parse(req.body);
    EXPECT_EQ(body["contractId"], "m1");
    EXPECT_EQ(body["outcome"], "NO");
    EXPECT_EQ(body["amount"], 13);
}

TEST_F(ManifoldClientTest, SellShares) {
    http_.reply_json({{"betId", "sell-1"}, {"shares", -20}});

    auto fill = client_.sell_shares("m1", Direction::YES);
    ASSERT_TRUE(fill.ok());
    EXPECT_DOUBLE_EQ(fill.value().shares.value_or(0.0), 20.0);
    EXPECT_EQ(http_.requests[0].url, base() + "/market/m1/sell");
    EXPECT_EQ(nlohmann::json::parse(http_.requests[0].body)["outcome"], "YES");
}

TEST_F(ManifoldClientTest, RateLimitRetriedThenRejectedSurfaces) {
    http_.reply(429, "slow down");
    http_.reply(403, "Insufficient balance");

    auto fill = client_.place_bet("m1", Direction::YES, 10);
    ASSERT_FALSE(fill.ok());
    EXPECT_EQ(fill.error().kind, ErrorKind::REJECTED);
    EXPECT_EQ(http_.requests.size(), 2u);
}

class PolymarketClientTest : public ::testing::Test {
protected:
    PolymarketClientTest()
        : limiter_(1000, std::chrono::minutes(1))
        , client_(fast_connection(), PolymarketConfig{}, http_, limiter_)
    {}

    bool sent_header_prefix(const std::string& prefix) const {
        const auto& h = http_.requests.at(0).headers;
        return std::any_of(h.begin(), h.end(),
                           [&](const std::string& s) { return s.rfind(prefix, 0) == 0; });
    }

    ConnectionConfig connection_;
    CannedHttp http_;
    time_utils::RateLimiter limiter_;
    PolymarketClient client_;
};

TEST_F(PolymarketClientTest, FetchOrderBook) {
    http_.reply_json({{"bids", nlohmann::json::array()},
                      {"asks", nlohmann::json::array({{{"price", "0.52"}, {"size", "40"}}})}});

    auto book = client_.fetch_order_book("123");
    ASSERT_TRUE(book.ok());
    EXPECT_DOUBLE_EQ(book.value().best_ask()->price, 0.52);
    EXPECT_EQ(http_.requests[0].url, connection_.polymarket_clob_url + "/book?token_id=123");
}

TEST_F(PolymarketClientTest, FetchMarkets_RequiresArray) {
    http_.reply_json({{"error", "bad"}});
    auto markets = client_.fetch_markets();
    ASSERT_FALSE(markets.ok());
    EXPECT_EQ(markets.error().kind, ErrorKind::INVALID_DATA);
}

TEST_F(PolymarketClientTest, Order_RequiresCredentials) {
    auto r = client_.place_fok_order("tok", 5.0, 0.4);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, ErrorKind::CONFIGURATION);
    EXPECT_TRUE(http_.requests.empty());
}

TEST_F(PolymarketClientTest, Order_SignedFokBody) {
    client_.set_api_credentials("key-1", "c2VjcmV0", "pass");
    http_.reply_json({{"success", true}, {"orderID", "0xo"}, {"status", "matched"}, {"takingAmount", "12.5"}});

    auto r = client_.place_fok_order("tok", 5.0, 0.4);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().filled);
    EXPECT_DOUBLE_EQ(r.value().shares.value_or(0.0), 12.5);

    EXPECT_EQ(http_.requests[0].url, connection_.polymarket_clob_url + "/order");
    EXPECT_TRUE(sent_header_prefix("POLY_API_KEY: key-1"));
    EXPECT_TRUE(sent_header_prefix("POLY_SIGNATURE: "));
    EXPECT_TRUE(sent_header_prefix("POLY_PASSPHRASE: pass"));
    EXPECT_FALSE(sent_header_prefix("POLY_ADDRESS"));

    auto body = nlohmann::json::parse(http_.requests[0].body);
    EXPECT_EQ(body["orderType"], "FOK");
    EXPECT_EQ(body["order"]["side"], "BUY");
    EXPECT_EQ(body["order"]["tokenID"], "tok");
    EXPECT_EQ(body["order"]["price"], "0.4000");
    EXPECT_EQ(body["order"]["amount"], "5.00");
}

TEST_F(PolymarketClientTest, Order_NotRetried) {
    client_.set_api_credentials("key-1", "c2VjcmV0", "pass");
    http_.reply(503, "busy");

    auto r = client_.place_fok_order("tok", 5.0, 0.4);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, ErrorKind::TRANSIENT);
    EXPECT_EQ(http_.requests.size(), 1u);
}

TEST_F(PolymarketClientTest, Order_KillRejectionIsNoFill) {
    client_.set_api_credentials("key-1", "c2VjcmV0", "pass");
    http_.responses.emplace_back(Error::rejected("order couldn't be fully filled, FOK orders are fully filled or killed", 400));

    auto r = client_.place_fok_order("tok", 5.0, 0.4);
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.value().filled);
    EXPECT_EQ(r.value().order_id, "no-fill");
}

TEST_F(PolymarketClientTest, L2SignatureUsesPathOnly) {
    client_.set_api_credentials("key-1", "c2VjcmV0", "pass");
    EXPECT_EQ(client_.generate_l2_signature("1700000000", "GET", "https://clob.polymarket.com/book", ""),
              "sGnIqIS0w73jlTVhz44U7ULfi9vy6WvUM6twuXXWi-o=");
    EXPECT_EQ(client_.generate_l2_signature("1700000000", "GET", "/book", ""),
              client_.generate_l2_signature("1700000000", "GET", "https://clob.polymarket.com/book", ""));
}
