#include <gtest/gtest.h>
#include "market_data/chain_reader.hpp"
#include "test_fakes.hpp"

using namespace pbot;
using namespace pbot::testing_support;

namespace {
    const std::string CONDITION =
        "0x1f2e3d4c5b6a79881f2e3d4c5b6a79881f2e3d4c5b6a79881f2e3d4c5b6a7988";

    std::string word(uint64_t v) { return "0x" + encode_uint256(v); }
}

class U256Test : public ::testing::Test {};

TEST_F(U256Test, FromHex_PaddedWord) {
    auto v = U256::from_hex(word(1));
    EXPECT_EQ(v, U256::from_u64(1));
    EXPECT_FALSE(v.is_zero());
    EXPECT_EQ(v.to_hex(), word(1));
}

TEST_F(U256Test, FromHex_ZeroForms) {
    EXPECT_TRUE(U256::from_hex("0x").is_zero());
    EXPECT_TRUE(U256::from_hex("").is_zero());
    EXPECT_TRUE(U256::from_hex("0x0").is_zero());
    EXPECT_TRUE(U256::from_hex(word(0)).is_zero());
}

TEST_F(U256Test, FromHex_WideValues) {
    auto high = U256::from_hex("0x1" + std::string(63, '0'));
    EXPECT_EQ(high.limbs[0], uint64_t{1} << 60);
    EXPECT_EQ(high.limbs[3], 0u);
    EXPECT_GT(high, U256::from_u64(UINT64_MAX));
    EXPECT_LT(U256::from_u64(7), U256::from_hex("0X08"));
}

TEST_F(U256Test, FromHex_Rejects) {
    EXPECT_THROW(U256::from_hex("0xzz"), std::invalid_argument);
    EXPECT_THROW(U256::from_hex("0x1" + std::string(64, '0')), std::invalid_argument);
    // Leading zeros beyond 64 digits are fine
    EXPECT_NO_THROW(U256::from_hex("0x00" + std::string(63, '0') + "1"));
}

TEST_F(U256Test, AbiEncoding) {
    EXPECT_EQ(encode_bytes32(CONDITION), CONDITION.substr(2));
    EXPECT_EQ(encode_bytes32(CONDITION.substr(2)), CONDITION.substr(2));
    EXPECT_THROW(encode_bytes32("0x1234"), std::invalid_argument);
    EXPECT_THROW(encode_bytes32("0x" + std::string(63, 'a') + "g"), std::invalid_argument);

    EXPECT_EQ(encode_uint256(1), std::string(63, '0') + "1");
    EXPECT_EQ(encode_uint256(255).substr(62), "ff");
    EXPECT_EQ(encode_uint256(0).size(), 64u);
}

class RpcChainReaderTest : public ::testing::Test {
protected:
    RpcChainReaderTest()
        : limiter_(1000, std::chrono::minutes(1))
        , reader_(fast_connection(), http_, limiter_)
    {}

    nlohmann::json request_body(size_t i) {
        return nlohmann::json::parse(http_.requests.at(i).body);
    }

    CannedHttp http_;
    time_utils::RateLimiter limiter_;
    RpcChainReader reader_;
};

TEST_F(RpcChainReaderTest, Denominator_EncodesCall) {
    http_.reply_json({{"jsonrpc", "2.0"}, {"id", 1}, {"result", word(1)}});

    auto result = reader_.payout_denominator(CONDITION);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), U256::from_u64(1));

    ASSERT_EQ(http_.requests.size(), 1u);
    EXPECT_EQ(http_.requests[0].method, "POST");
    EXPECT_EQ(http_.requests[0].url, ConnectionConfig{}.polygon_rpc_url);

    auto body = request_body(0);
    EXPECT_EQ(body["method"], "eth_call");
    EXPECT_EQ(body["params"][1], "latest");
    EXPECT_EQ(body["params"][0]["to"], ConnectionConfig{}.ctf_address);
    EXPECT_EQ(body["params"][0]["data"], "0xdd34de67" + CONDITION.substr(2));
}

TEST_F(RpcChainReaderTest, Numerator_AppendsIndex) {
    http_.reply_json({{"result", word(0)}});

    auto result = reader_.payout_numerator(CONDITION, 1);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().is_zero());

    auto data = request_body(0)["params"][0]["data"].get<std::string>();
    EXPECT_EQ(data, "0x0504c814" + CONDITION.substr(2) + encode_uint256(1));
}

TEST_F(RpcChainReaderTest, RequestIdsIncrease) {
    http_.reply_json({{"result", word(0)}});
    http_.reply_json({{"result", word(0)}});
    ASSERT_TRUE(reader_.payout_denominator(CONDITION).ok());
    ASSERT_TRUE(reader_.payout_denominator(CONDITION).ok());
    EXPECT_LT(request_body(0)["id"].get<int>(), request_body(1)["id"].get<int>());
}

TEST_F(RpcChainReaderTest, RpcErrorIsTransient) {
    http_.reply_json({{"error", {{"code", -32000}, {"message", "header not found"}}}});

    auto result = reader_.payout_denominator(CONDITION);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::TRANSIENT);
}

TEST_F(RpcChainReaderTest, MalformedReplies) {
    http_.reply_json({{"id", 1}});
    http_.reply_json({{"result", "0xnothex"}});
    http_.reply(200, "not json");

    for (int i = 0; i < 3; ++i) {
        auto result = reader_.payout_denominator(CONDITION);
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(result.error().kind, ErrorKind::INVALID_DATA);
    }
}

TEST_F(RpcChainReaderTest, TransportErrorsRetried) {
    http_.reply(503, "busy");
    http_.reply_json({{"result", word(1)}});

    auto result = reader_.payout_denominator(CONDITION);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(http_.requests.size(), 2u);
}

TEST_F(RpcChainReaderTest, BadArgumentsNeverSent) {
    auto bad_id = reader_.payout_denominator("0xabc");
    ASSERT_FALSE(bad_id.ok());
    EXPECT_EQ(bad_id.error().kind, ErrorKind::INVALID_DATA);

    auto bad_index = reader_.payout_numerator(CONDITION, -1);
    ASSERT_FALSE(bad_index.ok());
    EXPECT_EQ(bad_index.error().kind, ErrorKind::INVALID_DATA);

    EXPECT_TRUE(http_.requests.empty());
}
