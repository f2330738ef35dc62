#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include "common/result.hpp"
#include "config/config.hpp"
#include "utils/http_client.hpp"
#include "utils/retry.hpp"
#include "utils/time_utils.hpp"

namespace pbot {

/**
 * Unsigned 256-bit value as returned by eth_call. Only comparison is
 * needed; limbs are stored most significant first.
 */
struct U256 {
    std::array<uint64_t, 4> limbs{0, 0, 0, 0};

    static U256 from_u64(uint64_t v);

    // "0x"-prefixed (or bare) hex, up to 64 digits; throws std::invalid_argument
    static U256 from_hex(const std::string& hex);

    bool is_zero() const;
    std::string to_hex() const;

    bool operator==(const U256& other) const { return limbs == other.limbs; }
    bool operator!=(const U256& other) const { return limbs != other.limbs; }
    bool operator<(const U256& other) const { return limbs < other.limbs; }
    bool operator>(const U256& other) const { return other < *this; }
};

/**
 * Read-only view of the conditional-token settlement contract.
 */
class ChainReader {
public:
    virtual ~ChainReader() = default;

    // Non-zero once the condition has been reported
    virtual Result<U256> payout_denominator(const std::string& condition_id) = 0;

    // Payout weight of one outcome slot (0 = YES, 1 = NO)
    virtual Result<U256> payout_numerator(const std::string& condition_id, int index) = 0;
};

/**
 * JSON-RPC eth_call against the CTF contract on Polygon.
 */
class RpcChainReader : public ChainReader {
public:
    static constexpr const char* PAYOUT_DENOMINATOR_SELECTOR = "dd34de67";  // payoutDenominator(bytes32)
    static constexpr const char* PAYOUT_NUMERATORS_SELECTOR = "0504c814";   // payoutNumerators(bytes32,uint256)

    RpcChainReader(const ConnectionConfig& connection,
                   HttpClient& http,
                   time_utils::RateLimiter& limiter);

    Result<U256> payout_denominator(const std::string& condition_id) override;
    Result<U256> payout_numerator(const std::string& condition_id, int index) override;

private:
    ConnectionConfig connection_;
    HttpClient& http_;
    time_utils::RateLimiter& limiter_;
    RetryPolicy retry_;
    std::atomic<int> next_id_{1};  // numerator reads run concurrently

    Result<U256> eth_call(const std::string& data);
};

// ABI encoding of a bytes32 argument; throws std::invalid_argument
std::string encode_bytes32(const std::string& hex);
std::string encode_uint256(uint64_t v);

} // namespace pbot
