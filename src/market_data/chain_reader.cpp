#include "market_data/chain_reader.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cctype>
#include <stdexcept>

namespace pbot {

namespace {
    std::string strip_0x(const std::string& hex) {
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
            return hex.substr(2);
        }
        return hex;
    }

    bool all_hex(const std::string& s) {
        for (unsigned char c : s) {
            if (!std::isxdigit(c)) return false;
        }
        return true;
    }
}

U256 U256::from_u64(uint64_t v) {
    U256 u;
    u.limbs[3] = v;
    return u;
}

U256 U256::from_hex(const std::string& hex) {
    std::string digits = strip_0x(hex);
    if (digits.empty()) return U256{};
    if (!all_hex(digits)) {
        throw std::invalid_argument("not a hex quantity: " + hex);
    }

    // Strip leading zeros so 32-byte words with padding fit
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) return U256{};
    digits = digits.substr(first);
    if (digits.size() > 64) {
        throw std::invalid_argument("hex quantity wider than 256 bits: " + hex);
    }
    digits = std::string(64 - digits.size(), '0') + digits;

    U256 u;
    for (size_t i = 0; i < 4; ++i) {
        u.limbs[i] = std::stoull(digits.substr(i * 16, 16), nullptr, 16);
    }
    return u;
}

bool U256::is_zero() const {
    return limbs[0] == 0 && limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0;
}

std::string U256::to_hex() const {
    std::string out = "0x";
    for (auto limb : limbs) {
        out += fmt::format("{:016x}", limb);
    }
    return out;
}

std::string encode_bytes32(const std::string& hex) {
    std::string digits = strip_0x(hex);
    if (digits.size() != 64 || !all_hex(digits)) {
        throw std::invalid_argument("condition id must be 32 bytes of hex: " + hex);
    }
    return digits;
}

std::string encode_uint256(uint64_t v) {
    return fmt::format("{:064x}", v);
}

RpcChainReader::RpcChainReader(const ConnectionConfig& connection,
                               HttpClient& http,
                               time_utils::RateLimiter& limiter)
    : connection_(connection)
    , http_(http)
    , limiter_(limiter)
{
    retry_.max_attempts = connection_.retry_max_attempts;
    retry_.base_delay = std::chrono::milliseconds(connection_.retry_base_delay_ms);
}

Result<U256> RpcChainReader::eth_call(const std::string& data) {
    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", next_id_.fetch_add(1)},
        {"method", "eth_call"},
        {"params", nlohmann::json::array({
            {{"to", connection_.ctf_address}, {"data", data}},
            "latest"
        })}
    };
    std::string body = request.dump();

    auto response = with_retry([&] {
        limiter_.acquire();
        return http_.post(connection_.polygon_rpc_url, body, {}, connection_.request_timeout_ms);
    }, retry_, "eth_call");
    if (!response) return response.error();

    auto j = parse_json_body(response.value(), "eth_call");
    if (!j) return j.error();

    const auto& reply = j.value();
    if (reply.contains("error")) {
        return Error::transient("eth_call error: " + reply["error"].dump());
    }
    if (!reply.contains("result") || !reply["result"].is_string()) {
        return Error::invalid_data("eth_call: missing result");
    }

    try {
        return U256::from_hex(reply["result"].get<std::string>());
    } catch (const std::invalid_argument& e) {
        return Error::invalid_data(std::string("eth_call: ") + e.what());
    }
}

Result<U256> RpcChainReader::payout_denominator(const std::string& condition_id) {
    std::string data;
    try {
        data = std::string("0x") + PAYOUT_DENOMINATOR_SELECTOR + encode_bytes32(condition_id);
    } catch (const std::invalid_argument& e) {
        return Error::invalid_data(e.what());
    }
    return eth_call(data);
}

Result<U256> RpcChainReader::payout_numerator(const std::string& condition_id, int index) {
    if (index < 0) {
        return Error::invalid_data("negative outcome index");
    }
    std::string data;
    try {
        data = std::string("0x") + PAYOUT_NUMERATORS_SELECTOR + encode_bytes32(condition_id) +
               encode_uint256(static_cast<uint64_t>(index));
    } catch (const std::invalid_argument& e) {
        return Error::invalid_data(e.what());
    }
    return eth_call(data);
}

} // namespace pbot
