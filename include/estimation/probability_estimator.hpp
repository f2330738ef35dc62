#pragma once

#include <optional>
#include <string>
#include "common/types.hpp"
#include "common/result.hpp"
#include "config/config.hpp"
#include "utils/http_client.hpp"
#include "utils/retry.hpp"
#include "utils/time_utils.hpp"

namespace pbot {

/**
 * External probability estimate for one market.
 * data_context is optional structured data (quotes, odds) appended to the
 * prompt; feedback is the calibration text from past resolutions.
 */
class ProbabilityEstimator {
public:
    virtual ~ProbabilityEstimator() = default;

    virtual Result<Estimate> estimate(const MarketSnapshot& market,
                                      const std::string& data_context,
                                      const std::optional<std::string>& feedback) = 0;
};

/**
 * LLM messages endpoint. The reply must contain a JSON object
 * {"probability": p, "confidence": "low|medium|high", "reasoning": "..."}.
 */
class LlmEstimator : public ProbabilityEstimator {
public:
    LlmEstimator(const ConnectionConfig& connection,
                 const std::string& api_key,
                 HttpClient& http,
                 time_utils::RateLimiter& limiter);

    Result<Estimate> estimate(const MarketSnapshot& market,
                              const std::string& data_context,
                              const std::optional<std::string>& feedback) override;

    static const std::string& system_prompt();

    static std::string build_user_prompt(const MarketSnapshot& market,
                                         const std::string& data_context,
                                         int64_t now_ms);

private:
    ConnectionConfig connection_;
    std::string api_key_;
    HttpClient& http_;
    time_utils::RateLimiter& limiter_;
    RetryPolicy retry_;
};

// Parse the first {...} object in the reply; INVALID_DATA when it is
// missing, malformed, or the probability/confidence are out of range
Result<Estimate> parse_estimate(const std::string& text);

} // namespace pbot
