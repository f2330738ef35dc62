#include "estimation/probability_estimator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>

namespace pbot {

namespace {
    constexpr size_t MAX_DESCRIPTION_CHARS = 3000;
    constexpr int MAX_TOKENS = 512;

    std::string date_only(int64_t epoch_ms) {
        return time_utils::to_iso8601(epoch_ms).substr(0, 10);
    }

    std::string excerpt(const std::string& s, size_t n = 200) {
        return s.size() <= n ? s : s.substr(0, n);
    }
}

Result<Estimate> parse_estimate(const std::string& text) {
    auto open = text.find('{');
    auto close = open == std::string::npos ? std::string::npos : text.find('}', open);
    if (close == std::string::npos) {
        return Error::invalid_data("Could not find a JSON object in estimator reply: " + excerpt(text));
    }
    std::string object = text.substr(open, close - open + 1);

    nlohmann::json j = nlohmann::json::parse(object, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Error::invalid_data("Malformed JSON in estimator reply: " + excerpt(object));
    }

    double prob = std::nan("");
    if (j.contains("probability")) {
        const auto& p = j["probability"];
        if (p.is_number()) {
            prob = p.get<double>();
        } else if (p.is_string()) {
            try {
                prob = std::stod(p.get<std::string>());
            } catch (const std::exception&) {
                prob = std::nan("");
            }
        }
    }
    if (!std::isfinite(prob) || prob < 0.0 || prob > 1.0) {
        return Error::invalid_data("Invalid probability in estimator reply: " +
                                   (j.contains("probability") ? j["probability"].dump() : std::string("missing")));
    }

    std::string conf = j.contains("confidence") && j["confidence"].is_string()
                           ? j["confidence"].get<std::string>() : "";
    Confidence confidence = confidence_from_string(conf);
    if (confidence == Confidence::UNKNOWN) {
        return Error::invalid_data("Invalid confidence in estimator reply: " + conf);
    }

    Estimate e;
    e.probability = prob;
    e.confidence = confidence;
    e.reasoning = j.contains("reasoning") && j["reasoning"].is_string()
                      ? j["reasoning"].get<std::string>() : "";
    return e;
}

LlmEstimator::LlmEstimator(const ConnectionConfig& connection,
                           const std::string& api_key,
                           HttpClient& http,
                           time_utils::RateLimiter& limiter)
    : connection_(connection)
    , api_key_(api_key)
    , http_(http)
    , limiter_(limiter)
{
    retry_.max_attempts = connection_.retry_max_attempts;
    retry_.base_delay = std::chrono::milliseconds(connection_.retry_base_delay_ms);
}

const std::string& LlmEstimator::system_prompt() {
    static const std::string prompt =
        "You are an expert superforecaster trained in the methodology of the Good Judgment Project. "
        "Your task is to estimate the probability that a prediction market question resolves YES.\n"
        "\n"
        "## Your Process\n"
        "\n"
        "1. Identify the reference class: what broad category does this event belong to?\n"
        "2. Start with the base rate (outside view): how often do similar events happen?\n"
        "3. Adjust with specifics (inside view): what makes this case different from the average?\n"
        "4. Look for clashing causal forces: what pushes toward YES, and what toward NO?\n"
        "5. Decompose if complex: break into sub-questions and estimate each component.\n"
        "6. Calibrate your confidence: 50% means genuine uncertainty, 90%+ means you would be shocked if wrong.\n"
        "\n"
        "## Calibration Guidelines\n"
        "\n"
        "- 50%: \"I genuinely don't know\"\n"
        "- 60-70%: \"Leaning one way, but substantial uncertainty\"\n"
        "- 80-90%: \"Pretty confident, but surprises possible\"\n"
        "- 95%+: \"Would be genuinely shocked if wrong\" (use rarely!)\n"
        "- Avoid extreme probabilities (below 5% or above 95%) unless the evidence is overwhelming\n"
        "\n"
        "## Critical Rules\n"
        "\n"
        "- Do NOT anchor to any market price. Form your estimate independently.\n"
        "- Consider base rates before specific details.\n"
        "- Think about the strongest argument AGAINST your position.\n"
        "- Be honest about your uncertainty.\n"
        "\n"
        "## Output Format\n"
        "\n"
        "Respond with ONLY a JSON object (no markdown, no code fences):\n"
        "{\"probability\": 0.XX, \"confidence\": \"low|medium|high\", \"reasoning\": \"Your 2-3 sentence reasoning\"}";
    return prompt;
}

std::string LlmEstimator::build_user_prompt(const MarketSnapshot& market,
                                            const std::string& data_context,
                                            int64_t now_ms) {
    std::string prompt = "Estimate the probability that this question resolves YES:\n\n";
    prompt += "**Question:** " + market.question + "\n\n";
    if (!market.description.empty()) {
        prompt += "**Description/Context:** " + market.description.substr(0, MAX_DESCRIPTION_CHARS) + "\n\n";
    }
    if (!market.creator.empty()) {
        prompt += "**Created by:** " + market.creator + "\n";
    }
    if (market.close_time_ms > 0) {
        prompt += "**Market closes:** " + date_only(market.close_time_ms) + "\n";
    }
    prompt += "**Today's date:** " + date_only(now_ms) + "\n";
    if (!data_context.empty()) {
        prompt += "\n" + data_context + "\n";
    }
    prompt += "Respond with ONLY a JSON object: "
              "{\"probability\": 0.XX, \"confidence\": \"low|medium|high\", \"reasoning\": \"...\"}";
    return prompt;
}

Result<Estimate> LlmEstimator::estimate(const MarketSnapshot& market,
                                        const std::string& data_context,
                                        const std::optional<std::string>& feedback) {
    if (api_key_.empty()) {
        return Error::configuration("Estimator API key not set");
    }

    std::string system = system_prompt();
    if (feedback) {
        system += "\n\n" + *feedback;
    }

    nlohmann::json body = {
        {"model", connection_.estimator_model},
        {"max_tokens", MAX_TOKENS},
        {"system", system},
        {"messages", nlohmann::json::array({
            {{"role", "user"}, {"content", build_user_prompt(market, data_context, time_utils::epoch_ms())}}
        })}
    };
    std::string payload = body.dump();

    auto response = with_retry([&] {
        limiter_.acquire();
        return http_.post(connection_.estimator_url, payload,
                          {"x-api-key: " + api_key_, "anthropic-version: 2023-06-01"},
                          connection_.estimator_timeout_ms);
    }, retry_, "Estimator");
    if (!response) return response.error();

    auto j = parse_json_body(response.value(), "Estimator");
    if (!j) return j.error();

    std::string text;
    const auto& reply = j.value();
    if (reply.contains("content") && reply["content"].is_array() && !reply["content"].empty()) {
        const auto& first = reply["content"][0];
        if (first.value("type", "") == "text") {
            text = first.value("text", "");
        }
    }
    if (text.empty()) {
        return Error::invalid_data("Empty estimator reply for market " + market.id);
    }

    auto parsed = parse_estimate(text);
    if (parsed) {
        spdlog::debug("Estimate for {}: p={:.3f} conf={}", market.id,
                      parsed.value().probability, confidence_to_string(parsed.value().confidence));
    }
    return parsed;
}

} // namespace pbot
