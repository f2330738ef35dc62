#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace pbot {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

constexpr int64_t ONE_HOUR_MS = 60LL * 60 * 1000;
constexpr int64_t ONE_DAY_MS = 24 * ONE_HOUR_MS;

// Probability in [0, 1]; stakes in venue currency (mana or USDC)
using Probability = double;
using Amount = double;

// Bet direction on a binary market
enum class Direction {
    YES,
    NO
};

inline std::string direction_to_string(Direction d) {
    return d == Direction::YES ? "YES" : "NO";
}

std::optional<Direction> direction_from_string(const std::string& s);

// Venues the bot trades on
enum class Venue {
    MANIFOLD,    // Pooled liquidity (CPMM market maker)
    POLYMARKET   // Central limit order book, settles on-chain
};

inline std::string venue_to_string(Venue v) {
    switch (v) {
        case Venue::MANIFOLD: return "manifold";
        case Venue::POLYMARKET: return "polymarket";
    }
    return "unknown";
}

std::optional<Venue> venue_from_string(const std::string& s);

// How a market matches trades
enum class Mechanism {
    ORDER_BOOK,
    POOLED_LIQUIDITY
};

inline Mechanism venue_mechanism(Venue v) {
    switch (v) {
        case Venue::MANIFOLD: return Mechanism::POOLED_LIQUIDITY;
        case Venue::POLYMARKET: return Mechanism::ORDER_BOOK;
    }
    return Mechanism::POOLED_LIQUIDITY;
}

// Confidence label attached to an estimate
enum class Confidence {
    LOW,
    MEDIUM,
    HIGH,
    UNKNOWN  // Missing join against the decision log
};

inline std::string confidence_to_string(Confidence c) {
    switch (c) {
        case Confidence::LOW: return "low";
        case Confidence::MEDIUM: return "medium";
        case Confidence::HIGH: return "high";
        case Confidence::UNKNOWN: return "unknown";
    }
    return "unknown";
}

Confidence confidence_from_string(const std::string& s);

// Terminal states of the decision classifier
enum class DecisionAction {
    BET,
    SKIP_LOW_EDGE,
    SKIP_NEGATIVE_KELLY,
    SKIP_LOW_CONFIDENCE,
    SKIP_ERROR
};

inline std::string action_to_string(DecisionAction a) {
    switch (a) {
        case DecisionAction::BET: return "BET";
        case DecisionAction::SKIP_LOW_EDGE: return "SKIP_LOW_EDGE";
        case DecisionAction::SKIP_NEGATIVE_KELLY: return "SKIP_NEGATIVE_KELLY";
        case DecisionAction::SKIP_LOW_CONFIDENCE: return "SKIP_LOW_CONFIDENCE";
        case DecisionAction::SKIP_ERROR: return "SKIP_ERROR";
    }
    return "UNKNOWN";
}

std::optional<DecisionAction> action_from_string(const std::string& s);

// Venue-reported resolution of a market
enum class ResolutionOutcome {
    YES,
    NO,
    MKT,     // Resolved to a partial probability
    CANCEL   // Voided, stakes returned
};

inline std::string outcome_to_string(ResolutionOutcome o) {
    switch (o) {
        case ResolutionOutcome::YES: return "YES";
        case ResolutionOutcome::NO: return "NO";
        case ResolutionOutcome::MKT: return "MKT";
        case ResolutionOutcome::CANCEL: return "CANCEL";
    }
    return "UNKNOWN";
}

std::optional<ResolutionOutcome> outcome_from_string(const std::string& s);

// Trading mode
enum class TradingMode {
    DRY_RUN,  // Decisions logged, no orders placed
    LIVE      // Real orders
};

inline std::string mode_to_string(TradingMode m) {
    switch (m) {
        case TradingMode::DRY_RUN: return "DRY_RUN";
        case TradingMode::LIVE: return "LIVE";
    }
    return "UNKNOWN";
}

// Price level in an order book (price in USDC per share, size in shares)
struct PriceLevel {
    double price{0.0};
    double size{0.0};

    bool operator==(const PriceLevel& other) const {
        return price == other.price && size == other.size;
    }
};

/**
 * Venue-neutral market snapshot. Read-only input to the core; venue
 * specific fields (token ids, slugs) stay on the venue's own types.
 */
struct MarketSnapshot {
    std::string id;
    std::string question;
    std::string url;
    std::string description;
    std::string creator;
    std::string outcome_type{"BINARY"};
    Probability probability{0.0};
    double liquidity{0.0};
    double volume{0.0};
    int64_t close_time_ms{0};
    int bettor_count{0};
    Mechanism mechanism{Mechanism::POOLED_LIQUIDITY};

    bool is_resolved{false};
    std::string resolution;                       // Raw venue string, e.g. "YES"
    std::optional<double> resolution_probability; // Set for MKT resolutions
};

// Output of the external probability estimator
struct Estimate {
    Probability probability{0.5};
    Confidence confidence{Confidence::LOW};
    std::string reasoning;
};

} // namespace pbot
