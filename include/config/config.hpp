#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace pbot {

struct StrategyConfig {
    double edge_threshold{0.10};             // Minimum |estimate - market| to bet
    double kelly_fraction{0.25};             // Fractional Kelly multiplier
    double max_position_pct{0.20};           // Max share of bankroll per bet
    double max_bet_amount{50.0};             // Absolute cap, pooled venue (mana)
    double poly_max_bet_amount{5.0};         // Absolute cap, order-book venue (USDC)
    double max_impact_pct{0.05};             // Pooled venue: cap stake at impact * 2 * liquidity
    double min_unit{1.0};                    // Smallest tradeable stake
    double min_bankroll{10.0};               // Refuse to scan below this balance
    int max_slippage_iterations{8};
};

struct FilterConfig {
    double min_liquidity{100.0};
    int64_t min_time_to_close_ms{ONE_HOUR_MS};
    int64_t max_time_to_close_ms{90 * ONE_DAY_MS};
    int64_t fast_window_ms{7 * ONE_DAY_MS};  // Max time score inside this window
    int min_bettors{1};
    int max_markets_per_run{20};
    int search_limit{50};
};

struct PolymarketConfig {
    double min_volume_24hr{1000.0};
    double min_liquidity{1000.0};
    int64_t max_time_to_end_ms{7 * ONE_DAY_MS};
    double min_price{0.05};
    double max_price{0.95};
    int max_markets_per_run{10};
    int signature_type{0};
};

struct ConnectionConfig {
    std::string manifold_api_url{"https://api.manifold.markets/v0"};
    std::string polymarket_gamma_url{"https://gamma-api.polymarket.com"};
    std::string polymarket_clob_url{"https://clob.polymarket.com"};
    std::string polygon_rpc_url{"https://polygon-rpc.com"};
    std::string ctf_address{"0x4D97DCd97eC945f40cF65F87097ACe5EA0476045"};
    std::string estimator_url{"https://api.anthropic.com/v1/messages"};
    std::string estimator_model{"claude-sonnet-4-20250514"};

    int request_timeout_ms{30000};
    int gamma_timeout_ms{15000};
    int book_timeout_ms{10000};
    int estimator_timeout_ms{60000};

    int manifold_max_requests_per_minute{450};  // Manifold allows 500
    int polymarket_max_requests_per_minute{300};
    int rpc_max_requests_per_minute{600};
    int estimator_max_requests_per_minute{50};

    int retry_max_attempts{3};
    int retry_base_delay_ms{1000};
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{false};                 // JSON lines format for the file sink
    int max_log_file_size_mb{20};
    int max_log_files{5};
};

// Secrets are read from the environment only and never serialized
struct Credentials {
    std::string manifold_api_key;
    std::string estimator_api_key;
    std::string poly_api_key;
    std::string poly_api_secret;
    std::string poly_api_passphrase;
    std::string poly_address;
};

struct Config {
    TradingMode mode{TradingMode::DRY_RUN};

    StrategyConfig strategy;
    FilterConfig filter;
    PolymarketConfig polymarket;
    ConnectionConfig connection;
    LoggingConfig logging;
    Credentials credentials;

    std::string data_dir{"./data"};

    // Load from file
    static Config load(const std::string& path);

    // Save to file (credentials excluded)
    void save(const std::string& path) const;

    // Overlay environment variables; throws on malformed numbers
    void apply_env_overrides();

    // Validate configuration
    bool validate() const;

    bool is_dry_run() const { return mode == TradingMode::DRY_RUN; }

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
    static std::optional<double> env_double(const std::string& name);
    static std::optional<int> env_int(const std::string& name);
    static std::optional<bool> env_bool(const std::string& name);
};

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace pbot
