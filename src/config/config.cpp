#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace pbot {

void to_json(nlohmann::json& j, const StrategyConfig& c) {
    j = nlohmann::json{
        {"edge_threshold", c.edge_threshold},
        {"kelly_fraction", c.kelly_fraction},
        {"max_position_pct", c.max_position_pct},
        {"max_bet_amount", c.max_bet_amount},
        {"poly_max_bet_amount", c.poly_max_bet_amount},
        {"max_impact_pct", c.max_impact_pct},
        {"min_unit", c.min_unit},
        {"min_bankroll", c.min_bankroll},
        {"max_slippage_iterations", c.max_slippage_iterations}
    };
}

void from_json(const nlohmann::json& j, StrategyConfig& c) {
    if (j.contains("edge_threshold")) j.at("edge_threshold").get_to(c.edge_threshold);
    if (j.contains("kelly_fraction")) j.at("kelly_fraction").get_to(c.kelly_fraction);
    if (j.contains("max_position_pct")) j.at("max_position_pct").get_to(c.max_position_pct);
    if (j.contains("max_bet_amount")) j.at("max_bet_amount").get_to(c.max_bet_amount);
    if (j.contains("poly_max_bet_amount")) j.at("poly_max_bet_amount").get_to(c.poly_max_bet_amount);
    if (j.contains("max_impact_pct")) j.at("max_impact_pct").get_to(c.max_impact_pct);
    if (j.contains("min_unit")) j.at("min_unit").get_to(c.min_unit);
    if (j.contains("min_bankroll")) j.at("min_bankroll").get_to(c.min_bankroll);
    if (j.contains("max_slippage_iterations")) j.at("max_slippage_iterations").get_to(c.max_slippage_iterations);
}

void to_json(nlohmann::json& j, const FilterConfig& c) {
    j = nlohmann::json{
        {"min_liquidity", c.min_liquidity},
        {"min_time_to_close_ms", c.min_time_to_close_ms},
        {"max_time_to_close_ms", c.max_time_to_close_ms},
        {"fast_window_ms", c.fast_window_ms},
        {"min_bettors", c.min_bettors},
        {"max_markets_per_run", c.max_markets_per_run},
        {"search_limit", c.search_limit}
    };
}

void from_json(const nlohmann::json& j, FilterConfig& c) {
    if (j.contains("min_liquidity")) j.at("min_liquidity").get_to(c.min_liquidity);
    if (j.contains("min_time_to_close_ms")) j.at("min_time_to_close_ms").get_to(c.min_time_to_close_ms);
    if (j.contains("max_time_to_close_ms")) j.at("max_time_to_close_ms").get_to(c.max_time_to_close_ms);
    if (j.contains("fast_window_ms")) j.at("fast_window_ms").get_to(c.fast_window_ms);
    if (j.contains("min_bettors")) j.at("min_bettors").get_to(c.min_bettors);
    if (j.contains("max_markets_per_run")) j.at("max_markets_per_run").get_to(c.max_markets_per_run);
    if (j.contains("search_limit")) j.at("search_limit").get_to(c.search_limit);
}

void to_json(nlohmann::json& j, const PolymarketConfig& c) {
    j = nlohmann::json{
        {"min_volume_24hr", c.min_volume_24hr},
        {"min_liquidity", c.min_liquidity},
        {"max_time_to_end_ms", c.max_time_to_end_ms},
        {"min_price", c.min_price},
        {"max_price", c.max_price},
        {"max_markets_per_run", c.max_markets_per_run},
        {"signature_type", c.signature_type}
    };
}

void from_json(const nlohmann::json& j, PolymarketConfig& c) {
    if (j.contains("min_volume_24hr")) j.at("min_volume_24hr").get_to(c.min_volume_24hr);
    if (j.contains("min_liquidity")) j.at("min_liquidity").get_to(c.min_liquidity);
    if (j.contains("max_time_to_end_ms")) j.at("max_time_to_end_ms").get_to(c.max_time_to_end_ms);
    if (j.contains("min_price")) j.at("min_price").get_to(c.min_price);
    if (j.contains("max_price")) j.at("max_price").get_to(c.max_price);
    if (j.contains("max_markets_per_run")) j.at("max_markets_per_run").get_to(c.max_markets_per_run);
    if (j.contains("signature_type")) j.at("signature_type").get_to(c.signature_type);
}

void to_json(nlohmann::json& j, const ConnectionConfig& c) {
    j = nlohmann::json{
        {"manifold_api_url", c.manifold_api_url},
        {"polymarket_gamma_url", c.polymarket_gamma_url},
        {"polymarket_clob_url", c.polymarket_clob_url},
        {"polygon_rpc_url", c.polygon_rpc_url},
        {"ctf_address", c.ctf_address},
        {"estimator_url", c.estimator_url},
        {"estimator_model", c.estimator_model},
        {"request_timeout_ms", c.request_timeout_ms},
        {"gamma_timeout_ms", c.gamma_timeout_ms},
        {"book_timeout_ms", c.book_timeout_ms},
        {"estimator_timeout_ms", c.estimator_timeout_ms},
        {"manifold_max_requests_per_minute", c.manifold_max_requests_per_minute},
        {"polymarket_max_requests_per_minute", c.polymarket_max_requests_per_minute},
        {"rpc_max_requests_per_minute", c.rpc_max_requests_per_minute},
        {"estimator_max_requests_per_minute", c.estimator_max_requests_per_minute},
        {"retry_max_attempts", c.retry_max_attempts},
        {"retry_base_delay_ms", c.retry_base_delay_ms}
    };
}

void from_json(const nlohmann::json& j, ConnectionConfig& c) {
    if (j.contains("manifold_api_url")) j.at("manifold_api_url").get_to(c.manifold_api_url);
    if (j.contains("polymarket_gamma_url")) j.at("polymarket_gamma_url").get_to(c.polymarket_gamma_url);
    if (j.contains("polymarket_clob_url")) j.at("polymarket_clob_url").get_to(c.polymarket_clob_url);
    if (j.contains("polygon_rpc_url")) j.at("polygon_rpc_url").get_to(c.polygon_rpc_url);
    if (j.contains("ctf_address")) j.at("ctf_address").get_to(c.ctf_address);
    if (j.contains("estimator_url")) j.at("estimator_url").get_to(c.estimator_url);
    if (j.contains("estimator_model")) j.at("estimator_model").get_to(c.estimator_model);
    if (j.contains("request_timeout_ms")) j.at("request_timeout_ms").get_to(c.request_timeout_ms);
    if (j.contains("gamma_timeout_ms")) j.at("gamma_timeout_ms").get_to(c.gamma_timeout_ms);
    if (j.contains("book_timeout_ms")) j.at("book_timeout_ms").get_to(c.book_timeout_ms);
    if (j.contains("estimator_timeout_ms")) j.at("estimator_timeout_ms").get_to(c.estimator_timeout_ms);
    if (j.contains("manifold_max_requests_per_minute")) j.at("manifold_max_requests_per_minute").get_to(c.manifold_max_requests_per_minute);
    if (j.contains("polymarket_max_requests_per_minute")) j.at("polymarket_max_requests_per_minute").get_to(c.polymarket_max_requests_per_minute);
    if (j.contains("rpc_max_requests_per_minute")) j.at("rpc_max_requests_per_minute").get_to(c.rpc_max_requests_per_minute);
    if (j.contains("estimator_max_requests_per_minute")) j.at("estimator_max_requests_per_minute").get_to(c.estimator_max_requests_per_minute);
    if (j.contains("retry_max_attempts")) j.at("retry_max_attempts").get_to(c.retry_max_attempts);
    if (j.contains("retry_base_delay_ms")) j.at("retry_base_delay_ms").get_to(c.retry_base_delay_ms);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"mode", c.mode == TradingMode::LIVE ? "live" : "dry-run"},
        {"strategy", c.strategy},
        {"filter", c.filter},
        {"polymarket", c.polymarket},
        {"connection", c.connection},
        {"logging", c.logging},
        {"data_dir", c.data_dir}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("mode")) {
        std::string mode_str = j.at("mode").get<std::string>();
        if (mode_str == "dry-run" || mode_str == "dry_run") c.mode = TradingMode::DRY_RUN;
        else if (mode_str == "live") c.mode = TradingMode::LIVE;
        else throw std::runtime_error("Unknown mode: " + mode_str);
    }
    if (j.contains("strategy")) j.at("strategy").get_to(c.strategy);
    if (j.contains("filter")) j.at("filter").get_to(c.filter);
    if (j.contains("polymarket")) j.at("polymarket").get_to(c.polymarket);
    if (j.contains("connection")) j.at("connection").get_to(c.connection);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("data_dir")) j.at("data_dir").get_to(c.data_dir);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    file >> j;

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

void Config::apply_env_overrides() {
    credentials.manifold_api_key = get_env("MANIFOLD_API_KEY", credentials.manifold_api_key);
    credentials.estimator_api_key = get_env("ANTHROPIC_API_KEY", credentials.estimator_api_key);
    credentials.poly_api_key = get_env("POLY_API_KEY", credentials.poly_api_key);
    credentials.poly_api_secret = get_env("POLY_API_SECRET", credentials.poly_api_secret);
    credentials.poly_api_passphrase = get_env("POLY_API_PASSPHRASE", credentials.poly_api_passphrase);
    credentials.poly_address = get_env("POLY_FUNDER_ADDRESS", credentials.poly_address);

    if (auto v = env_bool("DRY_RUN")) mode = *v ? TradingMode::DRY_RUN : TradingMode::LIVE;
    if (auto v = env_double("EDGE_THRESHOLD")) strategy.edge_threshold = *v;
    if (auto v = env_double("KELLY_FRACTION")) strategy.kelly_fraction = *v;
    if (auto v = env_double("MAX_POSITION_PCT")) strategy.max_position_pct = *v;
    if (auto v = env_double("MAX_BET_AMOUNT")) strategy.max_bet_amount = *v;
    if (auto v = env_double("MAX_IMPACT_PCT")) strategy.max_impact_pct = *v;
    if (auto v = env_double("POLY_MAX_BET_AMOUNT")) strategy.poly_max_bet_amount = *v;
    if (auto v = env_double("MIN_LIQUIDITY")) filter.min_liquidity = *v;
    if (auto v = env_int("MAX_MARKETS_PER_RUN")) filter.max_markets_per_run = *v;
    if (auto v = env_int("POLY_MAX_MARKETS_PER_RUN")) polymarket.max_markets_per_run = *v;
    if (auto v = env_double("POLY_MIN_VOLUME_24HR")) polymarket.min_volume_24hr = *v;
    if (auto v = env_double("POLY_MIN_LIQUIDITY")) polymarket.min_liquidity = *v;
    if (auto v = env_int("POLY_SIGNATURE_TYPE")) polymarket.signature_type = *v;

    std::string model = get_env("CLAUDE_MODEL");
    if (!model.empty()) connection.estimator_model = model;
    std::string rpc = get_env("POLYGON_RPC_URL");
    if (!rpc.empty()) connection.polygon_rpc_url = rpc;
    std::string data = get_env("PREDICTBOT_DATA_DIR");
    if (!data.empty()) data_dir = data;
}

bool Config::validate() const {
    if (strategy.edge_threshold < 0 || strategy.edge_threshold >= 1) {
        spdlog::error("edge_threshold must be in [0, 1)");
        return false;
    }

    if (strategy.kelly_fraction <= 0 || strategy.kelly_fraction > 1) {
        spdlog::error("kelly_fraction must be in (0, 1]");
        return false;
    }

    if (strategy.max_position_pct <= 0 || strategy.max_position_pct > 1) {
        spdlog::error("max_position_pct must be in (0, 1]");
        return false;
    }

    if (strategy.max_bet_amount <= 0 || strategy.poly_max_bet_amount <= 0) {
        spdlog::error("max bet amounts must be positive");
        return false;
    }

    if (strategy.min_unit <= 0) {
        spdlog::error("min_unit must be positive");
        return false;
    }

    if (strategy.max_impact_pct <= 0) {
        spdlog::error("max_impact_pct must be positive");
        return false;
    }

    if (strategy.max_slippage_iterations < 1) {
        spdlog::error("max_slippage_iterations must be at least 1");
        return false;
    }

    if (filter.min_bettors < 1) {
        spdlog::error("min_bettors must be at least 1");
        return false;
    }

    if (filter.min_time_to_close_ms >= filter.max_time_to_close_ms) {
        spdlog::error("min_time_to_close_ms must be below max_time_to_close_ms");
        return false;
    }

    if (strategy.kelly_fraction > 0.5) {
        spdlog::warn("kelly_fraction {:.2f} is above half Kelly, this is risky", strategy.kelly_fraction);
    }

    return true;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return (val && *val) ? std::string(val) : default_val;
}

std::optional<double> Config::env_double(const std::string& name) {
    std::string val = get_env(name);
    if (val.empty()) return std::nullopt;
    size_t used = 0;
    double n = 0.0;
    try {
        n = std::stod(val, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid number for " + name + ": " + val);
    }
    if (used != val.size()) {
        throw std::runtime_error("Invalid number for " + name + ": " + val);
    }
    return n;
}

std::optional<int> Config::env_int(const std::string& name) {
    std::string val = get_env(name);
    if (val.empty()) return std::nullopt;
    size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(val, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer for " + name + ": " + val);
    }
    if (used != val.size()) {
        throw std::runtime_error("Invalid integer for " + name + ": " + val);
    }
    return n;
}

std::optional<bool> Config::env_bool(const std::string& name) {
    std::string val = get_env(name);
    if (val.empty()) return std::nullopt;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    return val == "true" || val == "1";
}

} // namespace pbot
