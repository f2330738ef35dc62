#include <iostream>
#include <filesystem>
#include <memory>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "calibration/calibration.hpp"
#include "core/market_scanner.hpp"
#include "core/resolution_reconciler.hpp"
#include "estimation/probability_estimator.hpp"
#include "execution/execution_dispatcher.hpp"
#include "market_data/chain_reader.hpp"
#include "market_data/manifold_client.hpp"
#include "market_data/polymarket_client.hpp"
#include "persistence/record_store.hpp"
#include "position/position_manager.hpp"
#include "utils/http_client.hpp"
#include "utils/time_utils.hpp"

using namespace pbot;

namespace {

constexpr const char* VERSION = "1.0.0";
constexpr const char* DEFAULT_CONFIG_PATH = "configs/predictbot.json";

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/predictbot.log",
            static_cast<size_t>(config.max_log_file_size_mb) * 1024 * 1024,
            config.max_log_files
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("predictbot", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

/**
 * Everything a command needs: one HTTP transport, one rate limiter per
 * external API, the record store and the venue clients built on them.
 */
struct Services {
    const Config& config;
    HttpClient http;
    time_utils::RateLimiter manifold_limiter;
    time_utils::RateLimiter polymarket_limiter;
    time_utils::RateLimiter rpc_limiter;
    time_utils::RateLimiter estimator_limiter;
    RecordStore store;
    ManifoldClient manifold;

    explicit Services(const Config& cfg)
        : config(cfg)
        , manifold_limiter(cfg.connection.manifold_max_requests_per_minute, std::chrono::minutes(1))
        , polymarket_limiter(cfg.connection.polymarket_max_requests_per_minute, std::chrono::minutes(1))
        , rpc_limiter(cfg.connection.rpc_max_requests_per_minute, std::chrono::minutes(1))
        , estimator_limiter(cfg.connection.estimator_max_requests_per_minute, std::chrono::minutes(1))
        , store(cfg.data_dir)
        , manifold(cfg.connection, cfg.credentials.manifold_api_key, http, manifold_limiter)
    {
    }

    ExecutionDispatcher::OrderClientFactory order_client_factory() {
        return [this]() -> Result<std::unique_ptr<OrderBookVenueClient>> {
            const auto& creds = config.credentials;
            if (creds.poly_api_key.empty() || creds.poly_api_secret.empty()) {
                return Error::configuration("Set POLY_API_KEY and POLY_API_SECRET for live Polymarket orders");
            }
            auto client = std::make_unique<PolymarketClient>(config.connection, config.polymarket,
                                                             http, polymarket_limiter);
            client->set_api_credentials(creds.poly_api_key, creds.poly_api_secret,
                                        creds.poly_api_passphrase, creds.poly_address);
            spdlog::info("Polymarket API credentials loaded from environment");
            return std::unique_ptr<OrderBookVenueClient>(std::move(client));
        };
    }
};

void log_run_header(const Config& config, const std::string& what) {
    spdlog::info("{} | Mode: {}", what, config.is_dry_run() ? "DRY RUN" : "LIVE");
    spdlog::info("Model: {}", config.connection.estimator_model);
    spdlog::info("Edge threshold: {:.0f}%", config.strategy.edge_threshold * 100);
}

int run_scan(const Config& config) {
    if (config.credentials.manifold_api_key.empty()) {
        spdlog::error("MANIFOLD_API_KEY not set");
        return 1;
    }
    if (config.credentials.estimator_api_key.empty()) {
        spdlog::error("ANTHROPIC_API_KEY not set");
        return 1;
    }

    Services services(config);
    log_run_header(config, "Manifold scan");

    LlmEstimator estimator(config.connection, config.credentials.estimator_api_key,
                           services.http, services.estimator_limiter);
    ExecutionDispatcher dispatcher(config.mode, services.store, &services.manifold, nullptr);
    MarketScanner scanner(config, services.store, estimator, dispatcher);

    auto result = scanner.scan_pooled(services.manifold);
    if (!result) {
        spdlog::error("Scan aborted: {}", result.error().message);
        return 1;
    }
    spdlog::info("Done.");
    return 0;
}

int run_poly_scan(const Config& config) {
    if (config.credentials.estimator_api_key.empty()) {
        spdlog::error("ANTHROPIC_API_KEY not set");
        return 1;
    }

    Services services(config);
    log_run_header(config, "Polymarket scan");

    PolymarketClient data_client(config.connection, config.polymarket,
                                 services.http, services.polymarket_limiter);
    LlmEstimator estimator(config.connection, config.credentials.estimator_api_key,
                           services.http, services.estimator_limiter);
    ExecutionDispatcher dispatcher(config.mode, services.store, nullptr,
                                   services.order_client_factory());
    MarketScanner scanner(config, services.store, estimator, dispatcher);

    auto result = scanner.scan_order_book(data_client);
    if (!result) {
        spdlog::error("Polymarket scan aborted: {}", result.error().message);
        return 1;
    }
    spdlog::info("Done.");
    return 0;
}

// Resolutions for both venues, then fresh snapshots for what is still open
void resolve_and_snapshot(Services& services) {
    RpcChainReader chain(services.config.connection, services.http, services.rpc_limiter);
    ResolutionReconciler reconciler(services.store, &services.manifold, &chain);

    auto summary = reconciler.reconcile();
    spdlog::info("Resolved: {} | Still pending: {} | Failed: {}",
                 summary.resolved, summary.pending, summary.failed);

    PositionManager positions(services.store, services.manifold);
    positions.record_snapshots();
}

int run_resolve(const Config& config) {
    Services services(config);
    spdlog::info("Checking unresolved bets...");
    resolve_and_snapshot(services);
    spdlog::info("Done.");
    return 0;
}

int run_monitor(const Config& config) {
    Services services(config);
    spdlog::info("Monitor cycle...");
    resolve_and_snapshot(services);

    PositionManager positions(services.store, services.manifold);
    auto report = positions.monitor();
    if (report.open_positions == 0) {
        spdlog::info("No open positions to monitor.");
        return 0;
    }
    std::cout << format_monitor_report(report) << std::endl;
    return 0;
}

int run_sell(const Config& config) {
    if (!config.is_dry_run() && config.credentials.manifold_api_key.empty()) {
        spdlog::error("MANIFOLD_API_KEY not set");
        return 1;
    }

    Services services(config);
    spdlog::info("Sell mode | {}", config.is_dry_run() ? "DRY RUN" : "LIVE");

    PositionManager positions(services.store, services.manifold);
    auto summary = positions.sell(config.mode);
    spdlog::info("Sell batch: {} evaluated, {} candidates, {} sold, {} failed",
                 summary.evaluated, summary.candidates.size(), summary.sold, summary.failed);
    spdlog::info("Done.");
    return 0;
}

int run_stats(const Config& config) {
    RecordStore store(config.data_dir);
    auto resolutions = store.load_resolutions();
    if (resolutions.empty()) {
        spdlog::info("No resolved bets yet.");
        return 0;
    }
    std::cout << format_report(compute_calibration(resolutions)) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"predictbot - prediction market trading agent"};
    app.fallthrough();

    std::string config_path = DEFAULT_CONFIG_PATH;
    bool dry_run = false;
    bool live_mode = false;
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_flag("--dry-run", dry_run, "Log decisions without placing orders");
    app.add_flag("--live", live_mode, "Place real orders");
    app.add_flag("-v,--version", show_version, "Show version information");

    auto* scan_cmd = app.add_subcommand("scan", "Scan Manifold markets and bet where the edge is large enough");
    auto* poly_scan_cmd = app.add_subcommand("poly-scan", "Scan Polymarket markets using order-book depth");
    auto* resolve_cmd = app.add_subcommand("resolve", "Reconcile open bets against market resolutions");
    auto* monitor_cmd = app.add_subcommand("monitor", "Resolve, snapshot and report drift of open positions");
    auto* sell_cmd = app.add_subcommand("sell", "Apply exit rules to open Manifold positions");
    auto* stats_cmd = app.add_subcommand("stats", "Print the calibration report");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "predictbot v" << VERSION << "\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        return 1;
    }

    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        } else if (config_path != DEFAULT_CONFIG_PATH) {
            std::cerr << "Config file not found: " << config_path << "\n";
            return 1;
        }
        config.apply_env_overrides();
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    if (dry_run) {
        config.mode = TradingMode::DRY_RUN;
    } else if (live_mode) {
        config.mode = TradingMode::LIVE;
    }

    if (!config.validate()) {
        std::cerr << "Invalid configuration\n";
        return 1;
    }

    setup_logging(config.logging);
    if (config.mode == TradingMode::LIVE) {
        spdlog::warn("LIVE trading mode: real orders will be placed");
    }

    try {
        if (scan_cmd->parsed()) return run_scan(config);
        if (poly_scan_cmd->parsed()) return run_poly_scan(config);
        if (resolve_cmd->parsed()) return run_resolve(config);
        if (monitor_cmd->parsed()) return run_monitor(config);
        if (sell_cmd->parsed()) return run_sell(config);
        if (stats_cmd->parsed()) return run_stats(config);
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}
