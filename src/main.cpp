#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/rate_source.hpp"
#include "strategy/execution_strategy.hpp"
#include "execution/arbitrage_engine.hpp"
#include "server/connection_server.hpp"
#include "utils/random_source.hpp"
#include "utils/metrics.hpp"

using namespace arbexec;

// Set from SIGINT/SIGTERM, polled by the main loop
std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/arbexec.log",
            static_cast<size_t>(config.max_log_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(config.max_log_files)
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("arbexec", sinks.begin(), sinks.end());
    // from_str maps unknown names to "off"; validate() has already vetted the level
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

void print_startup_banner(const Config& config) {
    std::cout << R"(
+---------------------------------------------------------------+
|   ArbExec - Funding Rate Arbitrage Execution Server           |
|   ** SIMULATED EXECUTION - NO REAL ORDERS ARE PLACED **       |
+---------------------------------------------------------------+
)" << std::endl;

    std::cout << "  Listen:     " << config.server.host << ":" << config.server.port
              << " (" << framing_to_string(config.server.framing) << " framing)\n";
    std::cout << "  Exchanges:  ";
    for (const auto& [id, connector] : config.exchanges) {
        std::cout << id << " ";
    }
    std::cout << "\n  Providers:  ";
    for (const auto& provider : config.flash_loan_providers) {
        std::cout << provider << " ";
    }
    std::cout << "\n  Gas:        price=" << config.gas.current_gas_price
              << " limit=" << config.gas.max_gas_limit << "\n\n";
}

int main(int argc, char* argv[]) {
    CLI::App app{"ArbExec - Funding Rate Arbitrage Execution Server"};

    std::string config_path = "configs/engine.json";
    std::string host;
    int port = -1;
    std::string log_level;
    std::string framing;
    bool dump_config = false;
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("--host", host, "Listen address (overrides config)");
    app.add_option("--port", port, "Listen port, 0 for ephemeral (overrides config)")
        ->check(CLI::Range(0, 65535));
    app.add_option("--log-level", log_level, "trace, debug, info, warn or error")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
    app.add_option("--framing", framing, "Request framing: line or read")
        ->check(CLI::IsMember({"line", "read"}));
    app.add_flag("--dump-config", dump_config, "Print the effective configuration as JSON and exit");
    app.add_flag("-v,--version", show_version, "Show version information");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "ArbExec v1.0.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        } else if (app.count("--config") > 0) {
            std::cerr << "Config file not found: " << config_path << "\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    if (!host.empty()) config.server.host = host;
    if (port >= 0) config.server.port = port;
    if (!log_level.empty()) config.logging.log_level = log_level;
    if (!framing.empty()) config.server.framing = *framing_from_string(framing);

    if (!config.validate()) {
        std::cerr << "Invalid configuration\n";
        return 1;
    }

    if (dump_config) {
        nlohmann::json j;
        to_json(j, config);
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    setup_logging(config.logging);
    print_startup_banner(config);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    spdlog::info("Initializing ArbExec...");

    auto random = std::make_shared<Mt19937RandomSource>();
    auto rate_source = std::make_shared<SimulatedRateSource>(config.exchanges, random);
    auto strategy = std::make_shared<SimulatedExecutionStrategy>(config.strategy, random);
    auto engine = std::make_shared<ArbitrageEngine>(config, rate_source, strategy);

    for (const auto& provider : config.flash_loan_providers) {
        spdlog::info("Flash loan provider available: {}", provider);
    }

    ConnectionServer server(config.server, engine);
    try {
        server.start();
    } catch (const std::exception& e) {
        spdlog::error("Failed to start server: {}", e.what());
        return 1;
    }

    spdlog::info("ArbExec started. Press Ctrl+C to stop.");

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Shutdown signal received");
    server.stop();

    spdlog::info("Requests: {} executed, {} succeeded, {} failed",
                 engine->requests_executed(), engine->requests_succeeded(), engine->requests_failed());
    spdlog::info("Strategy {}: {} evaluations, {} executions attempted, {} succeeded",
                 strategy->name(), strategy->evaluations(),
                 strategy->executions_attempted(), strategy->executions_succeeded());
    spdlog::info("Metrics:\n{}", MetricsRegistry::instance().to_json());

    spdlog::info("ArbExec shutdown complete.");
    return 0;
}
