#pragma once

#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace arbexec {

struct ServerConfig {
    std::string host{"127.0.0.1"};
    int port{8080};                          // 0 binds an ephemeral port
    FramingMode framing{FramingMode::LINE};
    int read_buffer_bytes{1024};             // Max bytes per socket read
    int max_frame_bytes{65536};              // Max buffered bytes for one line
    int idle_timeout_ms{0};                  // 0 = never close idle connections
    int max_connections{0};                  // 0 = unlimited
    int listen_backlog{128};
};

struct EngineConfig {
    int request_timeout_ms{0};               // 0 = no per-request deadline
    bool concurrent_rate_fetch{false};       // Fetch both rates in parallel
};

struct StrategyConfig {
    double rate_diff_threshold{0.0001};      // Minimum |rate_a - rate_b| (0.01%)
    double success_probability{0.9};         // Simulated execution success rate
    double efficiency_factor{0.95};          // Share of expected profit kept after slippage/fees
    int execution_latency_us{100};           // Simulated execution delay
};

// Process-wide gas constants, read-only after startup
struct GasConfig {
    Gas current_gas_price{20'000'000'000};   // 20 gwei
    Gas max_gas_limit{5'000'000};
};

// Connector metadata for one funding-rate source
struct ExchangeConnector {
    std::string name;
    std::string base_url;
    std::string api_key;                     // Placeholder, unused by the simulated feed
    std::string secret_key;                  // Placeholder, unused by the simulated feed
    double base_rate{0.0001};                // Simulated rate lower bound
    double rate_jitter{0.0002};              // Simulated rate band width
};

using ExchangeRegistry = std::map<std::string, ExchangeConnector>;

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{false};
    bool json_format{true};                  // JSON lines format for the file sink
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    ServerConfig server;
    EngineConfig engine;
    StrategyConfig strategy;
    GasConfig gas;
    LoggingConfig logging;

    ExchangeRegistry exchanges{default_exchanges()};
    std::vector<std::string> flash_loan_providers{"aave", "dydx", "compound"};

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // binance, bybit, okx with the reference rate bands
    static ExchangeRegistry default_exchanges();
};

// JSON serialization
void to_json(nlohmann::json& j, const ExchangeConnector& c);
void from_json(const nlohmann::json& j, ExchangeConnector& c);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace arbexec
