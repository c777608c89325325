#include "config/config.hpp"
#include <fstream>
#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace arbexec {

void to_json(nlohmann::json& j, const ServerConfig& c) {
    j = nlohmann::json{
        {"host", c.host},
        {"port", c.port},
        {"framing", framing_to_string(c.framing)},
        {"read_buffer_bytes", c.read_buffer_bytes},
        {"max_frame_bytes", c.max_frame_bytes},
        {"idle_timeout_ms", c.idle_timeout_ms},
        {"max_connections", c.max_connections},
        {"listen_backlog", c.listen_backlog}
    };
}

void from_json(const nlohmann::json& j, ServerConfig& c) {
    if (j.contains("host")) j.at("host").get_to(c.host);
    if (j.contains("port")) j.at("port").get_to(c.port);
    if (j.contains("framing")) {
        std::string framing_str = j.at("framing").get<std::string>();
        auto framing = framing_from_string(framing_str);
        if (!framing) {
            throw std::runtime_error("Unknown framing mode: " + framing_str);
        }
        c.framing = *framing;
    }
    if (j.contains("read_buffer_bytes")) j.at("read_buffer_bytes").get_to(c.read_buffer_bytes);
    if (j.contains("max_frame_bytes")) j.at("max_frame_bytes").get_to(c.max_frame_bytes);
    if (j.contains("idle_timeout_ms")) j.at("idle_timeout_ms").get_to(c.idle_timeout_ms);
    if (j.contains("max_connections")) j.at("max_connections").get_to(c.max_connections);
    if (j.contains("listen_backlog")) j.at("listen_backlog").get_to(c.listen_backlog);
}

void to_json(nlohmann::json& j, const EngineConfig& c) {
    j = nlohmann::json{
        {"request_timeout_ms", c.request_timeout_ms},
        {"concurrent_rate_fetch", c.concurrent_rate_fetch}
    };
}

void from_json(const nlohmann::json& j, EngineConfig& c) {
    if (j.contains("request_timeout_ms")) j.at("request_timeout_ms").get_to(c.request_timeout_ms);
    if (j.contains("concurrent_rate_fetch")) j.at("concurrent_rate_fetch").get_to(c.concurrent_rate_fetch);
}

void to_json(nlohmann::json& j, const StrategyConfig& c) {
    j = nlohmann::json{
        {"rate_diff_threshold", c.rate_diff_threshold},
        {"success_probability", c.success_probability},
        {"efficiency_factor", c.efficiency_factor},
        {"execution_latency_us", c.execution_latency_us}
    };
}

void from_json(const nlohmann::json& j, StrategyConfig& c) {
    if (j.contains("rate_diff_threshold")) j.at("rate_diff_threshold").get_to(c.rate_diff_threshold);
    if (j.contains("success_probability")) j.at("success_probability").get_to(c.success_probability);
    if (j.contains("efficiency_factor")) j.at("efficiency_factor").get_to(c.efficiency_factor);
    if (j.contains("execution_latency_us")) j.at("execution_latency_us").get_to(c.execution_latency_us);
}

void to_json(nlohmann::json& j, const GasConfig& c) {
    j = nlohmann::json{
        {"current_gas_price", c.current_gas_price},
        {"max_gas_limit", c.max_gas_limit}
    };
}

void from_json(const nlohmann::json& j, GasConfig& c) {
    if (j.contains("current_gas_price")) j.at("current_gas_price").get_to(c.current_gas_price);
    if (j.contains("max_gas_limit")) j.at("max_gas_limit").get_to(c.max_gas_limit);
}

void to_json(nlohmann::json& j, const ExchangeConnector& c) {
    j = nlohmann::json{
        {"name", c.name},
        {"base_url", c.base_url},
        {"api_key", c.api_key},
        {"secret_key", c.secret_key},
        {"base_rate", c.base_rate},
        {"rate_jitter", c.rate_jitter}
    };
}

void from_json(const nlohmann::json& j, ExchangeConnector& c) {
    if (j.contains("name")) j.at("name").get_to(c.name);
    if (j.contains("base_url")) j.at("base_url").get_to(c.base_url);
    if (j.contains("api_key")) j.at("api_key").get_to(c.api_key);
    if (j.contains("secret_key")) j.at("secret_key").get_to(c.secret_key);
    if (j.contains("base_rate")) j.at("base_rate").get_to(c.base_rate);
    if (j.contains("rate_jitter")) j.at("rate_jitter").get_to(c.rate_jitter);
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
        {"server", c.server},
        {"engine", c.engine},
        {"strategy", c.strategy},
        {"gas", c.gas},
        {"logging", c.logging},
        {"exchanges", c.exchanges},
        {"flash_loan_providers", c.flash_loan_providers}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("server")) j.at("server").get_to(c.server);
    if (j.contains("engine")) j.at("engine").get_to(c.engine);
    if (j.contains("strategy")) j.at("strategy").get_to(c.strategy);
    if (j.contains("gas")) j.at("gas").get_to(c.gas);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("exchanges")) {
        // A configured registry replaces the defaults entirely
        c.exchanges.clear();
        for (const auto& [id, entry] : j.at("exchanges").items()) {
            ExchangeConnector connector;
            connector.name = id;
            entry.get_to(connector);
            c.exchanges[id] = connector;
        }
    }
    if (j.contains("flash_loan_providers")) j.at("flash_loan_providers").get_to(c.flash_loan_providers);
}

ExchangeRegistry Config::default_exchanges() {
    ExchangeRegistry registry;
    registry["binance"] = ExchangeConnector{"binance", "https://fapi.binance.com", "", "", 0.0001, 0.0002};
    registry["bybit"] = ExchangeConnector{"bybit", "https://api.bybit.com", "", "", 0.0002, 0.0002};
    registry["okx"] = ExchangeConnector{"okx", "https://www.okx.com", "", "", 0.0003, 0.0002};
    return registry;
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    Config config;
    try {
        nlohmann::json j;
        file >> j;
        from_json(j, config);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }

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

bool Config::validate() const {
    if (server.host.empty()) {
        spdlog::error("server.host must not be empty");
        return false;
    }

    if (server.port < 0 || server.port > 65535) {
        spdlog::error("server.port must be in [0, 65535], got {}", server.port);
        return false;
    }

    if (server.read_buffer_bytes <= 0) {
        spdlog::error("server.read_buffer_bytes must be positive");
        return false;
    }

    if (server.max_frame_bytes < server.read_buffer_bytes) {
        spdlog::error("server.max_frame_bytes must be >= read_buffer_bytes");
        return false;
    }

    if (server.idle_timeout_ms < 0 || server.max_connections < 0 || server.listen_backlog <= 0) {
        spdlog::error("server timeouts and limits must be non-negative");
        return false;
    }

    if (engine.request_timeout_ms < 0) {
        spdlog::error("engine.request_timeout_ms must be non-negative");
        return false;
    }

    if (exchanges.empty()) {
        spdlog::error("At least one exchange must be configured");
        return false;
    }

    for (const auto& [id, connector] : exchanges) {
        if (connector.base_url.empty()) {
            spdlog::error("Exchange '{}' has no base_url", id);
            return false;
        }
        if (connector.rate_jitter < 0) {
            spdlog::error("Exchange '{}' rate_jitter must be non-negative", id);
            return false;
        }
    }

    if (strategy.rate_diff_threshold < 0) {
        spdlog::error("strategy.rate_diff_threshold must be non-negative");
        return false;
    }

    if (strategy.success_probability < 0.0 || strategy.success_probability > 1.0) {
        spdlog::error("strategy.success_probability must be in [0, 1]");
        return false;
    }

    if (strategy.efficiency_factor <= 0.0 || strategy.efficiency_factor > 1.0) {
        spdlog::error("strategy.efficiency_factor must be in (0, 1]");
        return false;
    }

    if (strategy.execution_latency_us < 0) {
        spdlog::error("strategy.execution_latency_us must be non-negative");
        return false;
    }

    if (gas.max_gas_limit == 0) {
        spdlog::error("gas.max_gas_limit must be positive");
        return false;
    }

    static const std::set<std::string> log_levels{"trace", "debug", "info", "warn", "error"};
    if (log_levels.count(logging.log_level) == 0) {
        spdlog::error("logging.log_level '{}' is not one of trace, debug, info, warn, error",
                      logging.log_level);
        return false;
    }

    if (flash_loan_providers.empty()) {
        spdlog::warn("No flash loan providers configured");
    }

    return true;
}

} // namespace arbexec
