#include <gtest/gtest.h>
#include "config/config.hpp"
#include "utils/crypto.hpp"
#include <filesystem>
#include <fstream>

using namespace arbexec;

class ConfigTest : public ::testing::Test {
protected:
    std::string config_path_;

    void SetUp() override {
        config_path_ = (std::filesystem::temp_directory_path() /
                        ("arbexec_config_" + crypto::connection_id() + ".json")).string();
    }

    void TearDown() override {
        std::filesystem::remove(config_path_);
    }

    void write_file(const std::string& contents) {
        std::ofstream file(config_path_);
        file << contents;
    }
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_TRUE(config.validate());

    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.framing, FramingMode::LINE);
    EXPECT_EQ(config.server.read_buffer_bytes, 1024);
    EXPECT_DOUBLE_EQ(config.strategy.rate_diff_threshold, 0.0001);
    EXPECT_DOUBLE_EQ(config.strategy.success_probability, 0.9);
    EXPECT_DOUBLE_EQ(config.strategy.efficiency_factor, 0.95);
    EXPECT_EQ(config.gas.current_gas_price, 20'000'000'000ULL);
    EXPECT_EQ(config.gas.max_gas_limit, 5'000'000ULL);
}

TEST_F(ConfigTest, DefaultExchangeRegistry) {
    Config config;

    ASSERT_EQ(config.exchanges.size(), 3u);
    EXPECT_DOUBLE_EQ(config.exchanges.at("binance").base_rate, 0.0001);
    EXPECT_DOUBLE_EQ(config.exchanges.at("bybit").base_rate, 0.0002);
    EXPECT_DOUBLE_EQ(config.exchanges.at("okx").base_rate, 0.0003);
    EXPECT_EQ(config.exchanges.at("okx").name, "okx");

    std::vector<std::string> providers{"aave", "dydx", "compound"};
    EXPECT_EQ(config.flash_loan_providers, providers);
}

// ============================================================================
// Loading
// ============================================================================

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    write_file(R"({
        "server": {"port": 9090, "framing": "read"},
        "strategy": {"success_probability": 0.5}
    })");

    Config config = Config::load(config_path_);

    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.framing, FramingMode::READ);
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_DOUBLE_EQ(config.strategy.success_probability, 0.5);
    EXPECT_DOUBLE_EQ(config.strategy.efficiency_factor, 0.95);
    EXPECT_EQ(config.exchanges.size(), 3u);
}

TEST_F(ConfigTest, ConfiguredExchangesReplaceDefaults) {
    write_file(R"({
        "exchanges": {
            "deribit": {"base_url": "https://www.deribit.com", "base_rate": 0.0005, "rate_jitter": 0.0}
        }
    })");

    Config config = Config::load(config_path_);

    ASSERT_EQ(config.exchanges.size(), 1u);
    const auto& deribit = config.exchanges.at("deribit");
    EXPECT_EQ(deribit.name, "deribit");
    EXPECT_DOUBLE_EQ(deribit.base_rate, 0.0005);
    EXPECT_DOUBLE_EQ(deribit.rate_jitter, 0.0);
}

TEST_F(ConfigTest, SaveThenLoad) {
    Config config;
    config.server.port = 0;
    config.server.idle_timeout_ms = 1500;
    config.engine.request_timeout_ms = 250;
    config.engine.concurrent_rate_fetch = true;
    config.flash_loan_providers = {"aave"};
    config.save(config_path_);

    Config loaded = Config::load(config_path_);

    EXPECT_EQ(loaded.server.port, 0);
    EXPECT_EQ(loaded.server.idle_timeout_ms, 1500);
    EXPECT_EQ(loaded.engine.request_timeout_ms, 250);
    EXPECT_TRUE(loaded.engine.concurrent_rate_fetch);
    EXPECT_EQ(loaded.flash_loan_providers.size(), 1u);
    EXPECT_EQ(loaded.exchanges.size(), 3u);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(Config::load(config_path_ + ".missing"), std::runtime_error);
}

TEST_F(ConfigTest, MalformedJsonThrows) {
    write_file("{\"server\": {\"port\": ");
    EXPECT_THROW(Config::load(config_path_), std::runtime_error);
}

TEST_F(ConfigTest, UnknownFramingThrows) {
    write_file(R"({"server": {"framing": "length_prefixed"}})");
    EXPECT_THROW(Config::load(config_path_), std::runtime_error);
}

TEST_F(ConfigTest, InvalidValuesRejectedOnLoad) {
    write_file(R"({"strategy": {"success_probability": 1.5}})");
    EXPECT_THROW(Config::load(config_path_), std::runtime_error);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, Validate_RejectsBadServerSettings) {
    Config config;
    config.server.port = 70000;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.server.host = "";
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.server.max_frame_bytes = 512;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.server.idle_timeout_ms = -1;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, Validate_RejectsBadStrategySettings) {
    Config config;
    config.strategy.efficiency_factor = 0.0;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.strategy.rate_diff_threshold = -0.1;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.strategy.execution_latency_us = -5;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, Validate_RejectsUnknownLogLevel) {
    Config config;
    config.logging.log_level = "verbose";
    EXPECT_FALSE(config.validate());

    config.logging.log_level = "trace";
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, Validate_RequiresExchanges) {
    Config config;
    config.exchanges.clear();
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.exchanges["binance"].base_url = "";
    EXPECT_FALSE(config.validate());
}
