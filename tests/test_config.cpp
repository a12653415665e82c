/**
 * @file test_config.cpp
 * @brief Тесты загрузки и валидации конфигурации
 */

#include <gtest/gtest.h>

#include "core/config.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace bchpool::tests {

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!temp_path_.empty()) {
            std::filesystem::remove(temp_path_);
        }
    }

    std::filesystem::path write_temp(std::string_view text) {
        temp_path_ = std::filesystem::temp_directory_path()
            / ("bchpool_test_" + std::to_string(::getpid()) + ".toml");
        std::ofstream out(temp_path_);
        out << text;
        return temp_path_;
    }

    std::filesystem::path temp_path_;
};

TEST_F(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_EQ(config.server.tcp_port, 3333);
    EXPECT_EQ(config.server.websocket_port, 3334);
    EXPECT_EQ(config.pool.network, bitcoin::Network::Testnet);
    EXPECT_EQ(config.jobs.max_job_age, 300u);
    EXPECT_EQ(config.jobs.max_ntime_drift, 7200);
    EXPECT_DOUBLE_EQ(config.difficulty.min, 0.001);

    auto valid = config.validate();
    EXPECT_TRUE(valid.has_value()) << valid.error().message;
}

TEST_F(ConfigTest, ParseAllSections) {
    auto config = Config::parse(R"(
[server]
bind_address = "127.0.0.1"
tcp_port = 4444
websocket_port = 4445
enable_websocket = false
max_connections = 10

[node]
rpc_host = "10.0.0.2"
rpc_port = 18443
rpc_user = "alice"
rpc_password = "secret"
timeout_seconds = 5

[pool]
network = "regtest"
payout_address = "bchreg:qpm2qsznhks23z7629mms6s4cwef74vcwv6ycwvz78"
coinbase_prefix = "/test/"
extranonce2_size = 8

[difficulty]
initial = 2.0
min = 0.5
max = 64.0
target_shares_per_minute = 20.0
enable_dynamic = false

[jobs]
broadcast_interval = 10
max_job_age = 120
nonces_per_job = 50

[fallback]
bits = "0x207fffff"
version = 536870912

[logging]
level = "debug"
color = true
)");
    ASSERT_TRUE(config.has_value()) << config.error().message;

    EXPECT_EQ(config->server.bind_address, "127.0.0.1");
    EXPECT_EQ(config->server.tcp_port, 4444);
    EXPECT_FALSE(config->server.enable_websocket);
    EXPECT_EQ(config->server.max_connections, 10u);

    EXPECT_EQ(config->node.rpc_host, "10.0.0.2");
    EXPECT_EQ(config->node.rpc_port, 18443);
    EXPECT_EQ(config->node.rpc_user, "alice");
    EXPECT_EQ(config->node.timeout_seconds, 5u);

    EXPECT_EQ(config->pool.network, bitcoin::Network::Regtest);
    EXPECT_EQ(config->pool.coinbase_prefix, "/test/");
    EXPECT_EQ(config->pool.extranonce2_size, 8u);

    EXPECT_DOUBLE_EQ(config->difficulty.initial, 2.0);
    EXPECT_DOUBLE_EQ(config->difficulty.target_shares_per_minute, 20.0);
    EXPECT_FALSE(config->difficulty.enable_dynamic);

    EXPECT_EQ(config->jobs.broadcast_interval, 10u);
    EXPECT_EQ(config->jobs.max_job_age, 120u);
    EXPECT_EQ(config->jobs.nonces_per_job, 50u);

    EXPECT_EQ(config->fallback.bits, 0x207fffffu);
    EXPECT_EQ(config->fallback.version, 0x20000000u);

    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_TRUE(config->logging.color);

    auto valid = config->validate();
    EXPECT_TRUE(valid.has_value()) << valid.error().message;
}

TEST_F(ConfigTest, ParseErrorReported) {
    auto config = Config::parse("[server\ntcp_port = ");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParseError);
}

TEST_F(ConfigTest, UnknownNetworkRejected) {
    auto config = Config::parse("[pool]\nnetwork = \"bitcoin-sv\"\n");
    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, BadFallbackBitsRejected) {
    auto config = Config::parse("[fallback]\nbits = \"zz\"\n");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigInvalidValue);
}

TEST_F(ConfigTest, LoadFromFile) {
    auto path = write_temp("[server]\ntcp_port = 5555\n");
    auto config = Config::load(path);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->server.tcp_port, 5555);

    auto searched = Config::load_with_search(path);
    ASSERT_TRUE(searched.has_value());
    EXPECT_EQ(searched->server.tcp_port, 5555);
}

TEST_F(ConfigTest, MissingFileReported) {
    auto config = Config::load("/nonexistent/bchpool.toml");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigNotFound);

    auto searched = Config::load_with_search(std::filesystem::path("/nonexistent/bchpool.toml"));
    EXPECT_FALSE(searched.has_value());
}

// =============================================================================
// Валидация
// =============================================================================

/**
 * @brief Адрес другой сети не проходит валидацию
 */
TEST_F(ConfigTest, PayoutAddressMustMatchNetwork) {
    Config config;
    config.pool.network = bitcoin::Network::Mainnet;
    config.pool.payout_address = "bchtest:qpm2qsznhks23z7629mms6s4cwef74vcwvqcw003ap";
    EXPECT_FALSE(config.validate().has_value());

    config.pool.payout_address = "bitcoincash:qpm2qsznhks23z7629mms6s4cwef74vcwvy22gdx6a";
    EXPECT_TRUE(config.validate().has_value());

    config.pool.payout_address.clear();
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ConfigTest, ExtranonceSizeBounds) {
    Config config;
    config.pool.extranonce2_size = 0;
    EXPECT_FALSE(config.validate().has_value());
    config.pool.extranonce2_size = 9;
    EXPECT_FALSE(config.validate().has_value());
    config.pool.extranonce2_size = 8;
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ConfigTest, CoinbasePrefixMustFitScriptSig) {
    Config config;
    config.pool.coinbase_prefix = std::string(80, 'x');
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ConfigTest, DifficultyOrdering) {
    Config config;
    config.difficulty.min = 0.0;
    EXPECT_FALSE(config.validate().has_value());

    config = Config{};
    config.difficulty.initial = 5000.0;
    EXPECT_FALSE(config.validate().has_value());

    config = Config{};
    config.difficulty.target_shares_per_minute = 0.0;
    EXPECT_FALSE(config.validate().has_value());
}

/**
 * @brief Нулевой интервал пересчёта допустим только без динамической сложности
 */
TEST_F(ConfigTest, DifficultyUpdateIntervalRequiredWhenDynamic) {
    Config config;
    config.difficulty.enable_dynamic = true;
    config.difficulty.update_interval = 0;
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalidValue);

    config.difficulty.enable_dynamic = false;
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ConfigTest, NegativeNtimeDriftRejected) {
    Config config;
    config.jobs.max_ntime_drift = -1;
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalidValue);

    config.jobs.max_ntime_drift = 0;
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ConfigTest, TransportSettings) {
    Config config;
    config.server.websocket_port = config.server.tcp_port;
    EXPECT_FALSE(config.validate().has_value());

    // Совпадение портов допустимо, если один транспорт выключен
    config.server.enable_websocket = false;
    EXPECT_TRUE(config.validate().has_value());

    config.server.enable_tcp = false;
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ConfigTest, FallbackHashAndLogLevel) {
    Config config;
    config.fallback.prev_block_hash = "abcd";
    EXPECT_FALSE(config.validate().has_value());

    config = Config{};
    config.logging.level = "verbose";
    EXPECT_FALSE(config.validate().has_value());
}

} // namespace bchpool::tests
