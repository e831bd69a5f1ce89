#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "utils/config_manager.hpp"
#include "utils/config_validator.hpp"

class ConfigManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("XARB_DB_PATH");
        unsetenv("XARB_LOG_LEVEL");
    }

    bool has_error_for(const std::string& field) const {
        for (const auto& error : xarb::ConfigValidator::get_errors()) {
            if (error.field == field) return true;
        }
        return false;
    }

    xarb::ConfigManager config;
};

TEST_F(ConfigManagerTest, DefaultsWithoutSections) {
    ASSERT_TRUE(config.load_from_json(nlohmann::json::object()));
    EXPECT_EQ(config.get_markets_config().asset, "XRP");
    EXPECT_EQ(config.get_markets_config().market_a.quote_currency, "USDT");
    EXPECT_EQ(config.get_markets_config().market_b.quote_currency, "USDC");
    EXPECT_DOUBLE_EQ(config.get_risk_management_config().min_spread_percentage, 0.3);
    EXPECT_DOUBLE_EQ(config.get_risk_management_config().daily_volume_limit, 5000.0);
    EXPECT_EQ(config.get_risk_management_config().cooldown_sec, 30);
    EXPECT_EQ(config.get_monitor_config().freshness_bound_ms, 30000);
    EXPECT_EQ(config.get_arbitrage_config().buy_retry_limit, 3);
}

TEST_F(ConfigManagerTest, SectionsOverrideDefaults) {
    nlohmann::json json = {
        {"markets", {{"asset", "ADA"},
                     {"market_a", {{"symbol", "ADA/USDT"}, {"quote_currency", "USDT"}}},
                     {"market_b", {{"symbol", "ADA/USDC"}, {"quote_currency", "USDC"}, {"poll_interval_ms", 500}}}}},
        {"risk_management", {{"min_spread_percentage", 0.5}, {"cooldown_sec", 0}}},
        {"balances", {{"initial", {{"ADA", 2500.0}, {"USDT", 100.0}}}}}
    };

    ASSERT_TRUE(config.load_from_json(json));
    EXPECT_EQ(config.get_markets_config().asset, "ADA");
    EXPECT_EQ(config.get_markets_config().market_b.poll_interval_ms, 500);
    EXPECT_EQ(config.get_markets_config().market_a.poll_interval_ms, 2000);
    EXPECT_DOUBLE_EQ(config.get_risk_management_config().min_spread_percentage, 0.5);
    EXPECT_EQ(config.get_risk_management_config().cooldown_sec, 0);
    EXPECT_DOUBLE_EQ(config.get_risk_management_config().volatility_ceiling, 2.0);
    ASSERT_EQ(config.get_balances_config().initial.size(), 2u);
    EXPECT_DOUBLE_EQ(config.get_balances_config().initial.at("ADA"), 2500.0);
}

TEST_F(ConfigManagerTest, RejectsMarketsSharingQuoteCurrency) {
    nlohmann::json json = {
        {"markets", {{"market_a", {{"symbol", "XRP/USDT"}, {"quote_currency", "USDT"}}},
                     {"market_b", {{"symbol", "XRP/BUSD"}, {"quote_currency", "USDT"}}}}}
    };
    EXPECT_FALSE(config.load_from_json(json));
    EXPECT_TRUE(has_error_for("markets.market_b.quote_currency"));
}

TEST_F(ConfigManagerTest, RejectsMalformedTradingPair) {
    nlohmann::json json = {{"markets", {{"market_a", {{"symbol", "xrp-usdt"}}}}}};
    EXPECT_FALSE(config.load_from_json(json));
    EXPECT_TRUE(has_error_for("markets.market_a.symbol"));
}

TEST_F(ConfigManagerTest, RejectsOutOfRangeValues) {
    EXPECT_FALSE(config.load_from_json({{"arbitrage", {{"buy_retry_limit", 0}}}}));
    EXPECT_TRUE(has_error_for("buy_retry_limit"));

    EXPECT_FALSE(config.load_from_json({{"risk_management", {{"safety_margin_fraction", 1.0}}}}));
    EXPECT_TRUE(has_error_for("safety_margin_fraction"));

    EXPECT_FALSE(config.load_from_json({{"risk_management", {{"daily_volume_limit", 0}}}}));
    EXPECT_FALSE(config.load_from_json({{"monitor", {{"history_capacity", 1}}}}));
    EXPECT_FALSE(config.load_from_json({{"balances", {{"initial", {{"XRP", -5.0}}}}}}));
    EXPECT_FALSE(config.load_from_json({{"app", {{"log_level", "VERBOSE"}}}}));
    EXPECT_FALSE(config.load_from_json({{"logging", {{"console_output", "yes"}}}}));
}

TEST_F(ConfigManagerTest, FailedLoadKeepsPreviousValues) {
    ASSERT_TRUE(config.load_from_json({{"risk_management", {{"cooldown_sec", 5}}}}));
    EXPECT_FALSE(config.load_from_json({{"risk_management", {{"cooldown_sec", -1}}}}));
    EXPECT_EQ(config.get_risk_management_config().cooldown_sec, 5);
}

TEST_F(ConfigManagerTest, EnvironmentOverridesFile) {
    setenv("XARB_DB_PATH", "/tmp/override.db", 1);
    setenv("XARB_LOG_LEVEL", "DEBUG", 1);
    ASSERT_TRUE(config.load_from_json({{"database", {{"path", "data/xarb.db"}}}}));
    EXPECT_EQ(config.get_database_config().path, "/tmp/override.db");
    EXPECT_EQ(config.get_app_config().log_level, "DEBUG");
}

TEST_F(ConfigManagerTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "xarb_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"arbitrage": {"nominal_trade_amount": 250.0, "taker_fee_rate": 0.001}})";
    }
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_DOUBLE_EQ(config.get_arbitrage_config().nominal_trade_amount, 250.0);
    EXPECT_DOUBLE_EQ(config.get_arbitrage_config().taker_fee_rate, 0.001);
    std::filesystem::remove(path);

    EXPECT_FALSE(config.load((std::filesystem::temp_directory_path() / "xarb_missing.json").string()));
}

TEST_F(ConfigManagerTest, RejectsUnparsableFile) {
    auto path = std::filesystem::temp_directory_path() / "xarb_config_broken.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_FALSE(config.load(path.string()));
    std::filesystem::remove(path);
}
