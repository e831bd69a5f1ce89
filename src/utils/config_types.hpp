#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace xarb {

std::string get_env_var(const std::string& key);

struct AppConfig {
    std::string name = "xarb";
    std::string version = "1.0.0";
    std::string log_level = "INFO";
    int status_interval_sec = 60;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AppConfig, name, version, log_level, status_interval_sec)

struct MarketSpec {
    std::string symbol;
    std::string quote_currency;
    int poll_interval_ms = 2000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(MarketSpec, symbol, quote_currency, poll_interval_ms)

struct MarketsConfig {
    std::string asset = "XRP";
    MarketSpec market_a{"XRP/USDT", "USDT", 2000};
    MarketSpec market_b{"XRP/USDC", "USDC", 2000};
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(MarketsConfig, asset, market_a, market_b)

struct MonitorConfig {
    size_t history_capacity = 500;
    int history_window_sec = 1800;
    int freshness_bound_ms = 30000;
    int feed_timeout_ms = 5000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(MonitorConfig, history_capacity, history_window_sec, freshness_bound_ms, feed_timeout_ms)

struct ArbitrageConfig {
    int tick_interval_ms = 5000;
    double nominal_trade_amount = 100.0;
    double taker_fee_rate = 0.0006;
    double price_buffer = 0.001;        // limit price slack applied to both legs
    int order_timeout_ms = 10000;
    int buy_retry_limit = 3;            // maximum buy submissions per attempt
    int retry_backoff_ms = 500;
    double inventory_tolerance = 0.01;  // fraction of the sold amount
    size_t success_rate_window = 20;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ArbitrageConfig, tick_interval_ms, nominal_trade_amount, taker_fee_rate, price_buffer, order_timeout_ms, buy_retry_limit, retry_backoff_ms, inventory_tolerance, success_rate_window)

struct RiskManagementConfig {
    double min_spread_percentage = 0.3;
    double daily_volume_limit = 5000.0;
    double safety_margin_fraction = 0.1;
    double safety_margin_absolute = 0.0;
    double volatility_ceiling = 2.0;   // percent, stddev of returns
    int cooldown_sec = 30;
    double max_trade_amount = 1000.0;
    double max_daily_loss = 100.0;     // reference currency
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RiskManagementConfig, min_spread_percentage, daily_volume_limit, safety_margin_fraction, safety_margin_absolute, volatility_ceiling, cooldown_sec, max_trade_amount, max_daily_loss)

struct BalancesConfig {
    std::map<std::string, double> initial = {{"XRP", 10000.0}, {"USDT", 5000.0}, {"USDC", 5000.0}};
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BalancesConfig, initial)

struct SimulationConfig {
    double base_price_a = 0.5234;
    double base_price_b = 0.5241;
    double price_jitter = 0.005;       // +/- fraction around the base price
    double failure_rate = 0.05;
    int latency_ms = 50;
    unsigned int seed = 42;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SimulationConfig, base_price_a, base_price_b, price_jitter, failure_rate, latency_ms, seed)

struct DatabaseConfig {
    std::string path = "data/xarb.db";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(DatabaseConfig, path)

struct LoggingConfig {
    std::string file_path = "logs/xarb.log";
    int max_file_size_mb = 10;
    int max_backup_files = 3;
    bool console_output = true;
    bool file_output = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LoggingConfig, file_path, max_file_size_mb, max_backup_files, console_output, file_output)

} // namespace xarb
