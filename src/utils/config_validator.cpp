#include "config_validator.hpp"
#include <algorithm>
#include <numeric>
#include <regex>

namespace xarb {

ConfigValidator::ValidationErrors ConfigValidator::errors_;

ConfigValidator::ValidationResult ConfigValidator::validate_config(const nlohmann::json& config) {
    clear_errors();

    if (!config.is_object()) {
        add_error("<root>", "Configuration must be a JSON object", config.dump());
        return Result<bool>::error("Configuration must be a JSON object");
    }

    if (config.contains("app")) validate_app_config(config["app"]);
    if (config.contains("markets")) validate_markets_config(config["markets"]);
    if (config.contains("monitor")) validate_monitor_config(config["monitor"]);
    if (config.contains("arbitrage")) validate_arbitrage_config(config["arbitrage"]);
    if (config.contains("risk_management")) validate_risk_config(config["risk_management"]);
    if (config.contains("balances")) validate_balances_config(config["balances"]);
    if (config.contains("simulation")) validate_simulation_config(config["simulation"]);
    if (config.contains("database")) validate_database_config(config["database"]);
    if (config.contains("logging")) validate_logging_config(config["logging"]);

    if (!errors_.empty()) {
        return Result<bool>::error(std::to_string(errors_.size()) + " configuration error(s)");
    }
    return Result<bool>::success(true);
}

ConfigValidator::ValidationResult ConfigValidator::validate_app_config(const nlohmann::json& app_config) {
    size_t before = errors_.size();
    validate_string_field(app_config, "name", 1, 100);
    validate_string_field(app_config, "version", 1, 20);
    validate_enum_field(app_config, "log_level", {"TRACE", "DEBUG", "INFO", "WARN", "WARNING", "ERROR", "CRITICAL"});
    validate_positive_field(app_config, "status_interval_sec");
    return section_result(before, "app");
}

ConfigValidator::ValidationResult ConfigValidator::validate_markets_config(const nlohmann::json& markets_config) {
    size_t before = errors_.size();
    validate_string_field(markets_config, "asset", 2, 10);

    bool specs_ok = true;
    if (markets_config.contains("market_a")) {
        specs_ok = validate_market_spec(markets_config["market_a"], "market_a") && specs_ok;
    }
    if (markets_config.contains("market_b")) {
        specs_ok = validate_market_spec(markets_config["market_b"], "market_b") && specs_ok;
    }

    if (specs_ok && markets_config.contains("market_a") && markets_config.contains("market_b")) {
        const auto& a = markets_config["market_a"];
        const auto& b = markets_config["market_b"];
        if (a.contains("quote_currency") && b.contains("quote_currency") &&
            a["quote_currency"] == b["quote_currency"]) {
            add_error("markets.market_b.quote_currency", "Both markets quote the same currency",
                      b["quote_currency"].dump());
        }
        if (a.contains("symbol") && b.contains("symbol") && a["symbol"] == b["symbol"]) {
            add_error("markets.market_b.symbol", "Both markets use the same symbol", b["symbol"].dump());
        }
    }
    return section_result(before, "markets");
}

ConfigValidator::ValidationResult ConfigValidator::validate_monitor_config(const nlohmann::json& monitor_config) {
    size_t before = errors_.size();
    validate_numeric_field(monitor_config, "history_capacity", 2, 1000000);
    validate_positive_field(monitor_config, "history_window_sec");
    validate_positive_field(monitor_config, "freshness_bound_ms");
    validate_positive_field(monitor_config, "feed_timeout_ms");
    return section_result(before, "monitor");
}

ConfigValidator::ValidationResult ConfigValidator::validate_arbitrage_config(const nlohmann::json& arbitrage_config) {
    size_t before = errors_.size();
    validate_positive_field(arbitrage_config, "tick_interval_ms");
    validate_positive_field(arbitrage_config, "nominal_trade_amount");
    validate_fraction_field(arbitrage_config, "taker_fee_rate");
    validate_fraction_field(arbitrage_config, "price_buffer");
    validate_positive_field(arbitrage_config, "order_timeout_ms");
    validate_numeric_field(arbitrage_config, "buy_retry_limit", 1, 100);
    validate_non_negative_field(arbitrage_config, "retry_backoff_ms");
    validate_fraction_field(arbitrage_config, "inventory_tolerance");
    validate_numeric_field(arbitrage_config, "success_rate_window", 1, 10000);
    return section_result(before, "arbitrage");
}

ConfigValidator::ValidationResult ConfigValidator::validate_risk_config(const nlohmann::json& risk_config) {
    size_t before = errors_.size();
    validate_non_negative_field(risk_config, "min_spread_percentage");
    validate_positive_field(risk_config, "daily_volume_limit");
    validate_fraction_field(risk_config, "safety_margin_fraction");
    validate_non_negative_field(risk_config, "safety_margin_absolute");
    validate_positive_field(risk_config, "volatility_ceiling");
    validate_non_negative_field(risk_config, "cooldown_sec");
    validate_positive_field(risk_config, "max_trade_amount");
    validate_positive_field(risk_config, "max_daily_loss");
    return section_result(before, "risk_management");
}

ConfigValidator::ValidationResult ConfigValidator::validate_balances_config(const nlohmann::json& balances_config) {
    size_t before = errors_.size();
    if (balances_config.contains("initial")) {
        const auto& initial = balances_config["initial"];
        if (!initial.is_object()) {
            add_error("balances.initial", "Field must be an object of currency amounts", initial.dump());
        } else {
            for (const auto& [currency, amount] : initial.items()) {
                if (!amount.is_number() || amount.get<double>() < 0.0) {
                    add_error("balances.initial." + currency, "Balance must be a non-negative number",
                              amount.dump());
                }
            }
        }
    }
    return section_result(before, "balances");
}

ConfigValidator::ValidationResult ConfigValidator::validate_simulation_config(const nlohmann::json& simulation_config) {
    size_t before = errors_.size();
    validate_positive_field(simulation_config, "base_price_a");
    validate_positive_field(simulation_config, "base_price_b");
    validate_fraction_field(simulation_config, "price_jitter");
    validate_fraction_field(simulation_config, "failure_rate");
    validate_non_negative_field(simulation_config, "latency_ms");
    return section_result(before, "simulation");
}

ConfigValidator::ValidationResult ConfigValidator::validate_database_config(const nlohmann::json& database_config) {
    size_t before = errors_.size();
    validate_string_field(database_config, "path", 1, 500);
    return section_result(before, "database");
}

ConfigValidator::ValidationResult ConfigValidator::validate_logging_config(const nlohmann::json& logging_config) {
    size_t before = errors_.size();
    validate_string_field(logging_config, "file_path", 1, 500);
    validate_positive_field(logging_config, "max_file_size_mb");
    validate_positive_field(logging_config, "max_backup_files");
    validate_boolean_field(logging_config, "console_output");
    validate_boolean_field(logging_config, "file_output");
    return section_result(before, "logging");
}

bool ConfigValidator::validate_market_spec(const nlohmann::json& spec, const std::string& prefix) {
    size_t before = errors_.size();
    if (!spec.is_object()) {
        add_error("markets." + prefix, "Market must be an object", spec.dump());
        return false;
    }
    if (spec.contains("symbol")) {
        if (!spec["symbol"].is_string() || !validate_trading_pair(spec["symbol"].get<std::string>())) {
            add_error("markets." + prefix + ".symbol", "Invalid trading pair format", spec["symbol"].dump());
        }
    }
    validate_string_field(spec, "quote_currency", 2, 10);
    validate_positive_field(spec, "poll_interval_ms");
    return errors_.size() == before;
}

bool ConfigValidator::validate_string_field(const nlohmann::json& config, const std::string& field,
                                            size_t min_length, size_t max_length) {
    if (!config.contains(field)) return true;

    if (!config[field].is_string()) {
        add_error(field, "Field must be a string", config[field].dump());
        return false;
    }

    std::string value = config[field].get<std::string>();
    if (value.length() < min_length) {
        add_error(field, "String too short (min: " + std::to_string(min_length) + ")", value);
        return false;
    }
    if (value.length() > max_length) {
        add_error(field, "String too long (max: " + std::to_string(max_length) + ")", value);
        return false;
    }
    return true;
}

bool ConfigValidator::validate_numeric_field(const nlohmann::json& config, const std::string& field,
                                             double min_value, double max_value) {
    if (!config.contains(field)) return true;

    if (!config[field].is_number()) {
        add_error(field, "Field must be a number", config[field].dump());
        return false;
    }

    double value = config[field].get<double>();
    if (value < min_value) {
        add_error(field, "Value too small (min: " + std::to_string(min_value) + ")", std::to_string(value));
        return false;
    }
    if (value > max_value) {
        add_error(field, "Value too large (max: " + std::to_string(max_value) + ")", std::to_string(value));
        return false;
    }
    return true;
}

bool ConfigValidator::validate_boolean_field(const nlohmann::json& config, const std::string& field) {
    if (!config.contains(field)) return true;

    if (!config[field].is_boolean()) {
        add_error(field, "Field must be a boolean", config[field].dump());
        return false;
    }
    return true;
}

bool ConfigValidator::validate_enum_field(const nlohmann::json& config, const std::string& field,
                                          const std::vector<std::string>& valid_values) {
    if (!config.contains(field)) return true;

    if (!config[field].is_string()) {
        add_error(field, "Field must be a string", config[field].dump());
        return false;
    }

    std::string value = config[field].get<std::string>();
    if (std::find(valid_values.begin(), valid_values.end(), value) == valid_values.end()) {
        add_error(field, "Invalid value. Must be one of: " +
                  std::accumulate(valid_values.begin(), valid_values.end(), std::string(),
                                  [](const std::string& a, const std::string& b) {
                                      return a.empty() ? b : a + ", " + b;
                                  }), value);
        return false;
    }
    return true;
}

bool ConfigValidator::validate_fraction_field(const nlohmann::json& config, const std::string& field) {
    if (!config.contains(field)) return true;
    if (!validate_numeric_field(config, field, 0.0, 1.0)) return false;
    if (config[field].get<double>() >= 1.0) {
        add_error(field, "Fraction must be below 1", config[field].dump());
        return false;
    }
    return true;
}

bool ConfigValidator::validate_positive_field(const nlohmann::json& config, const std::string& field) {
    if (!config.contains(field)) return true;
    if (!validate_numeric_field(config, field)) return false;
    if (config[field].get<double>() <= 0.0) {
        add_error(field, "Value must be positive", config[field].dump());
        return false;
    }
    return true;
}

bool ConfigValidator::validate_non_negative_field(const nlohmann::json& config, const std::string& field) {
    return validate_numeric_field(config, field, 0.0, std::numeric_limits<double>::infinity());
}

bool ConfigValidator::validate_trading_pair(const std::string& pair) {
    std::regex pair_pattern(R"(^[A-Z0-9]{2,10}/[A-Z0-9]{2,10}$)");
    return std::regex_match(pair, pair_pattern);
}

ConfigValidator::ValidationResult ConfigValidator::section_result(size_t errors_before, const std::string& section) {
    return errors_.size() == errors_before ? Result<bool>::success(true)
                                           : Result<bool>::error(section + " configuration validation failed");
}

void ConfigValidator::add_error(const std::string& field, const std::string& message,
                                const std::string& value) {
    errors_.push_back({field, message, value});
}

} // namespace xarb
