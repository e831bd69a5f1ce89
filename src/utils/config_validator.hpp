#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <limits>
#include <nlohmann/json.hpp>
#include "../core/result.hpp"

namespace xarb {

struct ValidationError {
    std::string field;
    std::string message;
    std::string value;
};

class ConfigValidator {
public:
    using ValidationResult = Result<bool>;
    using ValidationErrors = std::vector<ValidationError>;

    // Validate complete configuration. Every section is optional; present fields must be sane.
    static ValidationResult validate_config(const nlohmann::json& config);

    static ValidationResult validate_app_config(const nlohmann::json& app_config);
    static ValidationResult validate_markets_config(const nlohmann::json& markets_config);
    static ValidationResult validate_monitor_config(const nlohmann::json& monitor_config);
    static ValidationResult validate_arbitrage_config(const nlohmann::json& arbitrage_config);
    static ValidationResult validate_risk_config(const nlohmann::json& risk_config);
    static ValidationResult validate_balances_config(const nlohmann::json& balances_config);
    static ValidationResult validate_simulation_config(const nlohmann::json& simulation_config);
    static ValidationResult validate_database_config(const nlohmann::json& database_config);
    static ValidationResult validate_logging_config(const nlohmann::json& logging_config);

    static const ValidationErrors& get_errors() { return errors_; }
    static void clear_errors() { errors_.clear(); }

private:
    static ValidationErrors errors_;

    static bool validate_string_field(const nlohmann::json& config, const std::string& field,
                                      size_t min_length = 0, size_t max_length = SIZE_MAX);
    static bool validate_numeric_field(const nlohmann::json& config, const std::string& field,
                                       double min_value = -std::numeric_limits<double>::infinity(),
                                       double max_value = std::numeric_limits<double>::infinity());
    static bool validate_boolean_field(const nlohmann::json& config, const std::string& field);
    static bool validate_enum_field(const nlohmann::json& config, const std::string& field,
                                    const std::vector<std::string>& valid_values);
    static bool validate_fraction_field(const nlohmann::json& config, const std::string& field);
    static bool validate_positive_field(const nlohmann::json& config, const std::string& field);
    static bool validate_non_negative_field(const nlohmann::json& config, const std::string& field);
    static bool validate_market_spec(const nlohmann::json& spec, const std::string& prefix);
    static bool validate_trading_pair(const std::string& pair);

    static ValidationResult section_result(size_t errors_before, const std::string& section);
    static void add_error(const std::string& field, const std::string& message,
                          const std::string& value = "");
};

} // namespace xarb
