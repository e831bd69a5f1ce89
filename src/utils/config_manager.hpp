#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "config_types.hpp"

namespace xarb {

class ConfigManager {
public:
    bool load(const std::string& file_path);
    bool load_from_json(const nlohmann::json& config);

    AppConfig& get_app_config();
    MarketsConfig& get_markets_config();
    MonitorConfig& get_monitor_config();
    ArbitrageConfig& get_arbitrage_config();
    RiskManagementConfig& get_risk_management_config();
    BalancesConfig& get_balances_config();
    SimulationConfig& get_simulation_config();
    DatabaseConfig& get_database_config();
    LoggingConfig& get_logging_config();

private:
    void apply_env_overrides();

    nlohmann::json config_data_;
    AppConfig app_config_;
    MarketsConfig markets_config_;
    MonitorConfig monitor_config_;
    ArbitrageConfig arbitrage_config_;
    RiskManagementConfig risk_management_config_;
    BalancesConfig balances_config_;
    SimulationConfig simulation_config_;
    DatabaseConfig database_config_;
    LoggingConfig logging_config_;
};

} // namespace xarb
