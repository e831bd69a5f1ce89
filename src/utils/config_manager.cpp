#include "config_manager.hpp"
#include <fstream>
#include "config_validator.hpp"
#include "logger.hpp"

namespace xarb {

bool ConfigManager::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        XARB_LOG_ERROR("Failed to open config file: {}", file_path);
        return false;
    }

    nlohmann::json parsed;
    try {
        file >> parsed;
    } catch (const nlohmann::json::exception& e) {
        XARB_LOG_ERROR("Error parsing config file {}: {}", file_path, e.what());
        return false;
    }
    return load_from_json(parsed);
}

bool ConfigManager::load_from_json(const nlohmann::json& config) {
    auto validation = ConfigValidator::validate_config(config);
    if (validation.is_error()) {
        for (const auto& error : ConfigValidator::get_errors()) {
            XARB_LOG_ERROR("Invalid configuration {}: {}", error.field, error.message);
        }
        return false;
    }

    try {
        config_data_ = config;

        if (config_data_.contains("app")) {
            config_data_["app"].get_to(app_config_);
        }
        if (config_data_.contains("markets")) {
            config_data_["markets"].get_to(markets_config_);
        }
        if (config_data_.contains("monitor")) {
            config_data_["monitor"].get_to(monitor_config_);
        }
        if (config_data_.contains("arbitrage")) {
            config_data_["arbitrage"].get_to(arbitrage_config_);
        }
        if (config_data_.contains("risk_management")) {
            config_data_["risk_management"].get_to(risk_management_config_);
        }
        if (config_data_.contains("balances")) {
            config_data_["balances"].get_to(balances_config_);
        }
        if (config_data_.contains("simulation")) {
            config_data_["simulation"].get_to(simulation_config_);
        }
        if (config_data_.contains("database")) {
            config_data_["database"].get_to(database_config_);
        }
        if (config_data_.contains("logging")) {
            config_data_["logging"].get_to(logging_config_);
        }
    } catch (const nlohmann::json::exception& e) {
        XARB_LOG_ERROR("Error reading configuration: {}", e.what());
        return false;
    }

    apply_env_overrides();
    return true;
}

void ConfigManager::apply_env_overrides() {
    std::string log_level = get_env_var("XARB_LOG_LEVEL");
    if (!log_level.empty()) {
        app_config_.log_level = log_level;
    }
    std::string db_path = get_env_var("XARB_DB_PATH");
    if (!db_path.empty()) {
        database_config_.path = db_path;
    }
}

AppConfig& ConfigManager::get_app_config() {
    return app_config_;
}

MarketsConfig& ConfigManager::get_markets_config() {
    return markets_config_;
}

MonitorConfig& ConfigManager::get_monitor_config() {
    return monitor_config_;
}

ArbitrageConfig& ConfigManager::get_arbitrage_config() {
    return arbitrage_config_;
}

RiskManagementConfig& ConfigManager::get_risk_management_config() {
    return risk_management_config_;
}

BalancesConfig& ConfigManager::get_balances_config() {
    return balances_config_;
}

SimulationConfig& ConfigManager::get_simulation_config() {
    return simulation_config_;
}

DatabaseConfig& ConfigManager::get_database_config() {
    return database_config_;
}

LoggingConfig& ConfigManager::get_logging_config() {
    return logging_config_;
}

} // namespace xarb
