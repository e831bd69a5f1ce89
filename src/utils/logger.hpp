#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <spdlog/spdlog.h>
#include "config_types.hpp"

namespace xarb {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    // Console + rotating file sinks. Safe to call again; the previous logger is replaced.
    static void init(const LoggingConfig& config, LogLevel level);
    static void shutdown();

    // Lazily creates a console-only logger when init() has not been called.
    static std::shared_ptr<spdlog::logger> get();

    static void set_level(LogLevel level);
    static LogLevel get_level();

private:
    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    static std::shared_ptr<spdlog::logger> logger_;
    static LogLevel current_level_;
};

// Structured one-line trading events
class TradingLogger {
public:
    static void log_opportunity(const std::string& sell_symbol, const std::string& buy_symbol,
                                double sell_price, double buy_price, double spread_percentage);
    static void log_risk_rejection(const std::string& reason, const std::string& detail);
    static void log_leg_filled(const std::string& attempt_id, const std::string& side,
                               const std::string& symbol, double filled_amount, double filled_price);
    static void log_attempt_finished(const std::string& attempt_id, const std::string& status,
                                     double realized_pnl);
    static void log_risk_alert(const std::string& alert_type, const std::string& description);
};

#define XARB_LOG_TRACE(...) xarb::Logger::get()->trace(__VA_ARGS__)
#define XARB_LOG_DEBUG(...) xarb::Logger::get()->debug(__VA_ARGS__)
#define XARB_LOG_INFO(...) xarb::Logger::get()->info(__VA_ARGS__)
#define XARB_LOG_WARN(...) xarb::Logger::get()->warn(__VA_ARGS__)
#define XARB_LOG_ERROR(...) xarb::Logger::get()->error(__VA_ARGS__)
#define XARB_LOG_CRITICAL(...) xarb::Logger::get()->critical(__VA_ARGS__)

} // namespace xarb
