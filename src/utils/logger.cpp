#include "logger.hpp"
#include <filesystem>
#include <iostream>
#include <mutex>
#include <vector>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace xarb {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
LogLevel Logger::current_level_ = LogLevel::INFO;

namespace {
std::mutex logger_mutex;
const char* kLoggerName = "xarb";
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "TRACE") return LogLevel::TRACE;
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "WARN" || name == "WARNING") return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    if (name == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void Logger::init(const LoggingConfig& config, LogLevel level) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_output) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(console_sink);
        }

        if (config.file_output && !config.file_path.empty()) {
            std::filesystem::path log_path(config.file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path,
                static_cast<size_t>(config.max_file_size_mb) * 1024 * 1024,
                static_cast<size_t>(config.max_backup_files));
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        if (spdlog::get(kLoggerName)) {
            spdlog::drop(kLoggerName);
        }
        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(level));
        logger_->flush_on(spdlog::level::warn);
        current_level_ = level;

        spdlog::register_logger(logger_);
        spdlog::flush_every(std::chrono::seconds(3));

        logger_->info("Logger initialized");
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        throw;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (logger_) {
        logger_->flush();
        spdlog::drop(kLoggerName);
        logger_ = nullptr;
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!logger_) {
        logger_ = spdlog::get(kLoggerName);
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt(kLoggerName);
            logger_->set_level(to_spdlog_level(current_level_));
        }
    }
    return logger_;
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
    get()->set_level(to_spdlog_level(level));
}

LogLevel Logger::get_level() {
    return current_level_;
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

void TradingLogger::log_opportunity(const std::string& sell_symbol, const std::string& buy_symbol,
                                    double sell_price, double buy_price, double spread_percentage) {
    XARB_LOG_INFO("OPPORTUNITY sell={}@{:.6f} buy={}@{:.6f} spread={:.4f}%",
                  sell_symbol, sell_price, buy_symbol, buy_price, spread_percentage);
}

void TradingLogger::log_risk_rejection(const std::string& reason, const std::string& detail) {
    XARB_LOG_INFO("RISK_REJECT reason={} {}", reason, detail);
}

void TradingLogger::log_leg_filled(const std::string& attempt_id, const std::string& side,
                                   const std::string& symbol, double filled_amount, double filled_price) {
    XARB_LOG_INFO("LEG_FILLED attempt={} side={} symbol={} amount={:.6f} price={:.6f}",
                  attempt_id, side, symbol, filled_amount, filled_price);
}

void TradingLogger::log_attempt_finished(const std::string& attempt_id, const std::string& status,
                                         double realized_pnl) {
    XARB_LOG_INFO("ATTEMPT_FINISHED attempt={} status={} pnl={:.6f}", attempt_id, status, realized_pnl);
}

void TradingLogger::log_risk_alert(const std::string& alert_type, const std::string& description) {
    XARB_LOG_CRITICAL("RISK_ALERT type={} {}", alert_type, description);
}

} // namespace xarb
