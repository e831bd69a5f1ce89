#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>

#include "core/arbitrage_engine.hpp"
#include "core/balance_ledger.hpp"
#include "core/exceptions.hpp"
#include "core/price_monitor.hpp"
#include "core/risk_controller.hpp"
#include "core/trade_executor.hpp"
#include "data/database_manager.hpp"
#include "exchange/simulated_exchange.hpp"
#include "utils/config_manager.hpp"
#include "utils/logger.hpp"

namespace {

std::atomic<bool> g_running{true};

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

void log_status(const xarb::ArbitrageEngine& engine) {
    if (auto spread = engine.latest_spread()) {
        XARB_LOG_INFO("Spread {:.4f}% (A {:.6f}, B {:.6f})", spread->spread_percentage,
                      spread->quote_a.price, spread->quote_b.price);
    } else {
        XARB_LOG_INFO("Spread unavailable");
    }

    for (const auto& [currency, balance] : engine.balances()) {
        XARB_LOG_INFO("Balance {} free={:.6f} locked={:.6f}", currency, balance.free, balance.locked);
    }

    try {
        auto stats = engine.statistics();
        XARB_LOG_INFO("Attempts {} (completed {}, aborted {}, partial {}), pnl {:.6f}, today {:.6f}, "
                      "volume today {:.2f}, volatility {:.4f}%",
                      stats.total_attempts, stats.completed, stats.aborted, stats.partial,
                      stats.realized_pnl, stats.realized_pnl_today, stats.volume_today,
                      stats.current_volatility);
    } catch (const xarb::DatabaseError& e) {
        XARB_LOG_ERROR("Statistics unavailable: {}", e.what());
    }

    if (auto rejection = engine.last_rejection()) {
        XARB_LOG_INFO("Last rejection: {} {}", xarb::to_string(rejection->reason), rejection->detail);
    }
    if (engine.is_halted()) {
        XARB_LOG_WARN("Trading halted: {}", engine.halt_reason());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const std::string config_path = argc > 1 ? argv[1] : "config/settings.json";

    try {
        xarb::ConfigManager config_manager;
        if (!config_manager.load(config_path)) {
            throw xarb::ConfigurationError("failed to load " + config_path);
        }

        xarb::Logger::init(config_manager.get_logging_config(),
                           xarb::parse_log_level(config_manager.get_app_config().log_level));
        XARB_LOG_INFO("Starting {} {}", config_manager.get_app_config().name,
                      config_manager.get_app_config().version);

        const auto& markets = config_manager.get_markets_config();
        const auto& monitor_config = config_manager.get_monitor_config();
        const auto& arbitrage_config = config_manager.get_arbitrage_config();
        const auto& risk_config = config_manager.get_risk_management_config();

        const std::string& db_path = config_manager.get_database_config().path;
        std::filesystem::path db_file(db_path);
        if (db_path != ":memory:" && db_file.has_parent_path()) {
            std::filesystem::create_directories(db_file.parent_path());
        }
        auto db_manager = std::make_unique<xarb::DatabaseManager>(db_path);
        if (!db_manager->open()) {
            throw xarb::DatabaseError("failed to open " + db_path);
        }

        auto ledger = std::make_unique<xarb::BalanceLedger>(config_manager.get_balances_config().initial);
        if (auto persisted = db_manager->load_latest_balances()) {
            ledger->load(*persisted);
            XARB_LOG_INFO("Restored {} balances from the last snapshot", persisted->size());
        } else {
            XARB_LOG_INFO("No balance snapshot found, using configured balances");
        }

        auto exchange = std::make_shared<xarb::SimulatedExchange>(config_manager.get_simulation_config());
        auto price_monitor = std::make_unique<xarb::PriceMonitor>(exchange, markets, monitor_config);
        auto risk_controller = std::make_unique<xarb::RiskController>(
            xarb::RiskLimits::from_config(risk_config, arbitrage_config, monitor_config));
        auto trade_executor = std::make_unique<xarb::TradeExecutor>(exchange, *ledger, markets, arbitrage_config);
        auto engine = std::make_unique<xarb::ArbitrageEngine>(
            price_monitor.get(), ledger.get(), risk_controller.get(), trade_executor.get(), db_manager.get(),
            markets, arbitrage_config, risk_config);

        price_monitor->start();
        engine->start();
        XARB_LOG_INFO("Trading {} on {} and {}", markets.asset, markets.market_a.symbol, markets.market_b.symbol);

        const auto status_interval = std::chrono::seconds(config_manager.get_app_config().status_interval_sec);
        auto next_status = std::chrono::steady_clock::now() + status_interval;
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            if (std::chrono::steady_clock::now() >= next_status) {
                log_status(*engine);
                next_status += status_interval;
            }
        }

        XARB_LOG_INFO("Shutdown signal received, stopping components...");
        engine->stop();
        price_monitor->stop();
        log_status(*engine);
        XARB_LOG_INFO("Shut down gracefully");
    } catch (const xarb::XarbException& e) {
        XARB_LOG_CRITICAL("{}", e.what());
        xarb::Logger::shutdown();
        return 1;
    } catch (const std::exception& e) {
        XARB_LOG_CRITICAL("Fatal error: {}", e.what());
        xarb::Logger::shutdown();
        return 1;
    }

    xarb::Logger::shutdown();
    return 0;
}
