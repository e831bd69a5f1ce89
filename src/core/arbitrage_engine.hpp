#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "balance_ledger.hpp"
#include "price_monitor.hpp"
#include "risk_controller.hpp"
#include "trade_executor.hpp"
#include "types.hpp"
#include "../data/trade_store.hpp"
#include "../utils/config_types.hpp"

namespace xarb {

enum class TickOutcome {
    HALTED,
    NO_DATA,
    STALE,
    REJECTED,
    EXECUTED
};

std::string to_string(TickOutcome outcome);

struct TickResult {
    TickOutcome outcome;
    std::optional<Verdict> verdict;
    std::optional<TradeAttempt> attempt;
};

// The control loop. Ticks are serialized, so at most one attempt is ever in
// flight and the next one starts only after the previous one is terminal.
// A partial attempt, a store failure or the daily loss limit halts trading
// until acknowledge_halt().
class ArbitrageEngine {
public:
    ArbitrageEngine(PriceMonitor* price_monitor,
                    BalanceLedger* ledger,
                    const RiskController* risk_controller,
                    TradeExecutor* trade_executor,
                    TradeStore* store,
                    const MarketsConfig& markets,
                    const ArbitrageConfig& arbitrage_config,
                    const RiskManagementConfig& risk_config,
                    ClockFn clock = &Clock::now);
    ~ArbitrageEngine();

    ArbitrageEngine(const ArbitrageEngine&) = delete;
    ArbitrageEngine& operator=(const ArbitrageEngine&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

    TickResult tick();

    bool is_halted() const { return halted_; }
    std::string halt_reason() const;
    // Marks unresolved partial attempts reconciled and resumes trading.
    bool acknowledge_halt();

    std::optional<SpreadSnapshot> latest_spread() const;
    std::optional<Quote> quote(Market market) const;
    std::map<std::string, Balance> balances() const;
    std::vector<TradeAttempt> recent_attempts(size_t limit) const;
    TradeStatistics statistics() const;
    std::optional<Verdict> last_rejection() const;

private:
    void run();
    void halt(const std::string& reason);
    RiskState build_risk_state(Market buy_market, Timestamp now) const;
    double current_volatility() const;
    std::chrono::milliseconds cooldown_remaining(Timestamp now) const;
    void record_opportunity(const TradeCandidate& candidate, const Verdict& verdict);
    void finish_attempt(const TradeAttempt& attempt);
    Timestamp day_start(Timestamp now) const;

    PriceMonitor* price_monitor_;
    BalanceLedger* ledger_;
    const RiskController* risk_controller_;
    TradeExecutor* trade_executor_;
    TradeStore* store_;
    MarketsConfig markets_;
    ArbitrageConfig arbitrage_config_;
    RiskManagementConfig risk_config_;
    ClockFn clock_;

    std::mutex tick_mutex_;
    std::optional<Timestamp> last_finished_at_;

    mutable std::mutex state_mutex_;
    std::atomic<bool> halted_{false};
    std::string halt_reason_;
    std::optional<Verdict> last_rejection_;

    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::thread thread_;
};

} // namespace xarb
