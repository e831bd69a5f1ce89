#include "arbitrage_engine.hpp"
#include <algorithm>
#include "exceptions.hpp"
#include "../utils/logger.hpp"

namespace xarb {

std::string to_string(TickOutcome outcome) {
    switch (outcome) {
        case TickOutcome::HALTED: return "halted";
        case TickOutcome::NO_DATA: return "no_data";
        case TickOutcome::STALE: return "stale";
        case TickOutcome::REJECTED: return "rejected";
        case TickOutcome::EXECUTED: return "executed";
    }
    return "unknown";
}

ArbitrageEngine::ArbitrageEngine(PriceMonitor* price_monitor,
                                 BalanceLedger* ledger,
                                 const RiskController* risk_controller,
                                 TradeExecutor* trade_executor,
                                 TradeStore* store,
                                 const MarketsConfig& markets,
                                 const ArbitrageConfig& arbitrage_config,
                                 const RiskManagementConfig& risk_config,
                                 ClockFn clock)
    : price_monitor_(price_monitor),
      ledger_(ledger),
      risk_controller_(risk_controller),
      trade_executor_(trade_executor),
      store_(store),
      markets_(markets),
      arbitrage_config_(arbitrage_config),
      risk_config_(risk_config),
      clock_(std::move(clock)) {
    try {
        last_finished_at_ = store_->last_attempt_finished_at();
        auto unresolved = store_->unresolved_attempt_ids();
        if (!unresolved.empty()) {
            halt("unresolved partial attempt " + unresolved.front() + " from a previous run");
        }
    } catch (const DatabaseError& e) {
        XARB_LOG_ERROR("Failed to read trade store: {}", e.what());
        halt(std::string("store failure: ") + e.what());
    }
}

ArbitrageEngine::~ArbitrageEngine() {
    stop();
}

void ArbitrageEngine::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&ArbitrageEngine::run, this);
    XARB_LOG_INFO("Arbitrage engine started, tick every {} ms", arbitrage_config_.tick_interval_ms);
}

void ArbitrageEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    XARB_LOG_INFO("Arbitrage engine stopped");
}

void ArbitrageEngine::run() {
    const auto interval = std::chrono::milliseconds(arbitrage_config_.tick_interval_ms);
    while (running_) {
        TickResult result = tick();
        XARB_LOG_TRACE("Tick finished: {}", to_string(result.outcome));

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, interval, [this] { return !running_; });
    }
}

TickResult ArbitrageEngine::tick() {
    std::lock_guard<std::mutex> lock(tick_mutex_);

    if (halted_) {
        return TickResult{TickOutcome::HALTED, std::nullopt, std::nullopt};
    }

    auto snapshot = price_monitor_->latest_spread();
    if (!snapshot) {
        return TickResult{TickOutcome::NO_DATA, std::nullopt, std::nullopt};
    }

    const Timestamp now = clock_();
    if (snapshot->is_stale(now, risk_controller_->limits().freshness_bound)) {
        XARB_LOG_DEBUG("Skipping tick, quotes are {} ms and {} ms old",
                       snapshot->quote_a.age(now).count(), snapshot->quote_b.age(now).count());
        return TickResult{TickOutcome::STALE, std::nullopt, std::nullopt};
    }

    const Market sell_market = snapshot->higher_market();
    const Market buy_market = snapshot->lower_market();
    TradeCandidate candidate{*snapshot, sell_market, buy_market, arbitrage_config_.nominal_trade_amount,
                             snapshot->quote_for(sell_market).price, snapshot->quote_for(buy_market).price};

    try {
        RiskState risk_state = build_risk_state(buy_market, now);
        Verdict verdict = risk_controller_->evaluate(candidate, risk_state);
        record_opportunity(candidate, verdict);

        if (!verdict.approved) {
            TradingLogger::log_risk_rejection(to_string(verdict.reason), verdict.detail);
            {
                std::lock_guard<std::mutex> state_lock(state_mutex_);
                last_rejection_ = verdict;
            }
            return TickResult{TickOutcome::REJECTED, verdict, std::nullopt};
        }

        TradeAttempt attempt = trade_executor_->execute(trade_executor_->plan(candidate, verdict.approved_amount));
        last_finished_at_ = attempt.finished_at.value_or(clock_());
        try {
            finish_attempt(attempt);
        } catch (const DatabaseError& e) {
            halt(std::string("store failure: ") + e.what());
        }
        return TickResult{TickOutcome::EXECUTED, verdict, attempt};
    } catch (const DatabaseError& e) {
        XARB_LOG_ERROR("Trade store failure: {}", e.what());
        halt(std::string("store failure: ") + e.what());
        return TickResult{TickOutcome::HALTED, std::nullopt, std::nullopt};
    }
}

void ArbitrageEngine::finish_attempt(const TradeAttempt& attempt) {
    if (attempt.status == AttemptStatus::PARTIAL) {
        halt("unresolved partial attempt " + attempt.id);
    }

    try {
        store_->save_attempt(attempt);
        store_->save_balance_snapshot(ledger_->snapshot(), clock_());
    } catch (const DatabaseError& e) {
        XARB_LOG_CRITICAL("Attempt {} could not be persisted: {} record={}", attempt.id, e.what(),
                          nlohmann::json(attempt).dump());
        throw;
    }

    double pnl_today = store_->realized_pnl_since(day_start(clock_()));
    if (pnl_today < -risk_config_.max_daily_loss) {
        TradingLogger::log_risk_alert("DAILY_LOSS_LIMIT",
                                      "realized pnl today " + std::to_string(pnl_today) + " below -" +
                                      std::to_string(risk_config_.max_daily_loss));
        halt("daily loss limit reached");
    }
}

void ArbitrageEngine::record_opportunity(const TradeCandidate& candidate, const Verdict& verdict) {
    if (candidate.snapshot.spread_percentage < risk_controller_->minimum_spread_percentage()) {
        return;
    }
    TradingLogger::log_opportunity(market_spec(markets_, candidate.sell_market).symbol,
                                   market_spec(markets_, candidate.buy_market).symbol,
                                   candidate.sell_price, candidate.buy_price,
                                   candidate.snapshot.spread_percentage);
    store_->record_opportunity(OpportunityRecord{
        candidate.snapshot.computed_at, candidate.sell_market, candidate.buy_market,
        candidate.sell_price, candidate.buy_price, candidate.snapshot.spread_percentage,
        candidate.requested_amount, verdict.approved, verdict.reason});
}

RiskState ArbitrageEngine::build_risk_state(Market buy_market, Timestamp now) const {
    RiskState state;
    state.as_of = now;
    state.volume_traded_today = store_->volume_traded_since(day_start(now));
    state.current_volatility_estimate = current_volatility();
    state.success_rate_recent = store_->recent_success_rate(arbitrage_config_.success_rate_window);
    state.cooldown_remaining = cooldown_remaining(now);
    state.free_asset_balance = ledger_->free(markets_.asset);
    state.free_buy_quote_balance = ledger_->free(market_spec(markets_, buy_market).quote_currency);
    return state;
}

double ArbitrageEngine::current_volatility() const {
    return std::max(price_monitor_->volatility(Market::PAIR_A), price_monitor_->volatility(Market::PAIR_B));
}

std::chrono::milliseconds ArbitrageEngine::cooldown_remaining(Timestamp now) const {
    if (!last_finished_at_) {
        return std::chrono::milliseconds(0);
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - *last_finished_at_);
    auto remaining = std::chrono::milliseconds(std::chrono::seconds(risk_config_.cooldown_sec)) - elapsed;
    return std::max(remaining, std::chrono::milliseconds(0));
}

Timestamp ArbitrageEngine::day_start(Timestamp now) const {
    constexpr int64_t ms_per_day = 24LL * 60 * 60 * 1000;
    int64_t ms = to_epoch_ms(now);
    return from_epoch_ms(ms - ms % ms_per_day);
}

void ArbitrageEngine::halt(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        halt_reason_ = reason;
    }
    halted_ = true;
    XARB_LOG_CRITICAL("Trading halted: {}", reason);
}

std::string ArbitrageEngine::halt_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return halt_reason_;
}

bool ArbitrageEngine::acknowledge_halt() {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    if (!halted_) {
        return true;
    }

    try {
        for (const auto& id : store_->unresolved_attempt_ids()) {
            store_->mark_reconciled(id);
            XARB_LOG_INFO("Attempt {} marked reconciled", id);
        }
    } catch (const DatabaseError& e) {
        XARB_LOG_ERROR("Could not acknowledge halt: {}", e.what());
        return false;
    }

    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        XARB_LOG_WARN("Halt acknowledged ({}), trading resumes", halt_reason_);
        halt_reason_.clear();
    }
    halted_ = false;
    return true;
}

std::optional<SpreadSnapshot> ArbitrageEngine::latest_spread() const {
    return price_monitor_->latest_spread();
}

std::optional<Quote> ArbitrageEngine::quote(Market market) const {
    return price_monitor_->quote(market);
}

std::map<std::string, Balance> ArbitrageEngine::balances() const {
    return ledger_->snapshot();
}

std::vector<TradeAttempt> ArbitrageEngine::recent_attempts(size_t limit) const {
    return store_->recent_attempts(limit);
}

TradeStatistics ArbitrageEngine::statistics() const {
    TradeStatistics stats = store_->statistics(day_start(clock_()));
    stats.current_volatility = current_volatility();
    return stats;
}

std::optional<Verdict> ArbitrageEngine::last_rejection() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_rejection_;
}

} // namespace xarb
