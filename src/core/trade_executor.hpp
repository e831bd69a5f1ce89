#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include "balance_ledger.hpp"
#include "order_gateway.hpp"
#include "result.hpp"
#include "types.hpp"
#include "../utils/config_types.hpp"
#include "../utils/thread_pool.hpp"

namespace xarb {

// Drives one attempt through the sell-first state machine:
//   PLANNED -> SELLING -> SELL_FILLED -> BUYING -> COMPLETED
// with SELLING -> SELL_FAILED (ABORTED, ledger untouched) and
// BUYING -> BUY_FAILED (PARTIAL, flagged for reconciliation) after the buy
// retries run out. The buy leg is never submitted before the sell fill.
class TradeExecutor {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    TradeExecutor(std::shared_ptr<OrderGateway> gateway,
                  BalanceLedger& ledger,
                  const MarketsConfig& markets,
                  const ArbitrageConfig& config,
                  ClockFn clock = &Clock::now,
                  SleepFn sleep = SleepFn());
    virtual ~TradeExecutor() = default;

    TradeExecutor(const TradeExecutor&) = delete;
    TradeExecutor& operator=(const TradeExecutor&) = delete;

    // Builds a PLANNED attempt with both legs priced at their buffered limits.
    TradeAttempt plan(const TradeCandidate& candidate, double amount);

    // Runs a PLANNED attempt to a terminal state and returns it.
    virtual TradeAttempt execute(TradeAttempt attempt);

    double sell_limit_price(double quoted_price) const;
    double buy_limit_price(double quoted_price) const;

    static double slippage(double quoted_price, double filled_price, OrderSide side);

private:
    Result<OrderFill> submit(const OrderRequest& request);
    OrderRequest make_request(const TradeAttempt& attempt, const OrderLeg& leg) const;

    void fail_sell(TradeAttempt& attempt, const std::string& error);
    void fail_buy(TradeAttempt& attempt, const std::string& error);
    bool run_buy_leg(TradeAttempt& attempt, const Reservation& reservation, OrderFill& fill);

    std::chrono::milliseconds backoff_for(int submissions) const;

    std::shared_ptr<OrderGateway> gateway_;
    BalanceLedger& ledger_;
    MarketsConfig markets_;
    ArbitrageConfig config_;
    ClockFn clock_;
    SleepFn sleep_;
    std::atomic<uint64_t> sequence_{0};

    // Two hung submissions exhaust the pool; later ones fail without reaching the gateway.
    ThreadPool pool_{2};
};

} // namespace xarb
