#include "trade_executor.hpp"
#include <algorithm>
#include <cmath>
#include <thread>
#include "exceptions.hpp"
#include "../utils/logger.hpp"

namespace xarb {

TradeExecutor::TradeExecutor(std::shared_ptr<OrderGateway> gateway,
                             BalanceLedger& ledger,
                             const MarketsConfig& markets,
                             const ArbitrageConfig& config,
                             ClockFn clock,
                             SleepFn sleep)
    : gateway_(std::move(gateway)),
      ledger_(ledger),
      markets_(markets),
      config_(config),
      clock_(std::move(clock)),
      sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
}

double TradeExecutor::sell_limit_price(double quoted_price) const {
    return quoted_price * (1.0 - config_.price_buffer);
}

double TradeExecutor::buy_limit_price(double quoted_price) const {
    return quoted_price * (1.0 + config_.price_buffer);
}

double TradeExecutor::slippage(double quoted_price, double filled_price, OrderSide side) {
    if (quoted_price <= 0.0) {
        return 0.0;
    }
    double shortfall = side == OrderSide::SELL ? quoted_price - filled_price : filled_price - quoted_price;
    return shortfall / quoted_price;
}

TradeAttempt TradeExecutor::plan(const TradeCandidate& candidate, double amount) {
    TradeAttempt attempt;
    attempt.detected_at = candidate.snapshot.computed_at;
    attempt.id = "T" + std::to_string(to_epoch_ms(attempt.detected_at)) + "-" + std::to_string(++sequence_);
    attempt.sell_market = candidate.sell_market;
    attempt.buy_market = candidate.buy_market;
    attempt.requested_amount = amount;
    attempt.expected_spread_percentage = candidate.snapshot.spread_percentage;
    attempt.quoted_sell_price = candidate.sell_price;
    attempt.quoted_buy_price = candidate.buy_price;

    attempt.sell_leg.side = OrderSide::SELL;
    attempt.sell_leg.market = candidate.sell_market;
    attempt.sell_leg.currency_pair = market_spec(markets_, candidate.sell_market).symbol;
    attempt.sell_leg.requested_amount = amount;
    attempt.sell_leg.requested_price = sell_limit_price(candidate.sell_price);

    attempt.buy_leg.side = OrderSide::BUY;
    attempt.buy_leg.market = candidate.buy_market;
    attempt.buy_leg.currency_pair = market_spec(markets_, candidate.buy_market).symbol;
    attempt.buy_leg.requested_amount = amount;
    attempt.buy_leg.requested_price = buy_limit_price(candidate.buy_price);
    return attempt;
}

TradeAttempt TradeExecutor::execute(TradeAttempt attempt) {
    if (attempt.state != TradeState::PLANNED) {
        throw TradingError("attempt " + attempt.id + " is " + to_string(attempt.state) + ", expected planned");
    }

    const std::string& asset = markets_.asset;
    const std::string& sell_quote = market_spec(markets_, attempt.sell_market).quote_currency;
    const std::string& buy_quote = market_spec(markets_, attempt.buy_market).quote_currency;
    const double fee = config_.taker_fee_rate;

    // Sell leg
    attempt.transition_to(TradeState::SELLING, clock_(),
                          "selling " + std::to_string(attempt.sell_leg.requested_amount) + " " + asset);
    auto sell_reservation = ledger_.reserve(asset, attempt.sell_leg.requested_amount);
    if (sell_reservation.is_error()) {
        fail_sell(attempt, "reserve " + asset + ": " + to_string(sell_reservation.error()));
        return attempt;
    }

    attempt.sell_leg.state = LegState::SUBMITTED;
    attempt.sell_leg.attempts = 1;
    auto sell_fill = submit(make_request(attempt, attempt.sell_leg));
    if (sell_fill.is_error() || sell_fill.value().filled_amount <= LEDGER_EPSILON) {
        ledger_.release(sell_reservation.value());
        fail_sell(attempt, sell_fill.is_error() ? sell_fill.error() : "sell order did not fill");
        return attempt;
    }

    double sold = sell_fill.value().filled_amount;
    if (sold > attempt.sell_leg.requested_amount + LEDGER_EPSILON) {
        XARB_LOG_WARN("Attempt {} sell overfilled {} of {}, capping", attempt.id, sold,
                      attempt.sell_leg.requested_amount);
        attempt.requires_reconciliation = true;
    }
    sold = std::min(sold, attempt.sell_leg.requested_amount);
    const double sell_price = sell_fill.value().filled_price;
    const double proceeds = sold * sell_price * (1.0 - fee);

    ledger_.settle_spend(sell_reservation.value(), sold);
    ledger_.settle_receive(sell_quote, proceeds);

    attempt.sell_leg.filled_amount = sold;
    attempt.sell_leg.filled_price = sell_price;
    attempt.sell_leg.state = LegState::FILLED;
    attempt.sell_slippage = slippage(attempt.quoted_sell_price, sell_price, OrderSide::SELL);
    TradingLogger::log_leg_filled(attempt.id, "sell", attempt.sell_leg.currency_pair, sold, sell_price);
    attempt.transition_to(TradeState::SELL_FILLED, clock_(),
                          "sold " + std::to_string(sold) + " for " + std::to_string(proceeds) + " " + sell_quote);

    // Buy leg, sized to what was actually sold
    attempt.buy_leg.requested_amount = sold;
    const double buy_budget = sold * attempt.buy_leg.requested_price * (1.0 + fee);
    attempt.transition_to(TradeState::BUYING, clock_(),
                          "buying " + std::to_string(sold) + " " + asset + " with up to " +
                          std::to_string(buy_budget) + " " + buy_quote);

    auto buy_reservation = ledger_.reserve(buy_quote, buy_budget);
    if (buy_reservation.is_error()) {
        fail_buy(attempt, "reserve " + buy_quote + ": " + to_string(buy_reservation.error()));
        return attempt;
    }

    OrderFill buy_fill;
    if (!run_buy_leg(attempt, buy_reservation.value(), buy_fill)) {
        return attempt;
    }

    double bought = buy_fill.filled_amount;
    if (bought > sold + LEDGER_EPSILON) {
        XARB_LOG_WARN("Attempt {} buy overfilled {} of {}", attempt.id, bought, sold);
        attempt.requires_reconciliation = true;
    }
    const double buy_price = buy_fill.filled_price;
    const double cost = bought * buy_price * (1.0 + fee);

    if (cost > buy_reservation.value().amount + LEDGER_EPSILON) {
        XARB_LOG_ERROR("Attempt {} buy cost {} exceeds reserved {} {}", attempt.id, cost,
                       buy_reservation.value().amount, buy_quote);
        ledger_.settle_spend(buy_reservation.value());
        attempt.requires_reconciliation = true;
    } else {
        ledger_.settle_spend(buy_reservation.value(), cost);
    }
    ledger_.settle_receive(asset, bought);

    attempt.buy_leg.filled_amount = bought;
    attempt.buy_leg.filled_price = buy_price;
    attempt.buy_leg.state = LegState::FILLED;
    attempt.buy_slippage = slippage(attempt.quoted_buy_price, buy_price, OrderSide::BUY);
    TradingLogger::log_leg_filled(attempt.id, "buy", attempt.buy_leg.currency_pair, bought, buy_price);

    attempt.realized_profit_loss = proceeds - cost;
    attempt.inventory_drift = bought - sold;
    if (std::fabs(attempt.inventory_drift) > config_.inventory_tolerance * sold) {
        XARB_LOG_WARN("Attempt {} inventory drift {} {} exceeds tolerance", attempt.id,
                      attempt.inventory_drift, asset);
    }

    attempt.status = AttemptStatus::COMPLETED;
    attempt.transition_to(TradeState::COMPLETED, clock_(),
                          "pnl " + std::to_string(attempt.realized_profit_loss));
    TradingLogger::log_attempt_finished(attempt.id, to_string(attempt.status), attempt.realized_profit_loss);
    return attempt;
}

bool TradeExecutor::run_buy_leg(TradeAttempt& attempt, const Reservation& reservation, OrderFill& fill) {
    const int limit = std::max(1, config_.buy_retry_limit);
    while (true) {
        attempt.buy_leg.state = LegState::SUBMITTED;
        ++attempt.buy_leg.attempts;
        auto result = submit(make_request(attempt, attempt.buy_leg));
        if (result.is_success() && result.value().filled_amount > LEDGER_EPSILON) {
            fill = result.value();
            return true;
        }

        std::string error = result.is_error() ? result.error() : "buy order did not fill";
        attempt.buy_leg.error = error;
        if (attempt.buy_leg.attempts >= limit) {
            ledger_.release(reservation);
            fail_buy(attempt, error + " after " + std::to_string(attempt.buy_leg.attempts) + " submissions");
            return false;
        }

        auto backoff = backoff_for(attempt.buy_leg.attempts);
        XARB_LOG_WARN("Attempt {} buy submission {}/{} failed: {}; retrying in {} ms", attempt.id,
                      attempt.buy_leg.attempts, limit, error, backoff.count());
        sleep_(backoff);
    }
}

std::chrono::milliseconds TradeExecutor::backoff_for(int submissions) const {
    int exponent = std::max(0, std::min(submissions - 1, 16));
    return std::chrono::milliseconds(static_cast<int64_t>(config_.retry_backoff_ms) << exponent);
}

void TradeExecutor::fail_sell(TradeAttempt& attempt, const std::string& error) {
    attempt.sell_leg.state = LegState::FAILED;
    attempt.sell_leg.error = error;
    attempt.realized_profit_loss = 0.0;
    attempt.status = AttemptStatus::ABORTED;
    attempt.transition_to(TradeState::SELL_FAILED, clock_(), error);
    XARB_LOG_WARN("Attempt {} aborted, sell leg failed: {}", attempt.id, error);
    TradingLogger::log_attempt_finished(attempt.id, to_string(attempt.status), 0.0);
}

void TradeExecutor::fail_buy(TradeAttempt& attempt, const std::string& error) {
    attempt.buy_leg.state = LegState::FAILED;
    attempt.buy_leg.error = error;
    attempt.realized_profit_loss = 0.0;
    attempt.inventory_drift = -attempt.sell_leg.filled_amount;
    attempt.requires_reconciliation = true;
    attempt.status = AttemptStatus::PARTIAL;
    attempt.transition_to(TradeState::BUY_FAILED, clock_(), error);
    TradingLogger::log_risk_alert("PARTIAL_ATTEMPT",
                                  "attempt " + attempt.id + " sold " +
                                  std::to_string(attempt.sell_leg.filled_amount) + " " + markets_.asset +
                                  " but the buy leg failed: " + error);
    TradingLogger::log_attempt_finished(attempt.id, to_string(attempt.status), 0.0);
}

OrderRequest TradeExecutor::make_request(const TradeAttempt& attempt, const OrderLeg& leg) const {
    OrderRequest request;
    request.client_order_id = attempt.id + (leg.side == OrderSide::SELL ? "-S" : "-B") + std::to_string(leg.attempts);
    request.market = leg.market;
    request.symbol = leg.currency_pair;
    request.side = leg.side;
    request.amount = leg.requested_amount;
    request.limit_price = leg.requested_price;
    return request;
}

Result<OrderFill> TradeExecutor::submit(const OrderRequest& request) {
    auto gateway = gateway_;
    auto result = pool_.call_with_timeout([gateway, request]() { return gateway->submit_order(request); },
                                          std::chrono::milliseconds(config_.order_timeout_ms));
    if (result.is_error()) {
        return result;
    }

    const OrderFill& fill = result.value();
    if (!std::isfinite(fill.filled_amount) || fill.filled_amount < 0.0) {
        return Result<OrderFill>::error("invalid filled amount " + std::to_string(fill.filled_amount));
    }
    if (fill.filled_amount > LEDGER_EPSILON && (!std::isfinite(fill.filled_price) || fill.filled_price <= 0.0)) {
        return Result<OrderFill>::error("invalid fill price " + std::to_string(fill.filled_price));
    }
    return result;
}

} // namespace xarb
