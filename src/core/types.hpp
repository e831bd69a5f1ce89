#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../utils/config_types.hpp"

namespace xarb {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using ClockFn = std::function<Timestamp()>;

constexpr double LEDGER_EPSILON = 1e-9;

int64_t to_epoch_ms(Timestamp ts);
Timestamp from_epoch_ms(int64_t ms);

enum class Market {
    PAIR_A,
    PAIR_B
};

enum class OrderSide {
    SELL,
    BUY
};

enum class LegState {
    PENDING,
    SUBMITTED,
    FILLED,
    FAILED
};

enum class TradeState {
    PLANNED,
    SELLING,
    SELL_FILLED,
    BUYING,
    COMPLETED,
    SELL_FAILED,
    BUY_FAILED
};

enum class AttemptStatus {
    PENDING,
    COMPLETED,
    ABORTED,
    PARTIAL
};

enum class RejectReason {
    NONE,
    SPREAD_TOO_SMALL,
    STALE_PRICE,
    DAILY_LIMIT_EXCEEDED,
    INSUFFICIENT_SAFETY_MARGIN,
    VOLATILITY_TOO_HIGH,
    COOLDOWN_ACTIVE
};

NLOHMANN_JSON_SERIALIZE_ENUM(Market, {
    {Market::PAIR_A, "pair_a"},
    {Market::PAIR_B, "pair_b"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(OrderSide, {
    {OrderSide::SELL, "sell"},
    {OrderSide::BUY, "buy"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(LegState, {
    {LegState::PENDING, "pending"},
    {LegState::SUBMITTED, "submitted"},
    {LegState::FILLED, "filled"},
    {LegState::FAILED, "failed"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(TradeState, {
    {TradeState::PLANNED, "planned"},
    {TradeState::SELLING, "selling"},
    {TradeState::SELL_FILLED, "sell_filled"},
    {TradeState::BUYING, "buying"},
    {TradeState::COMPLETED, "completed"},
    {TradeState::SELL_FAILED, "sell_failed"},
    {TradeState::BUY_FAILED, "buy_failed"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(AttemptStatus, {
    {AttemptStatus::PENDING, "pending"},
    {AttemptStatus::COMPLETED, "completed"},
    {AttemptStatus::ABORTED, "aborted"},
    {AttemptStatus::PARTIAL, "partial"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(RejectReason, {
    {RejectReason::NONE, ""},
    {RejectReason::SPREAD_TOO_SMALL, "spread_too_small"},
    {RejectReason::STALE_PRICE, "stale_price"},
    {RejectReason::DAILY_LIMIT_EXCEEDED, "daily_limit_exceeded"},
    {RejectReason::INSUFFICIENT_SAFETY_MARGIN, "insufficient_safety_margin"},
    {RejectReason::VOLATILITY_TOO_HIGH, "volatility_too_high"},
    {RejectReason::COOLDOWN_ACTIVE, "cooldown_active"},
})

std::string to_string(Market market);
std::string to_string(OrderSide side);
std::string to_string(LegState state);
std::string to_string(TradeState state);
std::string to_string(AttemptStatus status);
std::string to_string(RejectReason reason);

Market other_market(Market market);
bool is_terminal(TradeState state);

const MarketSpec& market_spec(const MarketsConfig& markets, Market market);

struct Quote {
    Market market;
    double price;
    Timestamp timestamp;
    std::optional<double> volume;

    std::chrono::milliseconds age(Timestamp now) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - timestamp);
    }
};

struct SpreadSnapshot {
    Quote quote_a;
    Quote quote_b;
    double spread_absolute = 0.0;
    double spread_percentage = 0.0;
    Timestamp computed_at;

    // spread_percentage = |a - b| / min(a, b) * 100
    static SpreadSnapshot from_quotes(const Quote& quote_a, const Quote& quote_b, Timestamp computed_at);

    const Quote& quote_for(Market market) const;
    Market higher_market() const;
    Market lower_market() const;

    // Stale when either quote is older than the bound.
    bool is_stale(Timestamp now, std::chrono::milliseconds freshness_bound) const;
};

struct Balance {
    std::string currency;
    double free = 0.0;
    double locked = 0.0;

    double total() const { return free + locked; }
};

struct Reservation {
    uint64_t id = 0;
    std::string currency;
    double amount = 0.0;
};

struct OrderLeg {
    OrderSide side = OrderSide::SELL;
    Market market = Market::PAIR_A;
    std::string currency_pair;
    double requested_amount = 0.0;
    double requested_price = 0.0;
    double filled_amount = 0.0;
    double filled_price = 0.0;
    LegState state = LegState::PENDING;
    std::string error;
    int attempts = 0;
};

struct StateTransition {
    TradeState from;
    TradeState to;
    Timestamp at;
    std::string note;
};

struct TradeAttempt {
    std::string id;
    Timestamp detected_at;
    std::optional<Timestamp> finished_at;
    Market sell_market = Market::PAIR_A;
    Market buy_market = Market::PAIR_B;
    double requested_amount = 0.0;
    double expected_spread_percentage = 0.0;
    // Prices seen on the book when the candidate was built, before the limit buffer.
    double quoted_sell_price = 0.0;
    double quoted_buy_price = 0.0;
    TradeState state = TradeState::PLANNED;
    AttemptStatus status = AttemptStatus::PENDING;
    OrderLeg sell_leg;
    OrderLeg buy_leg;
    double realized_profit_loss = 0.0;
    double inventory_drift = 0.0;
    // Fractional price shortfall per leg against the quote, positive when
    // adverse. A leg that never filled counts as 0.
    double sell_slippage = 0.0;
    double buy_slippage = 0.0;
    bool requires_reconciliation = false;
    RejectReason rejection_reason = RejectReason::NONE;
    std::vector<StateTransition> transitions;

    void transition_to(TradeState next, Timestamp at, const std::string& note = "");
};

struct TradeCandidate {
    SpreadSnapshot snapshot;
    Market sell_market;
    Market buy_market;
    double requested_amount;
    double sell_price;
    double buy_price;
};

struct RiskState {
    Timestamp as_of;
    double volume_traded_today = 0.0;
    double current_volatility_estimate = 0.0;
    double success_rate_recent = 1.0;
    std::chrono::milliseconds cooldown_remaining{0};
    double free_asset_balance = 0.0;
    double free_buy_quote_balance = 0.0;
};

struct Verdict {
    bool approved = false;
    RejectReason reason = RejectReason::NONE;
    double approved_amount = 0.0;
    std::string detail;

    static Verdict approve(double amount) {
        return Verdict{true, RejectReason::NONE, amount, ""};
    }
    static Verdict reject(RejectReason reason, std::string detail) {
        return Verdict{false, reason, 0.0, std::move(detail)};
    }
};

struct TradeStatistics {
    int total_attempts = 0;
    int completed = 0;
    int aborted = 0;
    int partial = 0;
    double realized_pnl = 0.0;
    double success_rate = 0.0;
    double volume_today = 0.0;
    double realized_pnl_today = 0.0;
    double current_volatility = 0.0;
};

struct OpportunityRecord {
    Timestamp detected_at;
    Market sell_market;
    Market buy_market;
    double sell_price;
    double buy_price;
    double spread_percentage;
    double requested_amount;
    bool approved;
    RejectReason reason;
};

void to_json(nlohmann::json& j, const OrderLeg& leg);
void from_json(const nlohmann::json& j, OrderLeg& leg);
void to_json(nlohmann::json& j, const StateTransition& transition);
void from_json(const nlohmann::json& j, StateTransition& transition);
void to_json(nlohmann::json& j, const TradeAttempt& attempt);
void from_json(const nlohmann::json& j, TradeAttempt& attempt);
void to_json(nlohmann::json& j, const Balance& balance);
void from_json(const nlohmann::json& j, Balance& balance);

} // namespace xarb
