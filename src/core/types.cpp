#include "types.hpp"
#include <algorithm>
#include <cmath>

namespace xarb {

int64_t to_epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

std::string to_string(Market market) {
    switch (market) {
        case Market::PAIR_A: return "pair_a";
        case Market::PAIR_B: return "pair_b";
    }
    return "unknown";
}

std::string to_string(OrderSide side) {
    switch (side) {
        case OrderSide::SELL: return "sell";
        case OrderSide::BUY: return "buy";
    }
    return "unknown";
}

std::string to_string(LegState state) {
    switch (state) {
        case LegState::PENDING: return "pending";
        case LegState::SUBMITTED: return "submitted";
        case LegState::FILLED: return "filled";
        case LegState::FAILED: return "failed";
    }
    return "unknown";
}

std::string to_string(TradeState state) {
    switch (state) {
        case TradeState::PLANNED: return "planned";
        case TradeState::SELLING: return "selling";
        case TradeState::SELL_FILLED: return "sell_filled";
        case TradeState::BUYING: return "buying";
        case TradeState::COMPLETED: return "completed";
        case TradeState::SELL_FAILED: return "sell_failed";
        case TradeState::BUY_FAILED: return "buy_failed";
    }
    return "unknown";
}

std::string to_string(AttemptStatus status) {
    switch (status) {
        case AttemptStatus::PENDING: return "pending";
        case AttemptStatus::COMPLETED: return "completed";
        case AttemptStatus::ABORTED: return "aborted";
        case AttemptStatus::PARTIAL: return "partial";
    }
    return "unknown";
}

std::string to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "";
        case RejectReason::SPREAD_TOO_SMALL: return "spread_too_small";
        case RejectReason::STALE_PRICE: return "stale_price";
        case RejectReason::DAILY_LIMIT_EXCEEDED: return "daily_limit_exceeded";
        case RejectReason::INSUFFICIENT_SAFETY_MARGIN: return "insufficient_safety_margin";
        case RejectReason::VOLATILITY_TOO_HIGH: return "volatility_too_high";
        case RejectReason::COOLDOWN_ACTIVE: return "cooldown_active";
    }
    return "unknown";
}

Market other_market(Market market) {
    return market == Market::PAIR_A ? Market::PAIR_B : Market::PAIR_A;
}

bool is_terminal(TradeState state) {
    return state == TradeState::COMPLETED ||
           state == TradeState::SELL_FAILED ||
           state == TradeState::BUY_FAILED;
}

const MarketSpec& market_spec(const MarketsConfig& markets, Market market) {
    return market == Market::PAIR_A ? markets.market_a : markets.market_b;
}

SpreadSnapshot SpreadSnapshot::from_quotes(const Quote& quote_a, const Quote& quote_b, Timestamp computed_at) {
    SpreadSnapshot snapshot;
    snapshot.quote_a = quote_a;
    snapshot.quote_b = quote_b;
    snapshot.spread_absolute = std::fabs(quote_a.price - quote_b.price);
    snapshot.spread_percentage = snapshot.spread_absolute / std::min(quote_a.price, quote_b.price) * 100.0;
    snapshot.computed_at = computed_at;
    return snapshot;
}

const Quote& SpreadSnapshot::quote_for(Market market) const {
    return market == Market::PAIR_A ? quote_a : quote_b;
}

Market SpreadSnapshot::higher_market() const {
    return quote_a.price >= quote_b.price ? Market::PAIR_A : Market::PAIR_B;
}

Market SpreadSnapshot::lower_market() const {
    return other_market(higher_market());
}

bool SpreadSnapshot::is_stale(Timestamp now, std::chrono::milliseconds freshness_bound) const {
    return quote_a.age(now) > freshness_bound || quote_b.age(now) > freshness_bound;
}

void TradeAttempt::transition_to(TradeState next, Timestamp at, const std::string& note) {
    transitions.push_back({state, next, at, note});
    state = next;
    if (is_terminal(next)) {
        finished_at = at;
    }
}

void to_json(nlohmann::json& j, const OrderLeg& leg) {
    j = nlohmann::json{
        {"side", leg.side},
        {"market", leg.market},
        {"currency_pair", leg.currency_pair},
        {"requested_amount", leg.requested_amount},
        {"requested_price", leg.requested_price},
        {"filled_amount", leg.filled_amount},
        {"filled_price", leg.filled_price},
        {"state", leg.state},
        {"error", leg.error},
        {"attempts", leg.attempts}
    };
}

void from_json(const nlohmann::json& j, OrderLeg& leg) {
    j.at("side").get_to(leg.side);
    j.at("market").get_to(leg.market);
    j.at("currency_pair").get_to(leg.currency_pair);
    j.at("requested_amount").get_to(leg.requested_amount);
    j.at("requested_price").get_to(leg.requested_price);
    j.at("filled_amount").get_to(leg.filled_amount);
    j.at("filled_price").get_to(leg.filled_price);
    j.at("state").get_to(leg.state);
    leg.error = j.value("error", "");
    leg.attempts = j.value("attempts", 0);
}

void to_json(nlohmann::json& j, const StateTransition& transition) {
    j = nlohmann::json{
        {"from", transition.from},
        {"to", transition.to},
        {"at", to_epoch_ms(transition.at)},
        {"note", transition.note}
    };
}

void from_json(const nlohmann::json& j, StateTransition& transition) {
    j.at("from").get_to(transition.from);
    j.at("to").get_to(transition.to);
    transition.at = from_epoch_ms(j.at("at").get<int64_t>());
    transition.note = j.value("note", "");
}

void to_json(nlohmann::json& j, const TradeAttempt& attempt) {
    j = nlohmann::json{
        {"id", attempt.id},
        {"detected_at", to_epoch_ms(attempt.detected_at)},
        {"sell_market", attempt.sell_market},
        {"buy_market", attempt.buy_market},
        {"requested_amount", attempt.requested_amount},
        {"expected_spread_percentage", attempt.expected_spread_percentage},
        {"quoted_sell_price", attempt.quoted_sell_price},
        {"quoted_buy_price", attempt.quoted_buy_price},
        {"state", attempt.state},
        {"status", attempt.status},
        {"sell_leg", attempt.sell_leg},
        {"buy_leg", attempt.buy_leg},
        {"realized_profit_loss", attempt.realized_profit_loss},
        {"inventory_drift", attempt.inventory_drift},
        {"sell_slippage", attempt.sell_slippage},
        {"buy_slippage", attempt.buy_slippage},
        {"requires_reconciliation", attempt.requires_reconciliation},
        {"rejection_reason", attempt.rejection_reason},
        {"transitions", attempt.transitions}
    };
    if (attempt.finished_at) {
        j["finished_at"] = to_epoch_ms(*attempt.finished_at);
    } else {
        j["finished_at"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, TradeAttempt& attempt) {
    j.at("id").get_to(attempt.id);
    attempt.detected_at = from_epoch_ms(j.at("detected_at").get<int64_t>());
    if (j.contains("finished_at") && !j["finished_at"].is_null()) {
        attempt.finished_at = from_epoch_ms(j["finished_at"].get<int64_t>());
    } else {
        attempt.finished_at.reset();
    }
    j.at("sell_market").get_to(attempt.sell_market);
    j.at("buy_market").get_to(attempt.buy_market);
    j.at("requested_amount").get_to(attempt.requested_amount);
    j.at("expected_spread_percentage").get_to(attempt.expected_spread_percentage);
    j.at("state").get_to(attempt.state);
    j.at("status").get_to(attempt.status);
    j.at("sell_leg").get_to(attempt.sell_leg);
    j.at("buy_leg").get_to(attempt.buy_leg);
    j.at("realized_profit_loss").get_to(attempt.realized_profit_loss);
    attempt.inventory_drift = j.value("inventory_drift", 0.0);
    attempt.quoted_sell_price = j.value("quoted_sell_price", 0.0);
    attempt.quoted_buy_price = j.value("quoted_buy_price", 0.0);
    attempt.sell_slippage = j.value("sell_slippage", 0.0);
    attempt.buy_slippage = j.value("buy_slippage", 0.0);
    attempt.requires_reconciliation = j.value("requires_reconciliation", false);
    attempt.rejection_reason = j.value("rejection_reason", RejectReason::NONE);
    attempt.transitions = j.value("transitions", std::vector<StateTransition>{});
}

void to_json(nlohmann::json& j, const Balance& balance) {
    j = nlohmann::json{
        {"currency", balance.currency},
        {"free", balance.free},
        {"locked", balance.locked}
    };
}

void from_json(const nlohmann::json& j, Balance& balance) {
    j.at("currency").get_to(balance.currency);
    j.at("free").get_to(balance.free);
    balance.locked = j.value("locked", 0.0);
}

} // namespace xarb
