#include "risk_controller.hpp"
#include <algorithm>

namespace xarb {

RiskLimits RiskLimits::from_config(const RiskManagementConfig& risk,
                                   const ArbitrageConfig& arbitrage,
                                   const MonitorConfig& monitor) {
    RiskLimits limits;
    limits.min_spread_percentage = risk.min_spread_percentage;
    limits.taker_fee_rate = arbitrage.taker_fee_rate;
    limits.buy_price_buffer = arbitrage.price_buffer;
    limits.daily_volume_limit = risk.daily_volume_limit;
    limits.safety_margin_fraction = risk.safety_margin_fraction;
    limits.safety_margin_absolute = risk.safety_margin_absolute;
    limits.volatility_ceiling = risk.volatility_ceiling;
    limits.max_trade_amount = risk.max_trade_amount;
    limits.freshness_bound = std::chrono::milliseconds(monitor.freshness_bound_ms);
    return limits;
}

RiskController::RiskController(RiskLimits limits)
    : limits_(limits) {}

double RiskController::minimum_spread_percentage() const {
    return limits_.min_spread_percentage + 2.0 * limits_.taker_fee_rate * 100.0;
}

double RiskController::safety_margin(double free_balance) const {
    return std::max(free_balance * limits_.safety_margin_fraction, limits_.safety_margin_absolute);
}

double RiskController::buy_quote_cost(double amount, double buy_price) const {
    return amount * buy_price * (1.0 + limits_.buy_price_buffer) * (1.0 + limits_.taker_fee_rate);
}

Verdict RiskController::evaluate(const TradeCandidate& candidate, const RiskState& risk_state) const {
    const double spread = candidate.snapshot.spread_percentage;
    const double min_spread = minimum_spread_percentage();
    if (spread < min_spread) {
        return Verdict::reject(RejectReason::SPREAD_TOO_SMALL,
                               "spread " + std::to_string(spread) + "% below minimum " +
                               std::to_string(min_spread) + "%");
    }

    if (candidate.snapshot.is_stale(risk_state.as_of, limits_.freshness_bound)) {
        return Verdict::reject(RejectReason::STALE_PRICE,
                               "quote older than " + std::to_string(limits_.freshness_bound.count()) + " ms");
    }

    const double requested = candidate.requested_amount;
    if (risk_state.volume_traded_today + requested > limits_.daily_volume_limit) {
        return Verdict::reject(RejectReason::DAILY_LIMIT_EXCEEDED,
                               "volume " + std::to_string(risk_state.volume_traded_today) + " + " +
                               std::to_string(requested) + " exceeds " +
                               std::to_string(limits_.daily_volume_limit));
    }

    const double usable_asset = risk_state.free_asset_balance - safety_margin(risk_state.free_asset_balance);
    if (requested > usable_asset) {
        return Verdict::reject(RejectReason::INSUFFICIENT_SAFETY_MARGIN,
                               "sell leg needs " + std::to_string(requested) + ", usable asset " +
                               std::to_string(usable_asset));
    }

    const double usable_quote =
        risk_state.free_buy_quote_balance - safety_margin(risk_state.free_buy_quote_balance);
    const double quote_needed = buy_quote_cost(requested, candidate.buy_price);
    if (quote_needed > usable_quote) {
        return Verdict::reject(RejectReason::INSUFFICIENT_SAFETY_MARGIN,
                               "buy leg needs " + std::to_string(quote_needed) + ", usable quote " +
                               std::to_string(usable_quote));
    }

    // Sizing belongs to the margin step: an empty trade is a margin rejection, whatever comes later.
    double affordable = usable_quote / buy_quote_cost(1.0, candidate.buy_price);
    double amount = std::min({requested, usable_asset, limits_.max_trade_amount, affordable});
    if (amount <= LEDGER_EPSILON) {
        return Verdict::reject(RejectReason::INSUFFICIENT_SAFETY_MARGIN, "no executable amount left");
    }

    if (risk_state.current_volatility_estimate > limits_.volatility_ceiling) {
        return Verdict::reject(RejectReason::VOLATILITY_TOO_HIGH,
                               "volatility " + std::to_string(risk_state.current_volatility_estimate) +
                               "% above ceiling " + std::to_string(limits_.volatility_ceiling) + "%");
    }

    if (risk_state.cooldown_remaining.count() > 0) {
        return Verdict::reject(RejectReason::COOLDOWN_ACTIVE,
                               std::to_string(risk_state.cooldown_remaining.count()) + " ms of cooldown left");
    }

    return Verdict::approve(amount);
}

} // namespace xarb
