#pragma once

#include <chrono>
#include "types.hpp"
#include "../utils/config_types.hpp"

namespace xarb {

// Risk limits and thresholds
struct RiskLimits {
    double min_spread_percentage = 0.3;           // before fees, percent
    double taker_fee_rate = 0.0006;               // per leg
    double buy_price_buffer = 0.001;              // limit slack on the buy leg
    double daily_volume_limit = 5000.0;           // asset units per UTC day
    double safety_margin_fraction = 0.1;          // of each free balance
    double safety_margin_absolute = 0.0;          // floor for the margin
    double volatility_ceiling = 2.0;              // percent
    double max_trade_amount = 1000.0;             // asset units
    std::chrono::milliseconds freshness_bound{30000};

    static RiskLimits from_config(const RiskManagementConfig& risk,
                                  const ArbitrageConfig& arbitrage,
                                  const MonitorConfig& monitor);
};

// Stateless gate in front of the executor. evaluate() is a pure function of
// its arguments and the limits fixed at construction.
class RiskController {
public:
    explicit RiskController(RiskLimits limits);

    Verdict evaluate(const TradeCandidate& candidate, const RiskState& risk_state) const;

    // Minimum spread after paying the taker fee on both legs.
    double minimum_spread_percentage() const;
    double safety_margin(double free_balance) const;
    // Quote currency needed to buy `amount` at `buy_price` under the buffered limit.
    double buy_quote_cost(double amount, double buy_price) const;

    const RiskLimits& limits() const { return limits_; }

private:
    RiskLimits limits_;
};

} // namespace xarb
