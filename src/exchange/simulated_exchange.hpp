#pragma once

#include <array>
#include <atomic>
#include <mutex>
#include <random>
#include "../core/order_gateway.hpp"
#include "../core/price_feed.hpp"
#include "../utils/config_types.hpp"

namespace xarb {

// Paper-trading venue for both markets. Prices wander around the configured
// base prices within +/- price_jitter; orders fill in full at the current
// price when the limit allows, and are rejected at failure_rate.
class SimulatedExchange : public PriceFeed, public OrderGateway {
public:
    SimulatedExchange(const SimulationConfig& config, ClockFn clock = &Clock::now);

    Quote get_quote(Market market) override;
    OrderFill submit_order(const OrderRequest& request) override;

    // Re-centres a market on `price`.
    void set_price(Market market, double price);
    double current_price(Market market) const;

    uint64_t orders_submitted() const { return orders_submitted_; }
    uint64_t orders_rejected() const { return orders_rejected_; }

private:
    double step_price(Market market);
    void simulate_latency() const;

    SimulationConfig config_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::mt19937 rng_;
    std::array<double, 2> base_prices_;
    std::array<double, 2> prices_;

    std::atomic<uint64_t> orders_submitted_{0};
    std::atomic<uint64_t> orders_rejected_{0};
};

} // namespace xarb
