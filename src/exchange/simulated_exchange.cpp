#include "simulated_exchange.hpp"
#include <algorithm>
#include <thread>
#include "exchange_exception.hpp"
#include "../utils/logger.hpp"

namespace xarb {

SimulatedExchange::SimulatedExchange(const SimulationConfig& config, ClockFn clock)
    : config_(config),
      clock_(std::move(clock)),
      rng_(config.seed),
      base_prices_{config.base_price_a, config.base_price_b},
      prices_{config.base_price_a, config.base_price_b} {}

Quote SimulatedExchange::get_quote(Market market) {
    simulate_latency();
    std::uniform_real_distribution<double> volume(10000.0, 100000.0);
    double price;
    double reported_volume;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        price = step_price(market);
        reported_volume = volume(rng_);
    }
    return Quote{market, price, clock_(), reported_volume};
}

OrderFill SimulatedExchange::submit_order(const OrderRequest& request) {
    simulate_latency();
    ++orders_submitted_;

    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_real_distribution<double> roll(0.0, 1.0);
    if (roll(rng_) < config_.failure_rate) {
        ++orders_rejected_;
        throw ExchangeException("simulated rejection of " + request.client_order_id + " on " + request.symbol);
    }

    double price = step_price(request.market);
    bool marketable = request.side == OrderSide::SELL ? price >= request.limit_price
                                                      : price <= request.limit_price;
    if (!marketable) {
        XARB_LOG_DEBUG("Simulated {} {} at limit {} not marketable (price {})",
                       to_string(request.side), request.symbol, request.limit_price, price);
        return OrderFill{0.0, 0.0};
    }
    return OrderFill{request.amount, price};
}

void SimulatedExchange::set_price(Market market, double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    base_prices_[static_cast<size_t>(market)] = price;
    prices_[static_cast<size_t>(market)] = price;
}

double SimulatedExchange::current_price(Market market) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prices_[static_cast<size_t>(market)];
}

double SimulatedExchange::step_price(Market market) {
    const size_t index = static_cast<size_t>(market);
    const double base = base_prices_[index];
    const double band = base * config_.price_jitter;
    if (band <= 0.0) {
        return prices_[index];
    }
    std::uniform_real_distribution<double> move(-band / 4.0, band / 4.0);
    prices_[index] = std::clamp(prices_[index] + move(rng_), base - band, base + band);
    return prices_[index];
}

void SimulatedExchange::simulate_latency() const {
    if (config_.latency_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.latency_ms));
    }
}

} // namespace xarb
