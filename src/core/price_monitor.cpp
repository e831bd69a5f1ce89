#include "price_monitor.hpp"
#include <cmath>
#include <numeric>
#include "../utils/logger.hpp"

namespace xarb {

PriceMonitor::PriceMonitor(std::shared_ptr<PriceFeed> feed,
                           const MarketsConfig& markets,
                           const MonitorConfig& config,
                           ClockFn clock)
    : feed_(std::move(feed)), markets_(markets), config_(config), clock_(std::move(clock)) {}

PriceMonitor::~PriceMonitor() {
    stop();
}

void PriceMonitor::start() {
    if (running_.exchange(true)) {
        return;
    }
    pollers_.emplace_back(&PriceMonitor::run, this, Market::PAIR_A);
    pollers_.emplace_back(&PriceMonitor::run, this, Market::PAIR_B);
    XARB_LOG_INFO("Price monitor started for {} and {}", markets_.market_a.symbol, markets_.market_b.symbol);
}

void PriceMonitor::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();
    for (auto& poller : pollers_) {
        if (poller.joinable()) {
            poller.join();
        }
    }
    pollers_.clear();
    XARB_LOG_INFO("Price monitor stopped");
}

void PriceMonitor::run(Market market) {
    const auto interval = std::chrono::milliseconds(market_spec(markets_, market).poll_interval_ms);
    while (running_) {
        poll_once(market);

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, interval, [this] { return !running_; });
    }
}

bool PriceMonitor::poll_once(Market market) {
    const std::string& symbol = market_spec(markets_, market).symbol;
    auto feed = feed_;
    auto result = pool_for(market).call_with_timeout([feed, market]() { return feed->get_quote(market); },
                                          std::chrono::milliseconds(config_.feed_timeout_ms));

    std::string failure;
    if (result.is_error()) {
        failure = result.error();
    } else if (result.value().market != market) {
        failure = "feed answered for " + to_string(result.value().market);
    } else if (!std::isfinite(result.value().price) || result.value().price <= 0.0) {
        failure = "invalid price " + std::to_string(result.value().price);
    }

    if (!failure.empty()) {
        ++state_for(market).failures;
        XARB_LOG_WARN("Price poll failed for {}: {}", symbol, failure);
        return false;
    }

    record_quote(result.value());
    XARB_LOG_TRACE("{} quote {}", symbol, result.value().price);
    return true;
}

void PriceMonitor::record_quote(const Quote& quote) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    MarketState& state = state_for(quote.market);
    state.history.push_back(quote);
    state.latest = quote;
    prune_history(state.history);

    const MarketState& a = state_for(Market::PAIR_A);
    const MarketState& b = state_for(Market::PAIR_B);
    if (a.latest && b.latest) {
        latest_spread_ = SpreadSnapshot::from_quotes(*a.latest, *b.latest, clock_());
    }
}

void PriceMonitor::prune_history(std::deque<Quote>& history) const {
    while (history.size() > config_.history_capacity) {
        history.pop_front();
    }
    if (history.empty()) {
        return;
    }
    const Timestamp cutoff = history.back().timestamp - std::chrono::seconds(config_.history_window_sec);
    while (!history.empty() && history.front().timestamp < cutoff) {
        history.pop_front();
    }
}

std::optional<SpreadSnapshot> PriceMonitor::latest_spread() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return latest_spread_;
}

std::optional<Quote> PriceMonitor::quote(Market market) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return state_for(market).latest;
}

std::vector<Quote> PriceMonitor::history(Market market) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    const auto& history = state_for(market).history;
    return std::vector<Quote>(history.begin(), history.end());
}

double PriceMonitor::volatility(Market market) const {
    std::vector<double> returns;
    {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        const auto& history = state_for(market).history;
        if (history.size() < 2) {
            return 0.0;
        }
        returns.reserve(history.size() - 1);
        for (size_t i = 1; i < history.size(); ++i) {
            double previous = history[i - 1].price;
            returns.push_back((history[i].price - previous) / previous * 100.0);
        }
    }

    double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size();
    double variance = 0.0;
    for (double r : returns) {
        variance += (r - mean) * (r - mean);
    }
    variance /= returns.size();
    return std::sqrt(variance);
}

uint64_t PriceMonitor::poll_failures(Market market) const {
    return state_for(market).failures.load();
}

PriceMonitor::MarketState& PriceMonitor::state_for(Market market) {
    return states_[static_cast<size_t>(market)];
}

const PriceMonitor::MarketState& PriceMonitor::state_for(Market market) const {
    return states_[static_cast<size_t>(market)];
}

ThreadPool& PriceMonitor::pool_for(Market market) {
    return market == Market::PAIR_A ? pool_a_ : pool_b_;
}

} // namespace xarb
