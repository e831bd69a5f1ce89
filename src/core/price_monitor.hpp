#pragma once

#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <vector>
#include "price_feed.hpp"
#include "types.hpp"
#include "../utils/config_types.hpp"
#include "../utils/thread_pool.hpp"

namespace xarb {

// Polls both markets on independent schedules and keeps a bounded per-market
// history. A failed poll leaves the previous quote in place, so its timestamp
// keeps aging and the snapshot goes stale on its own.
class PriceMonitor {
public:
    PriceMonitor(std::shared_ptr<PriceFeed> feed,
                 const MarketsConfig& markets,
                 const MonitorConfig& config,
                 ClockFn clock = &Clock::now);
    ~PriceMonitor();

    PriceMonitor(const PriceMonitor&) = delete;
    PriceMonitor& operator=(const PriceMonitor&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

    // One bounded poll of a single market. Returns false on failure.
    bool poll_once(Market market);

    std::optional<SpreadSnapshot> latest_spread() const;
    std::optional<Quote> quote(Market market) const;
    std::vector<Quote> history(Market market) const;

    // Population standard deviation of simple returns, in percent.
    double volatility(Market market) const;

    uint64_t poll_failures(Market market) const;

private:
    struct MarketState {
        std::deque<Quote> history;
        std::optional<Quote> latest;
        std::atomic<uint64_t> failures{0};
    };

    void run(Market market);
    void record_quote(const Quote& quote);
    void prune_history(std::deque<Quote>& history) const;
    MarketState& state_for(Market market);
    const MarketState& state_for(Market market) const;
    ThreadPool& pool_for(Market market);

    std::shared_ptr<PriceFeed> feed_;
    MarketsConfig markets_;
    MonitorConfig config_;
    ClockFn clock_;

    mutable std::shared_mutex state_mutex_;
    std::array<MarketState, 2> states_;
    std::optional<SpreadSnapshot> latest_spread_;

    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::vector<std::thread> pollers_;

    // One worker per market, so a hung feed on one side never delays the other.
    ThreadPool pool_a_{1};
    ThreadPool pool_b_{1};
};

} // namespace xarb
