#include <gtest/gtest.h>
#include "exchange/exchange_exception.hpp"
#include "exchange/simulated_exchange.hpp"

class SimulatedExchangeTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.base_price_a = 0.52;
        config.base_price_b = 0.50;
        config.price_jitter = 0.01;
        config.failure_rate = 0.0;
        config.latency_ms = 0;
        config.seed = 7;
    }

    xarb::OrderRequest request(xarb::OrderSide side, xarb::Market market, double limit) const {
        return xarb::OrderRequest{"T1-1-S1", market, "XRP/USDT", side, 100.0, limit};
    }

    xarb::SimulationConfig config;
};

TEST_F(SimulatedExchangeTest, PricesStayWithinJitterBand) {
    xarb::SimulatedExchange exchange(config);
    for (int i = 0; i < 1000; ++i) {
        auto quote = exchange.get_quote(xarb::Market::PAIR_A);
        EXPECT_EQ(quote.market, xarb::Market::PAIR_A);
        EXPECT_GE(quote.price, 0.52 * 0.99 - 1e-12);
        EXPECT_LE(quote.price, 0.52 * 1.01 + 1e-12);
        ASSERT_TRUE(quote.volume.has_value());
        EXPECT_GT(*quote.volume, 0.0);
    }
}

TEST_F(SimulatedExchangeTest, ZeroJitterKeepsPriceFixed) {
    config.price_jitter = 0.0;
    xarb::SimulatedExchange exchange(config);
    EXPECT_DOUBLE_EQ(exchange.get_quote(xarb::Market::PAIR_B).price, 0.50);
    EXPECT_DOUBLE_EQ(exchange.get_quote(xarb::Market::PAIR_B).price, 0.50);
}

TEST_F(SimulatedExchangeTest, SameSeedSamePath) {
    xarb::SimulatedExchange first(config);
    xarb::SimulatedExchange second(config);
    for (int i = 0; i < 20; ++i) {
        EXPECT_DOUBLE_EQ(first.get_quote(xarb::Market::PAIR_A).price,
                         second.get_quote(xarb::Market::PAIR_A).price);
    }
}

TEST_F(SimulatedExchangeTest, MarketableOrdersFillInFull) {
    config.price_jitter = 0.0;
    xarb::SimulatedExchange exchange(config);

    auto sell = exchange.submit_order(request(xarb::OrderSide::SELL, xarb::Market::PAIR_A, 0.52 * 0.999));
    EXPECT_DOUBLE_EQ(sell.filled_amount, 100.0);
    EXPECT_DOUBLE_EQ(sell.filled_price, 0.52);

    auto buy = exchange.submit_order(request(xarb::OrderSide::BUY, xarb::Market::PAIR_B, 0.50 * 1.001));
    EXPECT_DOUBLE_EQ(buy.filled_amount, 100.0);
    EXPECT_DOUBLE_EQ(buy.filled_price, 0.50);
    EXPECT_EQ(exchange.orders_submitted(), 2u);
}

TEST_F(SimulatedExchangeTest, LimitOutsideMarketDoesNotFill) {
    config.price_jitter = 0.0;
    xarb::SimulatedExchange exchange(config);

    auto sell = exchange.submit_order(request(xarb::OrderSide::SELL, xarb::Market::PAIR_A, 0.53));
    EXPECT_DOUBLE_EQ(sell.filled_amount, 0.0);
    auto buy = exchange.submit_order(request(xarb::OrderSide::BUY, xarb::Market::PAIR_B, 0.49));
    EXPECT_DOUBLE_EQ(buy.filled_amount, 0.0);
}

TEST_F(SimulatedExchangeTest, FailureRateRejectsOrders) {
    config.failure_rate = 0.999999;
    xarb::SimulatedExchange exchange(config);
    EXPECT_THROW(exchange.submit_order(request(xarb::OrderSide::SELL, xarb::Market::PAIR_A, 0.1)),
                 xarb::ExchangeException);
    EXPECT_EQ(exchange.orders_submitted(), 1u);
    EXPECT_EQ(exchange.orders_rejected(), 1u);
}

TEST_F(SimulatedExchangeTest, SetPriceRecentresMarket) {
    xarb::SimulatedExchange exchange(config);
    exchange.set_price(xarb::Market::PAIR_B, 0.60);
    EXPECT_DOUBLE_EQ(exchange.current_price(xarb::Market::PAIR_B), 0.60);
    for (int i = 0; i < 100; ++i) {
        double price = exchange.get_quote(xarb::Market::PAIR_B).price;
        EXPECT_GE(price, 0.60 * 0.99 - 1e-12);
        EXPECT_LE(price, 0.60 * 1.01 + 1e-12);
    }
}
