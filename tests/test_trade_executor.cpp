#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "core/exceptions.hpp"
#include "core/trade_executor.hpp"
#include "exchange/exchange_exception.hpp"
#include "mocks/mock_order_gateway.hpp"

using ::testing::_;
using ::testing::AllOf;
using ::testing::DoubleNear;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;
using namespace std::chrono_literals;

namespace {

auto IsSell() {
    return Field(&xarb::OrderRequest::side, xarb::OrderSide::SELL);
}

auto IsBuy() {
    return Field(&xarb::OrderRequest::side, xarb::OrderSide::BUY);
}

} // namespace

class TradeExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        now = xarb::Timestamp(std::chrono::hours(24 * 400));
        gateway = std::make_shared<xarb::testing::MockOrderGateway>();
        config.taker_fee_rate = 0.0006;
        config.price_buffer = 0.001;
        config.order_timeout_ms = 1000;
        config.buy_retry_limit = 3;
        config.retry_backoff_ms = 500;
        config.inventory_tolerance = 0.01;
        ledger = std::make_unique<xarb::BalanceLedger>(
            std::map<std::string, double>{{"XRP", 10000.0}, {"USDT", 5000.0}, {"USDC", 5000.0}});
    }

    std::unique_ptr<xarb::TradeExecutor> make_executor() {
        return std::make_unique<xarb::TradeExecutor>(
            gateway, *ledger, markets, config,
            [this]() { return now; },
            [this](std::chrono::milliseconds duration) { sleeps.push_back(duration); });
    }

    // A quotes 0.52, B quotes 0.50: sell on A (USDT), buy on B (USDC).
    xarb::TradeCandidate candidate(double amount = 100.0) const {
        xarb::Quote a{xarb::Market::PAIR_A, 0.52, now, std::nullopt};
        xarb::Quote b{xarb::Market::PAIR_B, 0.50, now, std::nullopt};
        auto snapshot = xarb::SpreadSnapshot::from_quotes(a, b, now);
        return xarb::TradeCandidate{snapshot, xarb::Market::PAIR_A, xarb::Market::PAIR_B, amount, 0.52, 0.50};
    }

    void expect_ledger(double xrp, double usdt, double usdc) const {
        auto snapshot = ledger->snapshot();
        EXPECT_NEAR(snapshot["XRP"].free, xrp, 1e-9);
        EXPECT_NEAR(snapshot["USDT"].free, usdt, 1e-9);
        EXPECT_NEAR(snapshot["USDC"].free, usdc, 1e-9);
        for (const auto& [currency, balance] : snapshot) {
            EXPECT_NEAR(balance.locked, 0.0, 1e-12) << currency;
        }
        EXPECT_EQ(ledger->outstanding_reservations(), 0u);
    }

    xarb::Timestamp now;
    std::shared_ptr<xarb::testing::MockOrderGateway> gateway;
    xarb::MarketsConfig markets;
    xarb::ArbitrageConfig config;
    std::unique_ptr<xarb::BalanceLedger> ledger;
    std::vector<std::chrono::milliseconds> sleeps;
};

TEST_F(TradeExecutorTest, PlanPricesLegsAtBufferedLimits) {
    auto executor = make_executor();
    auto attempt = executor->plan(candidate(), 100.0);

    EXPECT_FALSE(attempt.id.empty());
    EXPECT_EQ(attempt.state, xarb::TradeState::PLANNED);
    EXPECT_EQ(attempt.status, xarb::AttemptStatus::PENDING);
    EXPECT_EQ(attempt.sell_leg.currency_pair, "XRP/USDT");
    EXPECT_EQ(attempt.buy_leg.currency_pair, "XRP/USDC");
    EXPECT_NEAR(attempt.sell_leg.requested_price, 0.52 * 0.999, 1e-12);
    EXPECT_NEAR(attempt.buy_leg.requested_price, 0.50 * 1.001, 1e-12);
    EXPECT_NEAR(attempt.expected_spread_percentage, 4.0, 1e-9);
    EXPECT_NE(executor->plan(candidate(), 100.0).id, attempt.id);
}

TEST_F(TradeExecutorTest, CompletedAttemptSettlesBothLegs) {
    auto executor = make_executor();
    {
        InSequence sequence;
        EXPECT_CALL(*gateway, submit_order(AllOf(
                IsSell(),
                Field(&xarb::OrderRequest::market, xarb::Market::PAIR_A),
                Field(&xarb::OrderRequest::amount, DoubleNear(100.0, 1e-12)),
                Field(&xarb::OrderRequest::limit_price, DoubleNear(0.52 * 0.999, 1e-12)))))
            .WillOnce(Return(xarb::OrderFill{100.0, 0.52}));
        EXPECT_CALL(*gateway, submit_order(AllOf(
                IsBuy(),
                Field(&xarb::OrderRequest::market, xarb::Market::PAIR_B),
                Field(&xarb::OrderRequest::amount, DoubleNear(100.0, 1e-12)),
                Field(&xarb::OrderRequest::limit_price, DoubleNear(0.50 * 1.001, 1e-12)))))
            .WillOnce(Return(xarb::OrderFill{100.0, 0.50}));
    }

    auto result = executor->execute(executor->plan(candidate(), 100.0));

    EXPECT_EQ(result.state, xarb::TradeState::COMPLETED);
    EXPECT_EQ(result.status, xarb::AttemptStatus::COMPLETED);
    EXPECT_FALSE(result.requires_reconciliation);
    ASSERT_TRUE(result.finished_at.has_value());

    const double proceeds = 100.0 * 0.52 * (1.0 - 0.0006);
    const double cost = 100.0 * 0.50 * (1.0 + 0.0006);
    EXPECT_NEAR(result.realized_profit_loss, proceeds - cost, 1e-9);
    EXPECT_NEAR(result.inventory_drift, 0.0, 1e-12);
    EXPECT_EQ(result.sell_leg.state, xarb::LegState::FILLED);
    EXPECT_EQ(result.buy_leg.state, xarb::LegState::FILLED);
    EXPECT_EQ(result.buy_leg.attempts, 1);
    EXPECT_NEAR(result.sell_slippage, 0.0, 1e-12);
    EXPECT_NEAR(result.buy_slippage, 0.0, 1e-12);

    ASSERT_EQ(result.transitions.size(), 4u);
    EXPECT_EQ(result.transitions[0].from, xarb::TradeState::PLANNED);
    EXPECT_EQ(result.transitions[0].to, xarb::TradeState::SELLING);
    EXPECT_EQ(result.transitions[1].to, xarb::TradeState::SELL_FILLED);
    EXPECT_EQ(result.transitions[2].to, xarb::TradeState::BUYING);
    EXPECT_EQ(result.transitions[3].to, xarb::TradeState::COMPLETED);

    expect_ledger(10000.0, 5000.0 + proceeds, 5000.0 - cost);
}

TEST_F(TradeExecutorTest, SellRejectionLeavesLedgerUntouched) {
    auto executor = make_executor();
    auto before = ledger->snapshot();
    EXPECT_CALL(*gateway, submit_order(IsSell()))
        .WillOnce(Throw(xarb::ExchangeException("insufficient liquidity")));
    EXPECT_CALL(*gateway, submit_order(IsBuy())).Times(0);

    auto result = executor->execute(executor->plan(candidate(), 100.0));

    EXPECT_EQ(result.state, xarb::TradeState::SELL_FAILED);
    EXPECT_EQ(result.status, xarb::AttemptStatus::ABORTED);
    EXPECT_DOUBLE_EQ(result.realized_profit_loss, 0.0);
    EXPECT_EQ(result.sell_leg.state, xarb::LegState::FAILED);
    EXPECT_NE(result.sell_leg.error.find("insufficient liquidity"), std::string::npos);
    ASSERT_TRUE(result.finished_at.has_value());

    auto after = ledger->snapshot();
    for (const auto& [currency, balance] : before) {
        EXPECT_NEAR(after[currency].free, balance.free, 1e-12) << currency;
        EXPECT_NEAR(after[currency].locked, balance.locked, 1e-12) << currency;
    }
    EXPECT_EQ(ledger->outstanding_reservations(), 0u);
}

TEST_F(TradeExecutorTest, UnfilledSellAborts) {
    auto executor = make_executor();
    EXPECT_CALL(*gateway, submit_order(IsSell())).WillOnce(Return(xarb::OrderFill{0.0, 0.0}));
    EXPECT_CALL(*gateway, submit_order(IsBuy())).Times(0);

    auto result = executor->execute(executor->plan(candidate(), 100.0));
    EXPECT_EQ(result.state, xarb::TradeState::SELL_FAILED);
    expect_ledger(10000.0, 5000.0, 5000.0);
}

TEST_F(TradeExecutorTest, SellTimeoutAborts) {
    config.order_timeout_ms = 20;
    auto executor = make_executor();
    EXPECT_CALL(*gateway, submit_order(IsSell())).WillOnce(Invoke([](const xarb::OrderRequest& request) {
        std::this_thread::sleep_for(150ms);
        return xarb::OrderFill{request.amount, 0.52};
    }));
    EXPECT_CALL(*gateway, submit_order(IsBuy())).Times(0);

    auto result = executor->execute(executor->plan(candidate(), 100.0));
    EXPECT_EQ(result.state, xarb::TradeState::SELL_FAILED);
    EXPECT_NE(result.sell_leg.error.find("timed out"), std::string::npos);
    expect_ledger(10000.0, 5000.0, 5000.0);
}

TEST_F(TradeExecutorTest, MissingAssetAbortsWithoutSubmitting) {
    auto executor = make_executor();
    EXPECT_CALL(*gateway, submit_order(_)).Times(0);

    auto result = executor->execute(executor->plan(candidate(20000.0), 20000.0));
    EXPECT_EQ(result.state, xarb::TradeState::SELL_FAILED);
    EXPECT_EQ(result.status, xarb::AttemptStatus::ABORTED);
    expect_ledger(10000.0, 5000.0, 5000.0);
}

TEST_F(TradeExecutorTest, PartialSellFillScalesBuyLeg) {
    auto executor = make_executor();
    EXPECT_CALL(*gateway, submit_order(IsSell())).WillOnce(Return(xarb::OrderFill{60.0, 0.52}));
    EXPECT_CALL(*gateway, submit_order(AllOf(IsBuy(), Field(&xarb::OrderRequest::amount, DoubleNear(60.0, 1e-12)))))
        .WillOnce(Return(xarb::OrderFill{60.0, 0.50}));

    auto result = executor->execute(executor->plan(candidate(), 100.0));

    EXPECT_EQ(result.status, xarb::AttemptStatus::COMPLETED);
    EXPECT_DOUBLE_EQ(result.sell_leg.filled_amount, 60.0);
    EXPECT_DOUBLE_EQ(result.buy_leg.requested_amount, 60.0);
    const double proceeds = 60.0 * 0.52 * (1.0 - 0.0006);
    const double cost = 60.0 * 0.50 * (1.0 + 0.0006);
    EXPECT_NEAR(result.realized_profit_loss, proceeds - cost, 1e-9);
    expect_ledger(10000.0, 5000.0 + proceeds, 5000.0 - cost);
}

TEST_F(TradeExecutorTest, BuyTimingOutTwiceEndsPartial) {
    config.buy_retry_limit = 2;
    config.order_timeout_ms = 20;
    auto executor = make_executor();
    EXPECT_CALL(*gateway, submit_order(IsSell())).WillOnce(Return(xarb::OrderFill{100.0, 0.52}));
    EXPECT_CALL(*gateway, submit_order(IsBuy()))
        .Times(2)
        .WillRepeatedly(Invoke([](const xarb::OrderRequest& request) {
            std::this_thread::sleep_for(150ms);
            return xarb::OrderFill{request.amount, 0.50};
        }));

    auto result = executor->execute(executor->plan(candidate(), 100.0));

    EXPECT_EQ(result.state, xarb::TradeState::BUY_FAILED);
    EXPECT_EQ(result.status, xarb::AttemptStatus::PARTIAL);
    EXPECT_TRUE(result.requires_reconciliation);
    EXPECT_EQ(result.buy_leg.attempts, 2);
    EXPECT_EQ(result.buy_leg.state, xarb::LegState::FAILED);
    EXPECT_EQ(result.sell_leg.state, xarb::LegState::FILLED);
    EXPECT_DOUBLE_EQ(result.inventory_drift, -100.0);
    EXPECT_DOUBLE_EQ(result.buy_slippage, 0.0);
    ASSERT_TRUE(result.finished_at.has_value());
    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(sleeps[0], 500ms);

    // The ledger holds the counter-currency instead of the asset.
    const double proceeds = 100.0 * 0.52 * (1.0 - 0.0006);
    expect_ledger(9900.0, 5000.0 + proceeds, 5000.0);
}

TEST_F(TradeExecutorTest, HungBuysNeverLetALaterSubmissionThrough) {
    config.buy_retry_limit = 3;
    config.order_timeout_ms = 50;
    auto executor = make_executor();
    EXPECT_CALL(*gateway, submit_order(IsSell())).WillOnce(Return(xarb::OrderFill{100.0, 0.52}));
    // Both workers stay stuck on the first two buys; the third must not reach the venue.
    EXPECT_CALL(*gateway, submit_order(IsBuy()))
        .Times(2)
        .WillRepeatedly(Invoke([](const xarb::OrderRequest& request) {
            std::this_thread::sleep_for(400ms);
            return xarb::OrderFill{request.amount, 0.50};
        }));

    auto result = executor->execute(executor->plan(candidate(), 100.0));

    EXPECT_EQ(result.status, xarb::AttemptStatus::PARTIAL);
    EXPECT_EQ(result.buy_leg.attempts, 3);
    EXPECT_NE(result.buy_leg.error.find("no idle worker"), std::string::npos);
    const double proceeds = 100.0 * 0.52 * (1.0 - 0.0006);
    expect_ledger(9900.0, 5000.0 + proceeds, 5000.0);
}

TEST_F(TradeExecutorTest, SlippageMeasuredAgainstQuotedPrices) {
    auto executor = make_executor();
    EXPECT_CALL(*gateway, submit_order(IsSell())).WillOnce(Return(xarb::OrderFill{100.0, 0.5195}));
    EXPECT_CALL(*gateway, submit_order(IsBuy())).WillOnce(Return(xarb::OrderFill{100.0, 0.5004}));

    auto attempt = executor->plan(candidate(), 100.0);
    EXPECT_DOUBLE_EQ(attempt.quoted_sell_price, 0.52);
    EXPECT_DOUBLE_EQ(attempt.quoted_buy_price, 0.50);

    auto result = executor->execute(attempt);

    EXPECT_EQ(result.status, xarb::AttemptStatus::COMPLETED);
    EXPECT_NEAR(result.sell_slippage, (0.52 - 0.5195) / 0.52, 1e-12);
    EXPECT_NEAR(result.buy_slippage, (0.5004 - 0.50) / 0.50, 1e-12);
}

TEST_F(TradeExecutorTest, FavourableFillsGiveNegativeSlippage) {
    EXPECT_NEAR(xarb::TradeExecutor::slippage(0.52, 0.53, xarb::OrderSide::SELL), -0.01 / 0.52, 1e-12);
    EXPECT_NEAR(xarb::TradeExecutor::slippage(0.50, 0.49, xarb::OrderSide::BUY), -0.02, 1e-12);
    EXPECT_DOUBLE_EQ(xarb::TradeExecutor::slippage(0.0, 0.49, xarb::OrderSide::BUY), 0.0);
}

TEST_F(TradeExecutorTest, BuyRecoversOnRetry) {
    auto executor = make_executor();
    EXPECT_CALL(*gateway, submit_order(IsSell())).WillOnce(Return(xarb::OrderFill{100.0, 0.52}));
    EXPECT_CALL(*gateway, submit_order(IsBuy()))
        .WillOnce(Throw(xarb::ExchangeException("rate limited")))
        .WillOnce(Return(xarb::OrderFill{100.0, 0.50}));

    auto result = executor->execute(executor->plan(candidate(), 100.0));

    EXPECT_EQ(result.status, xarb::AttemptStatus::COMPLETED);
    EXPECT_EQ(result.buy_leg.attempts, 2);
    EXPECT_FALSE(result.requires_reconciliation);
    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(sleeps[0], 500ms);
    expect_ledger(10000.0, 5000.0 + 100.0 * 0.52 * 0.9994, 5000.0 - 100.0 * 0.50 * 1.0006);
}

TEST_F(TradeExecutorTest, BuyBackoffDoublesEachRetry) {
    config.buy_retry_limit = 4;
    auto executor = make_executor();
    EXPECT_CALL(*gateway, submit_order(IsSell())).WillOnce(Return(xarb::OrderFill{100.0, 0.52}));
    EXPECT_CALL(*gateway, submit_order(IsBuy()))
        .Times(4)
        .WillRepeatedly(Throw(xarb::ExchangeException("venue down")));

    auto result = executor->execute(executor->plan(candidate(), 100.0));

    EXPECT_EQ(result.status, xarb::AttemptStatus::PARTIAL);
    EXPECT_EQ(result.buy_leg.attempts, 4);
    std::vector<std::chrono::milliseconds> expected{500ms, 1000ms, 2000ms};
    EXPECT_EQ(sleeps, expected);
}

TEST_F(TradeExecutorTest, BuyReservationFailureEscalatesImmediately) {
    ledger = std::make_unique<xarb::BalanceLedger>(
        std::map<std::string, double>{{"XRP", 10000.0}, {"USDT", 5000.0}, {"USDC", 10.0}});
    auto executor = make_executor();
    EXPECT_CALL(*gateway, submit_order(IsSell())).WillOnce(Return(xarb::OrderFill{100.0, 0.52}));
    EXPECT_CALL(*gateway, submit_order(IsBuy())).Times(0);

    auto result = executor->execute(executor->plan(candidate(), 100.0));

    EXPECT_EQ(result.state, xarb::TradeState::BUY_FAILED);
    EXPECT_EQ(result.status, xarb::AttemptStatus::PARTIAL);
    EXPECT_TRUE(result.requires_reconciliation);
    EXPECT_TRUE(sleeps.empty());
    expect_ledger(9900.0, 5000.0 + 100.0 * 0.52 * 0.9994, 10.0);
}

TEST_F(TradeExecutorTest, BuyCostAboveReservationIsFlagged) {
    auto executor = make_executor();
    EXPECT_CALL(*gateway, submit_order(IsSell())).WillOnce(Return(xarb::OrderFill{100.0, 0.52}));
    EXPECT_CALL(*gateway, submit_order(IsBuy())).WillOnce(Return(xarb::OrderFill{100.0, 0.60}));

    auto result = executor->execute(executor->plan(candidate(), 100.0));

    EXPECT_EQ(result.status, xarb::AttemptStatus::COMPLETED);
    EXPECT_TRUE(result.requires_reconciliation);
    const double reserved = 100.0 * 0.50 * 1.001 * 1.0006;
    expect_ledger(10000.0, 5000.0 + 100.0 * 0.52 * 0.9994, 5000.0 - reserved);
    EXPECT_NEAR(result.realized_profit_loss, 100.0 * 0.52 * 0.9994 - 100.0 * 0.60 * 1.0006, 1e-9);
}

TEST_F(TradeExecutorTest, ShortBuyFillReportsInventoryDrift) {
    auto executor = make_executor();
    EXPECT_CALL(*gateway, submit_order(IsSell())).WillOnce(Return(xarb::OrderFill{100.0, 0.52}));
    EXPECT_CALL(*gateway, submit_order(IsBuy())).WillOnce(Return(xarb::OrderFill{95.0, 0.50}));

    auto result = executor->execute(executor->plan(candidate(), 100.0));

    EXPECT_EQ(result.status, xarb::AttemptStatus::COMPLETED);
    EXPECT_NEAR(result.inventory_drift, -5.0, 1e-12);
    EXPECT_NEAR(ledger->balance("XRP").free, 9995.0, 1e-9);
}

TEST_F(TradeExecutorTest, RejectsAttemptThatIsNotPlanned) {
    auto executor = make_executor();
    auto attempt = executor->plan(candidate(), 100.0);
    attempt.transition_to(xarb::TradeState::SELLING, now);
    EXPECT_THROW(executor->execute(attempt), xarb::TradingError);
}
