// result_test.cpp - action accumulation, compilation and the strategy context

#include <gtest/gtest.h>

#include "result.hpp"
#include "strategy_context.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using backtester::BacktestConfig;
using backtester::Result;
using backtester::StrategyContext;
using core::Action;
using test_helpers::day;
using test_helpers::make_candle;

namespace {

BacktestConfig config_with_balance(double balance) {
    BacktestConfig config;
    config.starting_balance = balance;
    return config;
}

}  // namespace

// ===========================================================================
// 1. Recording actions
// ===========================================================================

TEST(ResultTest, RecordsDataPointsInOrder) {
    Result result;
    result.addDataPoint(make_candle(10.0), Action::Buy, 1);
    result.addDataPoint(make_candle(12.0), Action::CloseBuy, 3);
    ASSERT_EQ(result.getDataPoints().size(), 2u);
    EXPECT_EQ(result.getDataPoints()[1].index, 3u);
    EXPECT_EQ(result.getDataPoints()[1].action, Action::CloseBuy);
}

TEST(ResultTest, IndexMustIncrease) {
    Result result;
    result.addDataPoint(make_candle(10.0), Action::Buy, 2);
    EXPECT_THROW(result.addDataPoint(make_candle(11.0), Action::CloseBuy, 2), core::BacktestException);
    EXPECT_THROW(result.addDataPoint(make_candle(11.0), Action::CloseBuy, 1), core::BacktestException);
    EXPECT_EQ(result.getDataPoints().size(), 1u);
}

TEST(ResultTest, PositionFollowsLastAction) {
    Result result;
    EXPECT_EQ(result.position(), core::PositionState::None);
    result.addDataPoint(make_candle(10.0), Action::Sell, 1);
    EXPECT_EQ(result.position(), core::PositionState::Short);
    result.addDataPoint(make_candle(9.0), Action::CloseSell, 2);
    EXPECT_EQ(result.position(), core::PositionState::None);
    result.addDataPoint(make_candle(9.0), Action::Buy, 3);
    EXPECT_EQ(result.position(), core::PositionState::Long);
}

TEST(ResultTest, EquityIncludesRealizedTrades) {
    Result result(config_with_balance(1000.0));
    result.addDataPoint(make_candle(10.0), Action::Buy, 1);
    EXPECT_DOUBLE_EQ(result.equity(), 1000.0);
    result.addDataPoint(make_candle(12.0), Action::CloseBuy, 2);
    EXPECT_DOUBLE_EQ(result.equity(), 1002.0);
    result.addDataPoint(make_candle(20.0), Action::Sell, 3);
    result.addDataPoint(make_candle(21.0), Action::CloseSell, 4);
    EXPECT_DOUBLE_EQ(result.equity(), 1001.0);
}

TEST(ResultTest, MismatchedCloseDoesNotMoveEquity) {
    Result result(config_with_balance(1000.0));
    result.addDataPoint(make_candle(10.0), Action::Buy, 1);
    result.addDataPoint(make_candle(5.0), Action::CloseSell, 2);
    EXPECT_DOUBLE_EQ(result.equity(), 1000.0);
}

// ===========================================================================
// 2. Compilation
// ===========================================================================

TEST(ResultTest, CompileDerivesPairsAndMetrics) {
    Result result(config_with_balance(1000.0));
    result.setInputRange(day(0), day(10));
    result.addDataPoint(make_candle(10.0, day(1)), Action::Buy, 1);
    result.addDataPoint(make_candle(12.0, day(2)), Action::CloseBuy, 2);

    EXPECT_FALSE(result.compile().has_value());
    EXPECT_TRUE(result.isCompiled());
    EXPECT_EQ(result.getTradesCount(), 1u);
    EXPECT_DOUBLE_EQ(result.getTotalProfitAndLoss(), 2.0);
    EXPECT_DOUBLE_EQ(result.getMetrics().win_rate, 100.0);
    EXPECT_DOUBLE_EQ(result.equity(), 1002.0);
    ASSERT_TRUE(result.getDuration().has_value());
    EXPECT_DOUBLE_EQ(*result.getDuration(), 10.0);
}

TEST(ResultTest, CompiledResultIsImmutable) {
    Result result;
    ASSERT_FALSE(result.compile().has_value());
    EXPECT_THROW(result.addDataPoint(make_candle(10.0), Action::Buy, 1), core::BacktestException);
    EXPECT_THROW(result.setInputRange(day(0), day(1)), core::BacktestException);
    EXPECT_THROW(result.compile(), core::BacktestException);
}

TEST(ResultTest, PairingErrorLeavesResultUncompiled) {
    Result result;
    result.addDataPoint(make_candle(10.0), Action::Buy, 1);
    result.addDataPoint(make_candle(12.0), Action::CloseSell, 2);

    auto error = result.compile();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->message, "cannot pair buy at index 1 with close_sell at index 2");
    EXPECT_FALSE(result.isCompiled());
    EXPECT_TRUE(result.getTradePairs().empty());
}

TEST(ResultTest, NoTimestampsMeansNoDuration) {
    Result result;
    result.setInputRange(std::nullopt, std::nullopt);
    EXPECT_FALSE(result.getDuration().has_value());
}

TEST(ResultTest, NoTradesProducesWarning) {
    Result result;
    ASSERT_FALSE(result.compile().has_value());
    ASSERT_EQ(result.getWarnings().size(), 1u);
    EXPECT_EQ(result.getWarnings()[0], "No trades executed - strategy may be too conservative or data insufficient");
}

TEST(ResultTest, SummaryJson) {
    Result result(config_with_balance(1000.0));
    result.setInputRange(day(0), day(3));
    result.addDataPoint(make_candle(10.0, day(1)), Action::Buy, 1);
    result.addDataPoint(make_candle(15.0, day(2)), Action::CloseBuy, 2);
    ASSERT_FALSE(result.compile().has_value());

    auto summary = result.toSummaryJson();
    EXPECT_DOUBLE_EQ(summary.at("starting_balance").get<double>(), 1000.0);
    EXPECT_DOUBLE_EQ(summary.at("final_balance").get<double>(), 1005.0);
    EXPECT_EQ(summary.at("trades_count").get<std::size_t>(), 1u);
    EXPECT_EQ(summary.at("data_points_count").get<std::size_t>(), 2u);
    EXPECT_EQ(summary.at("start_date").get<std::string>(), "2023-01-01T00:00:00Z");
    EXPECT_DOUBLE_EQ(summary.at("duration_days").get<double>(), 3.0);
    // No losing trade
    EXPECT_EQ(summary.at("metrics").at("profit_factor").get<std::string>(), "inf");
}

// ===========================================================================
// 3. Strategy context
// ===========================================================================

TEST(StrategyContextTest, NoBarBeforeSetBar) {
    Result result;
    StrategyContext context(result);
    EXPECT_THROW(context.data(), core::BacktestException);
}

TEST(StrategyContextTest, LastActionWins) {
    Result result;
    StrategyContext context(result);
    context.setBar(make_candle(10.0), 0);
    context.buy();
    context.sell();
    ASSERT_TRUE(context.pendingAction().has_value());
    EXPECT_EQ(*context.pendingAction(), Action::Sell);

    auto taken = context.takeAction();
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(*taken, Action::Sell);
    EXPECT_FALSE(context.pendingAction().has_value());
}

TEST(StrategyContextTest, NewBarClearsPendingAction) {
    Result result;
    StrategyContext context(result);
    context.setBar(make_candle(10.0), 0);
    context.closeBuy();
    context.setBar(make_candle(11.0), 1);
    EXPECT_FALSE(context.pendingAction().has_value());
    EXPECT_EQ(context.barIndex(), 1u);
    EXPECT_DOUBLE_EQ(context.data().open, 11.0);
}

TEST(StrategyContextTest, ReadsPositionAndEquityFromResult) {
    Result result(config_with_balance(100.0));
    StrategyContext context(result);
    result.addDataPoint(make_candle(10.0), Action::Buy, 1);
    EXPECT_EQ(context.position(), core::PositionState::Long);
    result.addDataPoint(make_candle(13.0), Action::CloseBuy, 2);
    EXPECT_EQ(context.position(), core::PositionState::None);
    EXPECT_DOUBLE_EQ(context.equity(), 103.0);
}
