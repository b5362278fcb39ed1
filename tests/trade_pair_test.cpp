// trade_pair_test.cpp - round trip reconstruction from an action stream
//
// Covers the profit and loss of a single pair, balance threading across
// pairs, and how compilePairs treats unmatched or mismatched actions.

#include <gtest/gtest.h>

#include "trade_pair.hpp"
#include "test_helpers.hpp"

#include <variant>
#include <vector>

using backtester::PairingError;
using backtester::TradePair;
using core::Action;
using test_helpers::day;
using test_helpers::make_point;

namespace {

std::vector<TradePair> compileOk(const std::vector<core::DataPoint>& points, double starting_balance) {
    auto compiled = backtester::compilePairs(points, starting_balance);
    EXPECT_TRUE(std::holds_alternative<std::vector<TradePair>>(compiled));
    return std::get<std::vector<TradePair>>(compiled);
}

}  // namespace

// ===========================================================================
// 1. Profit and loss of one round trip
// ===========================================================================

TEST(ProfitAndLossTest, LongIsExitMinusEnter) {
    auto delta = backtester::profitAndLoss(make_point(Action::Buy, 10.0, 1), make_point(Action::CloseBuy, 12.0, 2));
    ASSERT_TRUE(std::holds_alternative<double>(delta));
    EXPECT_DOUBLE_EQ(std::get<double>(delta), 2.0);
}

TEST(ProfitAndLossTest, ShortIsEnterMinusExit) {
    auto delta = backtester::profitAndLoss(make_point(Action::Sell, 12.0, 1), make_point(Action::CloseSell, 9.0, 2));
    ASSERT_TRUE(std::holds_alternative<double>(delta));
    EXPECT_DOUBLE_EQ(std::get<double>(delta), 3.0);
}

TEST(ProfitAndLossTest, MismatchedDirectionIsAnError) {
    auto delta = backtester::profitAndLoss(make_point(Action::Buy, 10.0, 1), make_point(Action::CloseSell, 9.0, 2));
    ASSERT_TRUE(std::holds_alternative<PairingError>(delta));
    EXPECT_EQ(std::get<PairingError>(delta).message, "cannot pair buy at index 1 with close_sell at index 2");
}

TEST(ProfitAndLossTest, TwoEntriesCannotPair) {
    auto delta = backtester::profitAndLoss(make_point(Action::Buy, 10.0, 1), make_point(Action::Sell, 9.0, 2));
    EXPECT_TRUE(std::holds_alternative<PairingError>(delta));
}

// ===========================================================================
// 2. TradePair derived values
// ===========================================================================

TEST(TradePairTest, ResultPercentageOfPreviousBalance) {
    auto made = backtester::makeTradePair(make_point(Action::Buy, 10.0, 1), make_point(Action::CloseBuy, 12.0, 2), 10000.0);
    ASSERT_TRUE(std::holds_alternative<TradePair>(made));
    const auto& pair = std::get<TradePair>(made);
    EXPECT_DOUBLE_EQ(pair.previous_balance, 10000.0);
    EXPECT_DOUBLE_EQ(pair.balance, 10002.0);
    EXPECT_DOUBLE_EQ(pair.resultPercentage(), 0.02);
    EXPECT_EQ(pair.outcome(), backtester::TradeOutcome::Win);
}

TEST(TradePairTest, ZeroPreviousBalanceGivesZeroPercentage) {
    auto made = backtester::makeTradePair(make_point(Action::Buy, 10.0, 1), make_point(Action::CloseBuy, 12.0, 2), 0.0);
    ASSERT_TRUE(std::holds_alternative<TradePair>(made));
    EXPECT_DOUBLE_EQ(std::get<TradePair>(made).resultPercentage(), 0.0);
}

TEST(TradePairTest, OutcomeClassification) {
    auto loss = std::get<TradePair>(backtester::makeTradePair(
        make_point(Action::Sell, 10.0, 1), make_point(Action::CloseSell, 11.0, 2), 100.0));
    auto flat = std::get<TradePair>(backtester::makeTradePair(
        make_point(Action::Buy, 10.0, 1), make_point(Action::CloseBuy, 10.0, 2), 100.0));
    EXPECT_EQ(loss.outcome(), backtester::TradeOutcome::Loss);
    EXPECT_EQ(flat.outcome(), backtester::TradeOutcome::BreakEven);
    EXPECT_EQ(backtester::outcomeToString(flat.outcome()), "break_even");
}

TEST(TradePairTest, DurationNeedsBothTimestamps) {
    auto timed = std::get<TradePair>(backtester::makeTradePair(
        make_point(Action::Buy, 10.0, 1, day(0)), make_point(Action::CloseBuy, 12.0, 2, day(3)), 100.0));
    auto untimed = std::get<TradePair>(backtester::makeTradePair(
        make_point(Action::Buy, 10.0, 1, day(0)), make_point(Action::CloseBuy, 12.0, 2), 100.0));
    EXPECT_DOUBLE_EQ(timed.durationDays(), 3.0);
    EXPECT_DOUBLE_EQ(untimed.durationDays(), 0.0);
}

// ===========================================================================
// 3. compilePairs
// ===========================================================================

TEST(CompilePairsTest, SingleLongRoundTrip) {
    auto pairs = compileOk({make_point(Action::Buy, 10.0, 1), make_point(Action::CloseBuy, 12.0, 2)}, 10000.0);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_DOUBLE_EQ(pairs[0].resultValue(), 2.0);
    EXPECT_DOUBLE_EQ(pairs[0].balance, 10002.0);
    EXPECT_EQ(pairs[0].enter_point.index, 1u);
    EXPECT_EQ(pairs[0].exit_point.index, 2u);
}

TEST(CompilePairsTest, BalanceIsThreadedThroughPairs) {
    auto pairs = compileOk({
        make_point(Action::Buy, 10.0, 1),
        make_point(Action::CloseBuy, 12.0, 2),
        make_point(Action::Sell, 20.0, 3),
        make_point(Action::CloseSell, 25.0, 4),
    }, 1000.0);
    ASSERT_EQ(pairs.size(), 2u);
    EXPECT_DOUBLE_EQ(pairs[0].previous_balance, 1000.0);
    EXPECT_DOUBLE_EQ(pairs[0].balance, 1002.0);
    EXPECT_DOUBLE_EQ(pairs[1].previous_balance, 1002.0);
    EXPECT_DOUBLE_EQ(pairs[1].balance, 997.0);
}

TEST(CompilePairsTest, EmptyStreamGivesNoPairs) {
    EXPECT_TRUE(compileOk({}, 1000.0).empty());
}

TEST(CompilePairsTest, TrailingEntryIsDropped) {
    auto pairs = compileOk({
        make_point(Action::Buy, 10.0, 1),
        make_point(Action::CloseBuy, 12.0, 2),
        make_point(Action::Buy, 13.0, 3),
    }, 1000.0);
    EXPECT_EQ(pairs.size(), 1u);
}

TEST(CompilePairsTest, CloseWithoutEntryIsDropped) {
    auto pairs = compileOk({
        make_point(Action::CloseBuy, 9.0, 1),
        make_point(Action::Buy, 10.0, 2),
        make_point(Action::CloseBuy, 12.0, 3),
        make_point(Action::CloseSell, 14.0, 4),
    }, 1000.0);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].enter_point.index, 2u);
}

TEST(CompilePairsTest, LaterEntryReplacesOpenEntry) {
    auto pairs = compileOk({
        make_point(Action::Sell, 10.0, 1),
        make_point(Action::Buy, 11.0, 2),
        make_point(Action::CloseBuy, 15.0, 3),
    }, 1000.0);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].enter_point.index, 2u);
    EXPECT_DOUBLE_EQ(pairs[0].resultValue(), 4.0);
}

TEST(CompilePairsTest, MismatchedCloseFailsTheRun) {
    auto compiled = backtester::compilePairs({
        make_point(Action::Buy, 10.0, 1),
        make_point(Action::CloseBuy, 12.0, 2),
        make_point(Action::Buy, 12.0, 3),
        make_point(Action::CloseSell, 11.0, 4),
    }, 1000.0);
    ASSERT_TRUE(std::holds_alternative<PairingError>(compiled));
    EXPECT_EQ(std::get<PairingError>(compiled).message, "cannot pair buy at index 3 with close_sell at index 4");
}

TEST(CompilePairsTest, FlattenedPairsCompileToTheSamePairs) {
    auto pairs = compileOk({
        make_point(Action::CloseSell, 8.0, 1),
        make_point(Action::Buy, 10.0, 2),
        make_point(Action::Buy, 11.0, 3),
        make_point(Action::CloseBuy, 12.0, 4),
        make_point(Action::Sell, 20.0, 5),
        make_point(Action::CloseSell, 18.0, 6),
        make_point(Action::Sell, 21.0, 7),
    }, 500.0);

    auto flattened = backtester::flattenPairs(pairs);
    ASSERT_EQ(flattened.size(), 4u);

    auto again = compileOk(flattened, 500.0);
    ASSERT_EQ(again.size(), pairs.size());
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        EXPECT_EQ(again[i].enter_point.index, pairs[i].enter_point.index);
        EXPECT_EQ(again[i].exit_point.index, pairs[i].exit_point.index);
        EXPECT_DOUBLE_EQ(again[i].balance, pairs[i].balance);
    }
}
