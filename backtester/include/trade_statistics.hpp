#pragma once

#include <string>
#include <vector>
#include <utility>

#include "trade_pair.hpp"
#include "backtest_config.hpp"
#include "backtest_metrics.hpp"

// Pure reducers over a chronological sequence of trade pairs.
// Every function has a defined value for the degenerate cases (no trades,
// zero balance, zero volatility) and never throws.
namespace backtester {
namespace statistics {

    // --- Profit ---
    double totalProfitAndLoss(const std::vector<TradePair>& pairs);
    // {gross profit, gross loss}; loss collects every non-positive result
    std::pair<double, double> grossProfitAndLoss(const std::vector<TradePair>& pairs);
    // 0 when there is neither profit nor loss, +inf when there is no loss
    double profitFactor(const std::vector<TradePair>& pairs);
    double expectancy(const std::vector<TradePair>& pairs);
    double expectancyPercentage(const std::vector<TradePair>& pairs, double starting_balance);
    double averageWinningTrade(const std::vector<TradePair>& pairs);
    double averageLosingTrade(const std::vector<TradePair>& pairs);
    double largestWinningTrade(const std::vector<TradePair>& pairs);
    double largestLosingTrade(const std::vector<TradePair>& pairs);

    // --- Trades ---
    double winRate(const std::vector<TradePair>& pairs);
    double bestTradeByPercentage(const std::vector<TradePair>& pairs);
    double worstTradeByPercentage(const std::vector<TradePair>& pairs);
    double maxTradeDuration(const std::vector<TradePair>& pairs);
    double averageTradeDuration(const std::vector<TradePair>& pairs);

    // --- Draw Down ---
    DrawDownSummary drawDown(const std::vector<TradePair>& pairs);

    // --- Returns and Ratios ---
    double totalReturnPercentage(double total_profit_and_loss, double starting_balance);
    // Compound annual growth over duration_days
    double annualReturnPercentage(double total_profit_and_loss, double starting_balance, double duration_days);
    double annualVolatility(const std::vector<TradePair>& pairs, double duration_days);
    double downsideVolatility(const std::vector<TradePair>& pairs, double duration_days);
    double sharpeRatio(double annual_return_pct, double annual_volatility, double risk_free_rate);
    double sortinoRatio(double annual_return_pct, double downside_volatility, double risk_free_rate);
    double calmarRatio(double annual_return_pct, double max_draw_down_pct);

    // --- System Quality ---
    double systemQualityNumber(const std::vector<TradePair>& pairs);
    std::string sqnInterpretation(double sqn);
    double sqnConfidenceLevel(const std::vector<TradePair>& pairs);

    // --- Position Sizing ---
    double kellyCriterion(const std::vector<TradePair>& pairs);
    double fractionalKelly(const std::vector<TradePair>& pairs, double fraction);
    std::string kellyInterpretation(double kelly);
    double geometricMeanReturn(const std::vector<TradePair>& pairs);
    double riskOfRuin(const std::vector<TradePair>& pairs, double drawdown_limit);

    // Runs every reducer above
    BacktestMetrics computeMetrics(const std::vector<TradePair>& pairs,
                                   const BacktestConfig& config,
                                   double duration_days);

    // Human readable warnings about suspicious results, empty when none apply
    std::vector<std::string> runtimeWarnings(const BacktestMetrics& metrics);

} // namespace statistics
} // namespace backtester
