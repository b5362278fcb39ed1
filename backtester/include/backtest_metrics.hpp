// backtester/include/backtest_metrics.hpp
#pragma once

#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>

#include "logging.hpp"   // Provides core::logging::getLogger needed by BacktestMetrics::logMetrics

namespace backtester {

    // --- Draw Down Summary ---
    // Percentages are positive numbers (12.5 means 12.5% below the running peak)
    struct DrawDownSummary {
        double max_percentage = 0.0;
        double average_percentage = 0.0;
        double max_duration = 0.0;      // Days
        double average_duration = 0.0;  // Days
        std::size_t drawdown_count = 0; // Pairs that closed below the running peak
    };

    // --- Backtest Metrics Struct ---
    struct BacktestMetrics {
        // Profit and loss
        double total_profit_and_loss = 0.0;
        double total_return_pct = 0.0;
        double annual_return_pct = 0.0;
        double gross_profit = 0.0;
        double gross_loss = 0.0;       // Zero or negative
        double profit_factor = 0.0;    // +inf when there are profits and no losses

        // Trades
        std::size_t trades_count = 0;
        double win_rate = 0.0;         // Percent
        double expectancy = 0.0;
        double expectancy_pct = 0.0;
        double average_winning_trade = 0.0;
        double average_losing_trade = 0.0;
        double largest_winning_trade = 0.0;
        double largest_losing_trade = 0.0;
        double best_trade_pct = 0.0;
        double worst_trade_pct = 0.0;
        double max_trade_duration = 0.0;     // Days
        double average_trade_duration = 0.0; // Days

        // Risk
        DrawDownSummary draw_down;
        double annual_volatility = 0.0;
        double downside_volatility = 0.0;
        double sharpe_ratio = 0.0;
        double sortino_ratio = 0.0;
        double calmar_ratio = 0.0;

        // System quality and sizing
        double system_quality_number = 0.0;
        std::string sqn_interpretation;
        double sqn_confidence = 0.0;
        double kelly_criterion = 0.0;
        double fractional_kelly = 0.0;
        std::string kelly_interpretation;
        double geometric_mean_return = 0.0;
        double risk_of_ruin = 0.0;

        nlohmann::json toJson() const;

        // Helper method to log calculated metrics
        void logMetrics() const {
            auto logger = core::logging::getLogger();
            logger->info("--- Backtest Metrics ---");
            logger->info("Total PnL: {:.2f}", total_profit_and_loss);
            logger->info("Total Return: {:.2f}%", total_return_pct);
            logger->info("Annual Return: {:.2f}%", annual_return_pct);
            logger->info("Trades: {}", trades_count);
            logger->info("Win Rate: {:.2f}%", win_rate);
            logger->info("Profit Factor: {:.2f}", profit_factor);
            logger->info("Gross Profit / Loss: {:.2f} / {:.2f}", gross_profit, gross_loss);
            logger->info("Expectancy: {:.2f} ({:.4f}%)", expectancy, expectancy_pct);
            logger->info("Avg Win / Avg Loss: {:.2f} / {:.2f}", average_winning_trade, average_losing_trade);
            logger->info("Largest Win / Largest Loss: {:.2f} / {:.2f}", largest_winning_trade, largest_losing_trade);
            logger->info("Best / Worst Trade: {:.4f}% / {:.4f}%", best_trade_pct, worst_trade_pct);
            logger->info("Max / Avg Trade Duration: {:.2f} / {:.2f} days", max_trade_duration, average_trade_duration);
            logger->info("Max Drawdown: {:.2f}% ({:.2f} days)", draw_down.max_percentage, draw_down.max_duration);
            logger->info("Avg Drawdown: {:.2f}% ({:.2f} days)", draw_down.average_percentage, draw_down.average_duration);
            logger->info("Annual / Downside Volatility: {:.4f} / {:.4f}", annual_volatility, downside_volatility);
            logger->info("Sharpe / Sortino / Calmar: {:.4f} / {:.4f} / {:.4f}", sharpe_ratio, sortino_ratio, calmar_ratio);
            logger->info("SQN: {:.4f} ({}), confidence {:.2f}", system_quality_number, sqn_interpretation, sqn_confidence);
            logger->info("Kelly: {:.4f} ({}), fractional {:.4f}", kelly_criterion, kelly_interpretation, fractional_kelly);
            logger->info("Geometric Mean Return: {:.4f}%", geometric_mean_return);
            logger->info("Risk of Ruin: {:.4f}", risk_of_ruin);
            logger->info("------------------------");
        }
    };

} // namespace backtester
