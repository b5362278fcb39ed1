#include "backtest_metrics.hpp"

#include <cmath>

namespace backtester {

    namespace {
        // JSON has no infinity; an unbounded profit factor is written as the string "inf"
        nlohmann::json number(double value) {
            if (std::isinf(value)) {
                return value > 0 ? "inf" : "-inf";
            }
            return value;
        }
    } // end anonymous namespace

    nlohmann::json BacktestMetrics::toJson() const {
        return nlohmann::json{
            {"total_profit_and_loss", total_profit_and_loss},
            {"total_return_pct", total_return_pct},
            {"annual_return_pct", annual_return_pct},
            {"gross_profit", gross_profit},
            {"gross_loss", gross_loss},
            {"profit_factor", number(profit_factor)},
            {"trades_count", trades_count},
            {"win_rate", win_rate},
            {"expectancy", expectancy},
            {"expectancy_pct", expectancy_pct},
            {"average_winning_trade", average_winning_trade},
            {"average_losing_trade", average_losing_trade},
            {"largest_winning_trade", largest_winning_trade},
            {"largest_losing_trade", largest_losing_trade},
            {"best_trade_pct", best_trade_pct},
            {"worst_trade_pct", worst_trade_pct},
            {"max_trade_duration", max_trade_duration},
            {"average_trade_duration", average_trade_duration},
            {"max_draw_down_pct", draw_down.max_percentage},
            {"average_draw_down_pct", draw_down.average_percentage},
            {"max_draw_down_duration", draw_down.max_duration},
            {"average_draw_down_duration", draw_down.average_duration},
            {"annual_volatility", annual_volatility},
            {"downside_volatility", downside_volatility},
            {"sharpe_ratio", sharpe_ratio},
            {"sortino_ratio", sortino_ratio},
            {"calmar_ratio", calmar_ratio},
            {"system_quality_number", system_quality_number},
            {"sqn_interpretation", sqn_interpretation},
            {"sqn_confidence", sqn_confidence},
            {"kelly_criterion", kelly_criterion},
            {"fractional_kelly", fractional_kelly},
            {"kelly_interpretation", kelly_interpretation},
            {"geometric_mean_return", geometric_mean_return},
            {"risk_of_ruin", risk_of_ruin}
        };
    }

} // namespace backtester
