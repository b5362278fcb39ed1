#include "trade_statistics.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <iterator>
#include <numeric>
#include <optional>

namespace backtester {
namespace statistics {

    namespace {
        constexpr double kDaysPerYear = 365.25;
        constexpr std::size_t kMinTradesForConfidence = 30;
        constexpr std::size_t kExcessiveTradeCount = 1000;
        constexpr double kHighDrawDownPct = 20.0;

        std::vector<double> resultValues(const std::vector<TradePair>& pairs) {
            std::vector<double> values;
            values.reserve(pairs.size());
            for (const auto& pair : pairs) {
                values.push_back(pair.resultValue());
            }
            return values;
        }

        std::vector<double> resultPercentages(const std::vector<TradePair>& pairs) {
            std::vector<double> values;
            values.reserve(pairs.size());
            for (const auto& pair : pairs) {
                values.push_back(pair.resultPercentage());
            }
            return values;
        }

        double mean(const std::vector<double>& values) {
            if (values.empty()) return 0.0;
            return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
        }

        // Sample standard deviation (n - 1); 0 for fewer than two values
        double sampleStdDev(const std::vector<double>& values) {
            if (values.size() < 2) return 0.0;
            double avg = mean(values);
            double sum_sq = 0.0;
            for (double v : values) {
                sum_sq += (v - avg) * (v - avg);
            }
            return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
        }

        // Trades per year, 1.0 when the tested period is unknown
        double tradeFrequency(std::size_t trade_count, double duration_days) {
            if (duration_days <= 0.0) return 1.0;
            return static_cast<double>(trade_count) / (duration_days / kDaysPerYear);
        }
    } // end anonymous namespace

    // --- Profit ---

    double totalProfitAndLoss(const std::vector<TradePair>& pairs) {
        double total = 0.0;
        for (const auto& pair : pairs) {
            total += pair.resultValue();
        }
        return total;
    }

    std::pair<double, double> grossProfitAndLoss(const std::vector<TradePair>& pairs) {
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        for (const auto& pair : pairs) {
            double value = pair.resultValue();
            if (value > 0.0) {
                gross_profit += value;
            } else {
                gross_loss += value;
            }
        }
        return {gross_profit, gross_loss};
    }

    double profitFactor(const std::vector<TradePair>& pairs) {
        auto [gross_profit, gross_loss] = grossProfitAndLoss(pairs);
        if (gross_loss == 0.0) {
            return gross_profit == 0.0 ? 0.0 : std::numeric_limits<double>::infinity();
        }
        return gross_profit / std::abs(gross_loss);
    }

    double expectancy(const std::vector<TradePair>& pairs) {
        if (pairs.empty()) return 0.0;
        return totalProfitAndLoss(pairs) / static_cast<double>(pairs.size());
    }

    double expectancyPercentage(const std::vector<TradePair>& pairs, double starting_balance) {
        if (starting_balance == 0.0) return 0.0;
        return expectancy(pairs) / starting_balance * 100.0;
    }

    double averageWinningTrade(const std::vector<TradePair>& pairs) {
        double sum = 0.0;
        std::size_t count = 0;
        for (const auto& pair : pairs) {
            double value = pair.resultValue();
            if (value > 0.0) {
                sum += value;
                ++count;
            }
        }
        return count == 0 ? 0.0 : sum / static_cast<double>(count);
    }

    double averageLosingTrade(const std::vector<TradePair>& pairs) {
        double sum = 0.0;
        std::size_t count = 0;
        for (const auto& pair : pairs) {
            double value = pair.resultValue();
            if (value < 0.0) {
                sum += value;
                ++count;
            }
        }
        return count == 0 ? 0.0 : sum / static_cast<double>(count);
    }

    double largestWinningTrade(const std::vector<TradePair>& pairs) {
        double largest = 0.0;
        for (const auto& pair : pairs) {
            largest = std::max(largest, pair.resultValue());
        }
        return largest;
    }

    double largestLosingTrade(const std::vector<TradePair>& pairs) {
        double largest = 0.0;
        for (const auto& pair : pairs) {
            largest = std::min(largest, pair.resultValue());
        }
        return largest;
    }

    // --- Trades ---

    double winRate(const std::vector<TradePair>& pairs) {
        if (pairs.empty()) return 0.0;
        auto wins = std::count_if(pairs.begin(), pairs.end(),
                                  [](const TradePair& pair) { return pair.outcome() == TradeOutcome::Win; });
        return static_cast<double>(wins) / static_cast<double>(pairs.size()) * 100.0;
    }

    double bestTradeByPercentage(const std::vector<TradePair>& pairs) {
        auto values = resultPercentages(pairs);
        if (values.empty()) return 0.0;
        return *std::max_element(values.begin(), values.end());
    }

    double worstTradeByPercentage(const std::vector<TradePair>& pairs) {
        auto values = resultPercentages(pairs);
        if (values.empty()) return 0.0;
        return *std::min_element(values.begin(), values.end());
    }

    double maxTradeDuration(const std::vector<TradePair>& pairs) {
        if (pairs.empty()) return 0.0;
        double longest = pairs.front().durationDays();
        for (const auto& pair : pairs) {
            longest = std::max(longest, pair.durationDays());
        }
        return longest;
    }

    double averageTradeDuration(const std::vector<TradePair>& pairs) {
        if (pairs.empty()) return 0.0;
        double total = 0.0;
        for (const auto& pair : pairs) {
            total += pair.durationDays();
        }
        return total / static_cast<double>(pairs.size());
    }

    // --- Draw Down ---

    DrawDownSummary drawDown(const std::vector<TradePair>& pairs) {
        DrawDownSummary summary;
        if (pairs.empty()) return summary;

        // The first pair seeds the peak; later pairs raise it only when strictly higher
        double peak = pairs.front().balance;
        std::optional<core::Timestamp> peak_time = pairs.front().exit_point.candle.timestamp;
        double percentage_sum = 0.0;
        double duration_sum = 0.0;

        for (const auto& pair : pairs) {
            const auto& exit_time = pair.exit_point.candle.timestamp;
            if (pair.balance > peak) {
                peak = pair.balance;
                peak_time = exit_time;
            }

            if (peak <= 0.0 || pair.balance >= peak) {
                continue;
            }

            double percentage = (peak - pair.balance) / peak * 100.0;
            double duration = core::utils::daysBetween(peak_time, exit_time).value_or(0.0);

            ++summary.drawdown_count;
            percentage_sum += percentage;
            duration_sum += duration;
            summary.max_percentage = std::max(summary.max_percentage, percentage);
            summary.max_duration = std::max(summary.max_duration, duration);
        }

        if (summary.drawdown_count > 0) {
            summary.average_percentage = percentage_sum / static_cast<double>(summary.drawdown_count);
            summary.average_duration = duration_sum / static_cast<double>(summary.drawdown_count);
        }
        return summary;
    }

    // --- Returns and Ratios ---

    double totalReturnPercentage(double total_profit_and_loss, double starting_balance) {
        if (starting_balance == 0.0) return 0.0;
        return total_profit_and_loss / starting_balance * 100.0;
    }

    double annualReturnPercentage(double total_profit_and_loss, double starting_balance, double duration_days) {
        if (starting_balance == 0.0 || duration_days == 0.0) return 0.0;
        double final_value = starting_balance + total_profit_and_loss;
        if (final_value <= 0.0) return -100.0; // Account wiped out
        double years = duration_days / kDaysPerYear;
        return (std::pow(final_value / starting_balance, 1.0 / years) - 1.0) * 100.0;
    }

    double annualVolatility(const std::vector<TradePair>& pairs, double duration_days) {
        auto returns = resultPercentages(pairs);
        if (returns.size() < 2) return 0.0;
        return sampleStdDev(returns) * std::sqrt(tradeFrequency(returns.size(), duration_days));
    }

    double downsideVolatility(const std::vector<TradePair>& pairs, double duration_days) {
        auto returns = resultPercentages(pairs);
        std::vector<double> negative_returns;
        std::copy_if(returns.begin(), returns.end(), std::back_inserter(negative_returns),
                     [](double r) { return r < 0.0; });
        if (negative_returns.size() < 2) return 0.0;
        // Annualized by the frequency of all trades, not only the losing ones
        return sampleStdDev(negative_returns) * std::sqrt(tradeFrequency(returns.size(), duration_days));
    }

    double sharpeRatio(double annual_return_pct, double annual_volatility, double risk_free_rate) {
        if (annual_volatility == 0.0) return 0.0;
        return (annual_return_pct - risk_free_rate * 100.0) / annual_volatility;
    }

    double sortinoRatio(double annual_return_pct, double downside_volatility, double risk_free_rate) {
        if (downside_volatility == 0.0) return 0.0;
        return (annual_return_pct - risk_free_rate * 100.0) / downside_volatility;
    }

    double calmarRatio(double annual_return_pct, double max_draw_down_pct) {
        double max_draw_down = std::abs(max_draw_down_pct);
        if (max_draw_down == 0.0) return 0.0;
        return annual_return_pct / max_draw_down;
    }

    // --- System Quality ---

    double systemQualityNumber(const std::vector<TradePair>& pairs) {
        if (pairs.size() < 2) return 0.0;
        auto values = resultValues(pairs);
        double std_dev = sampleStdDev(values);
        if (std_dev == 0.0) return 0.0;
        return mean(values) / std_dev * std::sqrt(static_cast<double>(values.size()));
    }

    std::string sqnInterpretation(double sqn) {
        if (sqn < 1.6) return "Poor system";
        if (sqn < 2.0) return "Below average but tradeable";
        if (sqn < 2.5) return "Average system";
        if (sqn < 3.0) return "Good system";
        if (sqn < 5.0) return "Excellent system";
        if (sqn < 7.0) return "Superb system";
        return "Too good to be true (likely curve-fitted)";
    }

    double sqnConfidenceLevel(const std::vector<TradePair>& pairs) {
        if (pairs.size() < kMinTradesForConfidence) return 0.0;
        double sqn = systemQualityNumber(pairs);

        double base_confidence = 0.30;
        if (sqn >= 2.0) {
            base_confidence = 0.95;
        } else if (sqn >= 1.6) {
            base_confidence = 0.80;
        } else if (sqn >= 1.0) {
            base_confidence = 0.60;
        }

        double sample_adjustment = std::min(static_cast<double>(pairs.size()) / 100.0, 1.0);
        return base_confidence * sample_adjustment;
    }

    // --- Position Sizing ---

    double kellyCriterion(const std::vector<TradePair>& pairs) {
        if (pairs.empty()) return 0.0;

        double win_probability = winRate(pairs) / 100.0;
        double loss_probability = 1.0 - win_probability;
        double average_win = averageWinningTrade(pairs);
        double average_loss = std::abs(averageLosingTrade(pairs));

        if (average_win == 0.0 || average_loss == 0.0 || loss_probability == 0.0) {
            return 0.0;
        }

        double odds = average_win / average_loss;
        return (odds * win_probability - loss_probability) / odds;
    }

    double fractionalKelly(const std::vector<TradePair>& pairs, double fraction) {
        return kellyCriterion(pairs) * fraction;
    }

    std::string kellyInterpretation(double kelly) {
        if (kelly <= 0.0) return "No edge - avoid this strategy";
        if (kelly <= 0.10) return "Weak edge - use small position sizes";
        if (kelly <= 0.25) return "Moderate edge - reasonable strategy";
        if (kelly <= 0.40) return "Strong edge - good strategy";
        return "Very strong edge - potentially too aggressive";
    }

    double geometricMeanReturn(const std::vector<TradePair>& pairs) {
        if (pairs.empty()) return 0.0;
        double growth = 1.0;
        for (const auto& pair : pairs) {
            growth *= 1.0 + pair.resultPercentage() / 100.0;
        }
        if (growth <= 0.0) return -100.0; // A trade lost the whole balance
        return (std::pow(growth, 1.0 / static_cast<double>(pairs.size())) - 1.0) * 100.0;
    }

    double riskOfRuin(const std::vector<TradePair>& pairs, double drawdown_limit) {
        if (kellyCriterion(pairs) <= 0.0) return 1.0;

        double win_probability = winRate(pairs) / 100.0;
        double best_pct = bestTradeByPercentage(pairs);
        double worst_pct = std::abs(worstTradeByPercentage(pairs));

        if (best_pct == 0.0) return 1.0;
        if (worst_pct == 0.0) return 0.0;

        double base_risk = std::pow(worst_pct / best_pct, win_probability);
        return std::min(base_risk / (1.0 - drawdown_limit), 1.0);
    }

    // --- Aggregation ---

    BacktestMetrics computeMetrics(const std::vector<TradePair>& pairs,
                                   const BacktestConfig& config,
                                   double duration_days) {
        BacktestMetrics metrics;
        double starting_balance = config.starting_balance;

        metrics.trades_count = pairs.size();
        metrics.total_profit_and_loss = totalProfitAndLoss(pairs);
        metrics.total_return_pct = totalReturnPercentage(metrics.total_profit_and_loss, starting_balance);
        metrics.annual_return_pct = annualReturnPercentage(metrics.total_profit_and_loss, starting_balance, duration_days);

        auto [gross_profit, gross_loss] = grossProfitAndLoss(pairs);
        metrics.gross_profit = gross_profit;
        metrics.gross_loss = gross_loss;
        metrics.profit_factor = profitFactor(pairs);

        metrics.win_rate = winRate(pairs);
        metrics.expectancy = expectancy(pairs);
        metrics.expectancy_pct = expectancyPercentage(pairs, starting_balance);
        metrics.average_winning_trade = averageWinningTrade(pairs);
        metrics.average_losing_trade = averageLosingTrade(pairs);
        metrics.largest_winning_trade = largestWinningTrade(pairs);
        metrics.largest_losing_trade = largestLosingTrade(pairs);
        metrics.best_trade_pct = bestTradeByPercentage(pairs);
        metrics.worst_trade_pct = worstTradeByPercentage(pairs);
        metrics.max_trade_duration = maxTradeDuration(pairs);
        metrics.average_trade_duration = averageTradeDuration(pairs);

        metrics.draw_down = drawDown(pairs);
        metrics.annual_volatility = annualVolatility(pairs, duration_days);
        metrics.downside_volatility = downsideVolatility(pairs, duration_days);
        metrics.sharpe_ratio = sharpeRatio(metrics.annual_return_pct, metrics.annual_volatility, config.risk_free_rate);
        metrics.sortino_ratio = sortinoRatio(metrics.annual_return_pct, metrics.downside_volatility, config.risk_free_rate);
        metrics.calmar_ratio = calmarRatio(metrics.annual_return_pct, metrics.draw_down.max_percentage);

        metrics.system_quality_number = systemQualityNumber(pairs);
        metrics.sqn_interpretation = sqnInterpretation(metrics.system_quality_number);
        metrics.sqn_confidence = sqnConfidenceLevel(pairs);

        metrics.kelly_criterion = kellyCriterion(pairs);
        metrics.fractional_kelly = fractionalKelly(pairs, config.kelly_fraction);
        metrics.kelly_interpretation = kellyInterpretation(metrics.kelly_criterion);
        metrics.geometric_mean_return = geometricMeanReturn(pairs);
        metrics.risk_of_ruin = riskOfRuin(pairs, config.risk_of_ruin_drawdown_limit);

        return metrics;
    }

    std::vector<std::string> runtimeWarnings(const BacktestMetrics& metrics) {
        std::vector<std::string> warnings;

        if (metrics.trades_count == 0) {
            warnings.emplace_back("No trades executed - strategy may be too conservative or data insufficient");
        }
        if (metrics.trades_count > kExcessiveTradeCount) {
            warnings.push_back(fmt::format("Excessive trading detected ({} trades) - consider transaction costs",
                                           metrics.trades_count));
        }
        if (metrics.total_profit_and_loss < 0.0) {
            warnings.emplace_back("Negative total return - strategy may need optimization");
        }
        if (metrics.draw_down.max_percentage > kHighDrawDownPct) {
            warnings.push_back(fmt::format("High maximum drawdown ({:.2f}%) - consider risk management",
                                           metrics.draw_down.max_percentage));
        }
        if (metrics.trades_count > 0 && (metrics.win_rate > 95.0 || metrics.win_rate < 5.0)) {
            warnings.push_back(fmt::format("Unusual win rate ({:.2f}%) - verify strategy logic", metrics.win_rate));
        }
        return warnings;
    }

} // namespace statistics
} // namespace backtester
