#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "backtest_config.hpp"
#include "backtest_metrics.hpp"
#include "trade_pair.hpp"

namespace backtester {

    using json = nlohmann::json;

    // Accumulates the action stream of one backtest, then derives trades and
    // statistics from it in compile(). Mutable only until compiled.
    class Result {
    public:
        explicit Result(BacktestConfig config = BacktestConfig{});

        // --- Modifiers (throw core::BacktestException once compiled) ---
        void setInputRange(const std::optional<core::Timestamp>& start_date,
                           const std::optional<core::Timestamp>& end_date);

        // Records an action taken on a bar. index must be strictly greater than
        // the previously recorded one.
        void addDataPoint(const core::Candle& candle, core::Action action, std::size_t index);

        // Pairs the recorded actions and computes every metric. Returns the
        // pairing error, if any, and leaves the Result uncompiled in that case.
        // Throws core::BacktestException when called a second time.
        std::optional<PairingError> compile();

        bool isCompiled() const { return compiled_; }

        // --- Getters ---
        const BacktestConfig& getConfig() const { return config_; }
        double getStartingBalance() const { return config_.starting_balance; }
        double getTotalProfitAndLoss() const { return metrics_.total_profit_and_loss; }
        const std::vector<core::DataPoint>& getDataPoints() const { return data_points_; }
        const std::vector<TradePair>& getTradePairs() const { return trade_pairs_; }
        std::size_t getTradesCount() const { return trade_pairs_.size(); }
        const std::optional<core::Timestamp>& getStartDate() const { return start_date_; }
        const std::optional<core::Timestamp>& getEndDate() const { return end_date_; }
        // Days from the first to the last input bar; empty without timestamps
        std::optional<double> getDuration() const;
        const BacktestMetrics& getMetrics() const { return metrics_; }
        const std::vector<std::string>& getWarnings() const { return warnings_; }

        // Exposure implied by the last recorded action
        core::PositionState position() const;
        // Starting balance plus the P&L realised by the actions recorded so far
        double equity() const;

        // Metrics summary without data points or trade pairs
        json toSummaryJson() const;

    private:
        void ensureMutable(const char* operation) const;

        BacktestConfig config_;
        std::optional<core::Timestamp> start_date_;
        std::optional<core::Timestamp> end_date_;
        std::vector<core::DataPoint> data_points_;
        std::vector<TradePair> trade_pairs_;
        BacktestMetrics metrics_;
        std::vector<std::string> warnings_;
        bool compiled_ = false;

        // Running view of the stream for equity() during the replay
        std::optional<core::DataPoint> open_entry_;
        double realized_profit_and_loss_ = 0.0;
    };

} // namespace backtester
