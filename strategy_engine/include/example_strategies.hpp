#pragma once

#include "interfaces.hpp"
#include <deque>
#include <optional>
#include <string>

namespace strategy_engine {

    // Buys while flat until max_trades entries have been made, never closes.
    // Options: "max_trades" (positive integer, default 1)
    class BuyAndHoldStrategy : public IStatefulStrategy {
    public:
        std::string getName() const override { return "BuyAndHold"; }
        void init(const json& options) override;
        void next(backtester::StrategyContext& context) override;

    private:
        long long max_trades_ = 1;
        long long trades_made_ = 0;
    };

    // Stateless: closes the long once the bar's high reaches the threshold,
    // otherwise (re)enters long.
    class BuyUntilHighStrategy : public IStatelessStrategy {
    public:
        explicit BuyUntilHighStrategy(double threshold = 100.0) : threshold_(threshold) {}

        std::string getName() const override { return "BuyUntilHigh"; }
        std::optional<core::Action> evaluate(const core::Candle& candle,
                                             const backtester::Result& result) const override;

        double getThreshold() const { return threshold_; }

    private:
        double threshold_;
    };

    // Moving average crossover on closes. A fast average crossing above the slow
    // one closes a short or opens a long; crossing below closes a long or opens a short.
    // Options: "fast" (default 10), "slow" (default 20), 1 <= fast < slow
    class SmaCrossStrategy : public IStatefulStrategy {
    public:
        std::string getName() const override { return "SmaCross"; }
        void init(const json& options) override;
        void next(backtester::StrategyContext& context) override;

    private:
        static double average(const std::deque<double>& window, std::size_t period);

        std::size_t fast_period_ = 10;
        std::size_t slow_period_ = 20;
        std::deque<double> closes_;              // Newest at the back, at most slow_period_ values
        std::optional<double> previous_spread_;  // fast - slow of the previous bar
    };

} // namespace strategy_engine
