#include "example_strategies.hpp"
#include "strategy_context.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <numeric>

namespace strategy_engine {

    namespace {
        // Reads an optional positive integer option
        long long positiveOption(const json& options, const char* key, long long default_value,
                                 const std::string& strategy_name) {
            if (!options.is_object()) {
                throw core::StrategyException(fmt::format("{}: options must be a JSON object.", strategy_name));
            }
            if (!options.contains(key)) {
                return default_value;
            }
            const auto& value = options.at(key);
            if (!value.is_number_integer() || value.get<long long>() < 1) {
                throw core::StrategyException(fmt::format("{}: '{}' must be a positive integer.", strategy_name, key));
            }
            return value.get<long long>();
        }
    } // end anonymous namespace

    // --- BuyAndHoldStrategy ---

    void BuyAndHoldStrategy::init(const json& options) {
        max_trades_ = positiveOption(options, "max_trades", 1, getName());
        trades_made_ = 0;
    }

    void BuyAndHoldStrategy::next(backtester::StrategyContext& context) {
        if (trades_made_ < max_trades_ && context.position() == core::PositionState::None) {
            context.buy();
            ++trades_made_;
        }
    }

    // --- BuyUntilHighStrategy ---

    std::optional<core::Action> BuyUntilHighStrategy::evaluate(const core::Candle& candle,
                                                               const backtester::Result&) const {
        if (candle.high >= threshold_) {
            return core::Action::CloseBuy;
        }
        return core::Action::Buy;
    }

    // --- SmaCrossStrategy ---

    void SmaCrossStrategy::init(const json& options) {
        fast_period_ = static_cast<std::size_t>(positiveOption(options, "fast", 10, getName()));
        slow_period_ = static_cast<std::size_t>(positiveOption(options, "slow", 20, getName()));
        if (fast_period_ >= slow_period_) {
            throw core::StrategyException(fmt::format("{}: fast period ({}) must be less than slow period ({}).",
                                                      getName(), fast_period_, slow_period_));
        }
        closes_.clear();
        previous_spread_.reset();
    }

    double SmaCrossStrategy::average(const std::deque<double>& window, std::size_t period) {
        return std::accumulate(window.end() - static_cast<std::ptrdiff_t>(period), window.end(), 0.0) /
               static_cast<double>(period);
    }

    void SmaCrossStrategy::next(backtester::StrategyContext& context) {
        closes_.push_back(context.data().close);
        if (closes_.size() > slow_period_) {
            closes_.pop_front();
        }
        if (closes_.size() < slow_period_) {
            return; // Not enough history yet
        }

        double spread = average(closes_, fast_period_) - average(closes_, slow_period_);
        std::optional<double> previous = previous_spread_;
        previous_spread_ = spread;
        if (!previous) {
            return;
        }

        core::PositionState position = context.position();
        if (*previous <= 0.0 && spread > 0.0) {
            core::logging::getLogger()->debug("{}: bullish crossover at bar {}", getName(), context.barIndex());
            if (position == core::PositionState::Short) {
                context.closeSell();
            } else if (position == core::PositionState::None) {
                context.buy();
            }
        } else if (*previous >= 0.0 && spread < 0.0) {
            core::logging::getLogger()->debug("{}: bearish crossover at bar {}", getName(), context.barIndex());
            if (position == core::PositionState::Long) {
                context.closeBuy();
            } else if (position == core::PositionState::None) {
                context.sell();
            }
        }
    }

} // namespace strategy_engine
