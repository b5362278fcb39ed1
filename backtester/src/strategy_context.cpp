#include "strategy_context.hpp"
#include "result.hpp"
#include "exceptions.hpp"

namespace backtester {

    StrategyContext::StrategyContext(const Result& result)
        : result_(result) {}

    void StrategyContext::setBar(const core::Candle& candle, std::size_t index) {
        current_bar_ = candle;
        bar_index_ = index;
        pending_action_.reset();
    }

    const core::Candle& StrategyContext::data() const {
        if (!current_bar_) {
            throw core::BacktestException("Strategy context has no current bar.");
        }
        return *current_bar_;
    }

    double StrategyContext::equity() const {
        return result_.equity();
    }

    core::PositionState StrategyContext::position() const {
        return result_.position();
    }

    std::optional<core::Action> StrategyContext::takeAction() {
        std::optional<core::Action> action = pending_action_;
        pending_action_.reset();
        return action;
    }

} // namespace backtester
