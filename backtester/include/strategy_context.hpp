#pragma once

#include <cstddef>
#include <optional>

#include "datatypes.hpp"

namespace backtester {

    class Result;

    // Per-run execution context handed to stateful strategies.
    // Created on the stack of one Backtester::run call and gone when it returns,
    // so concurrent backtests never see each other's state.
    class StrategyContext {
    public:
        explicit StrategyContext(const Result& result);

        // Called by the loop before each next()
        void setBar(const core::Candle& candle, std::size_t index);

        // Current bar; throws core::BacktestException before the first setBar()
        const core::Candle& data() const;
        std::size_t barIndex() const { return bar_index_; }

        double equity() const;
        core::PositionState position() const;

        // --- Actions (a later call within the same bar replaces an earlier one) ---
        void buy()       { pending_action_ = core::Action::Buy; }
        void sell()      { pending_action_ = core::Action::Sell; }
        void closeBuy()  { pending_action_ = core::Action::CloseBuy; }
        void closeSell() { pending_action_ = core::Action::CloseSell; }
        void setAction(core::Action action) { pending_action_ = action; }

        const std::optional<core::Action>& pendingAction() const { return pending_action_; }
        // Returns the pending action and clears it
        std::optional<core::Action> takeAction();

        const Result& result() const { return result_; }

    private:
        const Result& result_;
        std::optional<core::Candle> current_bar_;
        std::size_t bar_index_ = 0;
        std::optional<core::Action> pending_action_;
    };

} // namespace backtester
