#pragma once

#include "interfaces.hpp"
#include <vector>
#include <memory> // For std::unique_ptr
#include <string>

namespace strategy_engine {

    enum class LogicalOp {
        And, // All sub-conditions hold
        Or   // At least one sub-condition holds
    };

    // --- LogicalCondition Class ---
    // Combines sub-conditions with AND / OR, short-circuiting in order.
    class LogicalCondition : public ICondition {
    public:
        // Throws std::invalid_argument for an empty list or a null entry
        LogicalCondition(LogicalOp op, std::vector<std::unique_ptr<ICondition>> conditions);

        bool evaluate(const core::Candle& candle) const override;
        std::string describe() const override;

    private:
        LogicalOp op_;
        std::vector<std::unique_ptr<ICondition>> conditions_;
    };

    // --- NotCondition Class ---
    class NotCondition : public ICondition {
    public:
        explicit NotCondition(std::unique_ptr<ICondition> condition);

        bool evaluate(const core::Candle& candle) const override { return !condition_->evaluate(candle); }
        std::string describe() const override { return "NOT " + condition_->describe(); }

    private:
        std::unique_ptr<ICondition> condition_;
    };

} // namespace strategy_engine
