#pragma once

#include "interfaces.hpp" // Includes ICondition, IRule
#include <string>
#include <memory> // For std::unique_ptr

namespace strategy_engine {

    // --- Rule Class ---
    // A condition and the action to take when it holds on the current bar.
    class Rule : public IRule {
    public:
        Rule(std::string rule_name,
             std::unique_ptr<ICondition> condition,
             core::Action action_on_true);

        std::optional<core::Action> evaluate(const core::Candle& candle) const override;
        std::string describe() const override;
        std::string getName() const override { return name_; }

        core::Action getAction() const { return action_; }

    private:
        std::string name_;
        std::unique_ptr<ICondition> condition_;
        core::Action action_;
    };

} // namespace strategy_engine
