#pragma once

#include "interfaces.hpp" // Includes IRule, IStatefulStrategy
#include <string>
#include <vector>
#include <memory>      // For std::unique_ptr / std::shared_ptr

namespace strategy_engine {

    // Parsed entry and exit rules. Immutable once built, so one set can back
    // any number of strategy instances.
    struct RuleSet {
        std::vector<std::unique_ptr<IRule>> entry_rules; // Actions: buy / sell
        std::vector<std::unique_ptr<IRule>> exit_rules;  // Actions: close_buy / close_sell
    };

    // --- RuleStrategy Class ---
    // Position-aware rule evaluation: while flat the first triggered entry rule
    // wins; while in a position the first exit rule closing that position wins.
    class RuleStrategy : public IStatefulStrategy {
    public:
        // Throws std::invalid_argument for an empty name, no entry rules, or a
        // rule whose action does not fit its list
        RuleStrategy(std::string name, std::shared_ptr<const RuleSet> rules);

        std::string getName() const override { return name_; }

        // Options: "max_entries" (non-negative integer, 0 = unlimited)
        void init(const json& options) override;
        void next(backtester::StrategyContext& context) override;

        std::size_t getEntriesTaken() const { return entries_taken_; }

    private:
        std::string name_;
        std::shared_ptr<const RuleSet> rules_;
        std::size_t max_entries_ = 0;
        std::size_t entries_taken_ = 0;
    };

} // namespace strategy_engine
