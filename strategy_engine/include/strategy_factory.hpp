#pragma once

#include <string>
#include <memory> // For std::unique_ptr
#include <nlohmann/json.hpp> // Include JSON library header

#include "interfaces.hpp"

namespace strategy_engine {

    using json = nlohmann::json; // Alias for convenience

    class StrategyFactory {
    public:
        // Builds a strategy handle from a JSON config:
        //   {"strategy_name": "...", "type": "rules" | "buy_and_hold" | "buy_until_high" | "sma_cross",
        //    "options": {...}, ...type specific fields}
        // "type" defaults to "rules". Stateful options are checked here by
        // initializing a throwaway instance. Throws core::ConfigException.
        static StrategyHandle createStrategy(const json& config);

        // Exposed for tests and tools that only need the condition tree
        static std::unique_ptr<ICondition> parseCondition(const json& condition_config);
        static std::unique_ptr<IRule> parseRule(const json& rule_config);

    private:
        static StrategyHandle createRuleStrategy(const std::string& name, const json& config, const json& options);
        // Runs init() on a fresh instance so bad options fail at load time
        static void checkOptions(const StatefulStrategySpec& spec, const std::string& name);
    };

} // namespace strategy_engine
