#include "strategy_factory.hpp"
#include "rule_strategy.hpp"      // Concrete strategies...
#include "example_strategies.hpp"
#include "rule.hpp"               // Concrete Rule class
#include "price_condition.hpp"    // Concrete Condition classes...
#include "logical_condition.hpp"
#include "common_types.hpp"
#include "logging.hpp"            // Use short path
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <stdexcept>              // For std::invalid_argument
#include <vector>
#include <string>
#include <memory>

namespace strategy_engine {

    namespace { // Use anonymous namespace for file-local helpers

        const json& requireField(const json& config, const char* key, const char* what) {
            if (!config.contains(key)) {
                throw std::invalid_argument(fmt::format("{} requires '{}'.", what, key));
            }
            return config.at(key);
        }

        std::string requireString(const json& config, const char* key, const char* what) {
            const auto& value = requireField(config, key, what);
            if (!value.is_string()) {
                throw std::invalid_argument(fmt::format("{}: '{}' must be a string.", what, key));
            }
            return value.get<std::string>();
        }

        std::vector<std::unique_ptr<IRule>> parseRuleList(const json& config, const char* key, bool required) {
            std::vector<std::unique_ptr<IRule>> rules;
            if (!config.contains(key)) {
                if (required) throw std::invalid_argument(fmt::format("Config missing '{}' array.", key));
                return rules;
            }
            const auto& list = config.at(key);
            if (!list.is_array()) {
                throw std::invalid_argument(fmt::format("'{}' must be an array.", key));
            }
            rules.reserve(list.size());
            for (const auto& rule_conf : list) {
                rules.push_back(StrategyFactory::parseRule(rule_conf));
            }
            return rules;
        }

    } // end anonymous namespace

    // --- Recursive Helper to Parse Conditions ---
    std::unique_ptr<ICondition> StrategyFactory::parseCondition(const json& config) {
        if (!config.is_object()) {
            throw std::invalid_argument("Condition config must be an object with a 'type' (string).");
        }
        std::string type = requireString(config, "type", "Condition");
        core::logging::getLogger()->trace("Parsing condition of type: {}", type);

        if (type == "Price") {
            PriceField field1 = priceFieldFromString(requireString(config, "field1", "Price condition"));
            ComparisonOp op = comparisonOpFromString(requireString(config, "op", "Price condition"));

            if (config.contains("value") && config["value"].is_number()) {
                return std::make_unique<PriceCondition>(field1, op, config["value"].get<double>());
            }
            if (config.contains("field2") && config["field2"].is_string()) {
                return std::make_unique<PriceCondition>(field1, op, priceFieldFromString(config["field2"].get<std::string>()));
            }
            throw std::invalid_argument("Price condition requires 'value' (number) or 'field2' (string).");
        }

        if (type == "AND" || type == "OR") {
            const auto& list = requireField(config, "conditions", "Logical condition");
            if (!list.is_array() || list.empty()) {
                throw std::invalid_argument(fmt::format("{} condition requires 'conditions' (non-empty array).", type));
            }
            std::vector<std::unique_ptr<ICondition>> sub_conditions;
            sub_conditions.reserve(list.size());
            for (const auto& sub_conf : list) {
                sub_conditions.push_back(parseCondition(sub_conf)); // Recursive call
            }
            return std::make_unique<LogicalCondition>(type == "AND" ? LogicalOp::And : LogicalOp::Or,
                                                      std::move(sub_conditions));
        }

        if (type == "NOT") {
            return std::make_unique<NotCondition>(parseCondition(requireField(config, "condition", "NOT condition")));
        }

        throw std::invalid_argument(fmt::format("Unknown condition type '{}' in config.", type));
    }

    // --- Helper to Parse Rules ---
    std::unique_ptr<IRule> StrategyFactory::parseRule(const json& config) {
        if (!config.is_object()) {
            throw std::invalid_argument("Rule config must be object with 'rule_name'(string), 'action'(string), 'condition'(object).");
        }
        std::string name = requireString(config, "rule_name", "Rule");
        core::Action action = core::utils::actionFromString(requireString(config, "action", "Rule"));
        auto condition = parseCondition(requireField(config, "condition", "Rule"));
        return std::make_unique<Rule>(name, std::move(condition), action);
    }

    StrategyHandle StrategyFactory::createRuleStrategy(const std::string& name, const json& config, const json& options) {
        auto rules = std::make_shared<RuleSet>();
        rules->entry_rules = parseRuleList(config, "entry_rules", true);
        rules->exit_rules = parseRuleList(config, "exit_rules", false);
        std::shared_ptr<const RuleSet> shared_rules = std::move(rules);

        // checkOptions() below also constructs one, which validates rule actions
        StatefulStrategySpec spec;
        spec.factory = [name, shared_rules]() { return std::make_unique<RuleStrategy>(name, shared_rules); };
        spec.options = options;
        checkOptions(spec, name);
        return spec;
    }

    void StrategyFactory::checkOptions(const StatefulStrategySpec& spec, const std::string& name) {
        auto instance = spec.factory();
        try {
            instance->init(spec.options);
        } catch (const core::StrategyException& e) {
            throw core::ConfigException(fmt::format("Invalid options for strategy '{}': {}", name, e.what()));
        }
    }

    // --- Main Factory Method ---
    StrategyHandle StrategyFactory::createStrategy(const json& config) {
        auto logger = core::logging::getLogger();
        logger->info("Attempting to create strategy from JSON config...");

        try {
            // --- Basic Validation ---
            if (!config.is_object()) throw std::invalid_argument("Config must be JSON object.");
            std::string name = requireString(config, "strategy_name", "Strategy config");
            std::string type = config.contains("type") ? requireString(config, "type", "Strategy config") : "rules";

            json options = json::object();
            if (config.contains("options")) {
                options = config.at("options");
                if (!options.is_object()) throw std::invalid_argument("'options' must be a JSON object.");
            }

            StrategyHandle handle;
            if (type == "rules") {
                handle = createRuleStrategy(name, config, options);
            } else if (type == "buy_and_hold") {
                auto spec = std::get<StatefulStrategySpec>(makeStatefulStrategy<BuyAndHoldStrategy>(options));
                checkOptions(spec, name);
                handle = std::move(spec);
            } else if (type == "sma_cross") {
                auto spec = std::get<StatefulStrategySpec>(makeStatefulStrategy<SmaCrossStrategy>(options));
                checkOptions(spec, name);
                handle = std::move(spec);
            } else if (type == "buy_until_high") {
                double threshold = 100.0;
                if (config.contains("threshold")) {
                    if (!config["threshold"].is_number()) throw std::invalid_argument("'threshold' must be a number.");
                    threshold = config["threshold"].get<double>();
                }
                handle = std::shared_ptr<const IStatelessStrategy>(std::make_shared<const BuyUntilHighStrategy>(threshold));
            } else {
                throw std::invalid_argument(fmt::format("Unknown strategy type '{}'.", type));
            }

            logger->info("Successfully created strategy '{}' of type '{}'", name, type);
            return handle;

        } catch (const json::exception& e) {
            logger->error("JSON parsing error while creating strategy: {}", e.what());
            throw core::ConfigException(fmt::format("Invalid strategy JSON: {}", e.what()));
        } catch (const std::invalid_argument& e) {
            logger->error("Invalid strategy configuration: {}", e.what());
            throw core::ConfigException(fmt::format("Invalid strategy configuration: {}", e.what()));
        }
    }

} // namespace strategy_engine
