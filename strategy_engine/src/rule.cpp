#include "rule.hpp"
#include "logging.hpp" // Use short path
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept> // For std::invalid_argument

namespace strategy_engine {

    Rule::Rule(std::string rule_name,
               std::unique_ptr<ICondition> condition,
               core::Action action_on_true)
        : name_(std::move(rule_name)),
          condition_(std::move(condition)),
          action_(action_on_true)
    {
        if (name_.empty()) {
            throw std::invalid_argument("Rule name cannot be empty.");
        }
        if (!condition_) {
            throw std::invalid_argument(fmt::format("Condition cannot be null for Rule '{}'.", name_));
        }
    }

    std::optional<core::Action> Rule::evaluate(const core::Candle& candle) const {
        bool condition_result = condition_->evaluate(candle);

        core::logging::getLogger()->trace("Rule '{}' evaluated condition '{}' -> {}",
                                          name_, condition_->describe(), condition_result);

        if (!condition_result) {
            return std::nullopt;
        }
        return action_;
    }

    std::string Rule::describe() const {
        return fmt::format("Rule('{}'): IF {} THEN {}",
                           name_,
                           condition_->describe(),
                           core::utils::actionToString(action_));
    }

} // namespace strategy_engine
