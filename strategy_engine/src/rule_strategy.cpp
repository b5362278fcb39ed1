#include "rule_strategy.hpp"
#include "rule.hpp"
#include "strategy_context.hpp"
#include "logging.hpp" // Use short path
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>  // For std::invalid_argument

namespace strategy_engine {

    RuleStrategy::RuleStrategy(std::string name, std::shared_ptr<const RuleSet> rules)
        : name_(std::move(name)), rules_(std::move(rules))
    {
        if (name_.empty()) throw std::invalid_argument("Strategy name cannot be empty.");
        if (!rules_) throw std::invalid_argument(fmt::format("Strategy '{}' has no rule set.", name_));
        if (rules_->entry_rules.empty()) throw std::invalid_argument(fmt::format("Strategy '{}' must have at least one entry rule.", name_));

        for (const auto& rule : rules_->entry_rules) {
            const auto* concrete = dynamic_cast<const Rule*>(rule.get());
            if (!rule || (concrete && !core::isEntry(concrete->getAction()))) {
                throw std::invalid_argument(fmt::format("Strategy '{}': entry rules must be non-null and buy or sell.", name_));
            }
        }
        for (const auto& rule : rules_->exit_rules) {
            const auto* concrete = dynamic_cast<const Rule*>(rule.get());
            if (!rule || (concrete && !core::isClose(concrete->getAction()))) {
                throw std::invalid_argument(fmt::format("Strategy '{}': exit rules must be non-null and close_buy or close_sell.", name_));
            }
        }
    }

    void RuleStrategy::init(const json& options) {
        if (!options.is_object()) {
            throw core::StrategyException(fmt::format("Strategy '{}': options must be a JSON object.", name_));
        }
        entries_taken_ = 0;
        max_entries_ = 0;
        if (options.contains("max_entries")) {
            const auto& value = options.at("max_entries");
            if (!value.is_number_integer() || value.get<long long>() < 0) {
                throw core::StrategyException(fmt::format("Strategy '{}': max_entries must be a non-negative integer.", name_));
            }
            max_entries_ = value.get<std::size_t>();
        }
        core::logging::getLogger()->debug("Strategy '{}' initialized ({} entry rules, {} exit rules, max entries {}).",
                                          name_, rules_->entry_rules.size(), rules_->exit_rules.size(), max_entries_);
    }

    void RuleStrategy::next(backtester::StrategyContext& context) {
        auto logger = core::logging::getLogger();
        const core::Candle& candle = context.data();
        core::PositionState position = context.position();
        logger->trace("Evaluating strategy '{}', current position: {}", name_, core::utils::positionToString(position));

        // --- Currently Flat: Check ENTRY rules ---
        if (position == core::PositionState::None) {
            if (max_entries_ != 0 && entries_taken_ >= max_entries_) {
                return;
            }
            for (const auto& rule : rules_->entry_rules) {
                auto action = rule->evaluate(candle);
                if (action && core::isEntry(*action)) {
                    logger->debug("Strategy '{}': Entry rule '{}' triggered -> {}",
                                  name_, rule->getName(), core::utils::actionToString(*action));
                    context.setAction(*action);
                    ++entries_taken_;
                    return; // Take the first entry signal
                }
            }
            return;
        }

        // --- Long or Short: Check EXIT rules matching the position ---
        core::Action closing = (position == core::PositionState::Long) ? core::Action::CloseBuy : core::Action::CloseSell;
        for (const auto& rule : rules_->exit_rules) {
            auto action = rule->evaluate(candle);
            if (action == closing) {
                logger->debug("Strategy '{}': Exit rule '{}' triggered -> {}",
                              name_, rule->getName(), core::utils::actionToString(closing));
                context.setAction(closing);
                return; // Take the first valid exit signal
            }
        }
    }

} // namespace strategy_engine
