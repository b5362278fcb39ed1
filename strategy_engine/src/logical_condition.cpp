#include "logical_condition.hpp"
#include <spdlog/fmt/ranges.h> // fmt::join
#include <algorithm>
#include <stdexcept>

namespace strategy_engine {

    LogicalCondition::LogicalCondition(LogicalOp op, std::vector<std::unique_ptr<ICondition>> conditions)
        : op_(op), conditions_(std::move(conditions))
    {
        if (conditions_.empty()) {
            throw std::invalid_argument("Logical condition must receive at least one condition.");
        }
        bool has_null = std::any_of(conditions_.begin(), conditions_.end(),
                                    [](const std::unique_ptr<ICondition>& c) { return !c; });
        if (has_null) {
            throw std::invalid_argument("Logical condition cannot contain a null condition.");
        }
    }

    bool LogicalCondition::evaluate(const core::Candle& candle) const {
        auto holds = [&candle](const std::unique_ptr<ICondition>& c) { return c->evaluate(candle); };
        if (op_ == LogicalOp::And) {
            return std::all_of(conditions_.begin(), conditions_.end(), holds);
        }
        return std::any_of(conditions_.begin(), conditions_.end(), holds);
    }

    std::string LogicalCondition::describe() const {
        std::vector<std::string> parts;
        parts.reserve(conditions_.size());
        for (const auto& condition : conditions_) {
            parts.push_back(condition->describe());
        }
        return fmt::format("({})", fmt::join(parts, op_ == LogicalOp::And ? " AND " : " OR "));
    }

    NotCondition::NotCondition(std::unique_ptr<ICondition> condition)
        : condition_(std::move(condition))
    {
        if (!condition_) {
            throw std::invalid_argument("NOT condition requires a condition.");
        }
    }

} // namespace strategy_engine
