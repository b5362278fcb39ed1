#include "price_condition.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

    PriceCondition::PriceCondition(PriceField field, ComparisonOp op, double value)
        : lhs_(field), op_(op), rhs_(value) {}

    PriceCondition::PriceCondition(PriceField field1, ComparisonOp op, PriceField field2)
        : lhs_(field1), op_(op), rhs_(field2) {}

    bool PriceCondition::evaluate(const core::Candle& candle) const {
        double lhs_value = priceValue(candle, lhs_);
        double rhs_value = std::holds_alternative<double>(rhs_)
            ? std::get<double>(rhs_)
            : priceValue(candle, std::get<PriceField>(rhs_));

        bool result = compare(lhs_value, op_, rhs_value);
        core::logging::getLogger()->trace("PriceCondition {} -> {} ({} vs {})", describe(), result, lhs_value, rhs_value);
        return result;
    }

    std::string PriceCondition::describe() const {
        if (const auto* value = std::get_if<double>(&rhs_)) {
            return fmt::format("{} {} {}", toString(lhs_), toString(op_), *value);
        }
        return fmt::format("{} {} {}", toString(lhs_), toString(op_), toString(std::get<PriceField>(rhs_)));
    }

} // namespace strategy_engine
