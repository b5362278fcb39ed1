#pragma once

#include "interfaces.hpp" // Include the base interface
#include "common_types.hpp"
#include <string>
#include <variant> // Right-hand side is a fixed value or another field

namespace strategy_engine {

    // --- PriceCondition Class ---
    // Compares a field of the current bar against a fixed value or another field
    // of the same bar, e.g. "Close > 100" or "Close > Open".
    class PriceCondition : public ICondition {
    public:
        PriceCondition(PriceField field, ComparisonOp op, double value);
        PriceCondition(PriceField field1, ComparisonOp op, PriceField field2);

        bool evaluate(const core::Candle& candle) const override;
        std::string describe() const override;

    private:
        PriceField lhs_;
        ComparisonOp op_;
        std::variant<double, PriceField> rhs_;
    };

} // namespace strategy_engine
