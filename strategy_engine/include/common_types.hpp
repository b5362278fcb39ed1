#pragma once

#include <string>
#include "datatypes.hpp"     // Use short path (Provides core types)

namespace strategy_engine {

    // Enum to specify which candle price field to use
    enum class PriceField {
        Open,
        High,
        Low,
        Close
    };

    // Enum for comparison types
    enum class ComparisonOp {
        GT,  // Greater Than (>)
        LT,  // Less Than (<)
        GTE, // Greater Than or Equal To (>=)
        LTE, // Less Than or Equal To (<=)
        EQ   // Equal To (==)
    };

    double priceValue(const core::Candle& candle, PriceField field);
    bool compare(double lhs, ComparisonOp op, double rhs);

    // Case-insensitive "open", "high", "low", "close"; throws std::invalid_argument
    PriceField priceFieldFromString(const std::string& field_str);
    // ">", "<", ">=", "<=", "==" or GT, LT, GTE, LTE, EQ; throws std::invalid_argument
    ComparisonOp comparisonOpFromString(const std::string& op_str);

    std::string toString(PriceField field);
    std::string toString(ComparisonOp op);

} // namespace strategy_engine
