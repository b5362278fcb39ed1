#include "common_types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>      // For std::fabs with floating point EQ comparison
#include <stdexcept>

namespace strategy_engine {

    namespace {
        constexpr double kEqualityTolerance = 1e-9;
    }

    double priceValue(const core::Candle& candle, PriceField field) {
        switch (field) {
            case PriceField::Open:  return candle.open;
            case PriceField::High:  return candle.high;
            case PriceField::Low:   return candle.low;
            case PriceField::Close: return candle.close;
        }
        throw std::invalid_argument("Invalid PriceField value.");
    }

    bool compare(double lhs, ComparisonOp op, double rhs) {
        switch (op) {
            case ComparisonOp::GT:  return lhs > rhs;
            case ComparisonOp::LT:  return lhs < rhs;
            case ComparisonOp::GTE: return lhs >= rhs;
            case ComparisonOp::LTE: return lhs <= rhs;
            case ComparisonOp::EQ:  return std::fabs(lhs - rhs) < kEqualityTolerance;
        }
        throw std::invalid_argument("Invalid ComparisonOp value.");
    }

    PriceField priceFieldFromString(const std::string& field_str) {
        std::string lower_str = field_str;
        std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (lower_str == "open") return PriceField::Open;
        if (lower_str == "high") return PriceField::High;
        if (lower_str == "low") return PriceField::Low;
        if (lower_str == "close") return PriceField::Close;
        throw std::invalid_argument("Unknown price field string: " + field_str);
    }

    ComparisonOp comparisonOpFromString(const std::string& op_str) {
        if (op_str == ">" || op_str == "GT") return ComparisonOp::GT;
        if (op_str == "<" || op_str == "LT") return ComparisonOp::LT;
        if (op_str == ">=" || op_str == "GTE") return ComparisonOp::GTE;
        if (op_str == "<=" || op_str == "LTE") return ComparisonOp::LTE;
        if (op_str == "==" || op_str == "EQ") return ComparisonOp::EQ;
        throw std::invalid_argument("Unknown comparison operator string: " + op_str);
    }

    std::string toString(PriceField field) {
        switch (field) {
            case PriceField::Open:  return "Open";
            case PriceField::High:  return "High";
            case PriceField::Low:   return "Low";
            case PriceField::Close: return "Close";
        }
        return "InvalidField";
    }

    std::string toString(ComparisonOp op) {
        switch (op) {
            case ComparisonOp::GT:  return ">";
            case ComparisonOp::LT:  return "<";
            case ComparisonOp::GTE: return ">=";
            case ComparisonOp::LTE: return "<=";
            case ComparisonOp::EQ:  return "==";
        }
        return "InvalidOp";
    }

} // namespace strategy_engine
