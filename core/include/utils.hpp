#pragma once

#include "datatypes.hpp"
#include <string>
#include <optional>

namespace core {
namespace utils {

    // Convert Timestamp to ISO 8601 UTC string, e.g. "2023-01-02T09:15:00Z".
    // with_millis always writes three fraction digits ("...T09:15:00.250Z"),
    // so equal-width strings sort in time order.
    std::string timestampToString(const Timestamp& ts, bool with_millis = false);

    // Parse "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]".
    // A missing offset is read as UTC. Throws std::runtime_error on malformed input.
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Days from start to end. On the same UTC calendar day the result is
    // fractional (seconds / 86400), otherwise whole days truncated toward zero.
    double daysBetween(const Timestamp& start, const Timestamp& end);

    // Same as above; empty when either side is missing
    std::optional<double> daysBetween(const std::optional<Timestamp>& start,
                                      const std::optional<Timestamp>& end);

    // "buy", "sell", "close_buy", "close_sell"
    std::string actionToString(Action action);
    // Accepts the names above; throws std::invalid_argument otherwise
    Action actionFromString(const std::string& action_str);

    std::string positionToString(PositionState position);

} // namespace utils
} // namespace core
