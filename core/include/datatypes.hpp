#pragma once

#include <string>
#include <vector>
#include <chrono>   // For timestamps
#include <optional> // Bars without a timestamp are allowed

namespace core {

    // Using system_clock for time points, all values are UTC
    using Timestamp = std::chrono::system_clock::time_point;


    struct Candle {
        std::optional<Timestamp> timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes
    };

    // Decision a strategy can take for the next bar.
    // "No action" is expressed as an empty std::optional<Action>.
    enum class Action {
        Buy,       // Enter long
        Sell,      // Enter short
        CloseBuy,  // Close the open long
        CloseSell  // Close the open short
    };

    // Represents the current directional exposure seen by a strategy
    enum class PositionState {
        None,  // Flat, no position
        Long,  // Currently holding a long position
        Short  // Currently holding a short position
    };

    // One bar that received an action, with its position in the input series
    struct DataPoint {
        Candle candle;
        Action action = Action::Buy;
        std::size_t index = 0;
    };

    inline bool isEntry(Action action) {
        return action == Action::Buy || action == Action::Sell;
    }

    inline bool isClose(Action action) {
        return action == Action::CloseBuy || action == Action::CloseSell;
    }

    template<typename T>
    using TimeSeries = std::vector<T>;

} // namespace core
