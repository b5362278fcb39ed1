#pragma once

#include <string>
#include <vector>
#include <variant>

#include "datatypes.hpp"

namespace backtester {

    // Why an action stream could not be turned into trades
    struct PairingError {
        std::string message;
    };

    enum class TradeOutcome {
        Win,
        Loss,
        BreakEven
    };

    // --- Trade Pair ---
    // One round trip: an entry (buy/sell) and the close that ended it.
    // balance == previous_balance + resultValue()
    struct TradePair {
        core::DataPoint exit_point;
        core::DataPoint enter_point;
        double balance = 0.0;
        double previous_balance = 0.0;

        // Profit or loss from the open prices of both legs
        double resultValue() const;
        // resultValue() as a percentage of previous_balance (0 when that is 0)
        double resultPercentage() const;
        TradeOutcome outcome() const;
        // Days between the legs, 0 when either bar has no timestamp
        double durationDays() const;
    };

    // Delta of a closed round trip: buy -> close_buy is exit - enter,
    // sell -> close_sell is enter - exit. Anything else is an error.
    std::variant<double, PairingError> profitAndLoss(const core::DataPoint& enter_point,
                                                     const core::DataPoint& exit_point);

    std::variant<TradePair, PairingError> makeTradePair(const core::DataPoint& enter_point,
                                                        const core::DataPoint& exit_point,
                                                        double previous_balance);

    // Reconstructs round trips from a chronological action stream.
    // - an entry becomes the open entry (an older unmatched one is dropped)
    // - a close without an open entry is dropped
    // - a close of the other direction than the open entry fails the whole run
    // - a trailing unmatched entry is dropped
    // Balances are threaded through the pairs starting at starting_balance.
    std::variant<std::vector<TradePair>, PairingError> compilePairs(const std::vector<core::DataPoint>& data_points,
                                                                    double starting_balance);

    // [enter, exit, enter, exit, ...] in pair order
    std::vector<core::DataPoint> flattenPairs(const std::vector<TradePair>& trade_pairs);

    std::string outcomeToString(TradeOutcome outcome);

} // namespace backtester
