#include "trade_pair.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <optional>

namespace backtester {

    namespace {
        std::string describePoint(const core::DataPoint& point) {
            return core::utils::actionToString(point.action) + " at index " + std::to_string(point.index);
        }

        bool closesEntry(core::Action entry, core::Action close) {
            return (entry == core::Action::Buy && close == core::Action::CloseBuy) ||
                   (entry == core::Action::Sell && close == core::Action::CloseSell);
        }
    } // end anonymous namespace

    // --- TradePair ---

    double TradePair::resultValue() const {
        if (enter_point.action == core::Action::Sell) {
            return enter_point.candle.open - exit_point.candle.open;
        }
        return exit_point.candle.open - enter_point.candle.open;
    }

    double TradePair::resultPercentage() const {
        if (previous_balance == 0.0) {
            return 0.0;
        }
        return 100.0 * resultValue() / previous_balance;
    }

    TradeOutcome TradePair::outcome() const {
        double value = resultValue();
        if (value > 0.0) return TradeOutcome::Win;
        if (value < 0.0) return TradeOutcome::Loss;
        return TradeOutcome::BreakEven;
    }

    double TradePair::durationDays() const {
        return core::utils::daysBetween(enter_point.candle.timestamp, exit_point.candle.timestamp).value_or(0.0);
    }

    // --- Pairing ---

    std::variant<double, PairingError> profitAndLoss(const core::DataPoint& enter_point,
                                                     const core::DataPoint& exit_point) {
        if (!closesEntry(enter_point.action, exit_point.action)) {
            return PairingError{"cannot pair " + describePoint(enter_point) + " with " + describePoint(exit_point)};
        }
        if (enter_point.action == core::Action::Buy) {
            return exit_point.candle.open - enter_point.candle.open;
        }
        return enter_point.candle.open - exit_point.candle.open;
    }

    std::variant<TradePair, PairingError> makeTradePair(const core::DataPoint& enter_point,
                                                        const core::DataPoint& exit_point,
                                                        double previous_balance) {
        auto delta = profitAndLoss(enter_point, exit_point);
        if (auto* error = std::get_if<PairingError>(&delta)) {
            return *error;
        }

        TradePair pair;
        pair.enter_point = enter_point;
        pair.exit_point = exit_point;
        pair.previous_balance = previous_balance;
        pair.balance = previous_balance + std::get<double>(delta);
        return pair;
    }

    std::variant<std::vector<TradePair>, PairingError> compilePairs(const std::vector<core::DataPoint>& data_points,
                                                                    double starting_balance) {
        auto logger = core::logging::getLogger();
        std::vector<TradePair> pairs;
        std::optional<core::DataPoint> open_entry;
        double balance = starting_balance;

        for (const auto& point : data_points) {
            if (core::isEntry(point.action)) {
                if (open_entry) {
                    logger->debug("Discarding unmatched {} (replaced by {}).",
                                  describePoint(*open_entry), describePoint(point));
                }
                open_entry = point;
                continue;
            }

            // Closing action
            if (!open_entry) {
                logger->debug("Discarding {}: no open entry.", describePoint(point));
                continue;
            }

            auto made = makeTradePair(*open_entry, point, balance);
            if (auto* error = std::get_if<PairingError>(&made)) {
                logger->error("Pairing failed: {}", error->message);
                return *error;
            }
            pairs.push_back(std::get<TradePair>(std::move(made)));
            balance = pairs.back().balance;
            open_entry.reset();
        }

        if (open_entry) {
            logger->debug("Discarding trailing unmatched {}.", describePoint(*open_entry));
        }
        return pairs;
    }

    std::vector<core::DataPoint> flattenPairs(const std::vector<TradePair>& trade_pairs) {
        std::vector<core::DataPoint> points;
        points.reserve(trade_pairs.size() * 2);
        for (const auto& pair : trade_pairs) {
            points.push_back(pair.enter_point);
            points.push_back(pair.exit_point);
        }
        return points;
    }

    std::string outcomeToString(TradeOutcome outcome) {
        switch (outcome) {
            case TradeOutcome::Win:       return "win";
            case TradeOutcome::Loss:      return "loss";
            case TradeOutcome::BreakEven: return "break_even";
        }
        return "unknown";
    }

} // namespace backtester
