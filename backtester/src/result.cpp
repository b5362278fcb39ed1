#include "result.hpp"
#include "trade_statistics.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <variant>

namespace backtester {

    Result::Result(BacktestConfig config)
        : config_(std::move(config)) {}

    void Result::ensureMutable(const char* operation) const {
        if (compiled_) {
            throw core::BacktestException(std::string("Cannot ") + operation + " on a compiled result.");
        }
    }

    void Result::setInputRange(const std::optional<core::Timestamp>& start_date,
                               const std::optional<core::Timestamp>& end_date) {
        ensureMutable("set the input range");
        start_date_ = start_date;
        end_date_ = end_date;
    }

    void Result::addDataPoint(const core::Candle& candle, core::Action action, std::size_t index) {
        ensureMutable("add a data point");
        if (!data_points_.empty() && index <= data_points_.back().index) {
            throw core::BacktestException("Data point index " + std::to_string(index) +
                                          " is not after the last recorded index " +
                                          std::to_string(data_points_.back().index) + ".");
        }

        core::DataPoint point{candle, action, index};
        data_points_.push_back(point);

        // Same cursor rules as compilePairs, applied one point at a time
        if (core::isEntry(action)) {
            open_entry_ = point;
        } else if (open_entry_) {
            auto delta = profitAndLoss(*open_entry_, point);
            if (const double* value = std::get_if<double>(&delta)) {
                realized_profit_and_loss_ += *value;
                open_entry_.reset();
            }
        }
    }

    std::optional<PairingError> Result::compile() {
        ensureMutable("compile");
        auto logger = core::logging::getLogger();

        auto paired = compilePairs(data_points_, config_.starting_balance);
        if (auto* error = std::get_if<PairingError>(&paired)) {
            return *error;
        }
        trade_pairs_ = std::get<std::vector<TradePair>>(std::move(paired));

        metrics_ = statistics::computeMetrics(trade_pairs_, config_, getDuration().value_or(0.0));
        warnings_ = statistics::runtimeWarnings(metrics_);
        for (const auto& warning : warnings_) {
            logger->warn("{}", warning);
        }

        compiled_ = true;
        logger->debug("Result compiled: {} data points, {} trades, PnL {:.2f}",
                      data_points_.size(), trade_pairs_.size(), metrics_.total_profit_and_loss);
        return std::nullopt;
    }

    std::optional<double> Result::getDuration() const {
        return core::utils::daysBetween(start_date_, end_date_);
    }

    core::PositionState Result::position() const {
        if (data_points_.empty()) {
            return core::PositionState::None;
        }
        switch (data_points_.back().action) {
            case core::Action::Buy:  return core::PositionState::Long;
            case core::Action::Sell: return core::PositionState::Short;
            case core::Action::CloseBuy:
            case core::Action::CloseSell:
                return core::PositionState::None;
        }
        return core::PositionState::None;
    }

    double Result::equity() const {
        if (compiled_) {
            return config_.starting_balance + metrics_.total_profit_and_loss;
        }
        return config_.starting_balance + realized_profit_and_loss_;
    }

    json Result::toSummaryJson() const {
        json summary;
        summary["starting_balance"] = config_.starting_balance;
        summary["final_balance"] = equity();
        summary["total_profit_and_loss"] = metrics_.total_profit_and_loss;
        summary["trades_count"] = getTradesCount();
        summary["data_points_count"] = data_points_.size();
        summary["start_date"] = start_date_ ? json(core::utils::timestampToString(*start_date_)) : json(nullptr);
        summary["end_date"] = end_date_ ? json(core::utils::timestampToString(*end_date_)) : json(nullptr);

        auto duration = getDuration();
        summary["duration_days"] = duration ? json(*duration) : json(nullptr);
        summary["metrics"] = metrics_.toJson();
        summary["warnings"] = warnings_;
        return summary;
    }

} // namespace backtester
