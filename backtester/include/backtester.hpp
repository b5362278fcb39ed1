#pragma once

#include <string>
#include <vector>
#include <memory>
#include <variant>
#include <optional>

// Required project headers (use short paths)
#include "datatypes.hpp"
#include "interfaces.hpp"       // Strategy engine interfaces
#include "backtest_config.hpp"
#include "result.hpp"

namespace backtester {

    enum class BacktestErrorKind {
        InputContract,          // Rejected before the replay started
        StrategyInitialization, // Stateful strategy could not be built or init() failed
        Pairing                 // Action stream could not be turned into trades
    };

    struct BacktestError {
        BacktestErrorKind kind = BacktestErrorKind::InputContract;
        std::string message;
    };

    using BacktestOutcome = std::variant<std::shared_ptr<const Result>, BacktestError>;

    class Backtester {
    public:
        explicit Backtester(BacktestConfig config = BacktestConfig{});

        // Replays the strategy over the bars ("decide on bar i, act on bar i+1")
        // and compiles the result. Holds no per-run state, safe to call concurrently.
        BacktestOutcome run(const std::vector<core::Candle>& bars,
                            const strategy_engine::StrategyHandle& strategy) const;

        // Same as run(), throws core::BacktestException carrying the error message
        std::shared_ptr<const Result> runOrThrow(const std::vector<core::Candle>& bars,
                                                 const strategy_engine::StrategyHandle& strategy) const;

        const BacktestConfig& getConfig() const { return config_; }

    private:
        BacktestConfig config_;

        // --- Private Helper Methods ---
        std::optional<BacktestError> checkInputs(const std::vector<core::Candle>& bars,
                                                 const strategy_engine::StrategyHandle& strategy) const;
        void runStateless(const std::vector<core::Candle>& bars,
                          const strategy_engine::IStatelessStrategy& strategy,
                          Result& result) const;
        std::optional<BacktestError> runStateful(const std::vector<core::Candle>& bars,
                                                 const strategy_engine::StatefulStrategySpec& spec,
                                                 Result& result) const;
        static void recordDecision(const std::vector<core::Candle>& bars,
                                   std::size_t decision_index,
                                   const std::optional<core::Action>& action,
                                   Result& result);
    };

    std::string errorKindToString(BacktestErrorKind kind);

} // namespace backtester
