#include "backtester.hpp"
#include "strategy_context.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <stdexcept>
#include <string>

namespace backtester {

    namespace {
        BacktestError inputError(const std::string& message) {
            return BacktestError{BacktestErrorKind::InputContract, message};
        }

        std::string describeAction(const std::optional<core::Action>& action) {
            return action ? core::utils::actionToString(*action) : "none";
        }
    } // end anonymous namespace

    Backtester::Backtester(BacktestConfig config)
        : config_(std::move(config))
    {
        core::logging::getLogger()->debug("Backtester initialized with starting balance: {}", config_.starting_balance);
    }

    std::optional<BacktestError> Backtester::checkInputs(const std::vector<core::Candle>& bars,
                                                         const strategy_engine::StrategyHandle& strategy) const {
        if (bars.empty()) {
            return inputError("data cannot be empty");
        }

        if (std::holds_alternative<std::monostate>(strategy)) {
            return inputError("strategy cannot be nil");
        }
        if (const auto* stateless = std::get_if<std::shared_ptr<const strategy_engine::IStatelessStrategy>>(&strategy)) {
            if (!*stateless) {
                return inputError("strategy cannot be nil");
            }
            const auto* function_strategy = dynamic_cast<const strategy_engine::FunctionStrategy*>(stateless->get());
            if (function_strategy && !function_strategy->isCallable()) {
                return inputError("invalid strategy format");
            }
        }
        if (const auto* spec = std::get_if<strategy_engine::StatefulStrategySpec>(&strategy)) {
            if (!spec->factory) {
                return inputError("invalid strategy format");
            }
        }

        try {
            config_.validate();
        } catch (const core::ConfigException& e) {
            return inputError(std::string("invalid configuration: ") + e.what());
        }
        return std::nullopt;
    }

    BacktestOutcome Backtester::run(const std::vector<core::Candle>& bars,
                                    const strategy_engine::StrategyHandle& strategy) const
    {
        auto logger = core::logging::getLogger();

        if (auto error = checkInputs(bars, strategy)) {
            logger->error("Backtest rejected: {}", error->message);
            return *error;
        }

        logger->info("========================================================");
        logger->info("Starting Backtest Run over {} bars (starting balance {:.2f})", bars.size(), config_.starting_balance);
        logger->info("========================================================");

        auto result = std::make_shared<Result>(config_);
        result->setInputRange(bars.front().timestamp, bars.back().timestamp);

        if (const auto* stateless = std::get_if<std::shared_ptr<const strategy_engine::IStatelessStrategy>>(&strategy)) {
            logger->info("Strategy '{}' (stateless) loaded.", (*stateless)->getName());
            runStateless(bars, **stateless, *result);
        } else {
            const auto& spec = std::get<strategy_engine::StatefulStrategySpec>(strategy);
            if (auto error = runStateful(bars, spec, *result)) {
                logger->error("Backtest aborted: {}", error->message);
                return *error;
            }
        }
        logger->info("Event loop finished. {} actions recorded.", result->getDataPoints().size());

        if (auto pairing_error = result->compile()) {
            BacktestError error{BacktestErrorKind::Pairing, "pairing failed: " + pairing_error->message};
            logger->error("Backtest failed: {}", error.message);
            return error;
        }

        logger->info("Backtest Run Completed: {} trades, PnL {:.2f}, final balance {:.2f}",
                     result->getTradesCount(), result->getTotalProfitAndLoss(), result->equity());
        return std::shared_ptr<const Result>(std::move(result));
    }

    std::shared_ptr<const Result> Backtester::runOrThrow(const std::vector<core::Candle>& bars,
                                                         const strategy_engine::StrategyHandle& strategy) const {
        auto outcome = run(bars, strategy);
        if (auto* error = std::get_if<BacktestError>(&outcome)) {
            if (error->kind == BacktestErrorKind::Pairing) {
                throw core::PairingException(error->message);
            }
            throw core::BacktestException(error->message);
        }
        return std::get<std::shared_ptr<const Result>>(outcome);
    }

    void Backtester::recordDecision(const std::vector<core::Candle>& bars,
                                    std::size_t decision_index,
                                    const std::optional<core::Action>& action,
                                    Result& result) {
        if (!action) {
            return;
        }
        // Decide now, act on the next bar
        std::size_t target = decision_index + 1;
        result.addDataPoint(bars[target], *action, target);
        core::logging::getLogger()->debug("Recorded {} at index {} (open {:.4f})",
                                          core::utils::actionToString(*action), target, bars[target].open);
    }

    void Backtester::runStateless(const std::vector<core::Candle>& bars,
                                  const strategy_engine::IStatelessStrategy& strategy,
                                  Result& result) const {
        auto logger = core::logging::getLogger();

        for (std::size_t i = 0; i + 1 < bars.size(); ++i) {
            std::optional<core::Action> action;
            try {
                action = strategy.evaluate(bars[i], result);
            } catch (const std::exception& e) {
                logger->warn("Strategy '{}' failed on bar {}: {}. No action taken.", strategy.getName(), i, e.what());
                continue;
            }
            logger->trace("Bar {}: decision {}", i, describeAction(action));
            recordDecision(bars, i, action, result);
        }
    }

    std::optional<BacktestError> Backtester::runStateful(const std::vector<core::Candle>& bars,
                                                         const strategy_engine::StatefulStrategySpec& spec,
                                                         Result& result) const {
        auto logger = core::logging::getLogger();

        // --- Build and initialize a fresh instance for this run ---
        std::unique_ptr<strategy_engine::IStatefulStrategy> strategy;
        try {
            strategy = spec.factory();
            if (!strategy) {
                return BacktestError{BacktestErrorKind::StrategyInitialization,
                                     "strategy initialization failed: factory returned no strategy"};
            }
            strategy->init(spec.options);
        } catch (const std::exception& e) {
            return BacktestError{BacktestErrorKind::StrategyInitialization,
                                 std::string("strategy initialization failed: ") + e.what()};
        }
        logger->info("Strategy '{}' (stateful) initialized with options: {}", strategy->getName(), spec.options.dump());

        // Lives only for this run
        StrategyContext context(result);

        for (std::size_t i = 0; i + 1 < bars.size(); ++i) {
            context.setBar(bars[i], i);
            try {
                strategy->next(context);
            } catch (const std::exception& e) {
                logger->warn("Strategy '{}' failed on bar {}: {}. No action taken.", strategy->getName(), i, e.what());
                context.takeAction(); // Drop anything set before the failure
                continue;
            }
            auto action = context.takeAction();
            logger->trace("Bar {}: decision {}", i, describeAction(action));
            recordDecision(bars, i, action, result);
        }
        return std::nullopt;
    }

    std::string errorKindToString(BacktestErrorKind kind) {
        switch (kind) {
            case BacktestErrorKind::InputContract:          return "input_contract";
            case BacktestErrorKind::StrategyInitialization: return "strategy_initialization";
            case BacktestErrorKind::Pairing:                return "pairing";
        }
        return "unknown";
    }

} // namespace backtester
