#pragma once

#include <string>
#include <memory>     // For std::unique_ptr / std::shared_ptr
#include <optional>
#include <variant>    // Strategy shapes are a closed set
#include <functional>
#include <nlohmann/json.hpp> // Strategy init options

#include "datatypes.hpp" // Provides Candle, Action etc.

// Defined by the backtester module; strategies only see them by reference
namespace backtester { class Result; class StrategyContext; }

namespace strategy_engine {

    using json = nlohmann::json;

    // --- Condition Interface ---
    // Represents a single logical condition on a bar (e.g., Close > Open)
    class ICondition {
    public:
        virtual ~ICondition() = default;
        virtual bool evaluate(const core::Candle& candle) const = 0;
        virtual std::string describe() const = 0;
    };

    // --- Rule Interface ---
    // An entry or exit rule: a condition plus the action taken when it holds
    class IRule {
    public:
        virtual ~IRule() = default;
        // Returns the rule's action if triggered, std::nullopt otherwise
        virtual std::optional<core::Action> evaluate(const core::Candle& candle) const = 0;
        virtual std::string describe() const = 0;
        virtual std::string getName() const = 0;
    };

    // --- Stateless Strategy ---
    // A pure decision function: sees the current bar and the read-only result
    // accumulated so far, returns the action to take on the following bar.
    class IStatelessStrategy {
    public:
        virtual ~IStatelessStrategy() = default;

        virtual std::string getName() const = 0;

        virtual std::optional<core::Action> evaluate(const core::Candle& candle,
                                                     const backtester::Result& result) const = 0;
    };

    // --- Stateful Strategy ---
    // Holds its own state across bars. One instance serves exactly one backtest:
    // init() is called once before the replay, next() once per bar.
    // Bar data, equity and position are read from the context, and actions are
    // emitted through it (buy(), sell(), closeBuy(), closeSell()).
    class IStatefulStrategy {
    public:
        virtual ~IStatefulStrategy() = default;

        virtual std::string getName() const = 0;

        // Throws core::StrategyException (or any std::exception) when the
        // options are unusable; the backtest is aborted.
        virtual void init(const json& options) = 0;

        // Throwing here only drops the action for the current bar.
        virtual void next(backtester::StrategyContext& context) = 0;
    };

    using StatefulStrategyFactory = std::function<std::unique_ptr<IStatefulStrategy>()>;

    // A stateful strategy is described by how to build a fresh instance and the
    // options handed to its init(), so parallel backtests never share state.
    struct StatefulStrategySpec {
        StatefulStrategyFactory factory;
        json options = json::object();
    };

    // std::monostate stands for "no strategy given"
    using StrategyHandle = std::variant<std::monostate,
                                        std::shared_ptr<const IStatelessStrategy>,
                                        StatefulStrategySpec>;

    using DecisionFunction = std::function<std::optional<core::Action>(const core::Candle&,
                                                                       const backtester::Result&)>;

    // Adapts a plain callable to the stateless shape
    class FunctionStrategy : public IStatelessStrategy {
    public:
        FunctionStrategy(std::string name, DecisionFunction decide)
            : name_(std::move(name)), decide_(std::move(decide)) {}

        std::string getName() const override { return name_; }

        std::optional<core::Action> evaluate(const core::Candle& candle,
                                             const backtester::Result& result) const override {
            return decide_(candle, result);
        }

        bool isCallable() const { return static_cast<bool>(decide_); }

    private:
        std::string name_;
        DecisionFunction decide_;
    };

    inline StrategyHandle makeStatelessStrategy(std::string name, DecisionFunction decide) {
        return std::make_shared<const FunctionStrategy>(std::move(name), std::move(decide));
    }

    template<typename StrategyT>
    StrategyHandle makeStatefulStrategy(json options = json::object()) {
        StatefulStrategySpec spec;
        spec.factory = []() { return std::make_unique<StrategyT>(); };
        spec.options = std::move(options);
        return spec;
    }

} // namespace strategy_engine
