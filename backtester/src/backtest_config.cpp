#include "backtest_config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <cmath>

namespace backtester {

    namespace {
        // Reads an optional numeric key into target
        void readNumber(const json& config_json, const char* key, double& target) {
            if (!config_json.contains(key)) {
                return;
            }
            const auto& value = config_json.at(key);
            if (!value.is_number()) {
                throw core::ConfigException(std::string("Backtest config field '") + key + "' must be a number.");
            }
            target = value.get<double>();
        }
    } // end anonymous namespace

    BacktestConfig BacktestConfig::fromJson(const json& config_json) {
        if (!config_json.is_object()) {
            throw core::ConfigException("Backtest config must be a JSON object.");
        }

        BacktestConfig config;
        readNumber(config_json, "starting_balance", config.starting_balance);
        readNumber(config_json, "risk_free_rate", config.risk_free_rate);
        readNumber(config_json, "kelly_fraction", config.kelly_fraction);
        readNumber(config_json, "risk_of_ruin_drawdown_limit", config.risk_of_ruin_drawdown_limit);
        config.validate();

        core::logging::getLogger()->debug("Backtest config loaded: {}", config.toJson().dump());
        return config;
    }

    void BacktestConfig::validate() const {
        if (!std::isfinite(starting_balance) || starting_balance < 0.0) {
            throw core::ConfigException("starting_balance must be a finite, non-negative number.");
        }
        if (!std::isfinite(risk_free_rate)) {
            throw core::ConfigException("risk_free_rate must be finite.");
        }
        if (!std::isfinite(kelly_fraction) || kelly_fraction <= 0.0 || kelly_fraction > 1.0) {
            throw core::ConfigException("kelly_fraction must be in (0, 1].");
        }
        if (!std::isfinite(risk_of_ruin_drawdown_limit) ||
            risk_of_ruin_drawdown_limit < 0.0 || risk_of_ruin_drawdown_limit >= 1.0) {
            throw core::ConfigException("risk_of_ruin_drawdown_limit must be in [0, 1).");
        }
    }

    json BacktestConfig::toJson() const {
        return json{
            {"starting_balance", starting_balance},
            {"risk_free_rate", risk_free_rate},
            {"kelly_fraction", kelly_fraction},
            {"risk_of_ruin_drawdown_limit", risk_of_ruin_drawdown_limit}
        };
    }

} // namespace backtester
