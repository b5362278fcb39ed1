#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace backtester {

    using json = nlohmann::json;

    // Parameters of one backtest run
    struct BacktestConfig {
        double starting_balance = 10000.0;
        double risk_free_rate = 0.02;              // Annual, as a fraction (0.02 = 2%)
        double kelly_fraction = 0.25;              // Multiplier applied to the full Kelly value
        double risk_of_ruin_drawdown_limit = 0.20; // Drawdown treated as ruin, as a fraction

        // Missing keys keep their defaults. Throws core::ConfigException on
        // wrong types or values that fail validate().
        static BacktestConfig fromJson(const json& config_json);

        // Throws core::ConfigException describing the first invalid field
        void validate() const;

        json toJson() const;
    };

} // namespace backtester
