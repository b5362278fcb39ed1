// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <vector>
#include <exception>   // Needed for std::exception
#include <memory>      // For std::shared_ptr
#include <fstream>     // For std::ifstream
#include <variant>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "database_manager.hpp" // Bars are loaded from SQLite
#include "strategy_factory.hpp"
#include "backtest_config.hpp"
#include "backtester.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>

namespace {

    using json = nlohmann::json;

    void printUsage(const char* program) {
        std::cerr << "Usage: " << program
                  << " <db_path> <instrument_key> <interval> <strategy.json> [backtest_config.json]\n"
                  << "  Replays the strategy over the stored candles and prints a JSON summary.\n"
                  << "  Log level can be overridden with SPDLOG_LEVEL (trace, debug, info, ...).\n";
    }

    json loadJsonFile(const std::string& path, const char* what) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigException(fmt::format("Failed to open {} file: {}", what, path));
        }
        try {
            return json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw core::ConfigException(fmt::format("Failed to parse {} file '{}': {}", what, path, e.what()));
        }
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 5 || argc > 6) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string db_path = argv[1];
    const std::string instrument_key = argv[2];
    const std::string interval = argv[3];
    const std::string strategy_path = argv[4];
    const std::string config_path = (argc == 6) ? argv[5] : "";

    std::shared_ptr<spdlog::logger> logger;

    try {
        // --- Initialize Logging ---
        core::logging::initialize("post_facto_cli", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("post_facto CLI starting...");

        // --- Configuration ---
        backtester::BacktestConfig config;
        if (!config_path.empty()) {
            logger->info("Loading backtest config from: {}", config_path);
            config = backtester::BacktestConfig::fromJson(loadJsonFile(config_path, "backtest config"));
        }

        logger->info("Loading strategy config from: {}", strategy_path);
        json strategy_config = loadJsonFile(strategy_path, "strategy");
        strategy_engine::StrategyHandle strategy = strategy_engine::StrategyFactory::createStrategy(strategy_config);

        // --- Load Bars ---
        data::DatabaseManager db_manager(db_path);
        if (!db_manager.connect()) {
            throw core::DataLoadException("Could not open database: " + db_path);
        }
        if (!db_manager.initializeSchema()) {
            throw core::DataLoadException("Could not initialize schema in database: " + db_path);
        }
        core::TimeSeries<core::Candle> bars = db_manager.queryCandles(instrument_key, interval);
        db_manager.disconnect();
        logger->info("Loaded {} candles for {} ({}).", bars.size(), instrument_key, interval);

        // --- Run Backtest ---
        backtester::Backtester the_backtester(config);
        backtester::BacktestOutcome outcome = the_backtester.run(bars, strategy);

        if (const auto* error = std::get_if<backtester::BacktestError>(&outcome)) {
            logger->error("---=== Backtest Run Failed ({}) ===---", backtester::errorKindToString(error->kind));
            std::cerr << "Backtest failed: " << error->message << std::endl;
            return 1;
        }

        const auto& result = std::get<std::shared_ptr<const backtester::Result>>(outcome);
        result->getMetrics().logMetrics();
        std::cout << result->toSummaryJson().dump(2) << std::endl;

        logger->info("post_facto CLI finished.");

    // --- Exception Handling ---
    } catch (const core::PostFactoException& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
