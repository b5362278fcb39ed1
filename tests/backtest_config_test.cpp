// backtest_config_test.cpp - run parameters: defaults, JSON loading, validation

#include <gtest/gtest.h>

#include "backtest_config.hpp"
#include "exceptions.hpp"

using backtester::BacktestConfig;
using json = nlohmann::json;

class BacktestConfigTest : public ::testing::Test {
protected:
    BacktestConfig config;  // default-constructed
};

TEST_F(BacktestConfigTest, Defaults) {
    EXPECT_DOUBLE_EQ(config.starting_balance, 10000.0);
    EXPECT_DOUBLE_EQ(config.risk_free_rate, 0.02);
    EXPECT_DOUBLE_EQ(config.kelly_fraction, 0.25);
    EXPECT_DOUBLE_EQ(config.risk_of_ruin_drawdown_limit, 0.20);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(BacktestConfigTest, MissingKeysKeepDefaults) {
    auto loaded = BacktestConfig::fromJson(json{{"starting_balance", 500}});
    EXPECT_DOUBLE_EQ(loaded.starting_balance, 500.0);
    EXPECT_DOUBLE_EQ(loaded.risk_free_rate, 0.02);
    EXPECT_DOUBLE_EQ(loaded.kelly_fraction, 0.25);
}

TEST_F(BacktestConfigTest, EmptyObjectIsDefaults) {
    auto loaded = BacktestConfig::fromJson(json::object());
    EXPECT_DOUBLE_EQ(loaded.starting_balance, config.starting_balance);
}

TEST_F(BacktestConfigTest, ToJsonCarriesEveryField) {
    config.kelly_fraction = 0.5;
    json out = config.toJson();
    EXPECT_DOUBLE_EQ(out.at("kelly_fraction").get<double>(), 0.5);
    EXPECT_DOUBLE_EQ(BacktestConfig::fromJson(out).kelly_fraction, 0.5);
    EXPECT_TRUE(out.contains("risk_of_ruin_drawdown_limit"));
}

TEST_F(BacktestConfigTest, NonObjectIsRejected) {
    EXPECT_THROW(BacktestConfig::fromJson(json::array()), core::ConfigException);
}

TEST_F(BacktestConfigTest, WrongTypeIsRejected) {
    try {
        BacktestConfig::fromJson(json{{"risk_free_rate", "two percent"}});
        FAIL() << "Expected ConfigException";
    } catch (const core::ConfigException& e) {
        EXPECT_STREQ(e.what(), "Backtest config field 'risk_free_rate' must be a number.");
    }
}

TEST_F(BacktestConfigTest, NegativeBalanceIsInvalid) {
    config.starting_balance = -1.0;
    EXPECT_THROW(config.validate(), core::ConfigException);
    EXPECT_THROW(BacktestConfig::fromJson(json{{"starting_balance", -1}}), core::ConfigException);
}

TEST_F(BacktestConfigTest, ZeroBalanceIsAllowed) {
    config.starting_balance = 0.0;
    EXPECT_NO_THROW(config.validate());
}

TEST_F(BacktestConfigTest, KellyFractionRange) {
    config.kelly_fraction = 0.0;
    EXPECT_THROW(config.validate(), core::ConfigException);
    config.kelly_fraction = 1.5;
    EXPECT_THROW(config.validate(), core::ConfigException);
    config.kelly_fraction = 1.0;
    EXPECT_NO_THROW(config.validate());
}

TEST_F(BacktestConfigTest, DrawdownLimitRange) {
    config.risk_of_ruin_drawdown_limit = 1.0;
    EXPECT_THROW(config.validate(), core::ConfigException);
    config.risk_of_ruin_drawdown_limit = 0.0;
    EXPECT_NO_THROW(config.validate());
}
