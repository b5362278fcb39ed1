// database_manager_test.cpp - candle storage on an in-memory SQLite database

#include <gtest/gtest.h>

#include "database_manager.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <vector>

using test_helpers::day;
using test_helpers::make_candle;

class DatabaseManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db.connect());
        ASSERT_TRUE(db.initializeSchema());
    }

    data::DatabaseManager db{":memory:"};
};

TEST_F(DatabaseManagerTest, StartsEmpty) {
    EXPECT_TRUE(db.isConnected());
    EXPECT_EQ(db.countCandles("NSE_EQ|INE002A01018", "1d"), 0u);
    EXPECT_TRUE(db.queryCandles("NSE_EQ|INE002A01018", "1d").empty());
}

TEST_F(DatabaseManagerTest, SchemaInitializationIsRepeatable) {
    EXPECT_TRUE(db.initializeSchema());
}

TEST_F(DatabaseManagerTest, QueryReturnsAscendingTime) {
    core::TimeSeries<core::Candle> candles = {
        make_candle(12.0, 13.0, day(2)),
        make_candle(10.0, 11.0, day(0)),
        make_candle(11.0, 12.0, day(1)),
    };
    ASSERT_TRUE(db.saveCandles(candles, "ACME", "1d"));

    auto loaded = db.queryCandles("ACME", "1d");
    ASSERT_EQ(loaded.size(), 3u);
    ASSERT_TRUE(loaded[0].timestamp.has_value());
    EXPECT_EQ(*loaded[0].timestamp, day(0));
    EXPECT_EQ(*loaded[2].timestamp, day(2));
    EXPECT_DOUBLE_EQ(loaded[0].open, 10.0);
    EXPECT_DOUBLE_EQ(loaded[0].close, 11.0);
    EXPECT_DOUBLE_EQ(loaded[0].high, 11.0);
    EXPECT_EQ(loaded[0].volume, 100);
}

TEST_F(DatabaseManagerTest, DuplicatesAreIgnored) {
    core::TimeSeries<core::Candle> candles = {make_candle(10.0, day(0)), make_candle(11.0, day(1))};
    ASSERT_TRUE(db.saveCandles(candles, "ACME", "1d"));

    core::TimeSeries<core::Candle> again = {make_candle(99.0, day(1)), make_candle(12.0, day(2))};
    ASSERT_TRUE(db.saveCandles(again, "ACME", "1d"));

    auto loaded = db.queryCandles("ACME", "1d");
    ASSERT_EQ(loaded.size(), 3u);
    EXPECT_DOUBLE_EQ(loaded[1].open, 11.0);
}

TEST_F(DatabaseManagerTest, CandlesWithoutTimestampAreSkipped) {
    core::TimeSeries<core::Candle> candles = {make_candle(10.0, day(0)), make_candle(11.0)};
    ASSERT_TRUE(db.saveCandles(candles, "ACME", "1d"));
    EXPECT_EQ(db.countCandles("ACME", "1d"), 1u);
}

TEST_F(DatabaseManagerTest, SeriesAreKeyedByInstrumentAndInterval) {
    ASSERT_TRUE(db.saveCandles({make_candle(10.0, day(0))}, "ACME", "1d"));
    ASSERT_TRUE(db.saveCandles({make_candle(20.0, day(0))}, "ACME", "1h"));
    ASSERT_TRUE(db.saveCandles({make_candle(30.0, day(0))}, "OTHER", "1d"));

    EXPECT_EQ(db.countCandles("ACME", "1d"), 1u);
    EXPECT_DOUBLE_EQ(db.queryCandles("ACME", "1h").at(0).open, 20.0);
    EXPECT_DOUBLE_EQ(db.queryCandles("OTHER", "1d").at(0).open, 30.0);
}

TEST_F(DatabaseManagerTest, RangeBoundsAreInclusive) {
    core::TimeSeries<core::Candle> candles;
    for (int d = 0; d < 5; ++d) {
        candles.push_back(make_candle(10.0 + d, day(d)));
    }
    ASSERT_TRUE(db.saveCandles(candles, "ACME", "1d"));

    auto middle = db.queryCandles("ACME", "1d", day(1), day(3));
    ASSERT_EQ(middle.size(), 3u);
    EXPECT_DOUBLE_EQ(middle.front().open, 11.0);
    EXPECT_DOUBLE_EQ(middle.back().open, 13.0);

    EXPECT_EQ(db.queryCandles("ACME", "1d", day(3)).size(), 2u);
    EXPECT_EQ(db.queryCandles("ACME", "1d", std::nullopt, day(0)).size(), 1u);
}

TEST_F(DatabaseManagerTest, SubSecondCandlesAreDistinct) {
    auto base = day(0);
    core::TimeSeries<core::Candle> candles = {
        make_candle(10.0, base + std::chrono::milliseconds(500)),
        make_candle(11.0, base + std::chrono::milliseconds(250)),
        make_candle(12.0, base + std::chrono::seconds(1)),
        make_candle(9.0, base),
    };
    ASSERT_TRUE(db.saveCandles(candles, "ACME", "1s"));

    auto loaded = db.queryCandles("ACME", "1s");
    ASSERT_EQ(loaded.size(), 4u);
    EXPECT_EQ(*loaded[0].timestamp, base);
    EXPECT_EQ(*loaded[1].timestamp, base + std::chrono::milliseconds(250));
    EXPECT_EQ(*loaded[2].timestamp, base + std::chrono::milliseconds(500));
    EXPECT_EQ(*loaded[3].timestamp, base + std::chrono::seconds(1));

    auto window = db.queryCandles("ACME", "1s", base + std::chrono::milliseconds(250),
                                  base + std::chrono::milliseconds(500));
    ASSERT_EQ(window.size(), 2u);
    EXPECT_DOUBLE_EQ(window[0].open, 11.0);
}

TEST_F(DatabaseManagerTest, EmptySaveSucceeds) {
    EXPECT_TRUE(db.saveCandles({}, "ACME", "1d"));
}

TEST_F(DatabaseManagerTest, DisconnectedQueriesThrow) {
    db.disconnect();
    EXPECT_FALSE(db.isConnected());
    EXPECT_THROW(db.queryCandles("ACME", "1d"), core::DataLoadException);
    EXPECT_THROW(db.countCandles("ACME", "1d"), core::DataLoadException);
    EXPECT_FALSE(db.saveCandles({make_candle(10.0, day(0))}, "ACME", "1d"));
    EXPECT_FALSE(db.initializeSchema());
}

TEST_F(DatabaseManagerTest, CorruptTimestampIsReported) {
    ASSERT_TRUE(db.executeSQL(
        "INSERT INTO candles (instrument_key, interval, timestamp, open, high, low, close, volume) "
        "VALUES ('ACME', '1d', 'yesterday', 1, 1, 1, 1, 1);"));
    EXPECT_THROW(db.queryCandles("ACME", "1d"), core::DataLoadException);
}
