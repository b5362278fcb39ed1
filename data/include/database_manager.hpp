#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp" // Keep core types

namespace data {

// Bar storage on SQLite. Timestamps are stored as UTC ISO-8601 text
// ("2023-01-02T09:15:00Z"), so text order is time order.
class DatabaseManager {
public:
    // ":memory:" opens a private in-memory database
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates the candles table and its index if missing
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // Inserts in one transaction, ignoring rows already stored for the same
    // (instrument, interval, timestamp). Candles without a timestamp are skipped.
    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                     const std::string& instrument_key,
                     const std::string& interval);

    // Candles in ascending time order, bounds inclusive and optional.
    // Throws core::DataLoadException when not connected or the query fails.
    core::TimeSeries<core::Candle> queryCandles(
        const std::string& instrument_key,
        const std::string& interval,
        const std::optional<core::Timestamp>& start_time = std::nullopt,
        const std::optional<core::Timestamp>& end_time = std::nullopt);

    // Throws core::DataLoadException like queryCandles
    std::size_t countCandles(const std::string& instrument_key, const std::string& interval);

private:
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    // Empty pointer on failure (logged)
    Statement prepare(const char* sql);

    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

} // namespace data
