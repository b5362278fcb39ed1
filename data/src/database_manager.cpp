#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <stdexcept>

namespace data
{

    namespace
    {
        // Lower and upper bounds that compare below/above every stored ISO text
        const char* kMinTimestampText = "";
        const char* kMaxTimestampText = "~";
    }

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        auto logger = core::logging::getLogger();
        if (connected_)
        {
            logger->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        logger->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Cannot open SQLite database '{}': {}", database_path_, db_ ? sqlite3_errmsg(db_) : "out of memory");
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000);
        logger->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        auto logger = core::logging::getLogger();
        logger->info("Disconnecting from SQLite database: {}", database_path_);
        if (sqlite3_close(db_) != SQLITE_OK)
        {
            // Only happens when statements are still open
            logger->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        logger->debug("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK)
        {
            logger->error("SQL error: {}", error_msg ? error_msg : sqlite3_errstr(rc));
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    DatabaseManager::Statement DatabaseManager::prepare(const char* sql)
    {
        sqlite3_stmt* raw = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr);
        Statement stmt(raw);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Failed to prepare SQL statement [{}]: {}", rc, sqlite3_errmsg(db_));
            return Statement();
        }
        return stmt;
    }

    bool DatabaseManager::initializeSchema()
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        logger->info("Initializing SQLite database schema if needed...");

        const std::string create_candles_sql = R"(
        CREATE TABLE IF NOT EXISTS candles (
            instrument_key TEXT NOT NULL,
            interval TEXT NOT NULL,
            timestamp TEXT NOT NULL, -- UTC ISO-8601 with milliseconds
            open REAL NOT NULL,
            high REAL NOT NULL,
            low REAL NOT NULL,
            close REAL NOT NULL,
            volume INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (instrument_key, interval, timestamp)
        );
    )";

        const std::string create_candles_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_candles_timestamp
        ON candles (instrument_key, interval, timestamp);
    )";

        bool success = executeSQL(create_candles_sql) && executeSQL(create_candles_index_sql);
        if (success)
        {
            logger->info("SQLite database schema initialization check complete.");
        }
        else
        {
            logger->error("SQLite database schema initialization failed.");
        }
        return success;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const std::string& instrument_key,
        const std::string& interval,
        const std::optional<core::Timestamp>& start_time,
        const std::optional<core::Timestamp>& end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot query candles: Not connected to database.");
        }

        std::string start_str = start_time ? core::utils::timestampToString(*start_time, true) : kMinTimestampText;
        std::string end_str = end_time ? core::utils::timestampToString(*end_time, true) : kMaxTimestampText;

        logger->debug("Querying candles for {} ({}) between '{}' and '{}'",
                      instrument_key, interval, start_str, end_str);

        const char* sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM candles
            WHERE instrument_key = ?
              AND interval = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        Statement stmt = prepare(sql);
        if (!stmt)
        {
            throw core::DataLoadException("Failed to prepare candle query: " + std::string(sqlite3_errmsg(db_)));
        }

        // SQLITE_TRANSIENT: bound strings are locals
        sqlite3_bind_text(stmt.get(), 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        core::TimeSeries<core::Candle> candles;
        int rc = SQLITE_OK;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            core::Candle candle;
            const unsigned char *ts_text = sqlite3_column_text(stmt.get(), 0);
            if (!ts_text)
            {
                throw core::DataLoadException("NULL timestamp stored for " + instrument_key + ".");
            }
            try
            {
                candle.timestamp = core::utils::stringToTimestamp(reinterpret_cast<const char*>(ts_text));
            }
            catch (const std::runtime_error& e)
            {
                throw core::DataLoadException("Invalid timestamp stored for " + instrument_key + ": " + e.what());
            }
            candle.open = sqlite3_column_double(stmt.get(), 1);
            candle.high = sqlite3_column_double(stmt.get(), 2);
            candle.low = sqlite3_column_double(stmt.get(), 3);
            candle.close = sqlite3_column_double(stmt.get(), 4);
            candle.volume = sqlite3_column_int64(stmt.get(), 5);
            candles.push_back(candle);
        }

        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException("Error stepping through candle query: " + std::string(sqlite3_errmsg(db_)));
        }

        logger->debug("Loaded {} candles for {} ({}).", candles.size(), instrument_key, interval);
        return candles;
    }

    std::size_t DatabaseManager::countCandles(const std::string& instrument_key, const std::string& interval)
    {
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot count candles: Not connected to database.");
        }

        Statement stmt = prepare("SELECT COUNT(*) FROM candles WHERE instrument_key = ? AND interval = ?;");
        if (!stmt)
        {
            throw core::DataLoadException("Failed to prepare candle count: " + std::string(sqlite3_errmsg(db_)));
        }
        sqlite3_bind_text(stmt.get(), 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, interval.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(stmt.get()) != SQLITE_ROW)
        {
            throw core::DataLoadException("Candle count returned no row: " + std::string(sqlite3_errmsg(db_)));
        }
        return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const std::string &instrument_key,
                                      const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            logger->debug("No candles provided to save for {} ({}).", instrument_key, interval);
            return true; // Nothing to do, report success
        }

        const char *sql = R"(
INSERT OR IGNORE INTO candles
(instrument_key, interval, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving candles.");
            return false;
        }

        bool success = true;
        int saved_count = 0;
        int skipped_count = 0;
        {
            Statement stmt = prepare(sql);
            success = static_cast<bool>(stmt);

            for (std::size_t i = 0; success && i < candles.size(); ++i)
            {
                const auto& candle = candles[i];
                if (!candle.timestamp)
                {
                    ++skipped_count;
                    continue;
                }

                std::string timestamp_str = core::utils::timestampToString(*candle.timestamp, true);
                sqlite3_bind_text(stmt.get(), 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt.get(), 2, interval.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt.get(), 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_double(stmt.get(), 4, candle.open);
                sqlite3_bind_double(stmt.get(), 5, candle.high);
                sqlite3_bind_double(stmt.get(), 6, candle.low);
                sqlite3_bind_double(stmt.get(), 7, candle.close);
                sqlite3_bind_int64(stmt.get(), 8, candle.volume);

                int rc = sqlite3_step(stmt.get());
                if (rc != SQLITE_DONE)
                {
                    logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                    success = false;
                    break;
                }
                if (sqlite3_changes(db_) > 0)
                {
                    ++saved_count;
                }
                sqlite3_reset(stmt.get());
                sqlite3_clear_bindings(stmt.get());
            }
        } // Statement finalized before COMMIT/ROLLBACK

        if (skipped_count > 0)
        {
            logger->warn("Skipped {} candles without a timestamp for {} ({}).", skipped_count, instrument_key, interval);
        }

        if (success && !executeSQL("COMMIT;"))
        {
            logger->error("Failed to COMMIT transaction for saving candles.");
            success = false;
        }
        if (!success)
        {
            if (!executeSQL("ROLLBACK;"))
            {
                logger->error("ROLLBACK failed for candle save of {} ({}).", instrument_key, interval);
            }
            logger->warn("Transaction rolled back due to error during candle save for {} ({}).", instrument_key, interval);
            return false;
        }

        logger->info("Saved {} new candles (duplicates ignored) for {} ({}).", saved_count, instrument_key, interval);
        return true;
    }

} // namespace data
