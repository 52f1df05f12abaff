#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace data
{

    namespace
    {
        // Stays below SQLITE_MAX_VARIABLE_NUMBER (999 before SQLite 3.32) with the three fixed parameters
        constexpr std::size_t kMaxCodesPerQuery = 500;

        // Finalizes on scope exit, including when a read throws
        using StatementPtr = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt *)>;

        StatementPtr wrap(sqlite3_stmt *stmt)
        {
            return StatementPtr(stmt, &sqlite3_finalize);
        }

        void bindOptional(sqlite3_stmt *stmt, int index, const std::optional<double> &value)
        {
            if (value)
            {
                sqlite3_bind_double(stmt, index, *value);
            }
            else
            {
                sqlite3_bind_null(stmt, index);
            }
        }

        std::string columnText(sqlite3_stmt *stmt, int index)
        {
            const unsigned char *text = sqlite3_column_text(stmt, index);
            return text ? std::string(reinterpret_cast<const char *>(text)) : std::string();
        }

        std::optional<double> columnOptionalDouble(sqlite3_stmt *stmt, int index)
        {
            if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
            {
                return std::nullopt;
            }
            return sqlite3_column_double(stmt, index);
        }

        // Signal family -> analysis_results column
        const std::vector<std::pair<core::SignalFamily, const char *>> &signalColumns()
        {
            static const std::vector<std::pair<core::SignalFamily, const char *>> columns{
                {core::SignalFamily::Macd, "macd_signal"},
                {core::SignalFamily::Rsi, "rsi_signal"},
                {core::SignalFamily::Kdj, "kdj_signal"},
                {core::SignalFamily::Bollinger, "boll_signal"},
                {core::SignalFamily::Ma, "ma_signal"}};
            return columns;
        }

    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path, std::shared_ptr<spdlog::logger> logger)
        : database_path_(db_path), db_(nullptr), connected_(false),
          logger_(core::logging::orNull(std::move(logger)))
    {
        logger_->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            logger_->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        logger_->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            logger_->error("Cannot open SQLite database '{}': {}", database_path_,
                           db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000); // Wait 5 seconds if busy
        logger_->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        logger_->info("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // This usually happens if prepared statements are not finalized
            logger_->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
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
        if (!isConnected())
        {
            logger_->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        logger_->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            logger_->error("SQL error: {}", error_msg ? error_msg : sqlite3_errstr(rc));
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            logger_->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        logger_->info("Initializing SQLite database schema if needed...");

        // Column names follow the baostock daily k-line export
        const std::string create_bars_sql = R"(
        CREATE TABLE IF NOT EXISTS history_k_data (
            date TEXT NOT NULL,
            code TEXT NOT NULL,
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            preclose REAL,
            volume REAL,
            amount REAL,
            adjustflag TEXT,
            turn REAL,
            tradestatus TEXT,
            pctChg REAL,
            peTTM REAL,
            pbMRQ REAL,
            psTTM REAL,
            pcfNcfTTM REAL,
            isST TEXT
        );
    )";
        const std::string create_bars_index_sql = R"(
        CREATE UNIQUE INDEX IF NOT EXISTS idx_history_k_data_code_date
        ON history_k_data (code, date);
    )";
        const std::string create_bars_date_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_history_k_data_date ON history_k_data (date);
    )";

        const std::string create_results_sql = R"(
        CREATE TABLE IF NOT EXISTS analysis_results (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            stock_code TEXT NOT NULL,
            analysis_date TEXT NOT NULL,
            strategy TEXT NOT NULL,
            rating TEXT NOT NULL,
            score INTEGER,
            macd_signal TEXT,
            rsi_signal TEXT,
            kdj_signal TEXT,
            boll_signal TEXT,
            ma_signal TEXT,
            risk_level TEXT,
            expected_return REAL,
            created_at TEXT DEFAULT CURRENT_TIMESTAMP
        );
    )";
        const std::string create_results_index_sql = R"(
        CREATE UNIQUE INDEX IF NOT EXISTS idx_analysis_results_stock_date_strategy
        ON analysis_results (stock_code, analysis_date, strategy);
    )";

        const std::string create_performance_sql = R"(
        CREATE TABLE IF NOT EXISTS strategy_performance (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            strategy_name TEXT NOT NULL,
            start_date TEXT NOT NULL,
            end_date TEXT NOT NULL,
            total_return REAL,
            annual_return REAL,
            max_drawdown REAL,
            sharpe_ratio REAL,
            win_rate REAL,
            profit_loss_ratio REAL,
            trades_count INTEGER,
            result_count INTEGER,
            instruments_evaluated INTEGER,
            instruments_skipped INTEGER,
            created_at TEXT DEFAULT CURRENT_TIMESTAMP
        );
    )";
        const std::string create_performance_index_sql = R"(
        CREATE UNIQUE INDEX IF NOT EXISTS idx_strategy_performance_name_date
        ON strategy_performance (strategy_name, start_date, end_date);
    )";

        bool success = true;
        success &= executeSQL(create_bars_sql);
        success &= executeSQL(create_bars_index_sql);
        success &= executeSQL(create_bars_date_index_sql);
        success &= executeSQL(create_results_sql);
        success &= executeSQL(create_results_index_sql);
        success &= executeSQL(create_performance_sql);
        success &= executeSQL(create_performance_index_sql);

        if (success)
        {
            logger_->info("SQLite database schema initialization check complete.");
        }
        else
        {
            logger_->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    bool DatabaseManager::saveBars(const core::TimeSeries<core::Bar> &bars)
    {
        if (!isConnected())
        {
            logger_->error("Cannot save bars: Not connected to database.");
            return false;
        }
        if (bars.empty())
        {
            logger_->debug("No bars provided to save.");
            return true; // Nothing to do, report success
        }

        const char *sql = R"(
INSERT OR IGNORE INTO history_k_data
(date, code, open, high, low, close, preclose, volume, amount, adjustflag, turn, tradestatus, pctChg,
 peTTM, pbMRQ, psTTM, pcfNcfTTM, isST)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *raw_stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &raw_stmt, nullptr);
        auto stmt = wrap(raw_stmt);
        if (rc != SQLITE_OK)
        {
            logger_->error("Failed to prepare bar INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger_->error("Failed to begin transaction for saving bars.");
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &bar : bars)
        {
            const std::string adjust_flag = std::to_string(bar.adjust_flag);
            const std::string trade_status = std::to_string(bar.trade_status);

            sqlite3_bind_text(stmt.get(), 1, bar.date.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 2, bar.code.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt.get(), 3, bar.open);
            sqlite3_bind_double(stmt.get(), 4, bar.high);
            sqlite3_bind_double(stmt.get(), 5, bar.low);
            sqlite3_bind_double(stmt.get(), 6, bar.close);
            sqlite3_bind_double(stmt.get(), 7, bar.preclose);
            sqlite3_bind_double(stmt.get(), 8, bar.volume);
            sqlite3_bind_double(stmt.get(), 9, bar.amount);
            sqlite3_bind_text(stmt.get(), 10, adjust_flag.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt.get(), 11, bar.turnover);
            sqlite3_bind_text(stmt.get(), 12, trade_status.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt.get(), 13, bar.pct_chg);
            if (bar.fundamentals)
            {
                const auto &f = *bar.fundamentals;
                bindOptional(stmt.get(), 14, f.pe_ttm);
                bindOptional(stmt.get(), 15, f.pb_mrq);
                bindOptional(stmt.get(), 16, f.ps_ttm);
                bindOptional(stmt.get(), 17, f.pcf_ncf_ttm);
                sqlite3_bind_text(stmt.get(), 18, f.is_st ? "1" : "0", -1, SQLITE_STATIC);
            }
            else
            {
                for (int idx = 14; idx <= 18; ++idx)
                {
                    sqlite3_bind_null(stmt.get(), idx);
                }
            }

            rc = sqlite3_step(stmt.get());
            if (rc != SQLITE_DONE)
            {
                logger_->error("Failed to insert bar {} {} [{}]: {}", bar.code, bar.date, rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }

            rc = sqlite3_reset(stmt.get());
            if (rc != SQLITE_OK)
            {
                logger_->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        stmt.reset(); // Finalize before commit/rollback

        const std::string final_sql = success ? "COMMIT;" : "ROLLBACK;";
        if (!executeSQL(final_sql))
        {
            logger_->error("Failed to {} transaction for saving bars.", success ? "COMMIT" : "ROLLBACK");
            if (success)
            {
                executeSQL("ROLLBACK;");
            }
            return false;
        }

        if (success)
        {
            logger_->info("Saved {} new bars ({} duplicates ignored).", saved_count, bars.size() - saved_count);
        }
        else
        {
            logger_->warn("Transaction rolled back due to error during bar save.");
        }
        return success;
    }

    core::TimeSeries<core::Bar> DatabaseManager::fetchBars(const std::string &code,
                                                           const core::Date &start_date,
                                                           const core::Date &end_date)
    {
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot query bars: Not connected to database " + database_path_);
        }

        logger_->debug("Querying bars for {} between '{}' and '{}'", code, start_date, end_date);

        const char *sql = R"(
            SELECT date, code, open, high, low, close, preclose, volume, amount, adjustflag, turn,
                   tradestatus, pctChg, peTTM, pbMRQ, psTTM, pcfNcfTTM, isST
            FROM history_k_data
            WHERE code = ?
              AND date >= ?
              AND date <= ?
            ORDER BY date ASC;
        )";

        sqlite3_stmt *raw_stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &raw_stmt, nullptr);
        auto stmt = wrap(raw_stmt);
        if (rc != SQLITE_OK)
        {
            throw core::DataLoadException(fmt::format("Failed to prepare bar query [{}]: {}", rc, sqlite3_errmsg(db_)));
        }

        sqlite3_bind_text(stmt.get(), 1, code.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, start_date.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 3, end_date.c_str(), -1, SQLITE_TRANSIENT);

        core::TimeSeries<core::Bar> bars;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            core::Bar bar;
            bar.date = columnText(stmt.get(), 0);
            bar.code = columnText(stmt.get(), 1);
            bar.open = sqlite3_column_double(stmt.get(), 2);
            bar.high = sqlite3_column_double(stmt.get(), 3);
            bar.low = sqlite3_column_double(stmt.get(), 4);
            bar.close = sqlite3_column_double(stmt.get(), 5);
            bar.preclose = sqlite3_column_double(stmt.get(), 6);
            bar.volume = sqlite3_column_double(stmt.get(), 7);
            bar.amount = sqlite3_column_double(stmt.get(), 8);
            if (sqlite3_column_type(stmt.get(), 9) != SQLITE_NULL)
            {
                bar.adjust_flag = sqlite3_column_int(stmt.get(), 9);
            }
            bar.turnover = sqlite3_column_double(stmt.get(), 10);
            if (sqlite3_column_type(stmt.get(), 11) != SQLITE_NULL)
            {
                bar.trade_status = sqlite3_column_int(stmt.get(), 11);
            }
            bar.pct_chg = sqlite3_column_double(stmt.get(), 12);

            core::Fundamentals fundamentals;
            fundamentals.pe_ttm = columnOptionalDouble(stmt.get(), 13);
            fundamentals.pb_mrq = columnOptionalDouble(stmt.get(), 14);
            fundamentals.ps_ttm = columnOptionalDouble(stmt.get(), 15);
            fundamentals.pcf_ncf_ttm = columnOptionalDouble(stmt.get(), 16);
            bool has_st = sqlite3_column_type(stmt.get(), 17) != SQLITE_NULL;
            fundamentals.is_st = has_st && sqlite3_column_int(stmt.get(), 17) != 0;
            if (has_st || fundamentals.pe_ttm || fundamentals.pb_mrq || fundamentals.ps_ttm || fundamentals.pcf_ncf_ttm)
            {
                bar.fundamentals = fundamentals;
            }

            if (bar.date.empty())
            {
                logger_->warn("NULL date in history_k_data for {}, skipping row.", code);
                continue;
            }
            bars.push_back(std::move(bar));
        }

        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format("Error stepping through bar query for {} [{}]: {}",
                                                      code, rc, sqlite3_errmsg(db_)));
        }

        logger_->debug("Loaded {} bars for {}.", bars.size(), code);
        return bars;
    }

    std::vector<std::string> DatabaseManager::getStockCodes()
    {
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot list stock codes: Not connected to database " + database_path_);
        }

        const char *sql = "SELECT DISTINCT code FROM history_k_data ORDER BY code ASC;";
        sqlite3_stmt *raw_stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &raw_stmt, nullptr);
        auto stmt = wrap(raw_stmt);
        if (rc != SQLITE_OK)
        {
            throw core::DataLoadException(fmt::format("Failed to prepare stock code query [{}]: {}", rc, sqlite3_errmsg(db_)));
        }

        std::vector<std::string> codes;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            std::string code = columnText(stmt.get(), 0);
            if (!code.empty())
            {
                codes.push_back(std::move(code));
            }
        }
        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format("Error reading stock codes [{}]: {}", rc, sqlite3_errmsg(db_)));
        }
        return codes;
    }

    bool DatabaseManager::saveAnalysisResults(const std::vector<core::AnalysisResult> &results)
    {
        if (!isConnected())
        {
            logger_->error("Cannot save analysis results: Not connected to database.");
            return false;
        }
        if (results.empty())
        {
            logger_->debug("No analysis results provided to save.");
            return true;
        }

        const char *sql = R"(
INSERT OR IGNORE INTO analysis_results
(stock_code, analysis_date, strategy, rating, score, macd_signal, rsi_signal, kdj_signal, boll_signal, ma_signal,
 risk_level, expected_return)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *raw_stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &raw_stmt, nullptr);
        auto stmt = wrap(raw_stmt);
        if (rc != SQLITE_OK)
        {
            logger_->error("Failed to prepare analysis result INSERT [{}]: {}", rc, sqlite3_errmsg(db_));
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger_->error("Failed to begin transaction for saving analysis results.");
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &result : results)
        {
            const std::string rating = core::utils::toString(result.rating);
            const std::string risk = core::utils::toString(result.risk_level);

            sqlite3_bind_text(stmt.get(), 1, result.code.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 2, result.analysis_date.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 3, result.strategy.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 4, rating.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt.get(), 5, result.score);
            int column = 6;
            for (const auto &entry : signalColumns())
            {
                auto it = result.signals.find(entry.first);
                if (it != result.signals.end())
                {
                    const std::string signal = core::utils::toString(it->second);
                    sqlite3_bind_text(stmt.get(), column, signal.c_str(), -1, SQLITE_TRANSIENT);
                }
                else
                {
                    sqlite3_bind_null(stmt.get(), column);
                }
                ++column;
            }
            sqlite3_bind_text(stmt.get(), 11, risk.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt.get(), 12, result.expected_return);

            rc = sqlite3_step(stmt.get());
            if (rc != SQLITE_DONE)
            {
                logger_->error("Failed to insert analysis result {} {} [{}]: {}",
                               result.code, result.analysis_date, rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }
            sqlite3_reset(stmt.get());
            sqlite3_clear_bindings(stmt.get());
        }

        stmt.reset();

        const std::string final_sql = success ? "COMMIT;" : "ROLLBACK;";
        if (!executeSQL(final_sql))
        {
            logger_->error("Failed to {} transaction for saving analysis results.", success ? "COMMIT" : "ROLLBACK");
            if (success)
            {
                executeSQL("ROLLBACK;");
            }
            return false;
        }

        if (success)
        {
            logger_->info("Saved {} analysis results ({} already stored).", saved_count, results.size() - saved_count);
        }
        return success;
    }

    std::vector<core::AnalysisResult> DatabaseManager::queryAnalysisResults(const std::string &strategy,
                                                                            const core::Date &start_date,
                                                                            const core::Date &end_date,
                                                                            const std::vector<std::string> &codes)
    {
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot query analysis results: Not connected to database " + database_path_);
        }

        if (codes.size() > kMaxCodesPerQuery)
        {
            std::vector<core::AnalysisResult> merged;
            for (std::size_t begin = 0; begin < codes.size(); begin += kMaxCodesPerQuery)
            {
                const std::size_t end = std::min(codes.size(), begin + kMaxCodesPerQuery);
                std::vector<std::string> chunk(codes.begin() + static_cast<std::ptrdiff_t>(begin),
                                               codes.begin() + static_cast<std::ptrdiff_t>(end));
                auto part = queryAnalysisResults(strategy, start_date, end_date, chunk);
                merged.insert(merged.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
            }
            std::sort(merged.begin(), merged.end(),
                      [](const core::AnalysisResult &a, const core::AnalysisResult &b)
                      {
                          return a.analysis_date != b.analysis_date ? a.analysis_date < b.analysis_date : a.code < b.code;
                      });
            return merged;
        }

        std::string sql = R"(
            SELECT stock_code, analysis_date, strategy, rating, score, macd_signal, rsi_signal, kdj_signal,
                   boll_signal, ma_signal, risk_level, expected_return
            FROM analysis_results
            WHERE strategy = ? AND analysis_date >= ? AND analysis_date <= ?)";
        if (!codes.empty())
        {
            std::string placeholders;
            for (std::size_t i = 0; i < codes.size(); ++i)
            {
                placeholders += (i == 0 ? "?" : ", ?");
            }
            sql += " AND stock_code IN (" + placeholders + ")";
        }
        sql += " ORDER BY analysis_date ASC, stock_code ASC;";

        sqlite3_stmt *raw_stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw_stmt, nullptr);
        auto stmt = wrap(raw_stmt);
        if (rc != SQLITE_OK)
        {
            throw core::DataLoadException(fmt::format("Failed to prepare analysis result query [{}]: {}", rc, sqlite3_errmsg(db_)));
        }

        sqlite3_bind_text(stmt.get(), 1, strategy.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, start_date.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 3, end_date.c_str(), -1, SQLITE_TRANSIENT);
        for (std::size_t i = 0; i < codes.size(); ++i)
        {
            sqlite3_bind_text(stmt.get(), static_cast<int>(4 + i), codes[i].c_str(), -1, SQLITE_TRANSIENT);
        }

        std::vector<core::AnalysisResult> results;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            core::AnalysisResult result;
            result.code = columnText(stmt.get(), 0);
            result.analysis_date = columnText(stmt.get(), 1);
            result.strategy = columnText(stmt.get(), 2);
            try
            {
                result.rating = core::utils::ratingFromString(columnText(stmt.get(), 3));
                result.score = sqlite3_column_int(stmt.get(), 4);
                int column = 5;
                for (const auto &entry : signalColumns())
                {
                    if (sqlite3_column_type(stmt.get(), column) != SQLITE_NULL)
                    {
                        result.signals[entry.first] = core::utils::signalFromString(columnText(stmt.get(), column));
                    }
                    ++column;
                }
                result.risk_level = core::utils::riskLevelFromString(columnText(stmt.get(), 10));
            }
            catch (const std::invalid_argument &e)
            {
                logger_->warn("Skipping malformed analysis result {} {}: {}", result.code, result.analysis_date, e.what());
                continue;
            }
            result.expected_return = sqlite3_column_double(stmt.get(), 11);
            results.push_back(std::move(result));
        }

        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format("Error reading analysis results [{}]: {}", rc, sqlite3_errmsg(db_)));
        }

        logger_->debug("Loaded {} analysis results for '{}' ({} to {}).", results.size(), strategy, start_date, end_date);
        return results;
    }

    bool DatabaseManager::savePerformance(const core::PerformanceRecord &record)
    {
        if (!isConnected())
        {
            logger_->error("Cannot save strategy performance: Not connected to database.");
            return false;
        }

        const char *sql = R"(
INSERT OR REPLACE INTO strategy_performance
(strategy_name, start_date, end_date, total_return, annual_return, max_drawdown, sharpe_ratio, win_rate,
 profit_loss_ratio, trades_count, result_count, instruments_evaluated, instruments_skipped)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *raw_stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &raw_stmt, nullptr);
        auto stmt = wrap(raw_stmt);
        if (rc != SQLITE_OK)
        {
            logger_->error("Failed to prepare performance INSERT [{}]: {}", rc, sqlite3_errmsg(db_));
            return false;
        }

        sqlite3_bind_text(stmt.get(), 1, record.strategy.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, record.start_date.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 3, record.end_date.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt.get(), 4, record.total_return);
        sqlite3_bind_double(stmt.get(), 5, record.annual_return);
        sqlite3_bind_double(stmt.get(), 6, record.max_drawdown);
        sqlite3_bind_double(stmt.get(), 7, record.sharpe_ratio);
        sqlite3_bind_double(stmt.get(), 8, record.win_rate);
        sqlite3_bind_double(stmt.get(), 9, record.profit_loss_ratio);
        sqlite3_bind_int(stmt.get(), 10, record.trade_count);
        sqlite3_bind_int(stmt.get(), 11, record.result_count);
        sqlite3_bind_int(stmt.get(), 12, record.instruments_evaluated);
        sqlite3_bind_int(stmt.get(), 13, record.instruments_skipped);

        rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE)
        {
            logger_->error("Failed to save performance for '{}' [{}]: {}", record.strategy, rc, sqlite3_errmsg(db_));
            return false;
        }
        logger_->info("Saved performance for '{}' ({} to {}).", record.strategy, record.start_date, record.end_date);
        return true;
    }

    std::vector<core::PerformanceRecord> DatabaseManager::queryPerformance(const std::string &strategy,
                                                                           const core::Date &start_date,
                                                                           const core::Date &end_date)
    {
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot query strategy performance: Not connected to database " + database_path_);
        }

        std::string sql = R"(
            SELECT strategy_name, start_date, end_date, total_return, annual_return, max_drawdown, sharpe_ratio,
                   win_rate, profit_loss_ratio, trades_count, result_count, instruments_evaluated, instruments_skipped
            FROM strategy_performance WHERE 1 = 1)";
        std::vector<std::string> params;
        if (!strategy.empty())
        {
            sql += " AND strategy_name = ?";
            params.push_back(strategy);
        }
        if (!start_date.empty())
        {
            sql += " AND start_date >= ?";
            params.push_back(start_date);
        }
        if (!end_date.empty())
        {
            sql += " AND end_date <= ?";
            params.push_back(end_date);
        }
        sql += " ORDER BY strategy_name ASC, start_date ASC;";

        sqlite3_stmt *raw_stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw_stmt, nullptr);
        auto stmt = wrap(raw_stmt);
        if (rc != SQLITE_OK)
        {
            throw core::DataLoadException(fmt::format("Failed to prepare performance query [{}]: {}", rc, sqlite3_errmsg(db_)));
        }
        for (std::size_t i = 0; i < params.size(); ++i)
        {
            sqlite3_bind_text(stmt.get(), static_cast<int>(i + 1), params[i].c_str(), -1, SQLITE_TRANSIENT);
        }

        std::vector<core::PerformanceRecord> records;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            core::PerformanceRecord record;
            record.strategy = columnText(stmt.get(), 0);
            record.start_date = columnText(stmt.get(), 1);
            record.end_date = columnText(stmt.get(), 2);
            record.total_return = sqlite3_column_double(stmt.get(), 3);
            record.annual_return = sqlite3_column_double(stmt.get(), 4);
            record.max_drawdown = sqlite3_column_double(stmt.get(), 5);
            record.sharpe_ratio = sqlite3_column_double(stmt.get(), 6);
            record.win_rate = sqlite3_column_double(stmt.get(), 7);
            record.profit_loss_ratio = sqlite3_column_double(stmt.get(), 8);
            record.trade_count = sqlite3_column_int(stmt.get(), 9);
            record.result_count = sqlite3_column_int(stmt.get(), 10);
            record.instruments_evaluated = sqlite3_column_int(stmt.get(), 11);
            record.instruments_skipped = sqlite3_column_int(stmt.get(), 12);
            records.push_back(std::move(record));
        }
        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format("Error reading strategy performance [{}]: {}", rc, sqlite3_errmsg(db_)));
        }
        return records;
    }

    bool DatabaseManager::healthCheck()
    {
        if (!isConnected())
        {
            logger_->warn("Health check failed: not connected to {}", database_path_);
            return false;
        }

        const char *sql = "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = 'history_k_data';";
        sqlite3_stmt *raw_stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &raw_stmt, nullptr);
        auto stmt = wrap(raw_stmt);
        if (rc != SQLITE_OK)
        {
            logger_->warn("Health check failed to prepare [{}]: {}", rc, sqlite3_errmsg(db_));
            return false;
        }
        if (sqlite3_step(stmt.get()) != SQLITE_ROW)
        {
            logger_->warn("Health check query returned no row: {}", sqlite3_errmsg(db_));
            return false;
        }
        bool has_bars_table = sqlite3_column_int(stmt.get(), 0) > 0;
        if (!has_bars_table)
        {
            logger_->warn("Health check failed: history_k_data table missing in {}", database_path_);
        }
        return has_bars_table;
    }

    std::string DatabaseManager::getName() const
    {
        return "sqlite:" + database_path_;
    }

} // namespace data
