#pragma once

#include <string>
#include <vector>
#include <memory>

#include <sqlite3.h> // Standard C header
#include <spdlog/logger.h>

#include "datatypes.hpp"
#include "price_history_provider.hpp"

namespace data {

// SQLite store for bars, analysis results and strategy performance.
// Writes report failure through their bool result and the log; reads throw core::DataLoadException.
class DatabaseManager : public IPriceHistoryProvider {
public:
    explicit DatabaseManager(const std::string& db_path, std::shared_ptr<spdlog::logger> logger = nullptr);
    ~DatabaseManager() override;

    // Owns a raw connection handle
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;
    DatabaseManager(DatabaseManager&&) = delete;
    DatabaseManager& operator=(DatabaseManager&&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // history_k_data, analysis_results, strategy_performance and their indexes
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // --- Bars ---
    // Existing (code, date) rows are kept
    bool saveBars(const core::TimeSeries<core::Bar>& bars);

    core::TimeSeries<core::Bar> fetchBars(const std::string& code,
                                          const core::Date& start_date,
                                          const core::Date& end_date) override;

    // Distinct instrument codes with stored bars, ascending
    std::vector<std::string> getStockCodes();

    // --- Analysis results ---
    // Results are immutable once stored: an existing (code, date, strategy) row is kept
    bool saveAnalysisResults(const std::vector<core::AnalysisResult>& results);

    // Results of `strategy` dated within [start_date, end_date], ordered by date then code.
    // An empty `codes` means every instrument; long code lists are queried in chunks.
    std::vector<core::AnalysisResult> queryAnalysisResults(const std::string& strategy,
                                                           const core::Date& start_date,
                                                           const core::Date& end_date,
                                                           const std::vector<std::string>& codes = {});

    // --- Strategy performance ---
    // Replaces an earlier record for the same (strategy, start_date, end_date)
    bool savePerformance(const core::PerformanceRecord& record);

    // Empty arguments do not filter
    std::vector<core::PerformanceRecord> queryPerformance(const std::string& strategy = "",
                                                          const core::Date& start_date = "",
                                                          const core::Date& end_date = "");

    // Connected, responsive, and the bar table exists
    bool healthCheck() override;

    std::string getName() const override;

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace data
