#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>

#include "datatypes.hpp"
#include "evaluation_config.hpp"
#include <spdlog/logger.h>

namespace evaluator {

    // One instrument's result dates matched to its bars
    struct JoinedPoint {
        core::Date date;
        double close = 0.0;
        core::Rating rating = core::Rating::Hold;
        std::size_t bar_index = 0;
        bool terminal = false; // closing mark after a lone result, carries no rating
    };

    // --- Per-instrument figures before pooling ---
    struct InstrumentPerformance {
        std::string code;
        std::vector<JoinedPoint> points;
        double total_return = 0.0;
        double max_drawdown = 0.0;
        std::vector<double> daily_returns;   // bars from the first to the last point
        int trades = 0;                      // pairs whose earlier point is rated buy
        int wins = 0;
        std::vector<double> winning_returns;
        std::vector<double> losing_returns;  // negative values
    };

    class PerformanceEvaluator {
    public:
        explicit PerformanceEvaluator(EvaluationConfig config = EvaluationConfig{},
                                      std::shared_ptr<spdlog::logger> logger = nullptr);

        // Builds one record for `strategy` over [start_date, end_date]. Results of other
        // strategies or outside the window are ignored. Instruments whose results do not
        // join to at least two points are skipped and counted.
        core::PerformanceRecord calculatePerformance(const std::string& strategy,
                                                     const core::Date& start_date,
                                                     const core::Date& end_date,
                                                     const std::vector<core::AnalysisResult>& results,
                                                     const std::map<std::string, core::TimeSeries<core::Bar>>& bars_by_code) const;

        // `results` must belong to one instrument. Throws core::EmptyJoinException when
        // fewer than two points can be joined.
        InstrumentPerformance evaluateInstrument(const std::string& code,
                                                 const std::vector<core::AnalysisResult>& results,
                                                 const core::TimeSeries<core::Bar>& bars,
                                                 const core::Date& start_date,
                                                 const core::Date& end_date) const;

        // Ranks by annual return (descending, stable) and names the best record per metric.
        // Ties go to the higher-ranked record.
        static core::StrategyComparison compareStrategies(const std::vector<core::PerformanceRecord>& records);

        // (1 + total_return)^(days_per_year / days) - 1; 0 for a window of zero days
        double annualize(double total_return, const core::Date& start_date, const core::Date& end_date) const;

        // Max over t of (runmax_t - cum_t) / (1 + runmax_t), cum measured from closes[first]
        static double maxDrawdown(const core::TimeSeries<core::Bar>& bars, std::size_t first, std::size_t last);

        // (mean - rf / trading_days) / population stdev * sqrt(trading_days); 0 for < 2 samples or zero stdev
        double sharpeRatio(const std::vector<double>& daily_returns) const;

        void logRecord(const core::PerformanceRecord& record) const;

        const EvaluationConfig& getConfig() const { return config_; }

    private:
        EvaluationConfig config_;
        std::shared_ptr<spdlog::logger> logger_;

        std::vector<JoinedPoint> joinToBars(const std::string& code,
                                            const std::vector<core::AnalysisResult>& results,
                                            const core::TimeSeries<core::Bar>& bars,
                                            const core::Date& start_date,
                                            const core::Date& end_date) const;
    };

} // namespace evaluator
