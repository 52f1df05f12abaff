#pragma once

#include "scoring_config.hpp"
#include "datatypes.hpp"
#include <spdlog/logger.h>
#include <map>
#include <memory>
#include <string>

namespace strategy_engine {

    // Folds a SignalSet and the bar window it came from into an AnalysisResult
    class ScoringEngine {
    public:
        explicit ScoringEngine(ScoringConfig config = ScoringConfig{},
                               std::shared_ptr<spdlog::logger> logger = nullptr);

        // clamp(baseline + sum(+w buy, -w sell), 0, 100)
        int calculateScore(const std::map<core::SignalFamily, core::Signal>& signals) const;

        core::Rating determineRating(int score) const;

        // Annualized sample volatility of daily close changes over the whole window
        double annualizedVolatility(const core::TimeSeries<core::Bar>& bars) const;
        core::RiskLevel determineRiskLevel(const core::TimeSeries<core::Bar>& bars) const;

        // Mean daily close change over the trailing window, annualized
        double estimateExpectedReturn(const core::TimeSeries<core::Bar>& bars) const;

        // Throws core::InsufficientHistoryException when bars are shorter than min_history.
        // An empty analysis_date means the date of the last bar.
        core::AnalysisResult score(const std::string& code,
                                   const core::SignalSet& signals,
                                   const core::TimeSeries<core::Bar>& bars,
                                   const core::Date& analysis_date = "") const;

        const ScoringConfig& getConfig() const { return config_; }

    private:
        ScoringConfig config_;
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace strategy_engine
