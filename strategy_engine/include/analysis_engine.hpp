#pragma once

#include "datatypes.hpp"
#include "indicator_engine.hpp"
#include "signal_engine.hpp"
#include "scoring_engine.hpp"
#include <spdlog/logger.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace strategy_engine {

    struct AnalysisConfig {
        indicators::IndicatorConfig indicators;
        SignalConfig signals;
        ScoringConfig scoring;
        int history_days = 365; // calendar days of bars loaded per instrument

        // Also checks that the periods the signal rules read are computed by the indicator engine
        void validate() const;

        static AnalysisConfig fromJson(const nlohmann::json& j);
    };

    struct BatchResult {
        std::vector<core::AnalysisResult> results;
        core::BatchSummary summary;
    };

    // Indicator -> signal -> scoring pipeline for one instrument at a time
    class AnalysisEngine {
    public:
        // Loads the bars of one instrument; may throw core::DataLoadException
        using BarLoader = std::function<core::TimeSeries<core::Bar>(const std::string& code)>;
        // Polled between instruments; returning false stops the batch
        using ContinuePredicate = std::function<bool()>;

        explicit AnalysisEngine(AnalysisConfig config = AnalysisConfig{},
                                std::shared_ptr<spdlog::logger> logger = nullptr);

        // Throws core::InsufficientHistoryException below the minimum history
        core::AnalysisResult analyze(const std::string& code,
                                     const core::TimeSeries<core::Bar>& bars,
                                     const core::Date& analysis_date = "") const;

        // Processes codes in ascending order. Per-instrument failures are counted and logged,
        // never propagated.
        BatchResult batchAnalyze(const std::vector<std::string>& codes,
                                 const BarLoader& loader,
                                 const core::Date& analysis_date = "",
                                 const ContinuePredicate& should_continue = nullptr) const;

        BatchResult batchAnalyze(const std::map<std::string, core::TimeSeries<core::Bar>>& bars_by_code,
                                 const core::Date& analysis_date = "",
                                 const ContinuePredicate& should_continue = nullptr) const;

        const AnalysisConfig& getConfig() const { return config_; }

    private:
        AnalysisConfig config_;
        std::shared_ptr<spdlog::logger> logger_;
        indicators::IndicatorEngine indicator_engine_;
        SignalEngine signal_engine_;
        ScoringEngine scoring_engine_;
    };

} // namespace strategy_engine
