#include "analysis_engine.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace strategy_engine {

    void AnalysisConfig::validate() const {
        indicators.validate();
        signals.validate();
        scoring.validate();
        if (history_days <= 0) {
            throw core::ConfigException(fmt::format("analysis.history_days must be positive, got {}", history_days));
        }

        auto computed = [](const std::vector<int>& periods, int period) {
            return std::find(periods.begin(), periods.end(), period) != periods.end();
        };
        if (!computed(indicators.ma_periods, signals.ma_short_period) ||
            !computed(indicators.ma_periods, signals.ma_long_period)) {
            throw core::ConfigException(fmt::format("signals use MA({}) and MA({}) but indicators.ma_periods does not contain both",
                                                    signals.ma_short_period, signals.ma_long_period));
        }
        if (!computed(indicators.rsi_periods, signals.rsi_period)) {
            throw core::ConfigException(fmt::format("signals use RSI({}) but indicators.rsi_periods does not contain it",
                                                    signals.rsi_period));
        }
    }

    AnalysisConfig AnalysisConfig::fromJson(const nlohmann::json& j) {
        AnalysisConfig config;
        const nlohmann::json empty = nlohmann::json::object();
        try {
            config.indicators = indicators::IndicatorConfig::fromJson(j.contains("indicators") ? j.at("indicators") : empty);
            config.signals = SignalConfig::fromJson(j.contains("signals") ? j.at("signals") : empty);
            config.scoring = ScoringConfig::fromJson(j.contains("scoring") ? j.at("scoring") : empty);
            config.history_days = j.value("history_days", config.history_days);
        } catch (const nlohmann::json::exception& e) {
            throw core::ConfigException(std::string("Invalid analysis configuration: ") + e.what());
        }
        config.validate();
        return config;
    }

    AnalysisEngine::AnalysisEngine(AnalysisConfig config, std::shared_ptr<spdlog::logger> logger)
        : config_(std::move(config)),
          logger_(core::logging::orNull(std::move(logger))),
          indicator_engine_(config_.indicators, logger_),
          signal_engine_(config_.signals, logger_),
          scoring_engine_(config_.scoring, logger_)
    {
        config_.validate();
        logger_->debug("AnalysisEngine ready: strategy '{}', history {} days", config_.scoring.strategy_id, config_.history_days);
    }

    core::AnalysisResult AnalysisEngine::analyze(const std::string& code,
                                                 const core::TimeSeries<core::Bar>& bars,
                                                 const core::Date& analysis_date) const {
        // Only history up to the analysis date is visible
        core::TimeSeries<core::Bar> window;
        if (analysis_date.empty()) {
            window = bars;
        } else {
            for (const auto& bar : bars) {
                if (bar.date <= analysis_date) {
                    window.push_back(bar);
                }
            }
        }

        const std::size_t required = config_.scoring.min_history;
        if (window.size() < required) {
            throw core::InsufficientHistoryException(
                fmt::format("{}: {} bars available, {} required", code, window.size(), required),
                window.size(), required);
        }

        logger_->debug("Analyzing {} over {} bars ({} to {})", code, window.size(), window.front().date, window.back().date);
        auto points = indicator_engine_.calculate(window);
        auto signals = signal_engine_.generateSignals(points);
        // Stamped with the date of the last bar used
        return scoring_engine_.score(code, signals, window);
    }

    BatchResult AnalysisEngine::batchAnalyze(const std::vector<std::string>& codes,
                                             const BarLoader& loader,
                                             const core::Date& analysis_date,
                                             const ContinuePredicate& should_continue) const {
        BatchResult batch;
        std::vector<std::string> ordered = codes;
        std::sort(ordered.begin(), ordered.end());
        ordered.erase(std::unique(ordered.begin(), ordered.end()), ordered.end());

        logger_->info("Batch analysis started for {} instruments{}", ordered.size(),
                      analysis_date.empty() ? std::string() : " as of " + analysis_date);

        for (const auto& code : ordered) {
            if (should_continue && !should_continue()) {
                batch.summary.cancelled = true;
                logger_->warn("Batch analysis cancelled after {} of {} instruments",
                              batch.summary.succeeded + batch.summary.skipped + batch.summary.failed, ordered.size());
                break;
            }

            try {
                auto bars = loader(code);
                batch.results.push_back(analyze(code, bars, analysis_date));
                ++batch.summary.succeeded;
            } catch (const core::InsufficientHistoryException& e) {
                ++batch.summary.skipped;
                batch.summary.skipped_codes.push_back(code);
                logger_->warn("Skipping {}: {}", code, e.what());
            } catch (const core::AnalysisPlatformException& e) {
                ++batch.summary.failed;
                batch.summary.failed_codes.push_back(code);
                logger_->error("Analysis failed for {}: {}", code, e.what());
            } catch (const std::exception& e) {
                ++batch.summary.failed;
                batch.summary.failed_codes.push_back(code);
                logger_->error("Unexpected error analyzing {}: {}", code, e.what());
            }
        }

        logger_->info("Batch analysis finished: {} succeeded, {} skipped, {} failed{}",
                      batch.summary.succeeded, batch.summary.skipped, batch.summary.failed,
                      batch.summary.cancelled ? " (cancelled)" : "");
        return batch;
    }

    BatchResult AnalysisEngine::batchAnalyze(const std::map<std::string, core::TimeSeries<core::Bar>>& bars_by_code,
                                             const core::Date& analysis_date,
                                             const ContinuePredicate& should_continue) const {
        std::vector<std::string> codes;
        codes.reserve(bars_by_code.size());
        for (const auto& entry : bars_by_code) {
            codes.push_back(entry.first);
        }
        return batchAnalyze(codes,
                            [&bars_by_code](const std::string& code) { return bars_by_code.at(code); },
                            analysis_date, should_continue);
    }

} // namespace strategy_engine
