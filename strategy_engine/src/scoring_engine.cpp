#include "scoring_engine.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace strategy_engine {

ScoringEngine::ScoringEngine(ScoringConfig config, std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)), logger_(core::logging::orNull(std::move(logger)))
{
    config_.validate();
    logger_->debug("ScoringEngine created for strategy '{}' (min history {} bars).",
                   config_.strategy_id, config_.min_history);
}

int ScoringEngine::calculateScore(const std::map<core::SignalFamily, core::Signal>& signals) const {
    int score = config_.baseline_score;
    for (const auto& [family, signal] : signals) {
        if (signal == core::Signal::Buy) {
            score += config_.weightFor(family);
        } else if (signal == core::Signal::Sell) {
            score -= config_.weightFor(family);
        }
    }
    return std::clamp(score, 0, 100);
}

core::Rating ScoringEngine::determineRating(int score) const {
    if (score >= config_.buy_threshold) {
        return core::Rating::Buy;
    }
    if (score <= config_.sell_threshold) {
        return core::Rating::Sell;
    }
    return core::Rating::Hold;
}

double ScoringEngine::annualizedVolatility(const core::TimeSeries<core::Bar>& bars) const {
    if (bars.size() < 2) {
        return 0.0;
    }
    auto changes = core::utils::pctChanges(bars, 0, bars.size() - 1);
    return core::utils::sampleStdDev(changes) * std::sqrt(static_cast<double>(config_.trading_days_per_year));
}

core::RiskLevel ScoringEngine::determineRiskLevel(const core::TimeSeries<core::Bar>& bars) const {
    double volatility = annualizedVolatility(bars);
    if (volatility < config_.low_volatility) {
        return core::RiskLevel::Low;
    }
    if (volatility < config_.high_volatility) {
        return core::RiskLevel::Medium;
    }
    return core::RiskLevel::High;
}

double ScoringEngine::estimateExpectedReturn(const core::TimeSeries<core::Bar>& bars) const {
    if (bars.size() < 2) {
        return 0.0;
    }
    // Changes of the last `expected_return_window` bars (the first bar has none)
    std::size_t last = bars.size() - 1;
    std::size_t first = bars.size() > config_.expected_return_window + 1
        ? bars.size() - config_.expected_return_window - 1
        : 0;
    auto changes = core::utils::pctChanges(bars, first, last);
    return core::utils::mean(changes) * static_cast<double>(config_.trading_days_per_year);
}

core::AnalysisResult ScoringEngine::score(const std::string& code,
                                          const core::SignalSet& signals,
                                          const core::TimeSeries<core::Bar>& bars,
                                          const core::Date& analysis_date) const {
    if (bars.size() < config_.min_history) {
        throw core::InsufficientHistoryException(
            fmt::format("{}: {} bars available, {} required for scoring", code, bars.size(), config_.min_history),
            bars.size(), config_.min_history);
    }

    core::AnalysisResult result;
    result.code = code;
    result.analysis_date = analysis_date.empty() ? bars.back().date : analysis_date;
    result.strategy = config_.strategy_id;
    result.signals = signals.signals;
    result.score = calculateScore(signals.signals);
    result.rating = determineRating(result.score);
    result.risk_level = determineRiskLevel(bars);
    result.expected_return = estimateExpectedReturn(bars);

    logger_->debug("{} {}: score={} rating={} risk={} expected_return={:.4f}",
                   code, result.analysis_date, result.score,
                   core::utils::toString(result.rating), core::utils::toString(result.risk_level),
                   result.expected_return);
    return result;
}

} // namespace strategy_engine
