#include "performance_evaluator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace evaluator {

    PerformanceEvaluator::PerformanceEvaluator(EvaluationConfig config, std::shared_ptr<spdlog::logger> logger)
        : config_(std::move(config)), logger_(core::logging::orNull(std::move(logger)))
    {
        config_.validate();
        logger_->debug("PerformanceEvaluator initialized: risk-free rate {:.4f}, {} trading days per year",
                       config_.risk_free_rate, config_.trading_days_per_year);
    }

    std::vector<JoinedPoint> PerformanceEvaluator::joinToBars(const std::string& code,
                                                              const std::vector<core::AnalysisResult>& results,
                                                              const core::TimeSeries<core::Bar>& bars,
                                                              const core::Date& start_date,
                                                              const core::Date& end_date) const {
        std::map<core::Date, std::size_t> bar_index_by_date;
        for (std::size_t i = 0; i < bars.size(); ++i) {
            if (bars[i].date >= start_date && bars[i].date <= end_date) {
                bar_index_by_date.emplace(bars[i].date, i);
            }
        }

        std::vector<core::AnalysisResult> ordered = results;
        std::stable_sort(ordered.begin(), ordered.end(),
            [](const core::AnalysisResult& a, const core::AnalysisResult& b) { return a.analysis_date < b.analysis_date; });

        std::vector<JoinedPoint> points;
        for (const auto& result : ordered) {
            auto it = bar_index_by_date.find(result.analysis_date);
            if (it == bar_index_by_date.end()) {
                logger_->trace("{}: no bar on {}, result dropped from the join", code, result.analysis_date);
                continue;
            }
            if (!points.empty() && points.back().date == result.analysis_date) {
                logger_->debug("{}: duplicate result on {}, keeping the first", code, result.analysis_date);
                continue;
            }
            JoinedPoint point;
            point.date = result.analysis_date;
            point.close = bars[it->second].close;
            point.rating = result.rating;
            point.bar_index = it->second;
            points.push_back(point);
        }

        // Terminal mark: a lone joined result is closed against the last bar inside the window
        if (points.size() == 1 && !bar_index_by_date.empty()) {
            const auto& last_bar = *bar_index_by_date.rbegin();
            if (last_bar.first > points.back().date) {
                JoinedPoint terminal;
                terminal.date = last_bar.first;
                terminal.close = bars[last_bar.second].close;
                terminal.bar_index = last_bar.second;
                terminal.terminal = true;
                points.push_back(terminal);
            }
        }
        return points;
    }

    InstrumentPerformance PerformanceEvaluator::evaluateInstrument(const std::string& code,
                                                                   const std::vector<core::AnalysisResult>& results,
                                                                   const core::TimeSeries<core::Bar>& bars,
                                                                   const core::Date& start_date,
                                                                   const core::Date& end_date) const {
        InstrumentPerformance perf;
        perf.code = code;
        perf.points = joinToBars(code, results, bars, start_date, end_date);
        if (perf.points.size() < 2) {
            throw core::EmptyJoinException(fmt::format("{}: {} results joined to {} points, at least 2 required",
                                                       code, results.size(), perf.points.size()));
        }

        const auto& first = perf.points.front();
        const auto& last = perf.points.back();

        if (first.close > 0.0) {
            perf.total_return = last.close / first.close - 1.0;
        } else {
            logger_->warn("{}: non-positive close {} on {}, total return set to 0", code, first.close, first.date);
        }
        perf.max_drawdown = maxDrawdown(bars, first.bar_index, last.bar_index);
        perf.daily_returns = core::utils::pctChanges(bars, first.bar_index, last.bar_index);

        // --- Trade-Based Metrics ---
        for (std::size_t i = 0; i + 1 < perf.points.size(); ++i) {
            const auto& entry = perf.points[i];
            const auto& exit = perf.points[i + 1];
            if (entry.terminal || entry.rating != core::Rating::Buy) {
                continue;
            }
            ++perf.trades;
            if (entry.close <= 0.0) {
                continue;
            }
            double holding_return = (exit.close - entry.close) / entry.close;
            if (holding_return > 0.0) {
                ++perf.wins;
                perf.winning_returns.push_back(holding_return);
            } else if (holding_return < 0.0) {
                perf.losing_returns.push_back(holding_return);
            }
        }

        logger_->debug("{}: {} points ({} to {}), return {:.4f}, drawdown {:.4f}, {} trades / {} wins",
                       code, perf.points.size(), first.date, last.date, perf.total_return, perf.max_drawdown,
                       perf.trades, perf.wins);
        return perf;
    }

    core::PerformanceRecord PerformanceEvaluator::calculatePerformance(const std::string& strategy,
                                                                       const core::Date& start_date,
                                                                       const core::Date& end_date,
                                                                       const std::vector<core::AnalysisResult>& results,
                                                                       const std::map<std::string, core::TimeSeries<core::Bar>>& bars_by_code) const {
        if (!core::utils::isValidDate(start_date) || !core::utils::isValidDate(end_date)) {
            throw std::invalid_argument(fmt::format("Invalid evaluation window: '{}' to '{}'", start_date, end_date));
        }
        if (end_date < start_date) {
            throw std::invalid_argument(fmt::format("Evaluation window ends ({}) before it starts ({})", end_date, start_date));
        }

        logger_->info("Evaluating strategy '{}' from {} to {}", strategy, start_date, end_date);

        core::PerformanceRecord record;
        record.strategy = strategy;
        record.start_date = start_date;
        record.end_date = end_date;

        // Group the strategy's in-window results per instrument; std::map keeps codes ordered
        std::map<std::string, std::vector<core::AnalysisResult>> results_by_code;
        for (const auto& result : results) {
            if (result.strategy != strategy || result.analysis_date < start_date || result.analysis_date > end_date) {
                continue;
            }
            results_by_code[result.code].push_back(result);
            ++record.result_count;
        }

        std::vector<double> instrument_returns;
        std::vector<double> instrument_drawdowns;
        std::vector<double> pooled_daily_returns;
        std::vector<double> winning_returns;
        std::vector<double> losing_returns;
        int trades = 0;
        int wins = 0;

        for (const auto& [code, code_results] : results_by_code) {
            auto bars_it = bars_by_code.find(code);
            if (bars_it == bars_by_code.end() || bars_it->second.empty()) {
                ++record.instruments_skipped;
                logger_->warn("Skipping {} for '{}': no bars available", code, strategy);
                continue;
            }
            try {
                auto perf = evaluateInstrument(code, code_results, bars_it->second, start_date, end_date);
                ++record.instruments_evaluated;
                instrument_returns.push_back(perf.total_return);
                instrument_drawdowns.push_back(perf.max_drawdown);
                pooled_daily_returns.insert(pooled_daily_returns.end(), perf.daily_returns.begin(), perf.daily_returns.end());
                winning_returns.insert(winning_returns.end(), perf.winning_returns.begin(), perf.winning_returns.end());
                losing_returns.insert(losing_returns.end(), perf.losing_returns.begin(), perf.losing_returns.end());
                trades += perf.trades;
                wins += perf.wins;
            } catch (const core::EmptyJoinException& e) {
                ++record.instruments_skipped;
                logger_->warn("Skipping {} for '{}': {}", code, strategy, e.what());
            }
        }

        if (record.instruments_evaluated == 0) {
            logger_->warn("Strategy '{}': no instrument qualified in {} to {} ({} results, {} skipped)",
                          strategy, start_date, end_date, record.result_count, record.instruments_skipped);
            return record;
        }

        record.total_return = core::utils::mean(instrument_returns);
        record.annual_return = annualize(record.total_return, start_date, end_date);
        record.max_drawdown = core::utils::mean(instrument_drawdowns);
        record.sharpe_ratio = sharpeRatio(pooled_daily_returns);
        record.trade_count = record.result_count;
        record.win_rate = trades > 0 ? static_cast<double>(wins) / trades : 0.0;

        if (!winning_returns.empty() && !losing_returns.empty()) {
            double mean_loss = 0.0;
            for (double loss : losing_returns) {
                mean_loss += std::abs(loss);
            }
            mean_loss /= static_cast<double>(losing_returns.size());
            record.profit_loss_ratio = core::utils::mean(winning_returns) / mean_loss;
        }

        logRecord(record);
        return record;
    }

    double PerformanceEvaluator::annualize(double total_return, const core::Date& start_date, const core::Date& end_date) const {
        long days = core::utils::daysBetween(start_date, end_date);
        if (days <= 0) {
            return 0.0;
        }
        return std::pow(1.0 + total_return, static_cast<double>(config_.days_per_year) / static_cast<double>(days)) - 1.0;
    }

    double PerformanceEvaluator::maxDrawdown(const core::TimeSeries<core::Bar>& bars, std::size_t first, std::size_t last) {
        if (first >= bars.size() || last >= bars.size() || first >= last) {
            return 0.0;
        }
        const double base = bars[first].close;
        if (base <= 0.0) {
            return 0.0;
        }
        double running_max = 0.0;
        double max_drawdown = 0.0;
        for (std::size_t i = first; i <= last; ++i) {
            double cumulative = bars[i].close / base - 1.0;
            running_max = std::max(running_max, cumulative);
            double drawdown = (running_max - cumulative) / (1.0 + running_max);
            max_drawdown = std::max(max_drawdown, drawdown);
        }
        return max_drawdown;
    }

    double PerformanceEvaluator::sharpeRatio(const std::vector<double>& daily_returns) const {
        if (daily_returns.size() < 2) {
            return 0.0;
        }
        double std_dev = core::utils::populationStdDev(daily_returns);
        if (std_dev == 0.0) {
            return 0.0;
        }
        const double periods = static_cast<double>(config_.trading_days_per_year);
        return (core::utils::mean(daily_returns) - config_.risk_free_rate / periods) / std_dev * std::sqrt(periods);
    }

    core::StrategyComparison PerformanceEvaluator::compareStrategies(const std::vector<core::PerformanceRecord>& records) {
        core::StrategyComparison comparison;
        comparison.ranked = records;
        std::stable_sort(comparison.ranked.begin(), comparison.ranked.end(),
            [](const core::PerformanceRecord& a, const core::PerformanceRecord& b) { return a.annual_return > b.annual_return; });

        if (comparison.ranked.empty()) {
            return comparison;
        }

        const core::PerformanceRecord* best_return = &comparison.ranked.front();
        const core::PerformanceRecord* best_sharpe = &comparison.ranked.front();
        const core::PerformanceRecord* best_drawdown = &comparison.ranked.front();
        const core::PerformanceRecord* best_win_rate = &comparison.ranked.front();
        for (const auto& record : comparison.ranked) {
            if (record.annual_return > best_return->annual_return) best_return = &record;
            if (record.sharpe_ratio > best_sharpe->sharpe_ratio) best_sharpe = &record;
            if (record.max_drawdown < best_drawdown->max_drawdown) best_drawdown = &record;
            if (record.win_rate > best_win_rate->win_rate) best_win_rate = &record;
        }

        comparison.best_annual_return_strategy = best_return->strategy;
        comparison.best_annual_return = best_return->annual_return;
        comparison.best_sharpe_strategy = best_sharpe->strategy;
        comparison.best_sharpe_ratio = best_sharpe->sharpe_ratio;
        comparison.best_drawdown_strategy = best_drawdown->strategy;
        comparison.best_drawdown = best_drawdown->max_drawdown;
        comparison.best_win_rate_strategy = best_win_rate->strategy;
        comparison.best_win_rate = best_win_rate->win_rate;
        return comparison;
    }

    void PerformanceEvaluator::logRecord(const core::PerformanceRecord& record) const {
        logger_->info("--- Performance: {} ({} to {}) ---", record.strategy, record.start_date, record.end_date);
        logger_->info("Total Return: {:.2f}%", record.total_return * 100.0);
        logger_->info("Annual Return: {:.2f}%", record.annual_return * 100.0);
        logger_->info("Max Drawdown: {:.2f}%", record.max_drawdown * 100.0);
        logger_->info("Sharpe Ratio: {:.2f}", record.sharpe_ratio);
        logger_->info("Win Rate: {:.2f}%", record.win_rate * 100.0);
        logger_->info("Profit/Loss Ratio: {:.2f}", record.profit_loss_ratio);
        logger_->info("Trades: {} (from {} results, {} instruments evaluated, {} skipped)",
                      record.trade_count, record.result_count, record.instruments_evaluated, record.instruments_skipped);
        logger_->info("------------------------");
    }

} // namespace evaluator
