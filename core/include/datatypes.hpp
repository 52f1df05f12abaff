#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <map>
#include <optional> // Undefined indicator values and optional fundamentals

namespace core {

    using Timestamp = std::chrono::system_clock::time_point;

    // Trading dates are kept as ISO strings (YYYY-MM-DD); lexicographic order == date order
    using Date = std::string;

    // std::nullopt marks an indicator that has not accumulated enough history yet
    using IndicatorValue = std::optional<double>;

    template<typename T>
    using TimeSeries = std::vector<T>;

    struct Fundamentals {
        std::optional<double> pe_ttm;
        std::optional<double> pb_mrq;
        std::optional<double> ps_ttm;
        std::optional<double> pcf_ncf_ttm;
        bool is_st = false;
    };

    // One daily OHLCV record. Exactly one Bar per (code, date).
    struct Bar {
        Date date;
        std::string code;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double preclose = 0.0;
        double volume = 0.0;
        double amount = 0.0;
        double turnover = 0.0;
        int adjust_flag = 3;   // 1 = backward, 2 = forward, 3 = unadjusted
        int trade_status = 1;  // 1 = trading, 0 = suspended
        double pct_chg = 0.0;
        std::optional<Fundamentals> fundamentals;

        bool operator<(const Bar& other) const {
            return date < other.date;
        }
    };

    // Date-aligned bundle of indicator values for a single bar
    struct IndicatorPoint {
        Date date;
        double close = 0.0;
        double volume = 0.0;

        std::map<int, IndicatorValue> ma;        // period -> MA
        IndicatorValue macd_dif;
        IndicatorValue macd_dea;
        IndicatorValue macd_hist;
        std::map<int, IndicatorValue> rsi;       // period -> RSI
        IndicatorValue kdj_k;
        IndicatorValue kdj_d;
        IndicatorValue kdj_j;
        IndicatorValue boll_upper;
        IndicatorValue boll_middle;
        IndicatorValue boll_lower;
        std::map<int, IndicatorValue> volume_ma; // period -> volume MA

        IndicatorValue maValue(int period) const {
            auto it = ma.find(period);
            return it != ma.end() ? it->second : std::nullopt;
        }
        IndicatorValue rsiValue(int period) const {
            auto it = rsi.find(period);
            return it != rsi.end() ? it->second : std::nullopt;
        }
        IndicatorValue volumeMaValue(int period) const {
            auto it = volume_ma.find(period);
            return it != volume_ma.end() ? it->second : std::nullopt;
        }
    };

    enum class Signal {
        Hold,
        Buy,
        Sell
    };

    enum class SignalFamily {
        Macd,
        Rsi,
        Kdj,
        Bollinger,
        Ma
    };

    enum class Rating {
        Buy,
        Hold,
        Sell
    };

    enum class RiskLevel {
        Low,
        Medium,
        High
    };

    // One signal per indicator family, plus the reasons any family fell back to Hold
    struct SignalSet {
        std::map<SignalFamily, Signal> signals;
        std::vector<std::string> diagnostics;

        Signal get(SignalFamily family) const {
            auto it = signals.find(family);
            return it != signals.end() ? it->second : Signal::Hold;
        }
    };

    struct AnalysisResult {
        std::string code;
        Date analysis_date;
        std::string strategy;
        std::map<SignalFamily, Signal> signals;
        int score = 50;                 // [0, 100]
        Rating rating = Rating::Hold;
        RiskLevel risk_level = RiskLevel::Medium;
        double expected_return = 0.0;   // annualized
    };

    struct PerformanceRecord {
        std::string strategy;
        Date start_date;
        Date end_date;
        double total_return = 0.0;
        double annual_return = 0.0;
        double max_drawdown = 0.0;
        double sharpe_ratio = 0.0;
        double win_rate = 0.0;
        double profit_loss_ratio = 0.0;
        int trade_count = 0;            // analysis results evaluated

        int result_count = 0;           // analysis results inside the window
        int instruments_evaluated = 0;
        int instruments_skipped = 0;
    };

    struct StrategyComparison {
        std::vector<PerformanceRecord> ranked; // annual_return descending

        std::string best_annual_return_strategy;
        double best_annual_return = 0.0;
        std::string best_sharpe_strategy;
        double best_sharpe_ratio = 0.0;
        std::string best_drawdown_strategy;    // smallest max_drawdown
        double best_drawdown = 0.0;
        std::string best_win_rate_strategy;
        double best_win_rate = 0.0;
    };

    // Aggregate outcome of a batch run over many instruments
    struct BatchSummary {
        int succeeded = 0;
        int skipped = 0;  // insufficient history / empty join
        int failed = 0;   // unexpected per-instrument errors
        std::vector<std::string> skipped_codes;
        std::vector<std::string> failed_codes;
        bool cancelled = false;
    };

} // namespace core
