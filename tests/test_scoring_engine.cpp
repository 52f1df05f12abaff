#include <catch2/catch.hpp>

#include "scoring_engine.hpp"
#include "signal_engine.hpp"
#include "indicator_engine.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <cmath>

using namespace strategy_engine;
using core::Signal;
using core::SignalFamily;

namespace {

    std::map<SignalFamily, Signal> allSignals(Signal signal) {
        return {{SignalFamily::Macd, signal}, {SignalFamily::Rsi, signal}, {SignalFamily::Kdj, signal},
                {SignalFamily::Bollinger, signal}, {SignalFamily::Ma, signal}};
    }

    // Closes alternating +pct / -pct from 100
    core::TimeSeries<core::Bar> swingingBars(std::size_t count, double pct) {
        std::vector<double> closes;
        double close = 100.0;
        for (std::size_t i = 0; i < count; ++i) {
            if (i > 0) {
                close *= (i % 2 == 1) ? 1.0 + pct : 1.0 - pct;
            }
            closes.push_back(close);
        }
        return test_helpers::makeBars(closes);
    }

} // namespace

TEST_CASE("Score is the weighted vote around the baseline", "[scoring][score]") {
    ScoringEngine engine;

    REQUIRE(engine.calculateScore(allSignals(Signal::Hold)) == 50);
    REQUIRE(engine.calculateScore({{SignalFamily::Macd, Signal::Buy}, {SignalFamily::Rsi, Signal::Buy}}) == 95);
    REQUIRE(engine.calculateScore({{SignalFamily::Kdj, Signal::Sell}, {SignalFamily::Bollinger, Signal::Buy}}) == 45);
    REQUIRE(engine.calculateScore({}) == 50);

    SECTION("clamped to [0, 100]") {
        REQUIRE(engine.calculateScore(allSignals(Signal::Buy)) == 100);
        REQUIRE(engine.calculateScore(allSignals(Signal::Sell)) == 0);
    }

    SECTION("families without a configured weight count 10") {
        ScoringConfig config;
        config.weights.erase(SignalFamily::Ma);
        ScoringEngine custom(config);
        REQUIRE(custom.calculateScore({{SignalFamily::Ma, Signal::Buy}}) == 60);
        REQUIRE(custom.calculateScore({{SignalFamily::Ma, Signal::Sell}}) == 40);
    }
}

TEST_CASE("Rating thresholds are inclusive", "[scoring][rating]") {
    ScoringEngine engine;
    REQUIRE(engine.determineRating(100) == core::Rating::Buy);
    REQUIRE(engine.determineRating(70) == core::Rating::Buy);
    REQUIRE(engine.determineRating(69) == core::Rating::Hold);
    REQUIRE(engine.determineRating(50) == core::Rating::Hold);
    REQUIRE(engine.determineRating(31) == core::Rating::Hold);
    REQUIRE(engine.determineRating(30) == core::Rating::Sell);
    REQUIRE(engine.determineRating(0) == core::Rating::Sell);
}

TEST_CASE("Risk level follows annualized volatility", "[scoring][risk]") {
    ScoringEngine engine;

    SECTION("flat prices are low risk") {
        auto bars = test_helpers::makeBars(std::vector<double>(30, 10.0));
        REQUIRE(engine.annualizedVolatility(bars) == Approx(0.0).margin(1e-12));
        REQUIRE(engine.determineRiskLevel(bars) == core::RiskLevel::Low);
    }

    SECTION("1% swings are low risk") {
        auto bars = swingingBars(30, 0.01);
        double volatility = engine.annualizedVolatility(bars);
        REQUIRE(volatility > 0.15);
        REQUIRE(volatility < 0.2);
        REQUIRE(engine.determineRiskLevel(bars) == core::RiskLevel::Low);
    }

    SECTION("2% swings are medium risk") {
        REQUIRE(engine.determineRiskLevel(swingingBars(30, 0.02)) == core::RiskLevel::Medium);
    }

    SECTION("5% swings are high risk") {
        REQUIRE(engine.determineRiskLevel(swingingBars(30, 0.05)) == core::RiskLevel::High);
    }

    SECTION("volatility uses the sample standard deviation") {
        // Changes +10% and -10%: sample stdev sqrt(0.02) ~ 0.1414
        auto bars = test_helpers::makeBars({100.0, 110.0, 99.0});
        REQUIRE(engine.annualizedVolatility(bars) == Approx(std::sqrt(0.02) * std::sqrt(252.0)));
    }
}

TEST_CASE("Expected return annualizes the recent mean change", "[scoring][expected]") {
    ScoringEngine engine;

    SECTION("short history uses every change") {
        // 29 changes: 15 up, 14 down
        auto bars = swingingBars(30, 0.01);
        REQUIRE(engine.estimateExpectedReturn(bars) == Approx(0.01 / 29.0 * 252.0).epsilon(1e-6));
    }

    SECTION("long history keeps the last 30 changes") {
        // Changes 10..39 are balanced: 15 up, 15 down
        auto bars = swingingBars(40, 0.01);
        REQUIRE(engine.estimateExpectedReturn(bars) == Approx(0.0).margin(1e-9));
    }

    SECTION("a single change") {
        auto bars = swingingBars(2, 0.02);
        REQUIRE(engine.estimateExpectedReturn(bars) == Approx(0.02 * 252.0));
    }
}

TEST_CASE("Scoring requires minimum history", "[scoring][history]") {
    ScoringEngine engine;
    core::SignalSet signals;
    signals.signals = allSignals(Signal::Hold);

    SECTION("25 bars raise") {
        auto bars = test_helpers::makeBars(std::vector<double>(25, 10.0));
        REQUIRE_THROWS_AS(engine.score("sh.600000", signals, bars), core::InsufficientHistoryException);
        try {
            engine.score("sh.600000", signals, bars);
        } catch (const core::InsufficientHistoryException& e) {
            REQUIRE(e.available() == 25);
            REQUIRE(e.required() == 26);
        }
    }

    SECTION("26 bars are enough") {
        auto bars = test_helpers::makeBars(std::vector<double>(26, 10.0));
        auto result = engine.score("sh.600000", signals, bars);
        REQUIRE(result.code == "sh.600000");
        REQUIRE(result.analysis_date == bars.back().date);
        REQUIRE(result.strategy == "traditional_technical_analysis");
        REQUIRE(result.score == 50);
        REQUIRE(result.rating == core::Rating::Hold);
        REQUIRE(result.risk_level == core::RiskLevel::Low);
        REQUIRE(result.signals.size() == 5);
    }
}

TEST_CASE("Alternating 1% moves run through the whole pipeline", "[scoring][pipeline]") {
    auto bars = test_helpers::makeBars(test_helpers::alternatingCloses(30));

    indicators::IndicatorEngine indicator_engine;
    SignalEngine signal_engine;
    ScoringEngine scoring_engine;

    auto points = indicator_engine.calculate(bars);
    core::SignalSet signals;
    REQUIRE_NOTHROW(signals = signal_engine.generateSignals(points));

    auto result = scoring_engine.score("sz.000001", signals, bars);
    REQUIRE(result.score >= 0);
    REQUIRE(result.score <= 100);
    const bool known_rating = result.rating == core::Rating::Buy || result.rating == core::Rating::Hold ||
                              result.rating == core::Rating::Sell;
    REQUIRE(known_rating);
    REQUIRE(result.risk_level == core::RiskLevel::Low);
}

TEST_CASE("Scoring configuration is validated", "[scoring][config]") {
    ScoringConfig config;

    SECTION("thresholds out of order") {
        config.buy_threshold = 30;
        config.sell_threshold = 70;
        REQUIRE_THROWS_AS(ScoringEngine(config), core::ConfigException);
    }

    SECTION("negative weight") {
        config.weights[SignalFamily::Rsi] = -5;
        REQUIRE_THROWS_AS(ScoringEngine(config), core::ConfigException);
    }
}
