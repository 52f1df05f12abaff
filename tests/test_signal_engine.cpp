#include <catch2/catch.hpp>

#include "signal_engine.hpp"
#include "signal_rule_factory.hpp"
#include "crossover_rule.hpp"
#include "threshold_rule.hpp"
#include "band_breakout_rule.hpp"
#include "common_types.hpp"
#include "exceptions.hpp"

#include <stdexcept>

using namespace strategy_engine;
using core::Signal;
using core::SignalFamily;

namespace {

    // A point where every family reads Hold against a neighbour built the same way
    core::IndicatorPoint neutralPoint(const core::Date& date) {
        core::IndicatorPoint point;
        point.date = date;
        point.close = 10.0;
        point.ma[5] = 10.0;
        point.ma[20] = 10.0;
        point.macd_dif = 0.0;
        point.macd_dea = 0.0;
        point.macd_hist = 0.0;
        point.rsi[12] = 50.0;
        point.kdj_k = 50.0;
        point.kdj_d = 50.0;
        point.kdj_j = 50.0;
        point.boll_upper = 12.0;
        point.boll_middle = 10.0;
        point.boll_lower = 8.0;
        return point;
    }

    core::TimeSeries<core::IndicatorPoint> twoNeutralPoints() {
        return {neutralPoint("2024-03-01"), neutralPoint("2024-03-04")};
    }

} // namespace

TEST_CASE("Line names resolve to point accessors", "[signals][lines]") {
    auto point = neutralPoint("2024-03-01");
    point.rsi[6] = 22.0;

    REQUIRE(*resolveLine("MA(5)").read(point) == Approx(10.0));
    REQUIRE(*resolveLine("rsi(6)").read(point) == Approx(22.0));
    REQUIRE(*resolveLine("CLOSE").read(point) == Approx(10.0));
    REQUIRE(*resolveLine("BOLL_UPPER").read(point) == Approx(12.0));
    REQUIRE_FALSE(resolveLine("MA(60)").read(point).has_value());

    REQUIRE_THROWS_AS(resolveLine("OBV"), std::invalid_argument);
    REQUIRE_THROWS_AS(resolveLine("MA(x)"), std::invalid_argument);
}

TEST_CASE("Every family starts at hold", "[signals]") {
    SignalEngine engine;
    auto set = engine.generateSignals(twoNeutralPoints());

    REQUIRE(set.signals.size() == 5);
    for (const auto& entry : set.signals) {
        REQUIRE(entry.second == Signal::Hold);
    }
    REQUIRE(set.diagnostics.empty());
}

TEST_CASE("MACD and KDJ crossovers", "[signals][crossover]") {
    SignalEngine engine;
    auto points = twoNeutralPoints();

    SECTION("DIF crossing above DEA buys") {
        points[0].macd_dif = -0.2;
        points[0].macd_dea = 0.1;
        points[1].macd_dif = 0.3;
        points[1].macd_dea = 0.1;
        REQUIRE(engine.generateSignals(points).get(SignalFamily::Macd) == Signal::Buy);
    }

    SECTION("DIF crossing below DEA sells") {
        points[0].macd_dif = 0.3;
        points[0].macd_dea = 0.1;
        points[1].macd_dif = -0.2;
        points[1].macd_dea = 0.1;
        REQUIRE(engine.generateSignals(points).get(SignalFamily::Macd) == Signal::Sell);
    }

    SECTION("touching is not a cross") {
        points[0].macd_dif = 0.1;
        points[0].macd_dea = 0.1;
        points[1].macd_dif = 0.3;
        points[1].macd_dea = 0.1;
        REQUIRE(engine.generateSignals(points).get(SignalFamily::Macd) == Signal::Hold);
    }

    SECTION("K crossing above D buys") {
        points[0].kdj_k = 20.0;
        points[0].kdj_d = 25.0;
        points[1].kdj_k = 30.0;
        points[1].kdj_d = 26.0;
        REQUIRE(engine.generateSignals(points).get(SignalFamily::Kdj) == Signal::Buy);
    }
}

TEST_CASE("Moving average crossover uses the configured periods", "[signals][crossover]") {
    SignalConfig config;
    config.ma_short_period = 10;
    config.ma_long_period = 60;
    SignalEngine engine(config);

    auto points = twoNeutralPoints();
    points[0].ma[10] = 9.0;
    points[0].ma[60] = 10.0;
    points[1].ma[10] = 11.0;
    points[1].ma[60] = 10.0;

    REQUIRE(engine.generateSignals(points).get(SignalFamily::Ma) == Signal::Buy);
}

TEST_CASE("RSI thresholds", "[signals][threshold]") {
    SignalEngine engine;
    auto points = twoNeutralPoints();

    SECTION("below oversold buys") {
        points[1].rsi[12] = 25.0;
        REQUIRE(engine.generateSignals(points).get(SignalFamily::Rsi) == Signal::Buy);
    }

    SECTION("above overbought sells") {
        points[1].rsi[12] = 75.0;
        REQUIRE(engine.generateSignals(points).get(SignalFamily::Rsi) == Signal::Sell);
    }

    SECTION("the bounds themselves hold") {
        points[1].rsi[12] = 30.0;
        REQUIRE(engine.generateSignals(points).get(SignalFamily::Rsi) == Signal::Hold);
        points[1].rsi[12] = 70.0;
        REQUIRE(engine.generateSignals(points).get(SignalFamily::Rsi) == Signal::Hold);
    }
}

TEST_CASE("Bollinger band breakouts", "[signals][bollinger]") {
    SignalEngine engine;
    auto points = twoNeutralPoints();

    SECTION("close above the upper band buys") {
        points[1].close = 12.5;
        REQUIRE(engine.generateSignals(points).get(SignalFamily::Bollinger) == Signal::Buy);
    }

    SECTION("close below the lower band sells") {
        points[1].close = 7.5;
        REQUIRE(engine.generateSignals(points).get(SignalFamily::Bollinger) == Signal::Sell);
    }

    SECTION("close on the band holds") {
        points[1].close = 12.0;
        REQUIRE(engine.generateSignals(points).get(SignalFamily::Bollinger) == Signal::Hold);
    }
}

TEST_CASE("Undefined indicators degrade to hold with a diagnostic", "[signals][undefined]") {
    SignalEngine engine;
    auto points = twoNeutralPoints();
    points[0].macd_dif = -1.0;
    points[1].macd_dif = 1.0;
    points[1].macd_dea.reset();
    points[1].rsi[12] = std::nullopt;
    points[1].boll_upper.reset();

    auto set = engine.generateSignals(points);
    REQUIRE(set.get(SignalFamily::Macd) == Signal::Hold);
    REQUIRE(set.get(SignalFamily::Rsi) == Signal::Hold);
    REQUIRE(set.get(SignalFamily::Bollinger) == Signal::Hold);
    REQUIRE(set.diagnostics.size() == 3);
}

TEST_CASE("A single point cannot cross", "[signals][undefined]") {
    SignalEngine engine;
    core::TimeSeries<core::IndicatorPoint> points{neutralPoint("2024-03-01")};
    points[0].rsi[12] = 10.0;

    auto set = engine.generateSignals(points);
    REQUIRE(set.get(SignalFamily::Macd) == Signal::Hold);
    REQUIRE(set.get(SignalFamily::Kdj) == Signal::Hold);
    REQUIRE(set.get(SignalFamily::Ma) == Signal::Hold);
    // Threshold rules only need the latest point
    REQUIRE(set.get(SignalFamily::Rsi) == Signal::Buy);
    REQUIRE(set.diagnostics.size() == 3);
}

TEST_CASE("No points at all", "[signals][undefined]") {
    SignalEngine engine;
    auto set = engine.generateSignals({});
    REQUIRE(set.signals.size() == 5);
    for (const auto& entry : set.signals) {
        REQUIRE(entry.second == Signal::Hold);
    }
    REQUIRE(set.diagnostics.size() == 5);
}

TEST_CASE("Rule factory", "[signals][factory]") {
    SECTION("custom rule set") {
        std::vector<std::unique_ptr<ISignalRule>> rules;
        rules.push_back(SignalRuleFactory::createRule(
            {{"family", "rsi"}, {"type", "threshold"}, {"line", "RSI(12)"}, {"lower", 40}, {"upper", 60}}));
        SignalEngine engine(std::move(rules));

        auto points = twoNeutralPoints();
        points[1].rsi[12] = 35.0;
        auto set = engine.generateSignals(points);
        REQUIRE(set.get(SignalFamily::Rsi) == Signal::Buy);
        REQUIRE(set.get(SignalFamily::Macd) == Signal::Hold);
    }

    SECTION("invalid definitions") {
        REQUIRE_THROWS_AS(SignalRuleFactory::createRule({{"family", "ma"}, {"type", "wave"}}), core::ConfigException);
        REQUIRE_THROWS_AS(SignalRuleFactory::createRule({{"type", "crossover"}, {"fast", "MA(5)"}, {"slow", "MA(20)"}}),
                          core::ConfigException);
        REQUIRE_THROWS_AS(SignalRuleFactory::createRule(
                              {{"family", "ma"}, {"type", "crossover"}, {"fast", "MA(5)"}, {"slow", "FOO"}}),
                          core::ConfigException);
        REQUIRE_THROWS_AS(SignalRuleFactory::createRule(
                              {{"family", "rsi"}, {"type", "threshold"}, {"line", "RSI(12)"}, {"lower", 80}, {"upper", 20}}),
                          core::ConfigException);
    }

    SECTION("standard rules cover the five families") {
        auto rules = SignalRuleFactory::createRules(SignalConfig{});
        REQUIRE(rules.size() == 5);
        REQUIRE(rules[0]->getFamily() == SignalFamily::Macd);
        REQUIRE(rules[4]->getFamily() == SignalFamily::Ma);
    }

    SECTION("signal config is validated") {
        SignalConfig config;
        config.ma_short_period = 20;
        config.ma_long_period = 5;
        REQUIRE_THROWS_AS(SignalEngine(config), core::ConfigException);
    }
}
