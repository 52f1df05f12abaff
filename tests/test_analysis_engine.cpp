#include <catch2/catch.hpp>

#include "analysis_engine.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

using namespace strategy_engine;
using test_helpers::makeBars;
using test_helpers::alternatingCloses;

TEST_CASE("Single instrument analysis", "[analysis]") {
    AnalysisEngine engine;
    auto bars = makeBars(alternatingCloses(60), "sh.600000");

    SECTION("result is stamped with the last bar") {
        auto result = engine.analyze("sh.600000", bars);
        REQUIRE(result.code == "sh.600000");
        REQUIRE(result.analysis_date == bars.back().date);
        REQUIRE(result.score >= 0);
        REQUIRE(result.score <= 100);
        REQUIRE(result.signals.size() == 5);
    }

    SECTION("bars after the analysis date are ignored") {
        const core::Date as_of = bars[39].date;
        auto result = engine.analyze("sh.600000", bars, as_of);
        REQUIRE(result.analysis_date == as_of);
    }

    SECTION("an early analysis date leaves too little history") {
        REQUIRE_THROWS_AS(engine.analyze("sh.600000", bars, bars[10].date), core::InsufficientHistoryException);
    }

    SECTION("analysis is deterministic") {
        auto first = engine.analyze("sh.600000", bars);
        auto second = engine.analyze("sh.600000", bars);
        REQUIRE(first.score == second.score);
        REQUIRE(first.rating == second.rating);
        REQUIRE(first.signals == second.signals);
        REQUIRE(first.expected_return == second.expected_return);
    }
}

TEST_CASE("Batch analysis counts skipped and failed instruments", "[analysis][batch]") {
    AnalysisEngine engine;

    std::map<std::string, core::TimeSeries<core::Bar>> bars_by_code{
        {"sz.000002", makeBars(alternatingCloses(40), "sz.000002")},
        {"sh.600000", makeBars(alternatingCloses(40), "sh.600000")},
        {"sh.600519", makeBars(alternatingCloses(10), "sh.600519")},
    };

    auto loader = [&bars_by_code](const std::string& code) -> core::TimeSeries<core::Bar> {
        if (code == "sz.000404") {
            throw core::DataLoadException("query failed for " + code);
        }
        if (code == "sz.000999") {
            throw std::runtime_error("connection reset");
        }
        return bars_by_code.at(code);
    };

    const std::vector<std::string> codes{"sz.000002", "sh.600519", "sz.000404", "sh.600000", "sz.000999", "sh.600000"};
    auto batch = engine.batchAnalyze(codes, loader);

    REQUIRE(batch.summary.succeeded == 2);
    REQUIRE(batch.summary.skipped == 1);
    REQUIRE(batch.summary.failed == 2);
    REQUIRE_FALSE(batch.summary.cancelled);
    REQUIRE((batch.summary.skipped_codes == std::vector<std::string>{"sh.600519"}));
    REQUIRE((batch.summary.failed_codes == std::vector<std::string>{"sz.000404", "sz.000999"}));

    // Codes are processed once, in ascending order
    REQUIRE(batch.results.size() == 2);
    REQUIRE(batch.results[0].code == "sh.600000");
    REQUIRE(batch.results[1].code == "sz.000002");
}

TEST_CASE("Batch analysis over preloaded bars", "[analysis][batch]") {
    AnalysisEngine engine;
    std::map<std::string, core::TimeSeries<core::Bar>> bars_by_code{
        {"sh.600000", makeBars(alternatingCloses(30), "sh.600000")},
        {"sz.000001", makeBars(alternatingCloses(30), "sz.000001")},
    };

    auto batch = engine.batchAnalyze(bars_by_code);
    REQUIRE(batch.summary.succeeded == 2);
    REQUIRE(batch.results.size() == 2);
}

TEST_CASE("Batch analysis stops between instruments when cancelled", "[analysis][batch]") {
    AnalysisEngine engine;
    std::map<std::string, core::TimeSeries<core::Bar>> bars_by_code{
        {"a", makeBars(alternatingCloses(30), "a")},
        {"b", makeBars(alternatingCloses(30), "b")},
        {"c", makeBars(alternatingCloses(30), "c")},
    };

    int polls = 0;
    auto batch = engine.batchAnalyze(bars_by_code, "", [&polls]() { return ++polls <= 2; });

    REQUIRE(batch.summary.cancelled);
    REQUIRE(batch.summary.succeeded == 2);
    REQUIRE(batch.results.size() == 2);
    REQUIRE(batch.results.back().code == "b");
}

TEST_CASE("Analysis configuration cross-checks signal periods", "[analysis][config]") {
    AnalysisConfig config;

    SECTION("defaults are consistent") {
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("signal MA period must be computed") {
        config.signals.ma_long_period = 30;
        REQUIRE_THROWS_AS(config.validate(), core::ConfigException);
    }

    SECTION("signal RSI period must be computed") {
        config.signals.rsi_period = 14;
        REQUIRE_THROWS_AS(AnalysisEngine(config), core::ConfigException);
    }

    SECTION("JSON overrides") {
        auto parsed = AnalysisConfig::fromJson(nlohmann::json::parse(R"({
            "history_days": 500,
            "indicators": { "rsi_periods": [6, 14] },
            "signals": { "rsi_period": 14 }
        })"));
        REQUIRE(parsed.history_days == 500);
        REQUIRE(parsed.signals.rsi_period == 14);
        REQUIRE(parsed.indicators.ma_periods.size() == 6);
    }
}
