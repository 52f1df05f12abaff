#include <catch2/catch.hpp>

#include "utils.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <stdexcept>

using namespace core;

TEST_CASE("Date helpers", "[utils][dates]") {
    SECTION("valid and invalid dates") {
        REQUIRE(utils::isValidDate("2024-02-29"));
        REQUIRE_FALSE(utils::isValidDate("2023-02-30"));
        REQUIRE_FALSE(utils::isValidDate("2024-13-01"));
        REQUIRE_FALSE(utils::isValidDate("20240101"));
        REQUIRE_FALSE(utils::isValidDate(""));
    }

    SECTION("day arithmetic") {
        REQUIRE(utils::daysBetween("2024-01-01", "2024-12-31") == 365);
        REQUIRE(utils::daysBetween("2024-01-10", "2024-01-01") == -9);
        REQUIRE(utils::addDays("2024-02-28", 1) == "2024-02-29");
        REQUIRE(utils::addDays("2024-03-01", -1) == "2024-02-29");
        REQUIRE(utils::addDays("2023-12-31", 1) == "2024-01-01");
    }

    SECTION("unparseable date throws") {
        REQUIRE_THROWS_AS(utils::dateToTimestamp("not-a-date"), AnalysisPlatformException);
    }
}

TEST_CASE("Enum string conversions", "[utils][enums]") {
    REQUIRE(utils::toString(Signal::Buy) == "buy");
    REQUIRE(utils::toString(Rating::Sell) == "sell");
    REQUIRE(utils::toString(RiskLevel::Medium) == "medium");
    REQUIRE(utils::toString(SignalFamily::Bollinger) == "bollinger");

    REQUIRE(utils::signalFromString("SELL") == Signal::Sell);
    REQUIRE(utils::ratingFromString("hold") == Rating::Hold);
    REQUIRE(utils::riskLevelFromString("High") == RiskLevel::High);
    REQUIRE(utils::signalFamilyFromString("boll") == SignalFamily::Bollinger);

    REQUIRE_THROWS_AS(utils::signalFromString("strong_buy"), std::invalid_argument);
    REQUIRE_THROWS_AS(utils::signalFamilyFromString("obv"), std::invalid_argument);
}

TEST_CASE("Statistics helpers", "[utils][math]") {
    const std::vector<double> values{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};

    REQUIRE(utils::mean(values) == Approx(5.0));
    REQUIRE(utils::populationStdDev(values) == Approx(2.0));
    REQUIRE(utils::sampleStdDev(values) == Approx(std::sqrt(32.0 / 7.0)));

    REQUIRE(utils::mean({}) == 0.0);
    REQUIRE(utils::sampleStdDev({1.0}) == 0.0);
    REQUIRE(utils::populationStdDev({}) == 0.0);
}

TEST_CASE("Close-to-close changes", "[utils][math]") {
    auto bars = test_helpers::makeBars({100.0, 110.0, 99.0, 0.0, 50.0});

    SECTION("whole range") {
        auto changes = utils::pctChanges(bars, 0, 2);
        REQUIRE(changes.size() == 2);
        REQUIRE(changes[0] == Approx(0.10));
        REQUIRE(changes[1] == Approx(-0.10));
    }

    SECTION("zero base close is dropped") {
        auto changes = utils::pctChanges(bars, 2, 4);
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0] == Approx(-1.0));
    }

    SECTION("degenerate ranges") {
        REQUIRE(utils::pctChanges(bars, 3, 3).empty());
        REQUIRE(utils::pctChanges(bars, 0, 10).empty());
    }
}

TEST_CASE("Split trims and drops empty items", "[utils][strings]") {
    auto parts = utils::split(" sh.600000, sz.000001 ,,", ',');
    REQUIRE(parts.size() == 2);
    REQUIRE(parts[0] == "sh.600000");
    REQUIRE(parts[1] == "sz.000001");
}

TEST_CASE("Log level names", "[utils][logging]") {
    REQUIRE(logging::level_from_string("DEBUG") == spdlog::level::debug);
    REQUIRE(logging::level_from_string("warning") == spdlog::level::warn);
    REQUIRE(logging::level_from_string("err") == spdlog::level::err);
    REQUIRE(logging::level_from_string("verbose") == spdlog::level::info);
}

TEST_CASE("Components without a logger get a silent one", "[utils][logging]") {
    auto fallback = logging::orNull(nullptr);
    REQUIRE(fallback != nullptr);
    REQUIRE(fallback->sinks().size() == 1);

    auto named = std::make_shared<spdlog::logger>("named");
    REQUIRE(logging::orNull(named) == named);
}
