#include <catch2/catch.hpp>

#include "app_config.hpp"
#include "indicator_config.hpp"
#include "signal_config.hpp"
#include "scoring_config.hpp"
#include "exceptions.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace {

    std::string writeTempFile(const std::string& name, const std::string& content) {
        auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

} // namespace

TEST_CASE("Indicator configuration from JSON", "[config][indicators]") {
    SECTION("present keys override defaults") {
        auto config = indicators::IndicatorConfig::fromJson(json::parse(R"({
            "ma_periods": [5, 20],
            "macd": { "fast": 8 },
            "bollinger": { "std": 2.5 }
        })"));
        REQUIRE(config.ma_periods == std::vector<int>{5, 20});
        REQUIRE(config.macd.fast == 8);
        REQUIRE(config.macd.slow == 26);
        REQUIRE(config.bollinger.length == 20);
        REQUIRE(config.bollinger.std == Approx(2.5));
        REQUIRE(config.rsi_periods.size() == 3);
    }

    SECTION("wrong types become config errors") {
        REQUIRE_THROWS_AS(indicators::IndicatorConfig::fromJson(json::parse(R"({"ma_periods": "5,10"})")),
                          core::ConfigException);
    }

    SECTION("invalid values are rejected") {
        REQUIRE_THROWS_AS(indicators::IndicatorConfig::fromJson(json::parse(R"({"kdj": {"length": 1}})")),
                          core::ConfigException);
    }
}

TEST_CASE("Signal and scoring configuration from JSON", "[config][strategy]") {
    SECTION("signal thresholds") {
        auto config = strategy_engine::SignalConfig::fromJson(json::parse(R"({"rsi_oversold": 20, "rsi_overbought": 80})"));
        REQUIRE(config.rsi_oversold == Approx(20.0));
        REQUIRE(config.rsi_overbought == Approx(80.0));
        REQUIRE(config.rsi_period == 12);

        REQUIRE_THROWS_AS(strategy_engine::SignalConfig::fromJson(json::parse(R"({"rsi_oversold": 90})")),
                          core::ConfigException);
    }

    SECTION("weights replace the whole map") {
        auto config = strategy_engine::ScoringConfig::fromJson(json::parse(R"({
            "weights": { "macd": 40, "rsi": 10 },
            "strategy_id": "macd_heavy"
        })"));
        REQUIRE(config.weights.size() == 2);
        REQUIRE(config.weightFor(core::SignalFamily::Macd) == 40);
        REQUIRE(config.weightFor(core::SignalFamily::Kdj) == config.default_weight);
        REQUIRE(config.strategy_id == "macd_heavy");
    }

    SECTION("unknown weight family") {
        REQUIRE_THROWS_AS(strategy_engine::ScoringConfig::fromJson(json::parse(R"({"weights": {"obv": 5}})")),
                          core::ConfigException);
    }
}

TEST_CASE("Application configuration", "[config][app]") {
    SECTION("full document") {
        auto config = cli::AppConfig::fromJson(json::parse(R"({
            "output": { "database_path": "/tmp/analysis.db" },
            "logging": { "level": "debug", "file": "nightly" },
            "analysis": { "history_days": 200, "scoring": { "buy_threshold": 75 } },
            "evaluation": { "risk_free_rate": 0.025 }
        })"));
        REQUIRE(config.database_path == "/tmp/analysis.db");
        REQUIRE(config.log_level == "debug");
        REQUIRE(config.log_file == "nightly");
        REQUIRE(config.analysis.history_days == 200);
        REQUIRE(config.analysis.scoring.buy_threshold == 75);
        REQUIRE(config.evaluation.risk_free_rate == Approx(0.025));
        REQUIRE_FALSE(config.from_defaults);
    }

    SECTION("empty document keeps defaults") {
        auto config = cli::AppConfig::fromJson(json::object());
        REQUIRE(config.database_path == "stock_data.db");
        REQUIRE(config.analysis.history_days == 365);
        REQUIRE(config.evaluation.trading_days_per_year == 252);
    }

    SECTION("missing file falls back to defaults") {
        auto config = cli::AppConfig::loadFromFile("/nonexistent/dir/config.json");
        REQUIRE(config.from_defaults);
        REQUIRE(config.database_path == "stock_data.db");
    }

    SECTION("file on disk") {
        auto path = writeTempFile("stock_analysis_test_config.json",
                                  R"({"output": {"database_path": "from_file.db"}})");
        auto config = cli::AppConfig::loadFromFile(path);
        REQUIRE(config.database_path == "from_file.db");
        std::remove(path.c_str());
    }

    SECTION("malformed JSON") {
        auto path = writeTempFile("stock_analysis_bad_config.json", R"({"output": )");
        REQUIRE_THROWS_AS(cli::AppConfig::loadFromFile(path), core::ConfigException);
        std::remove(path.c_str());
    }

    SECTION("inconsistent analysis section") {
        REQUIRE_THROWS_AS(cli::AppConfig::fromJson(json::parse(R"({"analysis": {"signals": {"rsi_period": 14}}})")),
                          core::ConfigException);
        REQUIRE_THROWS_AS(cli::AppConfig::fromJson(json::array()), core::ConfigException);
    }
}
