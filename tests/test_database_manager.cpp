#include <catch2/catch.hpp>

#include "database_manager.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <spdlog/fmt/fmt.h>

using data::DatabaseManager;

namespace {

    core::AnalysisResult makeResult(const std::string& code, const core::Date& date, int score) {
        core::AnalysisResult result;
        result.code = code;
        result.analysis_date = date;
        result.strategy = "traditional_technical_analysis";
        result.signals = {{core::SignalFamily::Macd, core::Signal::Buy},
                          {core::SignalFamily::Rsi, core::Signal::Hold},
                          {core::SignalFamily::Kdj, core::Signal::Sell},
                          {core::SignalFamily::Bollinger, core::Signal::Hold},
                          {core::SignalFamily::Ma, core::Signal::Buy}};
        result.score = score;
        result.rating = score >= 70 ? core::Rating::Buy : core::Rating::Hold;
        result.risk_level = core::RiskLevel::Medium;
        result.expected_return = 0.12;
        return result;
    }

} // namespace

TEST_CASE("Connection and schema", "[data][schema]") {
    DatabaseManager db(":memory:");
    REQUIRE(db.getName() == "sqlite::memory:");

    REQUIRE_FALSE(db.isConnected());
    REQUIRE_FALSE(db.healthCheck());

    REQUIRE(db.connect());
    REQUIRE(db.isConnected());
    REQUIRE_FALSE(db.healthCheck());

    REQUIRE(db.initializeSchema());
    REQUIRE(db.healthCheck());

    // Schema creation is repeatable
    REQUIRE(db.initializeSchema());

    db.disconnect();
    REQUIRE_FALSE(db.isConnected());
}

TEST_CASE("Bars are stored once per code and date", "[data][bars]") {
    DatabaseManager db(":memory:");
    REQUIRE(db.connect());
    REQUIRE(db.initializeSchema());

    auto bars = test_helpers::makeBars({10.0, 10.5, 10.2, 10.8}, "sh.600000", "2024-01-01");
    core::Fundamentals fundamentals;
    fundamentals.pe_ttm = 6.5;
    fundamentals.is_st = true;
    bars[1].fundamentals = fundamentals;
    REQUIRE(db.saveBars(bars));
    REQUIRE(db.saveBars(test_helpers::makeBars({9.0, 9.5}, "sz.000001", "2024-01-01")));

    SECTION("round trip") {
        auto loaded = db.fetchBars("sh.600000", "2024-01-01", "2024-12-31");
        REQUIRE(loaded.size() == 4);
        REQUIRE(loaded[0].date == "2024-01-01");
        REQUIRE(loaded[3].date == "2024-01-04");
        REQUIRE(loaded[2].close == Approx(10.2));
        REQUIRE(loaded[2].volume == Approx(bars[2].volume));

        REQUIRE_FALSE(loaded[0].fundamentals.has_value());
        REQUIRE(loaded[1].fundamentals.has_value());
        REQUIRE(*loaded[1].fundamentals->pe_ttm == Approx(6.5));
        REQUIRE_FALSE(loaded[1].fundamentals->pb_mrq.has_value());
        REQUIRE(loaded[1].fundamentals->is_st);
    }

    SECTION("date range is inclusive") {
        auto loaded = db.fetchBars("sh.600000", "2024-01-02", "2024-01-03");
        REQUIRE(loaded.size() == 2);
        REQUIRE(loaded.front().date == "2024-01-02");
        REQUIRE(loaded.back().date == "2024-01-03");
    }

    SECTION("existing rows are kept") {
        auto replacement = test_helpers::makeBars({99.0}, "sh.600000", "2024-01-01");
        REQUIRE(db.saveBars(replacement));
        auto loaded = db.fetchBars("sh.600000", "2024-01-01", "2024-01-01");
        REQUIRE(loaded.size() == 1);
        REQUIRE(loaded[0].close == Approx(10.0));
    }

    SECTION("unknown code yields no bars") {
        REQUIRE(db.fetchBars("sh.601398", "2024-01-01", "2024-12-31").empty());
    }

    SECTION("codes are distinct and ordered") {
        REQUIRE((db.getStockCodes() == std::vector<std::string>{"sh.600000", "sz.000001"}));
    }
}

TEST_CASE("Reads fail loudly without a connection", "[data][errors]") {
    DatabaseManager db(":memory:");
    REQUIRE_THROWS_AS(db.fetchBars("sh.600000", "2024-01-01", "2024-12-31"), core::DataLoadException);
    REQUIRE_FALSE(db.saveBars(test_helpers::makeBars({10.0})));
    REQUIRE_FALSE(db.saveAnalysisResults({makeResult("sh.600000", "2024-01-05", 80)}));
}

TEST_CASE("Analysis results", "[data][results]") {
    DatabaseManager db(":memory:");
    REQUIRE(db.connect());
    REQUIRE(db.initializeSchema());

    REQUIRE(db.saveAnalysisResults({makeResult("sz.000001", "2024-01-05", 80),
                                    makeResult("sh.600000", "2024-01-05", 55),
                                    makeResult("sh.600000", "2024-01-08", 72)}));

    SECTION("query by strategy and window") {
        auto results = db.queryAnalysisResults("traditional_technical_analysis", "2024-01-01", "2024-01-31");
        REQUIRE(results.size() == 3);
        REQUIRE(results[0].code == "sh.600000");
        REQUIRE(results[0].analysis_date == "2024-01-05");
        REQUIRE(results[1].code == "sz.000001");
        REQUIRE(results[2].analysis_date == "2024-01-08");

        REQUIRE(results[1].score == 80);
        REQUIRE(results[1].rating == core::Rating::Buy);
        REQUIRE(results[1].risk_level == core::RiskLevel::Medium);
        REQUIRE(results[1].expected_return == Approx(0.12));
        REQUIRE(results[1].signals.size() == 5);
        REQUIRE(results[1].signals.at(core::SignalFamily::Kdj) == core::Signal::Sell);
    }

    SECTION("code filter") {
        auto results = db.queryAnalysisResults("traditional_technical_analysis", "2024-01-01", "2024-01-31",
                                               {"sh.600000"});
        REQUIRE(results.size() == 2);
        for (const auto& result : results) {
            REQUIRE(result.code == "sh.600000");
        }
    }

    SECTION("a code filter longer than the SQLite parameter limit") {
        std::vector<std::string> codes;
        for (int i = 0; i < 1200; ++i) {
            codes.push_back(fmt::format("sz.{:06d}", 300000 + i));
        }
        codes.push_back("sz.000001");
        codes.push_back("sh.600000");

        auto results = db.queryAnalysisResults("traditional_technical_analysis", "2024-01-01", "2024-01-31", codes);
        REQUIRE(results.size() == 3);
        REQUIRE(results[0].code == "sh.600000");
        REQUIRE(results[1].code == "sz.000001");
        REQUIRE(results[2].analysis_date == "2024-01-08");
    }

    SECTION("other strategies are not returned") {
        REQUIRE(db.queryAnalysisResults("momentum", "2024-01-01", "2024-01-31").empty());
    }

    SECTION("a stored result is not overwritten") {
        REQUIRE(db.saveAnalysisResults({makeResult("sz.000001", "2024-01-05", 20)}));
        auto results = db.queryAnalysisResults("traditional_technical_analysis", "2024-01-05", "2024-01-05",
                                               {"sz.000001"});
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].score == 80);
    }
}

TEST_CASE("Strategy performance records", "[data][performance]") {
    DatabaseManager db(":memory:");
    REQUIRE(db.connect());
    REQUIRE(db.initializeSchema());

    core::PerformanceRecord record;
    record.strategy = "traditional_technical_analysis";
    record.start_date = "2024-01-01";
    record.end_date = "2024-06-30";
    record.total_return = 0.08;
    record.annual_return = 0.17;
    record.max_drawdown = 0.05;
    record.sharpe_ratio = 1.2;
    record.win_rate = 0.6;
    record.profit_loss_ratio = 1.5;
    record.trade_count = 12;
    record.result_count = 40;
    record.instruments_evaluated = 8;
    record.instruments_skipped = 2;
    REQUIRE(db.savePerformance(record));

    SECTION("round trip") {
        auto records = db.queryPerformance("traditional_technical_analysis");
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].end_date == "2024-06-30");
        REQUIRE(records[0].annual_return == Approx(0.17));
        REQUIRE(records[0].trade_count == 12);
        REQUIRE(records[0].instruments_skipped == 2);
    }

    SECTION("same strategy and window replaces") {
        record.total_return = -0.02;
        REQUIRE(db.savePerformance(record));
        auto records = db.queryPerformance();
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].total_return == Approx(-0.02));
    }

    SECTION("window filters") {
        core::PerformanceRecord later = record;
        later.start_date = "2024-07-01";
        later.end_date = "2024-12-31";
        REQUIRE(db.savePerformance(later));

        REQUIRE(db.queryPerformance().size() == 2);
        REQUIRE(db.queryPerformance("", "2024-07-01").size() == 1);
        REQUIRE(db.queryPerformance("", "", "2024-06-30").size() == 1);
        REQUIRE(db.queryPerformance("momentum").empty());
    }
}
