// cli/src/main.cpp

#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <exception>
#include <memory>
#include <csignal>

#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "app_config.hpp"
#include "database_manager.hpp"
#include "analysis_engine.hpp"
#include "performance_evaluator.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace {

    volatile std::sig_atomic_t g_interrupted = 0;

    void handleInterrupt(int) {
        g_interrupted = 1;
    }

    void printUsage() {
        std::cerr <<
            "Usage: stock_analysis_cli <command> [--config FILE] [options]\n"
            "\n"
            "Commands:\n"
            "  init-db                               create tables and indexes\n"
            "  analyze  [--codes a,b] [--date D]     analyze instruments and store the results\n"
            "  evaluate --strategies s1,s2 --start D --end D [--codes a,b]\n"
            "                                        evaluate and compare stored strategy results\n"
            "  health                                check the price history store\n";
    }

    struct CommandLine {
        std::string command;
        std::map<std::string, std::string> options; // "--name" -> value
    };

    CommandLine parseArguments(int argc, char* argv[]) {
        static const std::set<std::string> known{"--config", "--codes", "--date", "--strategies", "--start", "--end"};
        if (argc < 2) {
            throw std::invalid_argument("Missing command");
        }
        CommandLine cmd;
        cmd.command = argv[1];
        for (int i = 2; i < argc; ++i) {
            std::string name = argv[i];
            if (known.count(name) == 0) {
                throw std::invalid_argument("Unknown option: " + name);
            }
            if (i + 1 >= argc) {
                throw std::invalid_argument("Option " + name + " requires a value");
            }
            cmd.options[name] = argv[++i];
        }
        return cmd;
    }

    std::string option(const CommandLine& cmd, const std::string& name, const std::string& fallback = "") {
        auto it = cmd.options.find(name);
        return it != cmd.options.end() ? it->second : fallback;
    }

    std::string requireOption(const CommandLine& cmd, const std::string& name) {
        std::string value = option(cmd, name);
        if (value.empty()) {
            throw std::invalid_argument("Command '" + cmd.command + "' requires " + name);
        }
        return value;
    }

    std::vector<std::string> listOption(const CommandLine& cmd, const std::string& name) {
        std::vector<std::string> values;
        for (auto& item : core::utils::split(option(cmd, name), ',')) {
            if (!item.empty()) {
                values.push_back(item);
            }
        }
        return values;
    }

    core::Date dateOption(const CommandLine& cmd, const std::string& name, const core::Date& fallback) {
        core::Date date = option(cmd, name, fallback);
        if (!core::utils::isValidDate(date)) {
            throw std::invalid_argument(fmt::format("{} expects YYYY-MM-DD, got '{}'", name, date));
        }
        return date;
    }

    void connectOrThrow(data::DatabaseManager& db) {
        if (!db.connect()) {
            throw core::DataLoadException("Could not connect to database " + db.getName());
        }
    }

    int runInitDb(data::DatabaseManager& db, const std::shared_ptr<spdlog::logger>& logger) {
        connectOrThrow(db);
        if (!db.initializeSchema()) {
            throw core::StorageException("Schema initialization failed for " + db.getName());
        }
        logger->info("Database schema ready at {}", db.getName());
        return 0;
    }

    int runHealth(data::DatabaseManager& db, const std::shared_ptr<spdlog::logger>& logger) {
        if (!db.connect()) {
            fmt::print("{}: unreachable\n", db.getName());
            return 1;
        }
        bool healthy = db.healthCheck();
        fmt::print("{}: {}\n", db.getName(), healthy ? "ok" : "unhealthy");
        logger->info("Health check for {}: {}", db.getName(), healthy ? "ok" : "unhealthy");
        return healthy ? 0 : 1;
    }

    int runAnalyze(const CommandLine& cmd, const cli::AppConfig& config, data::DatabaseManager& db,
                   const std::shared_ptr<spdlog::logger>& logger) {
        connectOrThrow(db);

        const core::Date analysis_date = dateOption(cmd, "--date", core::utils::today());
        const core::Date history_start = core::utils::addDays(analysis_date, -config.analysis.history_days);

        std::vector<std::string> codes = listOption(cmd, "--codes");
        if (codes.empty()) {
            codes = db.getStockCodes();
        }
        if (codes.empty()) {
            logger->warn("No instruments to analyze; the bar table is empty.");
            return 0;
        }
        logger->info("Analyzing {} instruments as of {} (bars from {})", codes.size(), analysis_date, history_start);

        strategy_engine::AnalysisEngine engine(config.analysis, logger);
        auto loader = [&db, &history_start, &analysis_date](const std::string& code) {
            return db.fetchBars(code, history_start, analysis_date);
        };
        auto should_continue = []() { return g_interrupted == 0; };

        strategy_engine::BatchResult batch = engine.batchAnalyze(codes, loader, analysis_date, should_continue);

        if (!db.saveAnalysisResults(batch.results)) {
            throw core::StorageException(fmt::format("Failed to store {} analysis results", batch.results.size()));
        }

        const auto& summary = batch.summary;
        fmt::print("Analysis {}: {} succeeded, {} skipped, {} failed{}\n",
                   analysis_date, summary.succeeded, summary.skipped, summary.failed,
                   summary.cancelled ? " (interrupted)" : "");
        for (const auto& result : batch.results) {
            fmt::print("  {:<12} {:<10} score {:>3}  {:<4}  risk {:<6}  expected {:+.2f}%\n",
                       result.code, result.analysis_date, result.score,
                       core::utils::toString(result.rating), core::utils::toString(result.risk_level),
                       result.expected_return * 100.0);
        }
        if (!summary.skipped_codes.empty()) {
            fmt::print("  skipped: {}\n", fmt::join(summary.skipped_codes, ", "));
        }
        if (!summary.failed_codes.empty()) {
            fmt::print("  failed: {}\n", fmt::join(summary.failed_codes, ", "));
        }
        return summary.cancelled ? 1 : 0;
    }

    int runEvaluate(const CommandLine& cmd, const cli::AppConfig& config, data::DatabaseManager& db,
                    const std::shared_ptr<spdlog::logger>& logger) {
        const std::vector<std::string> strategies = core::utils::split(requireOption(cmd, "--strategies"), ',');
        const core::Date start_date = dateOption(cmd, "--start", requireOption(cmd, "--start"));
        const core::Date end_date = dateOption(cmd, "--end", requireOption(cmd, "--end"));
        const std::vector<std::string> codes = listOption(cmd, "--codes");

        connectOrThrow(db);
        evaluator::PerformanceEvaluator evaluator(config.evaluation, logger);

        std::vector<core::PerformanceRecord> records;
        for (const auto& strategy : strategies) {
            if (strategy.empty()) {
                continue;
            }
            std::vector<core::AnalysisResult> results = db.queryAnalysisResults(strategy, start_date, end_date, codes);
            logger->info("Strategy '{}': {} stored results between {} and {}", strategy, results.size(), start_date, end_date);

            std::map<std::string, core::TimeSeries<core::Bar>> bars_by_code;
            for (const auto& result : results) {
                if (bars_by_code.count(result.code) != 0) {
                    continue;
                }
                try {
                    bars_by_code[result.code] = db.fetchBars(result.code, start_date, end_date);
                } catch (const core::DataLoadException& e) {
                    // Left out of the map; the evaluator counts it as skipped
                    logger->warn("No bars for {}: {}", result.code, e.what());
                }
            }

            core::PerformanceRecord record = evaluator.calculatePerformance(strategy, start_date, end_date, results, bars_by_code);
            if (!db.savePerformance(record)) {
                throw core::StorageException("Failed to store performance of strategy " + strategy);
            }
            records.push_back(record);
        }

        if (records.empty()) {
            throw std::invalid_argument("--strategies named no strategy");
        }

        core::StrategyComparison comparison = evaluator::PerformanceEvaluator::compareStrategies(records);
        fmt::print("Strategy ranking {} to {}:\n", start_date, end_date);
        int rank = 1;
        for (const auto& record : comparison.ranked) {
            fmt::print("  {}. {:<32} annual {:+.2f}%  total {:+.2f}%  drawdown {:.2f}%  sharpe {:.2f}  win {:.1f}%  trades {}  "
                       "(evaluated {}, skipped {})\n",
                       rank++, record.strategy, record.annual_return * 100.0, record.total_return * 100.0,
                       record.max_drawdown * 100.0, record.sharpe_ratio, record.win_rate * 100.0, record.trade_count,
                       record.instruments_evaluated, record.instruments_skipped);
        }
        fmt::print("Best annual return: {} ({:+.2f}%)\n", comparison.best_annual_return_strategy, comparison.best_annual_return * 100.0);
        fmt::print("Best Sharpe ratio:  {} ({:.2f})\n", comparison.best_sharpe_strategy, comparison.best_sharpe_ratio);
        fmt::print("Smallest drawdown:  {} ({:.2f}%)\n", comparison.best_drawdown_strategy, comparison.best_drawdown * 100.0);
        fmt::print("Best win rate:      {} ({:.1f}%)\n", comparison.best_win_rate_strategy, comparison.best_win_rate * 100.0);
        return 0;
    }

} // namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        CommandLine cmd;
        try {
            cmd = parseArguments(argc, argv);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << "\n\n";
            printUsage();
            return 1;
        }

        // --- Configuration & Logging ---
        const std::string config_path = option(cmd, "--config", "config/config.json");
        cli::AppConfig config = cli::AppConfig::loadFromFile(config_path);

        auto level = core::logging::level_from_string(config.log_level);
        logger = core::logging::createLogger("StockAnalysis", config.log_file, level, spdlog::level::debug);
        if (config.from_defaults) {
            logger->warn("Configuration file '{}' not found; using defaults.", config_path);
        }
        logger->info("Stock analysis CLI starting: command '{}'", cmd.command);

        std::signal(SIGINT, handleInterrupt);
        std::signal(SIGTERM, handleInterrupt);

        data::DatabaseManager db_manager(config.database_path, logger);

        int exit_code = 0;
        if (cmd.command == "init-db") {
            exit_code = runInitDb(db_manager, logger);
        } else if (cmd.command == "analyze") {
            exit_code = runAnalyze(cmd, config, db_manager, logger);
        } else if (cmd.command == "evaluate") {
            exit_code = runEvaluate(cmd, config, db_manager, logger);
        } else if (cmd.command == "health") {
            exit_code = runHealth(db_manager, logger);
        } else {
            std::cerr << "Error: unknown command '" << cmd.command << "'\n\n";
            printUsage();
            return 1;
        }

        db_manager.disconnect();
        logger->info("Stock analysis CLI finished with exit code {}.", exit_code);
        return exit_code;

    // --- Exception Handling ---
    } catch (const core::AnalysisPlatformException& ex) {
        std::cerr << "Platform Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Platform Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }
}
