#pragma once

#include "analysis_engine.hpp"
#include "evaluation_config.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace cli {

    // Settings of one CLI run, read from the JSON config file
    struct AppConfig {
        std::string database_path = "stock_data.db";
        std::string log_level = "info";
        std::string log_file = "stock_analysis"; // base name inside logs/

        strategy_engine::AnalysisConfig analysis;
        evaluator::EvaluationConfig evaluation;

        // Set when the file was missing and defaults were used
        bool from_defaults = false;

        // Throws core::ConfigException on bad values
        static AppConfig fromJson(const nlohmann::json& j);

        // A missing file yields the defaults; malformed JSON throws core::ConfigException
        static AppConfig loadFromFile(const std::string& path);
    };

} // namespace cli
