#include "app_config.hpp"
#include "exceptions.hpp"
#include <fstream>
#include <filesystem>

namespace cli {

    AppConfig AppConfig::fromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw core::ConfigException("Configuration root must be a JSON object");
        }

        AppConfig config;
        const nlohmann::json empty = nlohmann::json::object();
        try {
            if (j.contains("output")) {
                config.database_path = j.at("output").value("database_path", config.database_path);
            }
            if (j.contains("logging")) {
                const auto& logging = j.at("logging");
                config.log_level = logging.value("level", config.log_level);
                config.log_file = logging.value("file", config.log_file);
            }
        } catch (const nlohmann::json::exception& e) {
            throw core::ConfigException(std::string("Invalid output/logging configuration: ") + e.what());
        }

        if (config.database_path.empty()) {
            throw core::ConfigException("output.database_path must not be empty");
        }

        config.analysis = strategy_engine::AnalysisConfig::fromJson(j.contains("analysis") ? j.at("analysis") : empty);
        config.evaluation = evaluator::EvaluationConfig::fromJson(j.contains("evaluation") ? j.at("evaluation") : empty);
        return config;
    }

    AppConfig AppConfig::loadFromFile(const std::string& path) {
        if (!std::filesystem::exists(path)) {
            AppConfig config;
            config.from_defaults = true;
            return config;
        }

        std::ifstream config_file(path);
        if (!config_file.is_open()) {
            throw core::ConfigException("Could not open configuration file: " + path);
        }

        nlohmann::json j;
        try {
            config_file >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw core::ConfigException("Failed to parse configuration file " + path + ": " + e.what());
        }
        return fromJson(j);
    }

} // namespace cli
