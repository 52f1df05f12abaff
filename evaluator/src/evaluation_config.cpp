#include "evaluation_config.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <string>

namespace evaluator {

    void EvaluationConfig::validate() const {
        if (!std::isfinite(risk_free_rate)) {
            throw core::ConfigException("evaluation.risk_free_rate must be a finite number");
        }
        if (trading_days_per_year <= 0) {
            throw core::ConfigException(fmt::format("evaluation.trading_days_per_year must be positive, got {}",
                                                    trading_days_per_year));
        }
        if (days_per_year <= 0) {
            throw core::ConfigException(fmt::format("evaluation.days_per_year must be positive, got {}", days_per_year));
        }
    }

    EvaluationConfig EvaluationConfig::fromJson(const nlohmann::json& j) {
        EvaluationConfig config;
        try {
            config.risk_free_rate = j.value("risk_free_rate", config.risk_free_rate);
            config.trading_days_per_year = j.value("trading_days_per_year", config.trading_days_per_year);
            config.days_per_year = j.value("days_per_year", config.days_per_year);
        } catch (const nlohmann::json::exception& e) {
            throw core::ConfigException(std::string("Invalid evaluation configuration: ") + e.what());
        }
        config.validate();
        return config;
    }

} // namespace evaluator
