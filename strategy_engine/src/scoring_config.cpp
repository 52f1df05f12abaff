#include "scoring_config.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

    void ScoringConfig::validate() const {
        for (const auto& [family, weight] : weights) {
            if (weight < 0) {
                throw core::ConfigException(fmt::format("scoring: weight for {} must not be negative, got {}",
                                                        core::utils::toString(family), weight));
            }
        }
        if (default_weight < 0) {
            throw core::ConfigException(fmt::format("scoring: default_weight must not be negative, got {}", default_weight));
        }
        if (baseline_score < 0 || baseline_score > 100) {
            throw core::ConfigException(fmt::format("scoring: baseline_score must lie in [0, 100], got {}", baseline_score));
        }
        if (sell_threshold >= buy_threshold) {
            throw core::ConfigException(fmt::format("scoring: sell_threshold ({}) must be below buy_threshold ({})",
                                                    sell_threshold, buy_threshold));
        }
        if (low_volatility < 0.0 || low_volatility >= high_volatility) {
            throw core::ConfigException(fmt::format("scoring: volatility bands must satisfy 0 <= low < high (got {} / {})",
                                                    low_volatility, high_volatility));
        }
        if (min_history < 2) {
            throw core::ConfigException(fmt::format("scoring: min_history must be at least 2, got {}", min_history));
        }
        if (expected_return_window == 0) {
            throw core::ConfigException("scoring: expected_return_window must be positive");
        }
        if (trading_days_per_year <= 0) {
            throw core::ConfigException(fmt::format("scoring: trading_days_per_year must be positive, got {}",
                                                    trading_days_per_year));
        }
        if (strategy_id.empty()) {
            throw core::ConfigException("scoring: strategy_id must not be empty");
        }
    }

    ScoringConfig ScoringConfig::fromJson(const nlohmann::json& j) {
        ScoringConfig config;
        try {
            if (j.contains("weights")) {
                config.weights.clear();
                for (const auto& [key, value] : j.at("weights").items()) {
                    config.weights[core::utils::signalFamilyFromString(key)] = value.get<int>();
                }
            }
            config.default_weight = j.value("default_weight", config.default_weight);
            config.baseline_score = j.value("baseline_score", config.baseline_score);
            config.buy_threshold = j.value("buy_threshold", config.buy_threshold);
            config.sell_threshold = j.value("sell_threshold", config.sell_threshold);
            config.low_volatility = j.value("low_volatility", config.low_volatility);
            config.high_volatility = j.value("high_volatility", config.high_volatility);
            config.min_history = j.value("min_history", config.min_history);
            config.expected_return_window = j.value("expected_return_window", config.expected_return_window);
            config.trading_days_per_year = j.value("trading_days_per_year", config.trading_days_per_year);
            config.strategy_id = j.value("strategy_id", config.strategy_id);
        } catch (const nlohmann::json::exception& e) {
            throw core::ConfigException(std::string("Invalid scoring configuration: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw core::ConfigException(std::string("Invalid scoring configuration: ") + e.what());
        }
        config.validate();
        return config;
    }

} // namespace strategy_engine
