#pragma once

#include "interfaces.hpp"
#include "signal_config.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>
#include <memory>
#include <vector>

namespace strategy_engine {

    class SignalRuleFactory {
    public:
        // Parses one rule definition, e.g.
        //   {"family": "ma", "type": "crossover", "fast": "MA(5)", "slow": "MA(20)"}
        //   {"family": "rsi", "type": "threshold", "line": "RSI(12)", "lower": 30, "upper": 70}
        //   {"family": "bollinger", "type": "band_breakout", "price": "CLOSE",
        //    "upper": "BOLL_UPPER", "lower": "BOLL_LOWER"}
        // Throws core::ConfigException on an invalid definition.
        static std::unique_ptr<ISignalRule> createRule(const nlohmann::json& rule_config,
                                                       std::shared_ptr<spdlog::logger> logger = nullptr);

        // Rule definitions for the five standard families, in MACD, RSI, KDJ, Bollinger, MA order
        static nlohmann::json standardRuleConfigs(const SignalConfig& config);

        static std::vector<std::unique_ptr<ISignalRule>> createRules(const SignalConfig& config,
                                                                     std::shared_ptr<spdlog::logger> logger = nullptr);
    };

} // namespace strategy_engine
