#pragma once

#include "datatypes.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace strategy_engine {

    struct ScoringConfig {
        // Score contribution per family; a family absent from the map weighs `default_weight`
        std::map<core::SignalFamily, int> weights{
            {core::SignalFamily::Macd, 25},
            {core::SignalFamily::Rsi, 20},
            {core::SignalFamily::Kdj, 20},
            {core::SignalFamily::Bollinger, 15},
            {core::SignalFamily::Ma, 20}
        };
        int default_weight = 10;
        int baseline_score = 50;
        int buy_threshold = 70;   // score >= -> buy
        int sell_threshold = 30;  // score <= -> sell

        double low_volatility = 0.2;   // annualized volatility below -> low risk
        double high_volatility = 0.4;  // at or above -> high risk

        std::size_t min_history = 26;
        std::size_t expected_return_window = 30;
        int trading_days_per_year = 252;

        std::string strategy_id = "traditional_technical_analysis";

        int weightFor(core::SignalFamily family) const {
            auto it = weights.find(family);
            return it != weights.end() ? it->second : default_weight;
        }

        void validate() const;

        // "weights", when present, replaces the whole weight map
        static ScoringConfig fromJson(const nlohmann::json& j);
    };

} // namespace strategy_engine
