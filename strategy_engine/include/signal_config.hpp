#pragma once

#include <nlohmann/json.hpp>

namespace strategy_engine {

    // Parameters of the per-family signal rules
    struct SignalConfig {
        int ma_short_period = 5;
        int ma_long_period = 20;
        int rsi_period = 12;
        double rsi_oversold = 30.0;
        double rsi_overbought = 70.0;

        // Throws core::ConfigException describing the first invalid field
        void validate() const;

        static SignalConfig fromJson(const nlohmann::json& j);
    };

} // namespace strategy_engine
