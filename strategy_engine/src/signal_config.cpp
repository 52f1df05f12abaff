#include "signal_config.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <string>

namespace strategy_engine {

    void SignalConfig::validate() const {
        if (ma_short_period <= 0 || ma_long_period <= 0) {
            throw core::ConfigException(fmt::format("signals: MA periods must be positive (short={}, long={})",
                                                    ma_short_period, ma_long_period));
        }
        if (ma_short_period >= ma_long_period) {
            throw core::ConfigException(fmt::format("signals: ma_short_period ({}) must be below ma_long_period ({})",
                                                    ma_short_period, ma_long_period));
        }
        if (rsi_period <= 0) {
            throw core::ConfigException(fmt::format("signals: rsi_period must be positive, got {}", rsi_period));
        }
        if (rsi_oversold < 0.0 || rsi_overbought > 100.0 || rsi_oversold >= rsi_overbought) {
            throw core::ConfigException(fmt::format("signals: RSI thresholds must satisfy 0 <= oversold < overbought <= 100 (got {} / {})",
                                                    rsi_oversold, rsi_overbought));
        }
    }

    SignalConfig SignalConfig::fromJson(const nlohmann::json& j) {
        SignalConfig config;
        try {
            config.ma_short_period = j.value("ma_short_period", config.ma_short_period);
            config.ma_long_period = j.value("ma_long_period", config.ma_long_period);
            config.rsi_period = j.value("rsi_period", config.rsi_period);
            config.rsi_oversold = j.value("rsi_oversold", config.rsi_oversold);
            config.rsi_overbought = j.value("rsi_overbought", config.rsi_overbought);
        } catch (const nlohmann::json::exception& e) {
            throw core::ConfigException(std::string("Invalid signals configuration: ") + e.what());
        }
        config.validate();
        return config;
    }

} // namespace strategy_engine
