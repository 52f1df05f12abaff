#include "indicator_config.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <string>

namespace indicators {

namespace {

    void requirePositivePeriods(const std::vector<int>& periods, const char* field) {
        for (int p : periods) {
            if (p <= 0) {
                throw core::ConfigException(fmt::format("indicators.{} contains a non-positive period: {}", field, p));
            }
        }
    }

    template<typename T>
    void readIfPresent(const nlohmann::json& j, const char* key, T& target) {
        if (j.contains(key)) {
            target = j.at(key).get<T>();
        }
    }

} // end anonymous namespace

void IndicatorConfig::validate() const {
    requirePositivePeriods(ma_periods, "ma_periods");
    requirePositivePeriods(rsi_periods, "rsi_periods");
    requirePositivePeriods(volume_ma_periods, "volume_ma_periods");

    if (macd.fast <= 0 || macd.slow <= 0 || macd.signal <= 0) {
        throw core::ConfigException(fmt::format("indicators.macd periods must be positive (fast={}, slow={}, signal={})",
                                                macd.fast, macd.slow, macd.signal));
    }
    if (macd.fast >= macd.slow) {
        throw core::ConfigException(fmt::format("indicators.macd fast period ({}) must be below slow period ({})",
                                                macd.fast, macd.slow));
    }
    if (kdj.length < 2 || kdj.signal <= 0) {
        throw core::ConfigException(fmt::format("indicators.kdj requires length >= 2 and signal > 0 (length={}, signal={})",
                                                kdj.length, kdj.signal));
    }
    if (bollinger.length < 2) {
        throw core::ConfigException(fmt::format("indicators.bollinger length must be >= 2, got {}", bollinger.length));
    }
    if (!(bollinger.std > 0.0)) {
        throw core::ConfigException(fmt::format("indicators.bollinger std must be positive, got {}", bollinger.std));
    }
}

IndicatorConfig IndicatorConfig::fromJson(const nlohmann::json& j) {
    IndicatorConfig config;
    try {
        readIfPresent(j, "ma_periods", config.ma_periods);
        readIfPresent(j, "rsi_periods", config.rsi_periods);
        readIfPresent(j, "volume_ma_periods", config.volume_ma_periods);
        if (j.contains("macd")) {
            const auto& m = j.at("macd");
            readIfPresent(m, "fast", config.macd.fast);
            readIfPresent(m, "slow", config.macd.slow);
            readIfPresent(m, "signal", config.macd.signal);
        }
        if (j.contains("kdj")) {
            const auto& k = j.at("kdj");
            readIfPresent(k, "length", config.kdj.length);
            readIfPresent(k, "signal", config.kdj.signal);
        }
        if (j.contains("bollinger")) {
            const auto& b = j.at("bollinger");
            readIfPresent(b, "length", config.bollinger.length);
            readIfPresent(b, "std", config.bollinger.std);
        }
    } catch (const nlohmann::json::exception& e) {
        throw core::ConfigException(std::string("Invalid indicators configuration: ") + e.what());
    }
    config.validate();
    return config;
}

} // namespace indicators
