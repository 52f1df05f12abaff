#pragma once

#include <nlohmann/json.hpp>
#include <vector>

namespace indicators {

struct MacdParams {
    int fast = 12;
    int slow = 26;
    int signal = 9;
};

struct KdjParams {
    int length = 9;
    int signal = 3;
};

struct BollingerParams {
    int length = 20;
    double std = 2.0;
};

// Periods and parameters for every indicator family the engine computes
struct IndicatorConfig {
    std::vector<int> ma_periods{5, 10, 20, 60, 120, 250};
    MacdParams macd;
    std::vector<int> rsi_periods{6, 12, 24};
    KdjParams kdj;
    BollingerParams bollinger;
    std::vector<int> volume_ma_periods{5, 10, 20};

    // Throws core::ConfigException describing the first invalid field
    void validate() const;

    // Defaults overridden by whatever keys `j` carries; the result is validated
    static IndicatorConfig fromJson(const nlohmann::json& j);
};

} // namespace indicators
