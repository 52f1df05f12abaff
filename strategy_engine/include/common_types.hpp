#pragma once

#include "datatypes.hpp"
#include <functional>
#include <string>

namespace strategy_engine {

    // A named series a rule reads from an IndicatorPoint (e.g. "MA(5)", "MACD_DIF", "CLOSE")
    struct IndicatorLine {
        std::string name;
        std::function<core::IndicatorValue(const core::IndicatorPoint&)> read;
    };

    // Resolves a line name to its accessor. Accepted names:
    //   CLOSE, MA(n), RSI(n), VOLUME_MA(n), MACD_DIF, MACD_DEA, MACD_HIST,
    //   KDJ_K, KDJ_D, KDJ_J, BOLL_UPPER, BOLL_MIDDLE, BOLL_LOWER
    // Case-insensitive. Throws std::invalid_argument for anything else.
    IndicatorLine resolveLine(const std::string& name);

} // namespace strategy_engine
