#pragma once

#include "datatypes.hpp" // Needs Bar, IndicatorPoint, TimeSeries
#include <string>
#include <vector>
#include <map>

namespace indicators {

// Named output lines of an indicator (e.g. "MACD_DIF"), each aligned 1:1 with the input bars
using IndicatorLines = std::map<std::string, core::TimeSeries<core::IndicatorValue>>;

// Which bar field an indicator reads
enum class SourceField {
    Close,
    Volume
};

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "MA(5)", "MACD(12,26,9)")
    virtual std::string getName() const = 0;

    // Index of the first bar that can carry a defined value.
    // Values before it are std::nullopt.
    virtual int getLookback() const = 0;

    // Calculate the indicator over the input bars and store the lines internally.
    // Never throws for short input; throws IndicatorCalculationException if TA-Lib fails.
    virtual void calculate(const core::TimeSeries<core::Bar>& input) = 0;

    // Calculated lines, same length as the last input
    virtual const IndicatorLines& getResult() const = 0;

    // Copy the calculated lines into the matching IndicatorPoint fields
    virtual void populate(core::TimeSeries<core::IndicatorPoint>& points) const = 0;
};

} // namespace indicators
