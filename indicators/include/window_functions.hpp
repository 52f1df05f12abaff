#pragma once

#include "datatypes.hpp"
#include <string>
#include <vector>

namespace indicators {
namespace window {

    // Trailing-window statistics over a raw series. Output is aligned 1:1 with the
    // input and undefined for the first (period - 1) positions.
    // TA-Lib does the work; a TA-Lib error raises core::IndicatorCalculationException.

    core::TimeSeries<core::IndicatorValue> rollingMean(const std::vector<double>& values, int period);
    core::TimeSeries<core::IndicatorValue> rollingMax(const std::vector<double>& values, int period);
    core::TimeSeries<core::IndicatorValue> rollingMin(const std::vector<double>& values, int period);

    // Sample standard deviation (n - 1 denominator)
    core::TimeSeries<core::IndicatorValue> rollingSampleStdDev(const std::vector<double>& values, int period);

    // Exact trailing sum, recomputed per window so an all-zero window sums to exactly 0
    core::TimeSeries<core::IndicatorValue> rollingSum(const std::vector<double>& values, int period);

    // Recursive exponential smoothing with weight `alpha` on the newest value, seeded from
    // the first defined input (no start-up bias correction). An undefined input repeats the
    // previous output and lets the old weight decay, so the next defined input counts more.
    core::TimeSeries<core::IndicatorValue> exponentialSmooth(const core::TimeSeries<core::IndicatorValue>& values,
                                                             double alpha);

    // alpha = 2 / (span + 1)
    double alphaFromSpan(int span);

    std::vector<double> extract(const core::TimeSeries<core::Bar>& bars, double core::Bar::*field);

} // namespace window
} // namespace indicators
