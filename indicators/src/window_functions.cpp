#include "window_functions.hpp"
#include "exceptions.hpp"
#include "ta_libc.h" // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace indicators {
namespace window {

    namespace {

        void requirePositive(int period, const char* what) {
            if (period <= 0) {
                throw core::IndicatorCalculationException(fmt::format("{} period must be positive, got {}", what, period));
            }
        }

        // Places TA-Lib's compacted output (starting at out_begin) back onto the input index grid
        core::TimeSeries<core::IndicatorValue> align(std::size_t input_size, int out_begin, int out_nb,
                                                     const std::vector<double>& out) {
            core::TimeSeries<core::IndicatorValue> aligned(input_size, std::nullopt);
            for (int k = 0; k < out_nb; ++k) {
                std::size_t idx = static_cast<std::size_t>(out_begin + k);
                if (idx < input_size) {
                    aligned[idx] = out[static_cast<std::size_t>(k)];
                }
            }
            return aligned;
        }

        void check(TA_RetCode ret_code, const char* function, int period) {
            if (ret_code != TA_SUCCESS) {
                throw core::IndicatorCalculationException(
                    fmt::format("TA-Lib {} failed (period {}) with error code: {}", function, period, static_cast<int>(ret_code)));
            }
        }

        core::TimeSeries<core::IndicatorValue> asDefined(const std::vector<double>& values) {
            return core::TimeSeries<core::IndicatorValue>(values.begin(), values.end());
        }

    } // end anonymous namespace

    core::TimeSeries<core::IndicatorValue> rollingMean(const std::vector<double>& values, int period) {
        requirePositive(period, "Moving average");
        if (values.size() < static_cast<std::size_t>(period)) {
            return core::TimeSeries<core::IndicatorValue>(values.size(), std::nullopt);
        }

        std::vector<double> out(values.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_MA(
            0,                                   // startIdx
            static_cast<int>(values.size()) - 1, // endIdx
            values.data(),
            period,
            TA_MAType_SMA,
            &out_begin_idx,
            &out_nb_element,
            out.data());
        check(ret_code, "TA_MA", period);
        return align(values.size(), out_begin_idx, out_nb_element, out);
    }

    core::TimeSeries<core::IndicatorValue> rollingMax(const std::vector<double>& values, int period) {
        requirePositive(period, "Rolling max");
        if (period == 1) {
            return asDefined(values); // TA_MAX rejects a period of 1
        }
        if (values.size() < static_cast<std::size_t>(period)) {
            return core::TimeSeries<core::IndicatorValue>(values.size(), std::nullopt);
        }

        std::vector<double> out(values.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_MAX(0, static_cast<int>(values.size()) - 1, values.data(), period,
                                     &out_begin_idx, &out_nb_element, out.data());
        check(ret_code, "TA_MAX", period);
        return align(values.size(), out_begin_idx, out_nb_element, out);
    }

    core::TimeSeries<core::IndicatorValue> rollingMin(const std::vector<double>& values, int period) {
        requirePositive(period, "Rolling min");
        if (period == 1) {
            return asDefined(values);
        }
        if (values.size() < static_cast<std::size_t>(period)) {
            return core::TimeSeries<core::IndicatorValue>(values.size(), std::nullopt);
        }

        std::vector<double> out(values.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_MIN(0, static_cast<int>(values.size()) - 1, values.data(), period,
                                     &out_begin_idx, &out_nb_element, out.data());
        check(ret_code, "TA_MIN", period);
        return align(values.size(), out_begin_idx, out_nb_element, out);
    }

    core::TimeSeries<core::IndicatorValue> rollingSampleStdDev(const std::vector<double>& values, int period) {
        requirePositive(period, "Standard deviation");
        if (period < 2 || values.size() < static_cast<std::size_t>(period)) {
            // A single observation has no sample deviation
            return core::TimeSeries<core::IndicatorValue>(values.size(), std::nullopt);
        }

        std::vector<double> out(values.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        // TA_VAR divides by n; rescale to the n - 1 denominator below
        TA_RetCode ret_code = TA_VAR(0, static_cast<int>(values.size()) - 1, values.data(), period, 1.0,
                                     &out_begin_idx, &out_nb_element, out.data());
        check(ret_code, "TA_VAR", period);

        core::TimeSeries<core::IndicatorValue> aligned = align(values.size(), out_begin_idx, out_nb_element, out);
        const double bessel = static_cast<double>(period) / static_cast<double>(period - 1);
        for (auto& v : aligned) {
            if (v) {
                // E[x^2] - E[x]^2 can come out as a tiny negative on a flat window
                double variance = std::max(0.0, *v);
                v = std::sqrt(variance * bessel);
            }
        }
        return aligned;
    }

    core::TimeSeries<core::IndicatorValue> rollingSum(const std::vector<double>& values, int period) {
        requirePositive(period, "Rolling sum");
        core::TimeSeries<core::IndicatorValue> sums(values.size(), std::nullopt);
        const std::size_t n = static_cast<std::size_t>(period);
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i + 1 < n) {
                continue;
            }
            double sum = 0.0;
            for (std::size_t j = i + 1 - n; j <= i; ++j) {
                sum += values[j];
            }
            sums[i] = sum;
        }
        return sums;
    }

    core::TimeSeries<core::IndicatorValue> exponentialSmooth(const core::TimeSeries<core::IndicatorValue>& values,
                                                             double alpha) {
        core::TimeSeries<core::IndicatorValue> smoothed(values.size(), std::nullopt);
        const double decay = 1.0 - alpha;
        core::IndicatorValue weighted;
        double old_weight = 1.0;

        for (std::size_t i = 0; i < values.size(); ++i) {
            const auto& current = values[i];
            if (weighted) {
                old_weight *= decay;
                if (current) {
                    weighted = (old_weight * (*weighted) + alpha * (*current)) / (old_weight + alpha);
                    old_weight = 1.0;
                }
            } else if (current) {
                weighted = current;
            }
            smoothed[i] = weighted;
        }
        return smoothed;
    }

    double alphaFromSpan(int span) {
        return 2.0 / (static_cast<double>(span) + 1.0);
    }

    std::vector<double> extract(const core::TimeSeries<core::Bar>& bars, double core::Bar::*field) {
        std::vector<double> values;
        values.reserve(bars.size());
        for (const auto& bar : bars) {
            values.push_back(bar.*field);
        }
        return values;
    }

} // namespace window
} // namespace indicators
