#pragma once

#include "datatypes.hpp"
#include "utils.hpp"
#include <string>
#include <vector>

namespace test_helpers {

    // One bar per calendar day starting at `start`; open/high/low follow the close
    inline core::TimeSeries<core::Bar> makeBars(const std::vector<double>& closes,
                                                const std::string& code = "sh.600000",
                                                const core::Date& start = "2024-01-01") {
        core::TimeSeries<core::Bar> bars;
        bars.reserve(closes.size());
        for (std::size_t i = 0; i < closes.size(); ++i) {
            core::Bar bar;
            bar.code = code;
            bar.date = core::utils::addDays(start, static_cast<long>(i));
            bar.open = closes[i];
            bar.high = closes[i];
            bar.low = closes[i];
            bar.close = closes[i];
            bar.preclose = i > 0 ? closes[i - 1] : closes[i];
            bar.volume = 1000.0 + static_cast<double>(i);
            bars.push_back(bar);
        }
        return bars;
    }

    // Closes alternating +1% / -1% from 100
    inline std::vector<double> alternatingCloses(std::size_t count) {
        std::vector<double> closes;
        double close = 100.0;
        for (std::size_t i = 0; i < count; ++i) {
            if (i > 0) {
                close *= (i % 2 == 1) ? 1.01 : 0.99;
            }
            closes.push_back(close);
        }
        return closes;
    }

    inline std::vector<double> linearCloses(std::size_t count, double start, double step) {
        std::vector<double> closes;
        for (std::size_t i = 0; i < count; ++i) {
            closes.push_back(start + step * static_cast<double>(i));
        }
        return closes;
    }

} // namespace test_helpers
