#pragma once

#include "datatypes.hpp"
#include <string>

namespace data {

    // Source of daily bars. Implementations deliver each instrument's bars in
    // ascending date order without duplicates; consumers rely on that.
    class IPriceHistoryProvider {
    public:
        virtual ~IPriceHistoryProvider() = default;

        // Bars of `code` dated within [start_date, end_date].
        // Throws core::DataLoadException when the source cannot be read.
        virtual core::TimeSeries<core::Bar> fetchBars(const std::string& code,
                                                      const core::Date& start_date,
                                                      const core::Date& end_date) = 0;

        virtual bool healthCheck() = 0;

        virtual std::string getName() const = 0;
    };

} // namespace data
