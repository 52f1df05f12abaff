#pragma once

#include "datatypes.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace core {
namespace utils {

    // --- Dates (YYYY-MM-DD, interpreted as UTC midnight) ---
    Timestamp dateToTimestamp(const Date& date);
    Date timestampToDate(const Timestamp& ts);
    bool isValidDate(const Date& date);
    // Calendar days from `start` to `end` (negative if end precedes start)
    long daysBetween(const Date& start, const Date& end);
    Date addDays(const Date& date, long days);
    Date today();

    // --- Enum <-> string (persistence contract) ---
    std::string toString(Signal signal);
    std::string toString(SignalFamily family);
    std::string toString(Rating rating);
    std::string toString(RiskLevel level);
    Signal signalFromString(const std::string& str);
    SignalFamily signalFamilyFromString(const std::string& str);
    Rating ratingFromString(const std::string& str);
    RiskLevel riskLevelFromString(const std::string& str);

    // --- Math helpers ---
    double mean(const std::vector<double>& values);
    // n-1 denominator; 0 for fewer than two values
    double sampleStdDev(const std::vector<double>& values);
    // n denominator; 0 for an empty input
    double populationStdDev(const std::vector<double>& values);
    // Close-to-close fractional changes of bars[first..last]; pairs with a zero base close are dropped
    std::vector<double> pctChanges(const TimeSeries<Bar>& bars, std::size_t first, std::size_t last);

    // --- Strings ---
    std::vector<std::string> split(const std::string& text, char delimiter);

} // namespace utils
} // namespace core
