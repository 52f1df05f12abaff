#include "common_types.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>
#include <utility>

namespace strategy_engine {

    namespace {

        // Parse an indicator name with a period, e.g. "MA(10)" -> {"MA", 10}.
        // Returns {name, -1} if no period is present.
        std::pair<std::string, int> parseIndicatorString(const std::string& indicator_str) {
            static const std::regex indicator_regex(R"(([A-Z_]+)\((\d+)\))");
            std::smatch match;
            if (std::regex_match(indicator_str, match, indicator_regex) && match.size() == 3) {
                try {
                    return {match[1].str(), std::stoi(match[2].str())};
                } catch (const std::out_of_range&) {
                    throw std::invalid_argument("Indicator period out of range: " + indicator_str);
                }
            }
            return {indicator_str, -1};
        }

    } // end anonymous namespace

    IndicatorLine resolveLine(const std::string& name) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
            [](unsigned char c){ return std::toupper(c); });

        auto parsed = parseIndicatorString(upper);
        const std::string& base_name = parsed.first;
        const int period = parsed.second;

        if (period > 0) {
            if (base_name == "MA") {
                return {upper, [period](const core::IndicatorPoint& p) { return p.maValue(period); }};
            }
            if (base_name == "RSI") {
                return {upper, [period](const core::IndicatorPoint& p) { return p.rsiValue(period); }};
            }
            if (base_name == "VOLUME_MA") {
                return {upper, [period](const core::IndicatorPoint& p) { return p.volumeMaValue(period); }};
            }
            throw std::invalid_argument("Unknown periodic indicator line: " + name);
        }
        if (period == 0) {
            throw std::invalid_argument("Indicator period must be positive: " + name);
        }

        if (upper == "CLOSE") {
            return {upper, [](const core::IndicatorPoint& p) -> core::IndicatorValue { return p.close; }};
        }
        if (upper == "MACD_DIF") return {upper, [](const core::IndicatorPoint& p) { return p.macd_dif; }};
        if (upper == "MACD_DEA") return {upper, [](const core::IndicatorPoint& p) { return p.macd_dea; }};
        if (upper == "MACD_HIST") return {upper, [](const core::IndicatorPoint& p) { return p.macd_hist; }};
        if (upper == "KDJ_K") return {upper, [](const core::IndicatorPoint& p) { return p.kdj_k; }};
        if (upper == "KDJ_D") return {upper, [](const core::IndicatorPoint& p) { return p.kdj_d; }};
        if (upper == "KDJ_J") return {upper, [](const core::IndicatorPoint& p) { return p.kdj_j; }};
        if (upper == "BOLL_UPPER") return {upper, [](const core::IndicatorPoint& p) { return p.boll_upper; }};
        if (upper == "BOLL_MIDDLE") return {upper, [](const core::IndicatorPoint& p) { return p.boll_middle; }};
        if (upper == "BOLL_LOWER") return {upper, [](const core::IndicatorPoint& p) { return p.boll_lower; }};

        throw std::invalid_argument("Unknown indicator line: " + name);
    }

} // namespace strategy_engine
