#include "utils.hpp"
#include "exceptions.hpp"
#include <iomanip> // For std::put_time, std::get_time
#include <sstream> // For string streams
#include <string>
#include <cmath>
#include <numeric>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace core {
namespace utils {

    namespace {

        constexpr long kSecondsPerDay = 24L * 60L * 60L;

        bool parseDate(const Date& date, std::tm& tm) {
            tm = {};
            if (date.size() != 10) {
                return false;
            }
            std::istringstream ss(date);
            ss >> std::get_time(&tm, "%Y-%m-%d");
            return !ss.fail();
        }

        std::string toLower(std::string str) {
            std::transform(str.begin(), str.end(), str.begin(),
                [](unsigned char c){ return std::tolower(c); });
            return str;
        }

    } // end anonymous namespace

    Timestamp dateToTimestamp(const Date& date) {
        std::tm tm;
        if (!parseDate(date, tm)) {
            throw AnalysisPlatformException("Failed to parse date (expected YYYY-MM-DD): " + date);
        }
        // timegm interprets struct tm as UTC. Use _mkgmtime on Windows.
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == (time_t)-1) {
            throw AnalysisPlatformException("Failed to convert date to epoch seconds: " + date);
        }
        return std::chrono::system_clock::from_time_t(tt);
    }

    Date timestampToDate(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);
        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    bool isValidDate(const Date& date) {
        std::tm tm;
        if (!parseDate(date, tm)) {
            return false;
        }
        // Reject dates std::get_time accepts but normalizes (e.g. 2023-02-30)
        try {
            return timestampToDate(dateToTimestamp(date)) == date;
        } catch (const AnalysisPlatformException&) {
            return false;
        }
    }

    long daysBetween(const Date& start, const Date& end) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
            dateToTimestamp(end) - dateToTimestamp(start)).count();
        return static_cast<long>(seconds / kSecondsPerDay);
    }

    Date addDays(const Date& date, long days) {
        return timestampToDate(dateToTimestamp(date) + std::chrono::seconds(days * kSecondsPerDay));
    }

    Date today() {
        return timestampToDate(std::chrono::system_clock::now());
    }

    std::string toString(Signal signal) {
        switch (signal) {
            case Signal::Buy:  return "buy";
            case Signal::Sell: return "sell";
            case Signal::Hold: return "hold";
        }
        return "hold";
    }

    std::string toString(SignalFamily family) {
        switch (family) {
            case SignalFamily::Macd:      return "macd";
            case SignalFamily::Rsi:       return "rsi";
            case SignalFamily::Kdj:       return "kdj";
            case SignalFamily::Bollinger: return "bollinger";
            case SignalFamily::Ma:        return "ma";
        }
        return "unknown";
    }

    std::string toString(Rating rating) {
        switch (rating) {
            case Rating::Buy:  return "buy";
            case Rating::Hold: return "hold";
            case Rating::Sell: return "sell";
        }
        return "hold";
    }

    std::string toString(RiskLevel level) {
        switch (level) {
            case RiskLevel::Low:    return "low";
            case RiskLevel::Medium: return "medium";
            case RiskLevel::High:   return "high";
        }
        return "medium";
    }

    Signal signalFromString(const std::string& str) {
        const std::string lower = toLower(str);
        if (lower == "buy") return Signal::Buy;
        if (lower == "sell") return Signal::Sell;
        if (lower == "hold") return Signal::Hold;
        throw std::invalid_argument("Unknown signal string: " + str);
    }

    SignalFamily signalFamilyFromString(const std::string& str) {
        const std::string lower = toLower(str);
        if (lower == "macd") return SignalFamily::Macd;
        if (lower == "rsi") return SignalFamily::Rsi;
        if (lower == "kdj") return SignalFamily::Kdj;
        if (lower == "bollinger" || lower == "boll") return SignalFamily::Bollinger;
        if (lower == "ma") return SignalFamily::Ma;
        throw std::invalid_argument("Unknown signal family string: " + str);
    }

    Rating ratingFromString(const std::string& str) {
        const std::string lower = toLower(str);
        if (lower == "buy") return Rating::Buy;
        if (lower == "hold") return Rating::Hold;
        if (lower == "sell") return Rating::Sell;
        throw std::invalid_argument("Unknown rating string: " + str);
    }

    RiskLevel riskLevelFromString(const std::string& str) {
        const std::string lower = toLower(str);
        if (lower == "low") return RiskLevel::Low;
        if (lower == "medium") return RiskLevel::Medium;
        if (lower == "high") return RiskLevel::High;
        throw std::invalid_argument("Unknown risk level string: " + str);
    }

    double mean(const std::vector<double>& values) {
        if (values.empty()) {
            return 0.0;
        }
        return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    }

    double sampleStdDev(const std::vector<double>& values) {
        if (values.size() < 2) {
            return 0.0;
        }
        const double avg = mean(values);
        double sq_sum = 0.0;
        for (double v : values) {
            sq_sum += (v - avg) * (v - avg);
        }
        return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
    }

    double populationStdDev(const std::vector<double>& values) {
        if (values.empty()) {
            return 0.0;
        }
        const double avg = mean(values);
        double sq_sum = 0.0;
        for (double v : values) {
            sq_sum += (v - avg) * (v - avg);
        }
        return std::sqrt(sq_sum / static_cast<double>(values.size()));
    }

    std::vector<double> pctChanges(const TimeSeries<Bar>& bars, std::size_t first, std::size_t last) {
        std::vector<double> changes;
        if (bars.empty() || first >= last || last >= bars.size()) {
            return changes;
        }
        changes.reserve(last - first);
        for (std::size_t i = first + 1; i <= last; ++i) {
            const double base = bars[i - 1].close;
            if (base == 0.0) {
                continue;
            }
            changes.push_back((bars[i].close - base) / base);
        }
        return changes;
    }

    std::vector<std::string> split(const std::string& text, char delimiter) {
        std::vector<std::string> parts;
        std::istringstream ss(text);
        std::string item;
        while (std::getline(ss, item, delimiter)) {
            item.erase(item.begin(), std::find_if(item.begin(), item.end(),
                [](unsigned char c){ return !std::isspace(c); }));
            item.erase(std::find_if(item.rbegin(), item.rend(),
                [](unsigned char c){ return !std::isspace(c); }).base(), item.end());
            if (!item.empty()) {
                parts.push_back(item);
            }
        }
        return parts;
    }

} // namespace utils
} // namespace core
