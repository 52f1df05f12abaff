#include "bollinger_indicator.hpp"
#include "window_functions.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace indicators {

BollingerIndicator::BollingerIndicator(const BollingerParams& params, std::shared_ptr<spdlog::logger> logger)
    : params_(params), logger_(core::logging::orNull(std::move(logger))) {
    if (params_.length < 2 || !(params_.std > 0.0)) {
        throw core::ConfigException(fmt::format("Invalid Bollinger parameters (length={}, std={})",
                                                params_.length, params_.std));
    }
    name_ = fmt::format("BOLL({},{})", params_.length, params_.std);
    logger_->debug("BollingerIndicator created: Name='{}', Lookback={}", name_, getLookback());
}

std::string BollingerIndicator::getName() const {
    return name_;
}

int BollingerIndicator::getLookback() const {
    return params_.length - 1;
}

const IndicatorLines& BollingerIndicator::getResult() const {
    return lines_;
}

void BollingerIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    logger_->trace("Calculating {}...", name_);
    lines_.clear();

    auto closes = window::extract(input, &core::Bar::close);
    auto middle = window::rollingMean(closes, params_.length);
    auto deviation = window::rollingSampleStdDev(closes, params_.length);

    core::TimeSeries<core::IndicatorValue> upper(input.size(), std::nullopt);
    core::TimeSeries<core::IndicatorValue> lower(input.size(), std::nullopt);
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (middle[i] && deviation[i]) {
            double band = params_.std * (*deviation[i]);
            upper[i] = *middle[i] + band;
            lower[i] = *middle[i] - band;
        }
    }

    lines_[kUpper] = std::move(upper);
    lines_[kMiddle] = std::move(middle);
    lines_[kLower] = std::move(lower);

    logger_->trace("Successfully calculated {} values for {}", input.size(), name_);
}

void BollingerIndicator::populate(core::TimeSeries<core::IndicatorPoint>& points) const {
    if (lines_.empty()) {
        return;
    }
    const auto& upper = lines_.at(kUpper);
    const auto& middle = lines_.at(kMiddle);
    const auto& lower = lines_.at(kLower);
    for (std::size_t i = 0; i < points.size() && i < upper.size(); ++i) {
        points[i].boll_upper = upper[i];
        points[i].boll_middle = middle[i];
        points[i].boll_lower = lower[i];
    }
}

} // namespace indicators
