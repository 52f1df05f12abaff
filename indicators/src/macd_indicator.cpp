#include "macd_indicator.hpp"
#include "window_functions.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace indicators {

MacdIndicator::MacdIndicator(const MacdParams& params, std::shared_ptr<spdlog::logger> logger)
    : params_(params), logger_(core::logging::orNull(std::move(logger))) {
    if (params_.fast <= 0 || params_.slow <= 0 || params_.signal <= 0 || params_.fast >= params_.slow) {
        throw core::ConfigException(fmt::format("Invalid MACD parameters (fast={}, slow={}, signal={})",
                                                params_.fast, params_.slow, params_.signal));
    }
    name_ = fmt::format("MACD({},{},{})", params_.fast, params_.slow, params_.signal);
    logger_->debug("MacdIndicator created: Name='{}'", name_);
}

std::string MacdIndicator::getName() const {
    return name_;
}

int MacdIndicator::getLookback() const {
    return 0;
}

const IndicatorLines& MacdIndicator::getResult() const {
    return lines_;
}

void MacdIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    logger_->trace("Calculating {}...", name_);
    lines_.clear();

    auto closes = window::extract(input, &core::Bar::close);
    core::TimeSeries<core::IndicatorValue> close_series(closes.begin(), closes.end());

    auto ema_fast = window::exponentialSmooth(close_series, window::alphaFromSpan(params_.fast));
    auto ema_slow = window::exponentialSmooth(close_series, window::alphaFromSpan(params_.slow));

    core::TimeSeries<core::IndicatorValue> dif(input.size(), std::nullopt);
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (ema_fast[i] && ema_slow[i]) {
            dif[i] = *ema_fast[i] - *ema_slow[i];
        }
    }

    auto dea = window::exponentialSmooth(dif, window::alphaFromSpan(params_.signal));

    core::TimeSeries<core::IndicatorValue> hist(input.size(), std::nullopt);
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (dif[i] && dea[i]) {
            hist[i] = 2.0 * (*dif[i] - *dea[i]);
        }
    }

    lines_[kDif] = std::move(dif);
    lines_[kDea] = std::move(dea);
    lines_[kHist] = std::move(hist);

    logger_->trace("Successfully calculated {} values for {}", input.size(), name_);
}

void MacdIndicator::populate(core::TimeSeries<core::IndicatorPoint>& points) const {
    if (lines_.empty()) {
        return;
    }
    const auto& dif = lines_.at(kDif);
    const auto& dea = lines_.at(kDea);
    const auto& hist = lines_.at(kHist);
    for (std::size_t i = 0; i < points.size() && i < dif.size(); ++i) {
        points[i].macd_dif = dif[i];
        points[i].macd_dea = dea[i];
        points[i].macd_hist = hist[i];
    }
}

} // namespace indicators
