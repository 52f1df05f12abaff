#include "kdj_indicator.hpp"
#include "window_functions.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace indicators {

KdjIndicator::KdjIndicator(const KdjParams& params, std::shared_ptr<spdlog::logger> logger)
    : params_(params), logger_(core::logging::orNull(std::move(logger))) {
    if (params_.length < 2 || params_.signal <= 0) {
        throw core::ConfigException(fmt::format("Invalid KDJ parameters (length={}, signal={})",
                                                params_.length, params_.signal));
    }
    name_ = fmt::format("KDJ({},{})", params_.length, params_.signal);
    logger_->debug("KdjIndicator created: Name='{}', Lookback={}", name_, getLookback());
}

std::string KdjIndicator::getName() const {
    return name_;
}

int KdjIndicator::getLookback() const {
    return params_.length - 1;
}

const IndicatorLines& KdjIndicator::getResult() const {
    return lines_;
}

void KdjIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    logger_->trace("Calculating {}...", name_);
    lines_.clear();

    auto highest = window::rollingMax(window::extract(input, &core::Bar::high), params_.length);
    auto lowest = window::rollingMin(window::extract(input, &core::Bar::low), params_.length);

    core::TimeSeries<core::IndicatorValue> rsv(input.size(), std::nullopt);
    std::size_t flat_windows = 0;
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (!highest[i] || !lowest[i]) {
            continue;
        }
        double range = *highest[i] - *lowest[i];
        if (range == 0.0) {
            ++flat_windows; // flat range: RSV stays undefined
            continue;
        }
        rsv[i] = (input[i].close - *lowest[i]) / range * 100.0;
    }
    if (flat_windows > 0) {
        logger_->debug("{}: {} flat high/low windows left RSV undefined", name_, flat_windows);
    }

    const double alpha = 1.0 / static_cast<double>(params_.signal);
    auto k = window::exponentialSmooth(rsv, alpha);
    auto d = window::exponentialSmooth(k, alpha);

    core::TimeSeries<core::IndicatorValue> j(input.size(), std::nullopt);
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (k[i] && d[i]) {
            j[i] = 3.0 * (*k[i]) - 2.0 * (*d[i]);
        }
    }

    lines_[kK] = std::move(k);
    lines_[kD] = std::move(d);
    lines_[kJ] = std::move(j);

    logger_->trace("Successfully calculated {} values for {}", input.size(), name_);
}

void KdjIndicator::populate(core::TimeSeries<core::IndicatorPoint>& points) const {
    if (lines_.empty()) {
        return;
    }
    const auto& k = lines_.at(kK);
    const auto& d = lines_.at(kD);
    const auto& j = lines_.at(kJ);
    for (std::size_t i = 0; i < points.size() && i < k.size(); ++i) {
        points[i].kdj_k = k[i];
        points[i].kdj_d = d[i];
        points[i].kdj_j = j[i];
    }
}

} // namespace indicators
