#include "sma_indicator.hpp"
#include "window_functions.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace indicators {

SmaIndicator::SmaIndicator(int period, SourceField source, std::shared_ptr<spdlog::logger> logger)
    : period_(period), source_(source), logger_(core::logging::orNull(std::move(logger))) {
    if (period_ <= 0) {
        throw core::ConfigException(fmt::format("SMA period must be positive, got {}", period_));
    }
    name_ = source_ == SourceField::Volume ? fmt::format("VOLUME_MA({})", period_)
                                           : fmt::format("MA({})", period_);
    logger_->debug("SmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, getLookback());
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return period_ - 1;
}

const IndicatorLines& SmaIndicator::getResult() const {
    return lines_;
}

void SmaIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    logger_->trace("Calculating {}...", name_);
    lines_.clear();

    if (input.size() <= static_cast<std::size_t>(getLookback())) {
        logger_->debug("Input size ({}) is less than or equal to lookback ({}) for {}. All values undefined.",
                       input.size(), getLookback(), name_);
    }

    auto values = window::extract(input, source_ == SourceField::Volume ? &core::Bar::volume : &core::Bar::close);
    lines_[name_] = window::rollingMean(values, period_);

    logger_->trace("Successfully calculated {} values for {}", lines_[name_].size(), name_);
}

void SmaIndicator::populate(core::TimeSeries<core::IndicatorPoint>& points) const {
    auto it = lines_.find(name_);
    if (it == lines_.end()) {
        return;
    }
    const auto& line = it->second;
    for (std::size_t i = 0; i < points.size() && i < line.size(); ++i) {
        if (source_ == SourceField::Volume) {
            points[i].volume_ma[period_] = line[i];
        } else {
            points[i].ma[period_] = line[i];
        }
    }
}

} // namespace indicators
