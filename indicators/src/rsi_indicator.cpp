#include "rsi_indicator.hpp"
#include "window_functions.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <vector>

namespace indicators {

RsiIndicator::RsiIndicator(int period, std::shared_ptr<spdlog::logger> logger)
    : period_(period), logger_(core::logging::orNull(std::move(logger))) {
    if (period_ <= 0) {
        throw core::ConfigException(fmt::format("RSI period must be positive, got {}", period_));
    }
    name_ = fmt::format("RSI({})", period_);
    logger_->debug("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, getLookback());
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return period_ - 1;
}

const IndicatorLines& RsiIndicator::getResult() const {
    return lines_;
}

void RsiIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    logger_->trace("Calculating {}...", name_);
    lines_.clear();

    // Per-bar gains and losses; the first bar has no predecessor and counts as unchanged
    std::vector<double> gains(input.size(), 0.0);
    std::vector<double> losses(input.size(), 0.0);
    for (std::size_t i = 1; i < input.size(); ++i) {
        double delta = input[i].close - input[i - 1].close;
        gains[i] = std::max(delta, 0.0);
        losses[i] = std::max(-delta, 0.0);
    }

    // Exact window sums: a window without losses must read exactly zero
    auto gain_sums = window::rollingSum(gains, period_);
    auto loss_sums = window::rollingSum(losses, period_);

    core::TimeSeries<core::IndicatorValue> rsi(input.size(), std::nullopt);
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (!gain_sums[i] || !loss_sums[i]) {
            continue;
        }
        double avg_gain = *gain_sums[i] / period_;
        double avg_loss = *loss_sums[i] / period_;
        if (avg_loss == 0.0) {
            rsi[i] = 100.0;
        } else if (avg_gain == 0.0) {
            rsi[i] = 0.0;
        } else {
            rsi[i] = 100.0 - 100.0 / (1.0 + avg_gain / avg_loss);
        }
    }
    lines_[name_] = std::move(rsi);

    logger_->trace("Successfully calculated {} values for {}", input.size(), name_);
}

void RsiIndicator::populate(core::TimeSeries<core::IndicatorPoint>& points) const {
    auto it = lines_.find(name_);
    if (it == lines_.end()) {
        return;
    }
    for (std::size_t i = 0; i < points.size() && i < it->second.size(); ++i) {
        points[i].rsi[period_] = it->second[i];
    }
}

} // namespace indicators
