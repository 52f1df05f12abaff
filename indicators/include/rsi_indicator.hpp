#pragma once

#include "indicators.hpp"
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace indicators {

// Relative strength index from simple rolling means of gains and losses.
// Saturates at 100 when the window has no losses, at 0 when it has no gains.
class RsiIndicator : public IIndicator {
public:
    explicit RsiIndicator(int period, std::shared_ptr<spdlog::logger> logger = nullptr);

    virtual ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;
    const IndicatorLines& getResult() const override;
    void populate(core::TimeSeries<core::IndicatorPoint>& points) const override;

private:
    const int period_;
    std::string name_;
    IndicatorLines lines_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace indicators
