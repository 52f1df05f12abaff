#pragma once

#include "indicators.hpp" // Base interface
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace indicators {

// Simple moving average of closes (MA_n) or volumes (volume MA_n)
class SmaIndicator : public IIndicator {
public:
    SmaIndicator(int period, SourceField source = SourceField::Close,
                 std::shared_ptr<spdlog::logger> logger = nullptr);

    virtual ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;
    const IndicatorLines& getResult() const override;
    void populate(core::TimeSeries<core::IndicatorPoint>& points) const override;

private:
    const int period_;          // SMA period (e.g., 5, 250)
    const SourceField source_;
    std::string name_;          // e.g. "MA(20)" or "VOLUME_MA(5)"
    IndicatorLines lines_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace indicators
