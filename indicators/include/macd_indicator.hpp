#pragma once

#include "indicators.hpp"
#include "indicator_config.hpp"
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace indicators {

// MACD over closes. Lines: "MACD_DIF", "MACD_DEA", "MACD_HIST" (hist = 2 * (DIF - DEA)).
// The EMAs are seeded from the first close, so every line is defined from the first bar.
class MacdIndicator : public IIndicator {
public:
    explicit MacdIndicator(const MacdParams& params, std::shared_ptr<spdlog::logger> logger = nullptr);

    virtual ~MacdIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;
    const IndicatorLines& getResult() const override;
    void populate(core::TimeSeries<core::IndicatorPoint>& points) const override;

    static constexpr const char* kDif = "MACD_DIF";
    static constexpr const char* kDea = "MACD_DEA";
    static constexpr const char* kHist = "MACD_HIST";

private:
    const MacdParams params_;
    std::string name_;
    IndicatorLines lines_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace indicators
