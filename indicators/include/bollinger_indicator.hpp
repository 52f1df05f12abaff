#pragma once

#include "indicators.hpp"
#include "indicator_config.hpp"
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace indicators {

// Bollinger bands around MA_length, `std` sample standard deviations wide
class BollingerIndicator : public IIndicator {
public:
    explicit BollingerIndicator(const BollingerParams& params, std::shared_ptr<spdlog::logger> logger = nullptr);

    virtual ~BollingerIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;
    const IndicatorLines& getResult() const override;
    void populate(core::TimeSeries<core::IndicatorPoint>& points) const override;

    static constexpr const char* kUpper = "BOLL_UPPER";
    static constexpr const char* kMiddle = "BOLL_MIDDLE";
    static constexpr const char* kLower = "BOLL_LOWER";

private:
    const BollingerParams params_;
    std::string name_;
    IndicatorLines lines_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace indicators
