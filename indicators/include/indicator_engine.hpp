#pragma once

#include "datatypes.hpp"
#include "indicators.hpp"
#include "indicator_config.hpp"
#include <spdlog/logger.h>
#include <memory>
#include <string>
#include <vector>

namespace indicators {

    // Turns one instrument's ascending bar sequence into date-aligned IndicatorPoints.
    // Stateless between calls: every call builds fresh indicator instances.
    class IndicatorEngine {
    public:
        explicit IndicatorEngine(IndicatorConfig config = IndicatorConfig{},
                                 std::shared_ptr<spdlog::logger> logger = nullptr);

        // One point per bar, in input order. Empty input gives empty output.
        // Short input yields undefined values rather than an error.
        core::TimeSeries<core::IndicatorPoint> calculate(const core::TimeSeries<core::Bar>& bars) const;

        const IndicatorConfig& getConfig() const { return config_; }

        // Names of the indicators a calculation runs, e.g. "MA(5)", "KDJ(9,3)"
        std::vector<std::string> getIndicatorNames() const;

    private:
        IndicatorConfig config_;
        std::shared_ptr<spdlog::logger> logger_;

        std::vector<std::unique_ptr<IIndicator>> createIndicators() const;
    };

} // namespace indicators
