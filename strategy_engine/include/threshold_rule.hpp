#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace strategy_engine {

    // --- ThresholdRule Class ---
    // Buy when the latest value is strictly below `lower`, Sell when strictly above `upper`.
    // Used for RSI oversold / overbought.
    class ThresholdRule : public ISignalRule {
    public:
        ThresholdRule(core::SignalFamily family,
                      IndicatorLine line,
                      double lower,
                      double upper,
                      std::shared_ptr<spdlog::logger> logger = nullptr);

        virtual ~ThresholdRule() override = default;

        core::Signal evaluate(const MarketDataSnapshot& snapshot,
                              std::vector<std::string>& diagnostics) const override;
        core::SignalFamily getFamily() const override { return family_; }
        std::string describe() const override;

    private:
        core::SignalFamily family_;
        IndicatorLine line_;
        double lower_;
        double upper_;
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace strategy_engine
