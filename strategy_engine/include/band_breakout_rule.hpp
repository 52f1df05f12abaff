#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace strategy_engine {

    // --- BandBreakoutRule Class ---
    // Compares the latest price against a band: Buy above the upper line, Sell below the lower line.
    class BandBreakoutRule : public ISignalRule {
    public:
        BandBreakoutRule(core::SignalFamily family,
                         IndicatorLine price_line,
                         IndicatorLine upper_line,
                         IndicatorLine lower_line,
                         std::shared_ptr<spdlog::logger> logger = nullptr);

        virtual ~BandBreakoutRule() override = default;

        core::Signal evaluate(const MarketDataSnapshot& snapshot,
                              std::vector<std::string>& diagnostics) const override;
        core::SignalFamily getFamily() const override { return family_; }
        std::string describe() const override;

    private:
        core::SignalFamily family_;
        IndicatorLine price_line_;
        IndicatorLine upper_line_;
        IndicatorLine lower_line_;
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace strategy_engine
