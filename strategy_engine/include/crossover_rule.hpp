#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace strategy_engine {

    // --- CrossoverRule Class ---
    // Buy when the fast line was strictly below the slow line on the previous point and is
    // strictly above it on the latest; Sell on the reverse cross; Hold otherwise.
    class CrossoverRule : public ISignalRule {
    public:
        // e.g. CrossoverRule(SignalFamily::Ma, resolveLine("MA(5)"), resolveLine("MA(20)"))
        CrossoverRule(core::SignalFamily family,
                      IndicatorLine fast_line,
                      IndicatorLine slow_line,
                      std::shared_ptr<spdlog::logger> logger = nullptr);

        virtual ~CrossoverRule() override = default;

        core::Signal evaluate(const MarketDataSnapshot& snapshot,
                              std::vector<std::string>& diagnostics) const override;
        core::SignalFamily getFamily() const override { return family_; }
        std::string describe() const override;

    private:
        core::SignalFamily family_;
        IndicatorLine fast_line_;
        IndicatorLine slow_line_;
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace strategy_engine
