#pragma once

#include "interfaces.hpp"
#include "signal_config.hpp"
#include "datatypes.hpp"
#include <spdlog/logger.h>
#include <memory>
#include <vector>

namespace strategy_engine {

    // Maps the tail of an IndicatorPoint sequence to one signal per family.
    // Never throws on short or undefined input: those families degrade to Hold with a diagnostic.
    class SignalEngine {
    public:
        explicit SignalEngine(SignalConfig config = SignalConfig{},
                              std::shared_ptr<spdlog::logger> logger = nullptr);

        // Custom rule set; a family without a rule reads Hold
        SignalEngine(std::vector<std::unique_ptr<ISignalRule>> rules,
                     std::shared_ptr<spdlog::logger> logger = nullptr);

        core::SignalSet generateSignals(const core::TimeSeries<core::IndicatorPoint>& points) const;

        const SignalConfig& getConfig() const { return config_; }

    private:
        SignalConfig config_;
        std::vector<std::unique_ptr<ISignalRule>> rules_;
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace strategy_engine
