#include "signal_engine.hpp"
#include "signal_rule_factory.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <stdexcept>

namespace strategy_engine {

SignalEngine::SignalEngine(SignalConfig config, std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)), logger_(core::logging::orNull(std::move(logger)))
{
    rules_ = SignalRuleFactory::createRules(config_, logger_);
    logger_->debug("SignalEngine created with {} rules.", rules_.size());
}

SignalEngine::SignalEngine(std::vector<std::unique_ptr<ISignalRule>> rules, std::shared_ptr<spdlog::logger> logger)
    : rules_(std::move(rules)), logger_(core::logging::orNull(std::move(logger)))
{
    for (const auto& rule : rules_) {
        if (!rule) {
            throw std::invalid_argument("SignalEngine rules cannot contain null entries.");
        }
    }
    logger_->debug("SignalEngine created with {} custom rules.", rules_.size());
}

core::SignalSet SignalEngine::generateSignals(const core::TimeSeries<core::IndicatorPoint>& points) const {
    core::SignalSet set;
    for (core::SignalFamily family : {core::SignalFamily::Macd, core::SignalFamily::Rsi, core::SignalFamily::Kdj,
                                      core::SignalFamily::Bollinger, core::SignalFamily::Ma}) {
        set.signals[family] = core::Signal::Hold;
    }

    auto snapshot = MarketDataSnapshot::fromPoints(points);
    for (const auto& rule : rules_) {
        core::Signal signal = rule->evaluate(snapshot, set.diagnostics);
        set.signals[rule->getFamily()] = signal;
        logger_->trace("Rule '{}' -> {}", rule->describe(), core::utils::toString(signal));
    }

    for (const auto& reason : set.diagnostics) {
        logger_->debug("Signal degraded to hold: {}", reason);
    }
    return set;
}

} // namespace strategy_engine
