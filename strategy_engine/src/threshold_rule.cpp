#include "threshold_rule.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

ThresholdRule::ThresholdRule(core::SignalFamily family,
                             IndicatorLine line,
                             double lower,
                             double upper,
                             std::shared_ptr<spdlog::logger> logger)
    : family_(family),
      line_(std::move(line)),
      lower_(lower),
      upper_(upper),
      logger_(core::logging::orNull(std::move(logger)))
{
    if (!line_.read) {
        throw std::invalid_argument("ThresholdRule requires a readable line.");
    }
    if (lower_ > upper_) {
        throw std::invalid_argument(fmt::format("ThresholdRule lower bound {} exceeds upper bound {}", lower_, upper_));
    }
}

core::Signal ThresholdRule::evaluate(const MarketDataSnapshot& snapshot,
                                     std::vector<std::string>& diagnostics) const {
    const std::string family = core::utils::toString(family_);

    if (!snapshot.current_point) {
        diagnostics.push_back(fmt::format("{}: no indicator points", family));
        return core::Signal::Hold;
    }

    auto value = line_.read(*snapshot.current_point);
    if (!value) {
        diagnostics.push_back(fmt::format("{}: {} undefined on the latest point", family, line_.name));
        logger_->trace("ThresholdRule '{}' skipped: undefined value.", describe());
        return core::Signal::Hold;
    }

    if (*value < lower_) {
        return core::Signal::Buy;
    }
    if (*value > upper_) {
        return core::Signal::Sell;
    }
    return core::Signal::Hold;
}

std::string ThresholdRule::describe() const {
    return fmt::format("{}: buy {} < {}, sell {} > {}", core::utils::toString(family_),
                       line_.name, lower_, line_.name, upper_);
}

} // namespace strategy_engine
