#include "band_breakout_rule.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

BandBreakoutRule::BandBreakoutRule(core::SignalFamily family,
                                   IndicatorLine price_line,
                                   IndicatorLine upper_line,
                                   IndicatorLine lower_line,
                                   std::shared_ptr<spdlog::logger> logger)
    : family_(family),
      price_line_(std::move(price_line)),
      upper_line_(std::move(upper_line)),
      lower_line_(std::move(lower_line)),
      logger_(core::logging::orNull(std::move(logger)))
{
    if (!price_line_.read || !upper_line_.read || !lower_line_.read) {
        throw std::invalid_argument("BandBreakoutRule requires readable price, upper and lower lines.");
    }
}

core::Signal BandBreakoutRule::evaluate(const MarketDataSnapshot& snapshot,
                                        std::vector<std::string>& diagnostics) const {
    const std::string family = core::utils::toString(family_);

    if (!snapshot.current_point) {
        diagnostics.push_back(fmt::format("{}: no indicator points", family));
        return core::Signal::Hold;
    }

    const auto& point = *snapshot.current_point;
    auto price = price_line_.read(point);
    auto upper = upper_line_.read(point);
    auto lower = lower_line_.read(point);

    if (!price || !upper || !lower) {
        diagnostics.push_back(fmt::format("{}: {} or {} undefined on the latest point",
                                          family, upper_line_.name, lower_line_.name));
        logger_->trace("BandBreakoutRule '{}' skipped: undefined values.", describe());
        return core::Signal::Hold;
    }

    if (*price > *upper) {
        return core::Signal::Buy;
    }
    if (*price < *lower) {
        return core::Signal::Sell;
    }
    return core::Signal::Hold;
}

std::string BandBreakoutRule::describe() const {
    return fmt::format("{}: {} outside [{}, {}]", core::utils::toString(family_),
                       price_line_.name, lower_line_.name, upper_line_.name);
}

} // namespace strategy_engine
