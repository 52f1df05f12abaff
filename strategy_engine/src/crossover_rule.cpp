#include "crossover_rule.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

CrossoverRule::CrossoverRule(core::SignalFamily family,
                             IndicatorLine fast_line,
                             IndicatorLine slow_line,
                             std::shared_ptr<spdlog::logger> logger)
    : family_(family),
      fast_line_(std::move(fast_line)),
      slow_line_(std::move(slow_line)),
      logger_(core::logging::orNull(std::move(logger)))
{
    if (!fast_line_.read || !slow_line_.read) {
        throw std::invalid_argument("CrossoverRule requires readable fast and slow lines.");
    }
    if (fast_line_.name == slow_line_.name) {
        throw std::invalid_argument("Cannot check cross condition for the same line: " + fast_line_.name);
    }
}

core::Signal CrossoverRule::evaluate(const MarketDataSnapshot& snapshot,
                                     std::vector<std::string>& diagnostics) const {
    const std::string family = core::utils::toString(family_);

    if (!snapshot.current_point || !snapshot.previous_point) {
        diagnostics.push_back(fmt::format("{}: insufficient history, a crossover needs two points", family));
        logger_->trace("CrossoverRule '{}' skipped: fewer than two points.", describe());
        return core::Signal::Hold;
    }

    auto fast_now = fast_line_.read(*snapshot.current_point);
    auto slow_now = slow_line_.read(*snapshot.current_point);
    auto fast_prev = fast_line_.read(*snapshot.previous_point);
    auto slow_prev = slow_line_.read(*snapshot.previous_point);

    if (!fast_now || !slow_now || !fast_prev || !slow_prev) {
        diagnostics.push_back(fmt::format("{}: {} or {} undefined on the last two points",
                                          family, fast_line_.name, slow_line_.name));
        logger_->trace("CrossoverRule '{}' skipped: undefined values.", describe());
        return core::Signal::Hold;
    }

    if (*fast_prev < *slow_prev && *fast_now > *slow_now) {
        return core::Signal::Buy;
    }
    if (*fast_prev > *slow_prev && *fast_now < *slow_now) {
        return core::Signal::Sell;
    }
    return core::Signal::Hold;
}

std::string CrossoverRule::describe() const {
    return fmt::format("{}: {} crosses {}", core::utils::toString(family_), fast_line_.name, slow_line_.name);
}

} // namespace strategy_engine
