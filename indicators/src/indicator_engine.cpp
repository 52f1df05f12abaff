#include "indicator_engine.hpp"
#include "sma_indicator.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"
#include "kdj_indicator.hpp"
#include "bollinger_indicator.hpp"
#include "logging.hpp"
#include "exceptions.hpp"

namespace indicators {

    IndicatorEngine::IndicatorEngine(IndicatorConfig config, std::shared_ptr<spdlog::logger> logger)
        : config_(std::move(config)), logger_(core::logging::orNull(std::move(logger)))
    {
        config_.validate();
        logger_->debug("IndicatorEngine initialized with {} indicators", createIndicators().size());
    }

    std::vector<std::unique_ptr<IIndicator>> IndicatorEngine::createIndicators() const {
        std::vector<std::unique_ptr<IIndicator>> created;
        for (int period : config_.ma_periods) {
            created.push_back(std::make_unique<SmaIndicator>(period, SourceField::Close, logger_));
        }
        created.push_back(std::make_unique<MacdIndicator>(config_.macd, logger_));
        for (int period : config_.rsi_periods) {
            created.push_back(std::make_unique<RsiIndicator>(period, logger_));
        }
        created.push_back(std::make_unique<KdjIndicator>(config_.kdj, logger_));
        created.push_back(std::make_unique<BollingerIndicator>(config_.bollinger, logger_));
        for (int period : config_.volume_ma_periods) {
            created.push_back(std::make_unique<SmaIndicator>(period, SourceField::Volume, logger_));
        }
        return created;
    }

    std::vector<std::string> IndicatorEngine::getIndicatorNames() const {
        std::vector<std::string> names;
        for (const auto& indicator : createIndicators()) {
            names.push_back(indicator->getName());
        }
        return names;
    }

    core::TimeSeries<core::IndicatorPoint> IndicatorEngine::calculate(const core::TimeSeries<core::Bar>& bars) const {
        core::TimeSeries<core::IndicatorPoint> points;
        if (bars.empty()) {
            logger_->debug("IndicatorEngine received no bars; returning no points.");
            return points;
        }

        points.reserve(bars.size());
        for (const auto& bar : bars) {
            core::IndicatorPoint point;
            point.date = bar.date;
            point.close = bar.close;
            point.volume = bar.volume;
            points.push_back(std::move(point));
        }

        auto indicators = createIndicators();
        for (auto& indicator : indicators) {
            try {
                indicator->calculate(bars);
            } catch (const core::IndicatorCalculationException& e) {
                logger_->error("Indicator {} failed for {}: {}", indicator->getName(), bars.front().code, e.what());
                throw;
            }
            indicator->populate(points);
        }

        logger_->debug("Calculated {} indicators over {} bars for {} ({} to {})",
                       indicators.size(), bars.size(), bars.front().code, bars.front().date, bars.back().date);
        return points;
    }

} // namespace indicators
