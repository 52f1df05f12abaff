#pragma once

#include "indicators.hpp"
#include "indicator_config.hpp"
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace indicators {

// Stochastic KDJ. RSV is undefined before `length` bars and on a flat high/low range;
// K and D smooth it with alpha = 1/signal and carry the last value across gaps.
class KdjIndicator : public IIndicator {
public:
    explicit KdjIndicator(const KdjParams& params, std::shared_ptr<spdlog::logger> logger = nullptr);

    virtual ~KdjIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;
    const IndicatorLines& getResult() const override;
    void populate(core::TimeSeries<core::IndicatorPoint>& points) const override;

    static constexpr const char* kK = "KDJ_K";
    static constexpr const char* kD = "KDJ_D";
    static constexpr const char* kJ = "KDJ_J";

private:
    const KdjParams params_;
    std::string name_;
    IndicatorLines lines_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace indicators
