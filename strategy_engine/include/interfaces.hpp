#pragma once

#include <vector>
#include <string>

#include "datatypes.hpp" // Provides IndicatorPoint, Signal, SignalFamily

namespace strategy_engine {

    // The two most recent indicator points of one instrument.
    // `previous` is null when only one point exists; both are null for an empty sequence.
    struct MarketDataSnapshot {
        const core::IndicatorPoint* current_point = nullptr;
        const core::IndicatorPoint* previous_point = nullptr;

        static MarketDataSnapshot fromPoints(const core::TimeSeries<core::IndicatorPoint>& points) {
            MarketDataSnapshot snapshot;
            if (!points.empty()) {
                snapshot.current_point = &points.back();
            }
            if (points.size() >= 2) {
                snapshot.previous_point = &points[points.size() - 2];
            }
            return snapshot;
        }
    };

    // --- Signal Rule Interface ---
    // Produces the signal of one indicator family from the latest points.
    // A rule that cannot decide returns Hold and appends the reason to `diagnostics`.
    class ISignalRule {
    public:
        virtual ~ISignalRule() = default;

        virtual core::Signal evaluate(const MarketDataSnapshot& snapshot,
                                      std::vector<std::string>& diagnostics) const = 0;

        virtual core::SignalFamily getFamily() const = 0;

        virtual std::string describe() const = 0;
    };

} // namespace strategy_engine
