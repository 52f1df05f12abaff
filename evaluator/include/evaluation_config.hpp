#pragma once

#include <nlohmann/json.hpp>

namespace evaluator {

    struct EvaluationConfig {
        double risk_free_rate = 0.03;    // annual
        int trading_days_per_year = 252; // Sharpe annualization
        int days_per_year = 365;         // annual return compounding

        void validate() const;

        static EvaluationConfig fromJson(const nlohmann::json& j);
    };

} // namespace evaluator
