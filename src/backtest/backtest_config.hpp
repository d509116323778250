#pragma once

#include "backtest/execution_costs.hpp"
#include "errors.hpp"
#include "series/price_series.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <ostream>
#include <string>

enum class SizingPolicy { WHOLE_UNITS, FRACTIONAL };

inline std::string sizing_policy_str(SizingPolicy p) {
    switch (p) {
        case SizingPolicy::WHOLE_UNITS: return "WHOLE_UNITS";
        case SizingPolicy::FRACTIONAL:  return "FRACTIONAL";
        default: return "UNKNOWN";
    }
}

// ---------------------------------------------------------------------------
// BacktestConfig — settings for one simulation run
// ---------------------------------------------------------------------------
struct BacktestConfig {
    double initial_capital = 10000.0;
    ExecutionCosts costs;  // fee_rate 0.001
    SizingPolicy sizing = SizingPolicy::WHOLE_UNITS;
    double capital_fraction = 1.0;

    // Fractions of the entry price; 0 disables the exit.
    double stop_loss_pct = 0.0;
    double take_profit_pct = 0.0;

    // 0 derives the annualization factor from the series interval (1h when unset).
    double periods_per_year = 0.0;

    // Optional sink for run notes (rejected buys, data gaps). Not owned.
    std::ostream* log = nullptr;

    void validate() const {
        costs.validate();
        if (!(initial_capital > 0.0) || !std::isfinite(initial_capital)) {
            throw InvalidParameterError("initial_capital must be > 0, got " +
                                        std::to_string(initial_capital));
        }
        if (!(capital_fraction > 0.0 && capital_fraction <= 1.0)) {
            throw InvalidParameterError("capital_fraction must lie within (0, 1], got " +
                                        std::to_string(capital_fraction));
        }
        if (!(stop_loss_pct >= 0.0) || !(take_profit_pct >= 0.0)) {
            throw InvalidParameterError("stop_loss_pct and take_profit_pct must be >= 0");
        }
        if (!(periods_per_year >= 0.0)) {
            throw InvalidParameterError("periods_per_year must be >= 0");
        }
    }

    double annualization(const PriceSeries& series) const {
        if (periods_per_year > 0.0) return periods_per_year;
        const std::string& iv = series.interval();
        return time_utils::periods_per_year(iv.empty() ? time_utils::DEFAULT_INTERVAL : iv);
    }
};
