#pragma once

#include "backtest/performance_metrics.hpp"
#include "optimize/optimization_result.hpp"

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// FilterAssessment — which thresholds a result met
// ---------------------------------------------------------------------------
struct FilterAssessment {
    bool passed = false;
    bool trade_count_passed = false;
    bool profit_factor_passed = false;
    bool win_rate_passed = false;
    bool drawdown_passed = false;

    std::string decision = "REJECT";
};

// ---------------------------------------------------------------------------
// ResultFilter — minimum-quality thresholds for optimization results.
// Defaults accept everything.
// ---------------------------------------------------------------------------
struct ResultFilter {
    int min_trades = 0;
    double min_profit_factor = 0.0;
    double min_win_rate = 0.0;
    double max_drawdown_pct = 100.0;

    FilterAssessment evaluate(const PerformanceReport& r) const {
        FilterAssessment a{};
        a.trade_count_passed = r.num_trades >= min_trades;
        a.profit_factor_passed = r.profit_factor >= min_profit_factor;
        a.win_rate_passed = r.win_rate >= min_win_rate;
        a.drawdown_passed = r.max_drawdown_pct <= max_drawdown_pct;

        a.passed = a.trade_count_passed && a.profit_factor_passed &&
                   a.win_rate_passed && a.drawdown_passed;
        a.decision = a.passed ? "ACCEPT" : "REJECT";
        return a;
    }

    bool accepts(const OptimizationResult& result) const {
        return result.ok() && evaluate(result.report).passed;
    }

    // Accepted results, order preserved.
    std::vector<OptimizationResult> apply(const std::vector<OptimizationResult>& results) const {
        std::vector<OptimizationResult> out;
        for (const auto& r : results) {
            if (accepts(r)) out.push_back(r);
        }
        return out;
    }
};
