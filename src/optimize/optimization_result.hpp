#pragma once

#include "backtest/performance_metrics.hpp"
#include "errors.hpp"
#include "optimize/objective.hpp"
#include "strategy/parameter_set.hpp"

#include <algorithm>
#include <string>
#include <vector>

enum class ResultStatus { OK, FAILED };

inline std::string result_status_str(ResultStatus s) {
    return s == ResultStatus::OK ? "OK" : "FAILED";
}

// ---------------------------------------------------------------------------
// OptimizationResult — one evaluated parameter combination
// ---------------------------------------------------------------------------
struct OptimizationResult {
    std::string strategy;
    ParameterSet parameter_set;
    PerformanceReport report;
    ResultStatus status = ResultStatus::OK;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;
    int data_gap_bars = 0;
    int rejected_buys = 0;

    // Test-window objective scores, walk-forward only.
    std::vector<double> walk_forward_scores;

    bool ok() const { return status == ResultStatus::OK; }
};

namespace optimization_ranking {

// OK before FAILED; then objective; then higher total return; then parameter
// set ascending.
inline bool ranks_before(const OptimizationResult& a, const OptimizationResult& b,
                         Objective objective) {
    if (a.ok() != b.ok()) return a.ok();
    if (a.ok()) {
        double va = objective_value(a.report, objective);
        double vb = objective_value(b.report, objective);
        if (objective_better(va, vb, objective)) return true;
        if (objective_better(vb, va, objective)) return false;
        if (a.report.total_return_pct != b.report.total_return_pct) {
            return a.report.total_return_pct > b.report.total_return_pct;
        }
    }
    if (a.parameter_set != b.parameter_set) return a.parameter_set < b.parameter_set;
    return a.strategy < b.strategy;
}

inline void sort_results(std::vector<OptimizationResult>& results, Objective objective) {
    std::stable_sort(results.begin(), results.end(),
                     [objective](const OptimizationResult& a, const OptimizationResult& b) {
                         return ranks_before(a, b, objective);
                     });
}

}  // namespace optimization_ranking
