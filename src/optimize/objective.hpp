#pragma once

#include "backtest/performance_metrics.hpp"
#include "errors.hpp"
#include "strategy/strategy_spec.hpp"

#include <string>

// Ranking key for optimization. MAX_DRAWDOWN ranks ascending, the rest descending.
enum class Objective { SHARPE, TOTAL_RETURN, PROFIT_FACTOR, WIN_RATE, CALMAR, MAX_DRAWDOWN };

inline std::string objective_str(Objective o) {
    switch (o) {
        case Objective::SHARPE:        return "SHARPE";
        case Objective::TOTAL_RETURN:  return "TOTAL_RETURN";
        case Objective::PROFIT_FACTOR: return "PROFIT_FACTOR";
        case Objective::WIN_RATE:      return "WIN_RATE";
        case Objective::CALMAR:        return "CALMAR";
        case Objective::MAX_DRAWDOWN:  return "MAX_DRAWDOWN";
        default: return "UNKNOWN";
    }
}

inline Objective parse_objective(const std::string& name) {
    std::string s = to_upper(name);
    if (s == "SHARPE") return Objective::SHARPE;
    if (s == "TOTAL_RETURN" || s == "RETURN") return Objective::TOTAL_RETURN;
    if (s == "PROFIT_FACTOR") return Objective::PROFIT_FACTOR;
    if (s == "WIN_RATE") return Objective::WIN_RATE;
    if (s == "CALMAR") return Objective::CALMAR;
    if (s == "MAX_DRAWDOWN" || s == "DRAWDOWN") return Objective::MAX_DRAWDOWN;
    throw InvalidParameterError("Unknown objective: " + name);
}

inline double objective_value(const PerformanceReport& r, Objective o) {
    switch (o) {
        case Objective::SHARPE:        return r.sharpe_ratio;
        case Objective::TOTAL_RETURN:  return r.total_return_pct;
        case Objective::PROFIT_FACTOR: return r.profit_factor;
        case Objective::WIN_RATE:      return r.win_rate;
        case Objective::CALMAR:        return r.calmar_ratio;
        case Objective::MAX_DRAWDOWN:  return r.max_drawdown_pct;
    }
    return 0.0;
}

inline bool higher_is_better(Objective o) { return o != Objective::MAX_DRAWDOWN; }

// Strictly better objective value; equal values are not better.
inline bool objective_better(double a, double b, Objective o) {
    return higher_is_better(o) ? a > b : a < b;
}
