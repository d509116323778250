#pragma once

#include "backtest/backtester.hpp"
#include "backtest/portfolio.hpp"
#include "backtest/trade_record.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

// ---------------------------------------------------------------------------
// PerformanceReport — summary statistics of one run
// ---------------------------------------------------------------------------
struct PerformanceReport {
    double total_return_pct = 0.0;
    double win_rate = 0.0;           // [0, 1]
    double sharpe_ratio = 0.0;
    double max_drawdown_pct = 0.0;   // [0, 100]
    double profit_factor = 0.0;      // +inf with trades and no losers
    int num_trades = 0;

    double initial_equity = 0.0;
    double final_equity = 0.0;
    int winning_trades = 0;
    int losing_trades = 0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double max_win = 0.0;
    double max_loss = 0.0;
    double annualized_volatility_pct = 0.0;
    double calmar_ratio = 0.0;
    double total_fees = 0.0;
    int forced_exits = 0;

    int64_t backtest_days = 0;       // first to last bar, truncated
    double annual_return_pct = 0.0;  // compounded over backtest_days; 0 when days == 0
};

// ---------------------------------------------------------------------------
// Equity-curve utilities
// ---------------------------------------------------------------------------
namespace backtest_util {

// r_i = e_i / e_{i-1} - 1 over consecutive points. A non-positive previous
// equity yields no return for that step.
inline std::vector<double> equity_returns(const std::vector<EquityPoint>& curve) {
    std::vector<double> r;
    if (curve.size() < 2) return r;
    r.reserve(curve.size() - 1);
    for (size_t i = 1; i < curve.size(); ++i) {
        double prev = curve[i - 1].equity;
        if (prev > 0.0) r.push_back(curve[i].equity / prev - 1.0);
    }
    return r;
}

inline double mean(const std::vector<double>& x) {
    if (x.empty()) return 0.0;
    double sum = 0.0;
    for (double v : x) sum += v;
    return sum / static_cast<double>(x.size());
}

// Sample (n - 1) standard deviation; 0 with fewer than two values.
inline double sample_std(const std::vector<double>& x) {
    if (x.size() < 2) return 0.0;
    double m = mean(x);
    double sum_sq = 0.0;
    for (double v : x) sum_sq += (v - m) * (v - m);
    return std::sqrt(sum_sq / static_cast<double>(x.size() - 1));
}

inline double compute_sharpe(const std::vector<double>& returns, double periods_per_year) {
    if (returns.size() < 2) return 0.0;
    double sd = sample_std(returns);
    if (!(sd > 0.0)) return 0.0;
    return mean(returns) / sd * std::sqrt(periods_per_year);
}

// Largest peak-to-trough decline as a percentage of the peak.
inline double compute_max_drawdown_pct(const std::vector<EquityPoint>& curve) {
    double peak = 0.0;
    double max_dd = 0.0;
    for (const auto& p : curve) {
        if (p.equity > peak) peak = p.equity;
        if (peak > 0.0) {
            double dd = (peak - p.equity) / peak;
            if (dd > max_dd) max_dd = dd;
        }
    }
    return std::clamp(max_dd * 100.0, 0.0, 100.0);
}

// ((1 + R)^(365 / days) - 1) * 100 for a total return of R percent.
inline double annualized_return_pct(double total_return_pct, int64_t days) {
    if (days <= 0) return 0.0;
    double growth = 1.0 + total_return_pct / 100.0;
    if (growth <= 0.0) return -100.0;
    return (std::pow(growth, time_utils::DAYS_PER_YEAR / static_cast<double>(days)) - 1.0) *
           100.0;
}

}  // namespace backtest_util

// ---------------------------------------------------------------------------
// PerformanceMetrics — pure reduction of a BacktestRun
// ---------------------------------------------------------------------------
class PerformanceMetrics {
public:
    static PerformanceReport compute(const BacktestRun& run) {
        PerformanceReport r{};
        r.initial_equity = run.initial_capital;
        r.final_equity = run.final_equity();
        if (r.initial_equity > 0.0) {
            r.total_return_pct = (r.final_equity / r.initial_equity - 1.0) * 100.0;
        }

        r.num_trades = static_cast<int>(run.trades.size());
        double gross_wins = 0.0;
        double gross_losses = 0.0;
        for (const auto& t : run.trades) {
            r.total_fees += t.fee_paid;
            if (t.is_forced_exit()) ++r.forced_exits;
            if (t.net_pnl > 0.0) {
                ++r.winning_trades;
                gross_wins += t.net_pnl;
                r.max_win = std::max(r.max_win, t.net_pnl);
            } else if (t.net_pnl < 0.0) {
                ++r.losing_trades;
                gross_losses += -t.net_pnl;
                r.max_loss = std::min(r.max_loss, t.net_pnl);
            }
        }

        if (r.num_trades > 0) {
            r.win_rate = static_cast<double>(r.winning_trades) / r.num_trades;
        }
        if (r.winning_trades > 0) r.avg_win = gross_wins / r.winning_trades;
        if (r.losing_trades > 0) r.avg_loss = -gross_losses / r.losing_trades;

        if (gross_losses > 0.0) {
            r.profit_factor = gross_wins / gross_losses;
        } else if (r.num_trades > 0) {
            r.profit_factor = std::numeric_limits<double>::infinity();
        }

        auto returns = backtest_util::equity_returns(run.equity_curve);
        r.sharpe_ratio = backtest_util::compute_sharpe(returns, run.periods_per_year);
        r.annualized_volatility_pct =
            backtest_util::sample_std(returns) * std::sqrt(run.periods_per_year) * 100.0;
        r.max_drawdown_pct = backtest_util::compute_max_drawdown_pct(run.equity_curve);
        if (r.max_drawdown_pct > 0.0) {
            r.calmar_ratio = r.total_return_pct / r.max_drawdown_pct;
        }

        if (!run.equity_curve.empty()) {
            r.backtest_days = time_utils::whole_days_between(run.equity_curve.front().ts,
                                                             run.equity_curve.back().ts);
        }
        r.annual_return_pct =
            backtest_util::annualized_return_pct(r.total_return_pct, r.backtest_days);
        return r;
    }
};
