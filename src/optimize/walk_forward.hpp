#pragma once

#include "errors.hpp"
#include "optimize/objective.hpp"
#include "optimize/optimization_result.hpp"
#include "optimize/optimizer.hpp"
#include "optimize/parameter_grid.hpp"
#include "series/price_series.hpp"
#include "strategy/strategy_spec.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// WalkForwardConfig — rolling train / test window geometry, in bars
// ---------------------------------------------------------------------------
struct WalkForwardConfig {
    size_t train_bars = 0;
    size_t test_bars = 0;
    size_t step_bars = 0;    // 0 = test_bars
    size_t max_windows = 0;  // 0 = as many as fit

    size_t step() const { return step_bars == 0 ? test_bars : step_bars; }

    void validate(size_t series_size) const {
        if (train_bars == 0 || test_bars == 0) {
            throw InvalidParameterError("Walk-forward train_bars and test_bars must be > 0");
        }
        if (train_bars + test_bars > series_size) {
            throw InvalidParameterError(
                "Walk-forward window (" + std::to_string(train_bars) + " + " +
                std::to_string(test_bars) + " bars) exceeds series length " +
                std::to_string(series_size));
        }
    }
};

// ---------------------------------------------------------------------------
// WalkForwardWindow — one train/test split and its outcome
// ---------------------------------------------------------------------------
struct WalkForwardWindow {
    size_t index = 0;
    size_t train_begin = 0;
    size_t train_end = 0;   // exclusive
    size_t test_begin = 0;
    size_t test_end = 0;    // exclusive
    uint64_t test_start_ts = 0;
    uint64_t test_end_ts = 0;

    bool failed = false;
    std::string failure;
    size_t train_evaluated = 0;
    ParameterSet selected;
    double train_score = 0.0;
    double test_score = 0.0;
    PerformanceReport test_report;
};

// ---------------------------------------------------------------------------
// WalkForwardReport — per-window outcomes and out-of-sample aggregates
// ---------------------------------------------------------------------------
struct WalkForwardReport {
    Objective objective = Objective::SHARPE;
    std::vector<WalkForwardWindow> windows;
    size_t successful_windows = 0;
    double mean_test_score = 0.0;
    double std_test_score = 0.0;      // sample std
    double mean_test_return_pct = 0.0;
    double consistency_pct = 0.0;     // windows with a positive test return
    bool cancelled = false;

    // Parameters chosen on the most recent successful window, carrying every
    // window's test score in walk_forward_scores.
    OptimizationResult final_result;
};

// ---------------------------------------------------------------------------
// WalkForwardRunner — optimize on each train window, score on the next test
// window. Each search sees a slice holding only its train bars.
// ---------------------------------------------------------------------------
class WalkForwardRunner {
public:
    WalkForwardRunner(const Optimizer& optimizer, const WalkForwardConfig& cfg)
        : optimizer_(optimizer), cfg_(cfg) {}

    // Window bounds for a series of `n` bars. Windows start every step() bars
    // while a full train window still leaves at least one test bar; the last
    // test window is clipped to the end of the series.
    static std::vector<WalkForwardWindow> plan(size_t n, const WalkForwardConfig& cfg) {
        cfg.validate(n);
        std::vector<WalkForwardWindow> out;
        size_t step = cfg.step();
        for (size_t start = 0; start + cfg.train_bars < n; start += step) {
            if (cfg.max_windows > 0 && out.size() >= cfg.max_windows) break;
            WalkForwardWindow w;
            w.index = out.size();
            w.train_begin = start;
            w.train_end = start + cfg.train_bars;
            w.test_begin = w.train_end;
            w.test_end = std::min(w.test_begin + cfg.test_bars, n);
            out.push_back(w);
        }
        return out;
    }

    WalkForwardReport run(const PriceSeries& series, const StrategySpec& base,
                          const ParameterGrid& grid) const {
        grid.validate(StrategyFactory::accepted_parameters(base));

        WalkForwardReport report;
        report.objective = optimizer_.config().objective;
        report.windows = plan(series.size(), cfg_);

        for (size_t k = 0; k < report.windows.size(); ++k) {
            WalkForwardWindow& w = report.windows[k];
            PriceSeries train = series.slice(w.train_begin, w.train_end);
            PriceSeries test = series.slice(w.test_begin, w.test_end);
            w.test_start_ts = test.front().ts;
            w.test_end_ts = test.back().ts;

            OptimizationReport search = optimizer_.grid_search(train, base, grid);
            w.train_evaluated = search.evaluated;
            if (search.cancelled) {
                report.cancelled = true;
                w.failed = true;
                w.failure = "cancelled";
                report.windows.resize(k + 1);
                break;
            }

            const OptimizationResult* best = search.best();
            if (!best) {
                w.failed = true;
                w.failure = "no valid parameter set on train window";
                continue;
            }
            w.selected = best->parameter_set;
            w.train_score = objective_value(best->report, report.objective);

            OptimizationResult oos =
                optimizer_.evaluate(test, base.with_params(w.selected), w.selected);
            if (!oos.ok()) {
                w.failed = true;
                w.failure = oos.error_message;
                continue;
            }
            w.test_report = oos.report;
            w.test_score = objective_value(oos.report, report.objective);
        }

        aggregate(report, base);
        return report;
    }

private:
    Optimizer optimizer_;
    WalkForwardConfig cfg_;

    static void aggregate(WalkForwardReport& report, const StrategySpec& base) {
        std::vector<double> scores;
        double return_sum = 0.0;
        size_t positive = 0;
        const WalkForwardWindow* last = nullptr;

        for (const auto& w : report.windows) {
            if (w.failed) continue;
            scores.push_back(w.test_score);
            return_sum += w.test_report.total_return_pct;
            if (w.test_report.total_return_pct > 0.0) ++positive;
            last = &w;
        }

        report.successful_windows = scores.size();
        OptimizationResult& fin = report.final_result;
        fin.strategy = strategy_kind_str(base.kind);
        if (scores.empty()) {
            fin.status = ResultStatus::FAILED;
            fin.error_kind = ErrorKind::INVALID_PARAMETER;
            fin.error_message = "no walk-forward window produced a valid parameter set";
            return;
        }

        double n = static_cast<double>(scores.size());
        report.mean_test_score = backtest_util::mean(scores);
        report.std_test_score = backtest_util::sample_std(scores);
        report.mean_test_return_pct = return_sum / n;
        report.consistency_pct = static_cast<double>(positive) / n * 100.0;

        fin.parameter_set = last->selected;
        fin.report = last->test_report;
        fin.walk_forward_scores = scores;
    }
};
