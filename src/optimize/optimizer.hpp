#pragma once

#include "backtest/backtest_config.hpp"
#include "backtest/backtester.hpp"
#include "backtest/performance_metrics.hpp"
#include "errors.hpp"
#include "indicators/technical_indicators.hpp"
#include "optimize/objective.hpp"
#include "optimize/optimization_result.hpp"
#include "optimize/parameter_grid.hpp"
#include "optimize/worker_pool.hpp"
#include "series/price_series.hpp"
#include "strategy/strategy_factory.hpp"
#include "strategy/strategy_spec.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// OptimizerConfig — how a sweep is ranked, sampled, parallelized and stopped
// ---------------------------------------------------------------------------
struct OptimizerConfig {
    Objective objective = Objective::SHARPE;
    size_t num_workers = 0;        // 0 = hardware concurrency
    size_t max_combinations = 0;   // 0 = the full grid
    uint64_t seed = 42;

    // Checked between combinations. Not owned.
    std::atomic<bool>* stop_flag = nullptr;
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

// ---------------------------------------------------------------------------
// OptimizationReport — ranked results of one sweep
// ---------------------------------------------------------------------------
struct OptimizationReport {
    Objective objective = Objective::SHARPE;
    std::vector<OptimizationResult> results;  // ranked
    size_t total_combinations = 0;
    size_t scheduled = 0;   // after sampling
    size_t evaluated = 0;
    size_t failed = 0;
    bool cancelled = false;

    // First OK result, or nullptr.
    const OptimizationResult* best() const {
        if (results.empty() || !results.front().ok()) return nullptr;
        return &results.front();
    }

    std::vector<OptimizationResult> top(size_t n) const {
        std::vector<OptimizationResult> out;
        for (const auto& r : results) {
            if (out.size() >= n) break;
            if (r.ok()) out.push_back(r);
        }
        return out;
    }
};

// ---------------------------------------------------------------------------
// Optimizer — runs one independent backtest per parameter combination
// ---------------------------------------------------------------------------
class Optimizer {
public:
    Optimizer(const BacktestConfig& backtest_cfg, const OptimizerConfig& cfg,
              std::shared_ptr<const IndicatorProvider> provider =
                  std::make_shared<TechnicalIndicators>())
        : backtester_(backtest_cfg, std::move(provider)), cfg_(cfg) {}

    const OptimizerConfig& config() const { return cfg_; }
    const Backtester& backtester() const { return backtester_; }

    // Backtest one spec. Per-run failures come back as FAILED results.
    OptimizationResult evaluate(const PriceSeries& series, const StrategySpec& spec,
                                const ParameterSet& label = {}) const {
        OptimizationResult result;
        result.strategy = strategy_kind_str(spec.kind);
        result.parameter_set = label;
        try {
            BacktestRun run = backtester_.run(spec, series);
            result.report = PerformanceMetrics::compute(run);
            result.data_gap_bars = run.data_gap_bars;
            result.rejected_buys = run.rejected_buys;
        } catch (const InvalidParameterError& e) {
            fail(result, ErrorKind::INVALID_PARAMETER, e.what());
        } catch (const EmptySeriesError& e) {
            fail(result, ErrorKind::EMPTY_SERIES, e.what());
        } catch (const std::exception& e) {
            fail(result, ErrorKind::INTERNAL, e.what());
        }
        return result;
    }

    // Evaluate every combination of `grid` applied on top of `base`.
    // Throws InvalidParameterError for a malformed grid before any run.
    OptimizationReport grid_search(const PriceSeries& series, const StrategySpec& base,
                                   const ParameterGrid& grid) const {
        grid.validate(StrategyFactory::accepted_parameters(base));

        std::vector<ParameterSet> combos;
        for (size_t i : sample_indices(grid.size())) combos.push_back(grid.at(i));

        OptimizationReport report = run_all(
            combos.size(),
            [&](size_t i) { return evaluate(series, base.with_params(combos[i]), combos[i]); });
        report.total_combinations = grid.size();
        return report;
    }

    // Run several complete specs on the same series and rank them together.
    OptimizationReport compare(const PriceSeries& series,
                               const std::vector<StrategySpec>& specs) const {
        if (specs.empty()) throw InvalidParameterError("Nothing to compare");
        OptimizationReport report = run_all(
            specs.size(), [&](size_t i) { return evaluate(series, specs[i], specs[i].params); });
        report.total_combinations = specs.size();
        return report;
    }

private:
    Backtester backtester_;
    OptimizerConfig cfg_;

    static void fail(OptimizationResult& r, ErrorKind kind, const std::string& msg) {
        r.status = ResultStatus::FAILED;
        r.error_kind = kind;
        r.error_message = msg;
        r.report = PerformanceReport{};
    }

    bool should_stop() const {
        if (cfg_.stop_flag && cfg_.stop_flag->load()) return true;
        if (cfg_.deadline && std::chrono::steady_clock::now() >= *cfg_.deadline) return true;
        return false;
    }

    // Grid indices to evaluate, ascending. A bounded sample is drawn without
    // replacement by a partial Fisher-Yates shuffle seeded from cfg_.seed.
    std::vector<size_t> sample_indices(size_t n) const {
        std::vector<size_t> idx(n);
        for (size_t i = 0; i < n; ++i) idx[i] = i;
        if (cfg_.max_combinations == 0 || cfg_.max_combinations >= n) return idx;

        std::mt19937_64 rng(cfg_.seed);
        size_t k = cfg_.max_combinations;
        for (size_t i = 0; i < k; ++i) {
            size_t j = i + static_cast<size_t>(rng() % (n - i));
            std::swap(idx[i], idx[j]);
        }
        idx.resize(k);
        std::sort(idx.begin(), idx.end());
        return idx;
    }

    template <typename Evaluate>
    OptimizationReport run_all(size_t count, Evaluate&& eval) const {
        std::vector<OptimizationResult> slots(count);
        std::vector<char> done(count, 0);

        WorkerPool pool(cfg_.num_workers);
        pool.for_each_index(
            count,
            [&](size_t i) {
                slots[i] = eval(i);
                done[i] = 1;
            },
            [&]() { return should_stop(); });

        OptimizationReport report;
        report.objective = cfg_.objective;
        report.scheduled = count;
        for (size_t i = 0; i < count; ++i) {
            if (!done[i]) continue;
            if (!slots[i].ok()) ++report.failed;
            report.results.push_back(std::move(slots[i]));
        }
        report.evaluated = report.results.size();
        report.cancelled = report.evaluated < count;
        optimization_ranking::sort_results(report.results, cfg_.objective);
        return report;
    }
};
