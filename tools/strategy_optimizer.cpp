// strategy_optimizer.cpp — Parameter sweep and walk-forward tool
// Loads a CSV price file, sweeps a parameter grid for one strategy (or
// compares every strategy at its defaults), ranks the results and writes
// them as JSON, CSV or Parquet. Ctrl-C stops the sweep between combinations
// and keeps what was evaluated.

#include "backtest/backtest_config.hpp"
#include "data/csv_series_loader.hpp"
#include "optimize/optimization_io.hpp"
#include "optimize/optimizer.hpp"
#include "optimize/parameter_grid.hpp"
#include "optimize/result_filter.hpp"
#include "optimize/results_parquet.hpp"
#include "optimize/walk_forward.hpp"
#include "strategy/strategy_factory.hpp"
#include "strategy/strategy_spec.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::atomic<bool> g_stop{false};

void on_interrupt(int) { g_stop.store(true); }

void print_results(const std::vector<OptimizationResult>& results, size_t top) {
    std::cout << std::fixed << std::setprecision(2);
    size_t shown = 0;
    for (const auto& r : results) {
        if (shown >= top) break;
        ++shown;
        std::cout << "  #" << shown << " " << r.strategy << " "
                  << params::to_string(r.parameter_set);
        if (!r.ok()) {
            std::cout << "  FAILED (" << error_kind_str(r.error_kind) << "): "
                      << r.error_message << "\n";
            continue;
        }
        std::cout << "  return=" << r.report.total_return_pct << "%"
                  << " sharpe=" << r.report.sharpe_ratio
                  << " maxdd=" << r.report.max_drawdown_pct << "%"
                  << " trades=" << r.report.num_trades
                  << " win=" << r.report.win_rate * 100.0 << "%\n";
    }
}

}  // namespace

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --data <prices.csv> --strategy <kind> --grid <axes> [options]\n"
              << "       " << prog << " --data <prices.csv> --compare\n"
              << "\n"
              << "  --data              CSV file: timestamp,open,high,low,close[,volume]\n"
              << "  --strategy          RSI, MACD, BOLLINGER, MA_CROSS, COMBINED\n"
              << "  --children          COMBINED children, e.g. RSI,MACD,BOLLINGER\n"
              << "  --voting            MAJORITY, UNANIMOUS or QUORUM\n"
              << "  --grid              Axes, e.g. \"fast=8:14:1;slow=20,26,30\"\n"
              << "  --compare           Rank every strategy at its defaults plus BUY_AND_HOLD\n"
              << "  --objective         SHARPE, TOTAL_RETURN, PROFIT_FACTOR, WIN_RATE, CALMAR,\n"
              << "                      MAX_DRAWDOWN (default SHARPE)\n"
              << "  --workers           Worker threads (default: hardware concurrency)\n"
              << "  --max-combinations  Random sample size (default: full grid)\n"
              << "  --seed              Sampling seed (default 42)\n"
              << "  --timeout-s         Stop the sweep after this many seconds\n"
              << "  --interval          Bar interval: 1m, 5m, 15m, 1h, 4h, 1d (default 1h)\n"
              << "  --capital           Initial capital (default 10000)\n"
              << "  --fee               Fee rate per fill (default 0.001)\n"
              << "  --min-trades        Filter: minimum trade count\n"
              << "  --min-profit-factor Filter: minimum profit factor\n"
              << "  --min-win-rate      Filter: minimum win rate in [0, 1]\n"
              << "  --max-drawdown      Filter: maximum drawdown percent\n"
              << "  --wf-train          Walk-forward train window in bars\n"
              << "  --wf-test           Walk-forward test window in bars\n"
              << "  --wf-step           Walk-forward step in bars (default: test window)\n"
              << "  --top               Results to print (default 10)\n"
              << "  --output            Output file (.json, .csv or .parquet)\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string data_path;
    std::string strategy_name;
    std::string children_list;
    std::string voting = "MAJORITY";
    std::string grid_text;
    std::string interval;
    std::string output_path;
    bool compare = false;
    double timeout_s = 0.0;
    size_t top = 10;
    BacktestConfig bt_cfg;
    OptimizerConfig opt_cfg;
    ResultFilter filter;
    WalkForwardConfig wf_cfg;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--data" && i + 1 < argc) {
                data_path = argv[++i];
            } else if (arg == "--strategy" && i + 1 < argc) {
                strategy_name = argv[++i];
            } else if (arg == "--children" && i + 1 < argc) {
                children_list = argv[++i];
            } else if (arg == "--voting" && i + 1 < argc) {
                voting = argv[++i];
            } else if (arg == "--grid" && i + 1 < argc) {
                grid_text = argv[++i];
            } else if (arg == "--compare") {
                compare = true;
            } else if (arg == "--objective" && i + 1 < argc) {
                opt_cfg.objective = parse_objective(argv[++i]);
            } else if (arg == "--workers" && i + 1 < argc) {
                opt_cfg.num_workers = std::stoul(argv[++i]);
            } else if (arg == "--max-combinations" && i + 1 < argc) {
                opt_cfg.max_combinations = std::stoul(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                opt_cfg.seed = std::stoull(argv[++i]);
            } else if (arg == "--timeout-s" && i + 1 < argc) {
                timeout_s = std::stod(argv[++i]);
            } else if (arg == "--interval" && i + 1 < argc) {
                interval = argv[++i];
            } else if (arg == "--capital" && i + 1 < argc) {
                bt_cfg.initial_capital = std::stod(argv[++i]);
            } else if (arg == "--fee" && i + 1 < argc) {
                bt_cfg.costs.fee_rate = std::stod(argv[++i]);
            } else if (arg == "--min-trades" && i + 1 < argc) {
                filter.min_trades = std::stoi(argv[++i]);
            } else if (arg == "--min-profit-factor" && i + 1 < argc) {
                filter.min_profit_factor = std::stod(argv[++i]);
            } else if (arg == "--min-win-rate" && i + 1 < argc) {
                filter.min_win_rate = std::stod(argv[++i]);
            } else if (arg == "--max-drawdown" && i + 1 < argc) {
                filter.max_drawdown_pct = std::stod(argv[++i]);
            } else if (arg == "--wf-train" && i + 1 < argc) {
                wf_cfg.train_bars = std::stoul(argv[++i]);
            } else if (arg == "--wf-test" && i + 1 < argc) {
                wf_cfg.test_bars = std::stoul(argv[++i]);
            } else if (arg == "--wf-step" && i + 1 < argc) {
                wf_cfg.step_bars = std::stoul(argv[++i]);
            } else if (arg == "--top" && i + 1 < argc) {
                top = std::stoul(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        if (data_path.empty()) {
            std::cerr << "Missing required argument: --data\n";
            print_usage(argv[0]);
            return 1;
        }
        if (!compare && (strategy_name.empty() || grid_text.empty())) {
            std::cerr << "Missing required argument: --strategy and --grid (or --compare)\n";
            print_usage(argv[0]);
            return 1;
        }

        // Detect output format by file extension
        std::string ext;
        if (!output_path.empty()) {
            ext = std::filesystem::path(output_path).extension().string();
            if (ext != ".json" && ext != ".csv" && ext != ".parquet") {
                std::cerr << "Unsupported output format. Use .json, .csv or .parquet extension.\n";
                return 1;
            }
        }

        std::signal(SIGINT, on_interrupt);
        opt_cfg.stop_flag = &g_stop;
        if (timeout_s > 0.0) {
            opt_cfg.deadline = std::chrono::steady_clock::now() +
                std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                    std::chrono::duration<double>(timeout_s));
        }

        PriceSeries series = load_csv_series(data_path, "", interval);
        std::cout << "Loaded " << series.size() << " bars from " << data_path << "\n";

        Optimizer optimizer(bt_cfg, opt_cfg);
        bool walk_forward = wf_cfg.train_bars > 0 || wf_cfg.test_bars > 0;

        StrategySpec base;
        if (!compare) {
            base.kind = parse_strategy_kind(strategy_name);
            base.voting = parse_voting_rule(voting);
            if (base.kind == StrategyKind::COMBINED) {
                base.children = parse_child_specs(children_list);
            }
        }

        if (walk_forward) {
            if (compare) {
                std::cerr << "--compare cannot be combined with walk-forward windows\n";
                return 1;
            }
            ParameterGrid grid = ParameterGrid::parse(grid_text);
            WalkForwardRunner runner(optimizer, wf_cfg);
            WalkForwardReport wf = runner.run(series, base, grid);

            std::cout << "\n=== Walk-forward " << base.describe() << " ("
                      << objective_str(wf.objective) << ") ===\n";
            std::cout << std::fixed << std::setprecision(2);
            for (const auto& w : wf.windows) {
                std::cout << "  window " << w.index << " train [" << w.train_begin << ", "
                          << w.train_end << ") test [" << w.test_begin << ", " << w.test_end
                          << ")";
                if (w.failed) {
                    std::cout << "  FAILED: " << w.failure << "\n";
                } else {
                    std::cout << "  " << params::to_string(w.selected)
                              << "  test return=" << w.test_report.total_return_pct << "%"
                              << " score=" << w.test_score << "\n";
                }
            }
            std::cout << "  Mean test score:  " << wf.mean_test_score << " (std "
                      << wf.std_test_score << ")\n";
            std::cout << "  Mean test return: " << wf.mean_test_return_pct << "%\n";
            std::cout << "  Consistency:      " << wf.consistency_pct << "%\n";
            if (wf.final_result.ok()) {
                std::cout << "  Final parameters: "
                          << params::to_string(wf.final_result.parameter_set) << "\n";
            }

            if (!output_path.empty()) {
                if (ext == ".parquet") {
                    results_parquet::write(output_path, {wf.final_result});
                } else {
                    std::ofstream out(output_path);
                    if (!out.is_open()) {
                        std::cerr << "Cannot open output file: " << output_path << "\n";
                        return 1;
                    }
                    if (ext == ".csv") {
                        out << backtest_io::results_csv({wf.final_result});
                    } else {
                        out << backtest_io::to_json(wf) << "\n";
                    }
                }
                std::cout << "\nOutput: " << output_path << "\n";
            }
            return wf.cancelled ? 130 : 0;
        }

        OptimizationReport report;
        if (compare) {
            std::vector<StrategySpec> specs;
            for (auto kind : {StrategyKind::RSI, StrategyKind::MACD, StrategyKind::BOLLINGER,
                              StrategyKind::MA_CROSS, StrategyKind::BUY_AND_HOLD}) {
                StrategySpec s;
                s.kind = kind;
                specs.push_back(s);
            }
            report = optimizer.compare(series, specs);
        } else {
            ParameterGrid grid = ParameterGrid::parse(grid_text);
            std::cout << "Sweeping " << base.describe() << " over " << grid.size()
                      << " combinations\n";
            report = optimizer.grid_search(series, base, grid);
        }

        std::vector<OptimizationResult> kept = filter.apply(report.results);
        std::cout << "\n=== Results (" << objective_str(report.objective) << ") ===\n";
        std::cout << "  Evaluated " << report.evaluated << "/" << report.scheduled
                  << " (" << report.failed << " failed, " << kept.size()
                  << " pass filter)" << (report.cancelled ? " [cancelled]" : "") << "\n";
        print_results(kept, top);

        if (!output_path.empty()) {
            if (ext == ".parquet") {
                results_parquet::write(output_path, kept);
            } else {
                std::ofstream out(output_path);
                if (!out.is_open()) {
                    std::cerr << "Cannot open output file: " << output_path << "\n";
                    return 1;
                }
                if (ext == ".csv") {
                    out << backtest_io::results_csv(kept);
                } else {
                    OptimizationReport filtered = report;
                    filtered.results = kept;
                    out << backtest_io::to_json(filtered) << "\n";
                }
            }
            std::cout << "\nOutput: " << output_path << "\n";
        }
        return report.cancelled ? 130 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
