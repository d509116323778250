// backtest_run.cpp — Single-strategy backtest tool
// Loads a CSV price file, runs one strategy (optionally next to a
// buy-and-hold benchmark), prints a summary and writes the run as JSON or the
// trade ledger as CSV.

#include "backtest/backtest_config.hpp"
#include "backtest/backtest_result_io.hpp"
#include "backtest/backtester.hpp"
#include "backtest/performance_metrics.hpp"
#include "data/csv_series_loader.hpp"
#include "strategy/strategy_factory.hpp"
#include "strategy/strategy_spec.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

// "period=14" -> {"period", 14}
void add_param(ParameterSet& params, const std::string& kv) {
    auto eq = kv.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw InvalidParameterError("Bad --param '" + kv + "' (expected name=value)");
    }
    params[kv.substr(0, eq)] = std::stod(kv.substr(eq + 1));
}

void print_report(const std::string& label, const PerformanceReport& r, const BacktestRun& run) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "\n=== " << label << " ===\n";
    std::cout << "  Final equity:   " << r.final_equity << " (start " << r.initial_equity << ")\n";
    std::cout << "  Total return:   " << r.total_return_pct << "%\n";
    std::cout << "  Period:         " << r.backtest_days << " days (annualized "
              << r.annual_return_pct << "%)\n";
    std::cout << "  Trades:         " << r.num_trades << " (" << r.winning_trades << " won, "
              << r.losing_trades << " lost, " << r.forced_exits << " forced)\n";
    std::cout << "  Win rate:       " << r.win_rate * 100.0 << "%\n";
    std::cout << "  Profit factor:  " << r.profit_factor << "\n";
    std::cout << "  Sharpe:         " << r.sharpe_ratio << "\n";
    std::cout << "  Max drawdown:   " << r.max_drawdown_pct << "%\n";
    std::cout << "  Calmar:         " << r.calmar_ratio << "\n";
    std::cout << "  Fees:           " << r.total_fees << "\n";
    if (run.data_gap_bars > 0 || run.rejected_buys > 0) {
        std::cout << "  Data gaps:      " << run.data_gap_bars << " bars\n";
        std::cout << "  Rejected buys:  " << run.rejected_buys << "\n";
    }
}

}  // namespace

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --data <prices.csv> --strategy <kind> [options]\n"
              << "\n"
              << "  --data          CSV file: timestamp,open,high,low,close[,volume]\n"
              << "  --strategy      RSI, MACD, BOLLINGER, MA_CROSS, BUY_AND_HOLD, COMBINED\n"
              << "  --param         name=value, repeatable (COMBINED: 0.period=10)\n"
              << "  --children      COMBINED children, e.g. RSI,MACD,BOLLINGER\n"
              << "  --voting        MAJORITY, UNANIMOUS or QUORUM (default MAJORITY)\n"
              << "  --symbol        Symbol label (default: none)\n"
              << "  --interval      Bar interval: 1m, 5m, 15m, 1h, 4h, 1d (default 1h)\n"
              << "  --capital       Initial capital (default 10000)\n"
              << "  --fee           Fee rate per fill (default 0.001)\n"
              << "  --sizing        whole or fractional (default whole)\n"
              << "  --fraction      Fraction of cash per entry (default 1.0)\n"
              << "  --stop-loss     Stop-loss fraction, e.g. 0.02 (default off)\n"
              << "  --take-profit   Take-profit fraction, e.g. 0.05 (default off)\n"
              << "  --benchmark     Also run BUY_AND_HOLD on the same data\n"
              << "  --verbose       Log data gaps and rejected buys to stderr\n"
              << "  --output        Output file (.json run report or .csv trade ledger)\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string data_path;
    std::string strategy_name;
    std::string children_list;
    std::string voting = "MAJORITY";
    std::string symbol;
    std::string interval;
    std::string sizing = "whole";
    std::string output_path;
    std::vector<std::string> param_args;
    bool benchmark = false;
    bool verbose = false;
    BacktestConfig cfg;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--data" && i + 1 < argc) {
                data_path = argv[++i];
            } else if (arg == "--strategy" && i + 1 < argc) {
                strategy_name = argv[++i];
            } else if (arg == "--param" && i + 1 < argc) {
                param_args.push_back(argv[++i]);
            } else if (arg == "--children" && i + 1 < argc) {
                children_list = argv[++i];
            } else if (arg == "--voting" && i + 1 < argc) {
                voting = argv[++i];
            } else if (arg == "--symbol" && i + 1 < argc) {
                symbol = argv[++i];
            } else if (arg == "--interval" && i + 1 < argc) {
                interval = argv[++i];
            } else if (arg == "--capital" && i + 1 < argc) {
                cfg.initial_capital = std::stod(argv[++i]);
            } else if (arg == "--fee" && i + 1 < argc) {
                cfg.costs.fee_rate = std::stod(argv[++i]);
            } else if (arg == "--sizing" && i + 1 < argc) {
                sizing = argv[++i];
            } else if (arg == "--fraction" && i + 1 < argc) {
                cfg.capital_fraction = std::stod(argv[++i]);
            } else if (arg == "--stop-loss" && i + 1 < argc) {
                cfg.stop_loss_pct = std::stod(argv[++i]);
            } else if (arg == "--take-profit" && i + 1 < argc) {
                cfg.take_profit_pct = std::stod(argv[++i]);
            } else if (arg == "--benchmark") {
                benchmark = true;
            } else if (arg == "--verbose") {
                verbose = true;
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
        if (strategy_name.empty()) {
            std::cerr << "Missing required argument: --strategy\n";
            print_usage(argv[0]);
            return 1;
        }

        if (sizing == "whole") {
            cfg.sizing = SizingPolicy::WHOLE_UNITS;
        } else if (sizing == "fractional") {
            cfg.sizing = SizingPolicy::FRACTIONAL;
        } else {
            std::cerr << "Invalid --sizing '" << sizing << "' (whole or fractional)\n";
            return 1;
        }
        if (verbose) cfg.log = &std::cerr;

        StrategySpec spec;
        spec.kind = parse_strategy_kind(strategy_name);
        spec.voting = parse_voting_rule(voting);
        if (spec.kind == StrategyKind::COMBINED) spec.children = parse_child_specs(children_list);
        ParameterSet overrides;
        for (const auto& kv : param_args) add_param(overrides, kv);
        spec = spec.with_params(overrides);

        bool write_csv = false;
        if (!output_path.empty()) {
            std::string ext = std::filesystem::path(output_path).extension().string();
            if (ext == ".csv") {
                write_csv = true;
            } else if (ext != ".json") {
                std::cerr << "Unsupported output format. Use .json or .csv extension.\n";
                return 1;
            }
        }

        PriceSeries series = load_csv_series(data_path, symbol, interval);
        std::cout << "Loaded " << series.size() << " bars from " << data_path << "\n";
        std::cout << "Strategy: " << spec.describe() << "\n";

        Backtester backtester(cfg);
        BacktestRun run = backtester.run(spec, series);
        PerformanceReport report = PerformanceMetrics::compute(run);
        print_report(run.strategy_name, report, run);

        if (benchmark) {
            StrategySpec bench;
            bench.kind = StrategyKind::BUY_AND_HOLD;
            BacktestRun bench_run = backtester.run(bench, series);
            PerformanceReport bench_report = PerformanceMetrics::compute(bench_run);
            print_report("BUY_AND_HOLD benchmark", bench_report, bench_run);
            std::cout << "\n  Excess return vs benchmark: "
                      << report.total_return_pct - bench_report.total_return_pct << "%\n";
        }

        if (!output_path.empty()) {
            std::ofstream out(output_path);
            if (!out.is_open()) {
                std::cerr << "Cannot open output file: " << output_path << "\n";
                return 1;
            }
            if (write_csv) {
                out << backtest_io::trades_csv(run.trades);
            } else {
                out << backtest_io::to_json(run, report, cfg) << "\n";
            }
            std::cout << "\nOutput: " << output_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
