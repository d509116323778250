#pragma once

#include "backtest/backtest_result_io.hpp"
#include "optimize/optimization_result.hpp"
#include "optimize/optimizer.hpp"
#include "optimize/walk_forward.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace backtest_io {

inline std::string to_json(const OptimizationResult& r) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"strategy\":\"" << json_escape(r.strategy) << "\"";
    ss << ",\"parameters\":" << to_json(r.parameter_set);
    ss << ",\"status\":\"" << result_status_str(r.status) << "\"";
    if (!r.ok()) {
        ss << ",\"error_kind\":\"" << error_kind_str(r.error_kind) << "\"";
        ss << ",\"error_message\":\"" << json_escape(r.error_message) << "\"";
    } else {
        ss << ",\"report\":" << to_json(r.report);
    }
    if (!r.walk_forward_scores.empty()) {
        ss << ",\"walk_forward_scores\":[";
        for (size_t i = 0; i < r.walk_forward_scores.size(); ++i) {
            if (i > 0) ss << ",";
            ss << json_number(r.walk_forward_scores[i]);
        }
        ss << "]";
    }
    ss << "}";
    return ss.str();
}

inline std::string to_json(const OptimizationReport& report) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"objective\":\"" << objective_str(report.objective) << "\"";
    ss << ",\"total_combinations\":" << report.total_combinations;
    ss << ",\"scheduled\":" << report.scheduled;
    ss << ",\"evaluated\":" << report.evaluated;
    ss << ",\"failed\":" << report.failed;
    ss << ",\"cancelled\":" << (report.cancelled ? "true" : "false");
    ss << ",\"results\":[";
    for (size_t i = 0; i < report.results.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(report.results[i]);
    }
    ss << "]";
    ss << "}";
    return ss.str();
}

inline std::string to_json(const WalkForwardReport& report) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"objective\":\"" << objective_str(report.objective) << "\"";
    ss << ",\"successful_windows\":" << report.successful_windows;
    ss << ",\"mean_test_score\":" << json_number(report.mean_test_score);
    ss << ",\"std_test_score\":" << json_number(report.std_test_score);
    ss << ",\"mean_test_return_pct\":" << json_number(report.mean_test_return_pct);
    ss << ",\"consistency_pct\":" << json_number(report.consistency_pct);
    ss << ",\"cancelled\":" << (report.cancelled ? "true" : "false");
    ss << ",\"windows\":[";
    for (size_t i = 0; i < report.windows.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& w = report.windows[i];
        ss << "{";
        ss << "\"index\":" << w.index;
        ss << ",\"train_begin\":" << w.train_begin;
        ss << ",\"train_end\":" << w.train_end;
        ss << ",\"test_begin\":" << w.test_begin;
        ss << ",\"test_end\":" << w.test_end;
        ss << ",\"failed\":" << (w.failed ? "true" : "false");
        if (w.failed) {
            ss << ",\"failure\":\"" << json_escape(w.failure) << "\"";
        } else {
            ss << ",\"selected\":" << to_json(w.selected);
            ss << ",\"train_score\":" << json_number(w.train_score);
            ss << ",\"test_score\":" << json_number(w.test_score);
            ss << ",\"test_return_pct\":" << json_number(w.test_report.total_return_pct);
        }
        ss << "}";
    }
    ss << "]";
    ss << ",\"final\":" << to_json(report.final_result);
    ss << "}";
    return ss.str();
}

// Ranked results as CSV; one column per swept parameter.
inline std::string results_csv(const std::vector<OptimizationResult>& results) {
    std::vector<std::string> names;
    for (const auto& r : results) {
        for (const auto& [k, v] : r.parameter_set) {
            if (std::find(names.begin(), names.end(), k) == names.end()) names.push_back(k);
        }
    }
    std::sort(names.begin(), names.end());

    std::ostringstream ss;
    ss << std::setprecision(12);
    ss << "rank,strategy,status";
    for (const auto& n : names) ss << "," << n;
    ss << ",total_return_pct,win_rate,sharpe_ratio,max_drawdown_pct,profit_factor,num_trades,"
          "annual_return_pct,backtest_days,error\n";
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        ss << (i + 1) << "," << r.strategy << "," << result_status_str(r.status);
        for (const auto& n : names) {
            auto it = r.parameter_set.find(n);
            ss << ",";
            if (it != r.parameter_set.end()) ss << it->second;
        }
        const auto& p = r.report;
        ss << "," << p.total_return_pct << "," << p.win_rate << "," << p.sharpe_ratio << ","
           << p.max_drawdown_pct << "," << p.profit_factor << "," << p.num_trades << ","
           << p.annual_return_pct << "," << p.backtest_days << ",";
        if (!r.ok()) ss << error_kind_str(r.error_kind);
        ss << "\n";
    }
    return ss.str();
}

}  // namespace backtest_io
