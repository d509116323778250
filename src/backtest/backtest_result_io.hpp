#pragma once

#include "backtest/backtest_config.hpp"
#include "backtest/backtester.hpp"
#include "backtest/performance_metrics.hpp"
#include "backtest/trade_record.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace backtest_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            default:   result += c;
        }
    }
    return result;
}

// JSON has no infinity or NaN: +inf -> "inf", -inf -> "-inf", NaN -> null.
inline std::string json_number(double v) {
    if (std::isnan(v)) return "null";
    if (std::isinf(v)) return v > 0 ? "\"inf\"" : "\"-inf\"";
    std::ostringstream ss;
    ss << std::setprecision(12) << v;
    return ss.str();
}

inline std::string exit_reason_str(int reason) {
    switch (reason) {
        case exit_reason::SIGNAL:      return "SIGNAL";
        case exit_reason::STOP_LOSS:   return "STOP_LOSS";
        case exit_reason::TAKE_PROFIT: return "TAKE_PROFIT";
        case exit_reason::END_OF_DATA: return "END_OF_DATA";
        default: return "UNKNOWN";
    }
}

inline std::string to_json(const ParameterSet& p) {
    std::ostringstream ss;
    ss << "{";
    bool first = true;
    for (const auto& [k, v] : p) {
        if (!first) ss << ",";
        first = false;
        ss << "\"" << json_escape(k) << "\":" << json_number(v);
    }
    ss << "}";
    return ss.str();
}

// Serialize a PerformanceReport to JSON
inline std::string to_json(const PerformanceReport& r) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"total_return_pct\":" << json_number(r.total_return_pct);
    ss << ",\"win_rate\":" << json_number(r.win_rate);
    ss << ",\"sharpe_ratio\":" << json_number(r.sharpe_ratio);
    ss << ",\"max_drawdown_pct\":" << json_number(r.max_drawdown_pct);
    ss << ",\"profit_factor\":" << json_number(r.profit_factor);
    ss << ",\"num_trades\":" << r.num_trades;
    ss << ",\"initial_equity\":" << json_number(r.initial_equity);
    ss << ",\"final_equity\":" << json_number(r.final_equity);
    ss << ",\"winning_trades\":" << r.winning_trades;
    ss << ",\"losing_trades\":" << r.losing_trades;
    ss << ",\"avg_win\":" << json_number(r.avg_win);
    ss << ",\"avg_loss\":" << json_number(r.avg_loss);
    ss << ",\"max_win\":" << json_number(r.max_win);
    ss << ",\"max_loss\":" << json_number(r.max_loss);
    ss << ",\"annualized_volatility_pct\":" << json_number(r.annualized_volatility_pct);
    ss << ",\"calmar_ratio\":" << json_number(r.calmar_ratio);
    ss << ",\"total_fees\":" << json_number(r.total_fees);
    ss << ",\"forced_exits\":" << r.forced_exits;
    ss << ",\"backtest_days\":" << r.backtest_days;
    ss << ",\"annual_return_pct\":" << json_number(r.annual_return_pct);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const TradeRecord& t) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"entry_ts\":" << t.entry_ts;
    ss << ",\"exit_ts\":" << t.exit_ts;
    ss << ",\"entry_price\":" << json_number(t.entry_price);
    ss << ",\"exit_price\":" << json_number(t.exit_price);
    ss << ",\"quantity\":" << json_number(t.quantity);
    ss << ",\"gross_pnl\":" << json_number(t.gross_pnl);
    ss << ",\"fee_paid\":" << json_number(t.fee_paid);
    ss << ",\"net_pnl\":" << json_number(t.net_pnl);
    ss << ",\"entry_bar_idx\":" << t.entry_bar_idx;
    ss << ",\"exit_bar_idx\":" << t.exit_bar_idx;
    ss << ",\"bars_held\":" << t.bars_held;
    ss << ",\"exit_reason\":\"" << exit_reason_str(t.exit_reason) << "\"";
    ss << ",\"forced\":" << (t.is_forced_exit() ? "true" : "false");
    ss << "}";
    return ss.str();
}

// Serialize a run with its report and config metadata
inline std::string to_json(const BacktestRun& run, const PerformanceReport& report,
                           const BacktestConfig& cfg) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"strategy\":\"" << json_escape(run.strategy_name) << "\"";
    ss << ",\"parameters\":" << to_json(run.parameters);
    ss << ",\"initial_capital\":" << json_number(cfg.initial_capital);
    ss << ",\"fee_rate\":" << json_number(cfg.costs.fee_rate);
    ss << ",\"sizing\":\"" << sizing_policy_str(cfg.sizing) << "\"";
    ss << ",\"capital_fraction\":" << json_number(cfg.capital_fraction);
    ss << ",\"stop_loss_pct\":" << json_number(cfg.stop_loss_pct);
    ss << ",\"take_profit_pct\":" << json_number(cfg.take_profit_pct);
    ss << ",\"bars\":" << run.bars;
    ss << ",\"data_gap_bars\":" << run.data_gap_bars;
    ss << ",\"rejected_buys\":" << run.rejected_buys;
    ss << ",\"report\":" << to_json(report);

    ss << ",\"trades\":[";
    for (size_t i = 0; i < run.trades.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(run.trades[i]);
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

// Trade ledger as CSV with a header row
inline std::string trades_csv(const std::vector<TradeRecord>& trades) {
    std::ostringstream ss;
    ss << std::setprecision(12);
    ss << "entry_ts,exit_ts,entry_price,exit_price,quantity,gross_pnl,fee_paid,net_pnl,"
          "entry_bar_idx,exit_bar_idx,bars_held,exit_reason\n";
    for (const auto& t : trades) {
        ss << t.entry_ts << "," << t.exit_ts << "," << t.entry_price << ","
           << t.exit_price << "," << t.quantity << "," << t.gross_pnl << ","
           << t.fee_paid << "," << t.net_pnl << "," << t.entry_bar_idx << ","
           << t.exit_bar_idx << "," << t.bars_held << ","
           << exit_reason_str(t.exit_reason) << "\n";
    }
    return ss.str();
}

inline std::string equity_csv(const std::vector<EquityPoint>& curve) {
    std::ostringstream ss;
    ss << std::setprecision(12);
    ss << "ts,equity\n";
    for (const auto& p : curve) ss << p.ts << "," << p.equity << "\n";
    return ss.str();
}

}  // namespace backtest_io
