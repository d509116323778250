#pragma once

#include "backtest/backtest_result_io.hpp"
#include "optimize/optimization_result.hpp"
#include "optimize/optimizer.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace results_parquet {

// Names of every swept parameter across `results`, sorted.
inline std::vector<std::string> parameter_columns(const std::vector<OptimizationResult>& results) {
    std::set<std::string> names;
    for (const auto& r : results) {
        for (const auto& [k, v] : r.parameter_set) names.insert(k);
    }
    return {names.begin(), names.end()};
}

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) throw std::runtime_error(what + ": " + status.ToString());
}

inline std::shared_ptr<arrow::Array> double_array(const std::vector<double>& values) {
    arrow::DoubleBuilder b;
    std::shared_ptr<arrow::Array> arr;
    check(b.AppendValues(values), "Append double column");
    check(b.Finish(&arr), "Finish double column");
    return arr;
}

inline std::shared_ptr<arrow::Array> int64_array(const std::vector<int64_t>& values) {
    arrow::Int64Builder b;
    std::shared_ptr<arrow::Array> arr;
    check(b.AppendValues(values), "Append int64 column");
    check(b.Finish(&arr), "Finish int64 column");
    return arr;
}

inline std::shared_ptr<arrow::Array> string_array(const std::vector<std::string>& values) {
    arrow::StringBuilder b;
    std::shared_ptr<arrow::Array> arr;
    for (const auto& v : values) check(b.Append(v), "Append string column");
    check(b.Finish(&arr), "Finish string column");
    return arr;
}

// One row per result, in ranked order: rank, strategy, status, error, one
// "param_<name>" column per swept parameter (NaN where absent), then the
// report fields.
inline std::shared_ptr<arrow::Table> to_table(const std::vector<OptimizationResult>& results) {
    auto param_names = parameter_columns(results);

    arrow::FieldVector fields;
    fields.push_back(arrow::field("rank", arrow::int64()));
    fields.push_back(arrow::field("strategy", arrow::utf8()));
    fields.push_back(arrow::field("status", arrow::utf8()));
    fields.push_back(arrow::field("error_kind", arrow::utf8()));
    fields.push_back(arrow::field("error_message", arrow::utf8()));
    for (const auto& name : param_names) {
        fields.push_back(arrow::field("param_" + name, arrow::float64()));
    }
    const std::vector<std::string> metric_names = {
        "total_return_pct", "win_rate", "sharpe_ratio", "max_drawdown_pct",
        "profit_factor", "calmar_ratio", "annualized_volatility_pct", "final_equity",
        "total_fees", "annual_return_pct"};
    for (const auto& name : metric_names) fields.push_back(arrow::field(name, arrow::float64()));
    fields.push_back(arrow::field("num_trades", arrow::int64()));
    fields.push_back(arrow::field("backtest_days", arrow::int64()));

    std::vector<int64_t> rank, num_trades, backtest_days;
    std::vector<std::string> strategy, status, error_kind, error_message;
    std::vector<std::vector<double>> params(param_names.size());
    std::vector<std::vector<double>> metrics(metric_names.size());

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        rank.push_back(static_cast<int64_t>(i + 1));
        strategy.push_back(r.strategy);
        status.push_back(result_status_str(r.status));
        error_kind.push_back(error_kind_str(r.error_kind));
        error_message.push_back(r.error_message);
        for (size_t c = 0; c < param_names.size(); ++c) {
            auto it = r.parameter_set.find(param_names[c]);
            params[c].push_back(it == r.parameter_set.end()
                                    ? std::numeric_limits<double>::quiet_NaN()
                                    : it->second);
        }
        const auto& p = r.report;
        double row[] = {p.total_return_pct, p.win_rate, p.sharpe_ratio, p.max_drawdown_pct,
                        p.profit_factor, p.calmar_ratio, p.annualized_volatility_pct,
                        p.final_equity, p.total_fees, p.annual_return_pct};
        for (size_t c = 0; c < metric_names.size(); ++c) metrics[c].push_back(row[c]);
        num_trades.push_back(p.num_trades);
        backtest_days.push_back(p.backtest_days);
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    arrays.push_back(int64_array(rank));
    arrays.push_back(string_array(strategy));
    arrays.push_back(string_array(status));
    arrays.push_back(string_array(error_kind));
    arrays.push_back(string_array(error_message));
    for (const auto& col : params) arrays.push_back(double_array(col));
    for (const auto& col : metrics) arrays.push_back(double_array(col));
    arrays.push_back(int64_array(num_trades));
    arrays.push_back(int64_array(backtest_days));

    return arrow::Table::Make(arrow::schema(fields), arrays);
}

// Write ranked results to Parquet with ZSTD compression.
inline void write(const std::string& path, const std::vector<OptimizationResult>& results) {
    auto table = to_table(results);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk = std::max<int64_t>(1, table->num_rows());
    auto status = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                             chunk, props);
    if (!status.ok()) {
        throw std::runtime_error("Failed to write Parquet " + path + ": " + status.ToString());
    }
    check(outfile->Close(), "Close " + path);
}

}  // namespace results_parquet
