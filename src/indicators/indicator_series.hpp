#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// IndicatorKind — indicators the collaborator knows how to compute
// ---------------------------------------------------------------------------
enum class IndicatorKind { SMA, EMA, RSI, MACD, BOLLINGER };

inline std::string indicator_kind_str(IndicatorKind kind) {
    switch (kind) {
        case IndicatorKind::SMA:       return "SMA";
        case IndicatorKind::EMA:       return "EMA";
        case IndicatorKind::RSI:       return "RSI";
        case IndicatorKind::MACD:      return "MACD";
        case IndicatorKind::BOLLINGER: return "BOLLINGER";
        default: return "UNKNOWN";
    }
}

// ---------------------------------------------------------------------------
// IndicatorSeries — named columns aligned 1:1 with a PriceSeries by index.
// NaN marks an undefined value (warm-up or data gap).
// ---------------------------------------------------------------------------
class IndicatorSeries {
public:
    static constexpr double UNDEFINED = std::numeric_limits<double>::quiet_NaN();

    IndicatorSeries() = default;
    explicit IndicatorSeries(size_t length) : length_(length) {}

    size_t length() const { return length_; }

    void set_column(const std::string& name, std::vector<double> values) {
        if (values.size() != length_) {
            throw std::invalid_argument("Indicator column '" + name + "' has " +
                                        std::to_string(values.size()) + " values, expected " +
                                        std::to_string(length_));
        }
        columns_[name] = std::move(values);
    }

    const std::vector<double>& column(const std::string& name) const {
        auto it = columns_.find(name);
        if (it == columns_.end()) {
            throw std::out_of_range("Unknown indicator column: " + name);
        }
        return it->second;
    }

    double value(const std::string& name, size_t i) const {
        return column(name).at(i);
    }

    bool defined(const std::string& name, size_t i) const {
        return !std::isnan(value(name, i));
    }

    // First index at which the column holds a value; length() if none.
    size_t first_defined(const std::string& name) const {
        const auto& col = column(name);
        for (size_t i = 0; i < col.size(); ++i) {
            if (!std::isnan(col[i])) return i;
        }
        return col.size();
    }

    std::vector<std::string> column_names() const {
        std::vector<std::string> names;
        for (const auto& [k, v] : columns_) names.push_back(k);
        return names;
    }

private:
    size_t length_ = 0;
    std::map<std::string, std::vector<double>> columns_;
};
