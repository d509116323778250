#pragma once

#include "indicators/indicator_provider.hpp"
#include "indicators/indicator_series.hpp"
#include "series/price_series.hpp"
#include "strategy/parameter_set.hpp"
#include "strategy/signal.hpp"

#include <cmath>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PreparedIndicators — everything a strategy precomputes for one run.
// Keyed series for the strategy itself plus one entry per child (COMBINED).
// ---------------------------------------------------------------------------
struct PreparedIndicators {
    std::map<std::string, IndicatorSeries> series;
    std::vector<PreparedIndicators> children;
};

// ---------------------------------------------------------------------------
// IndicatorView — read access to prepared indicators up to cursor t
// ---------------------------------------------------------------------------
class IndicatorView {
public:
    IndicatorView(const PreparedIndicators& data, size_t t) : data_(data), t_(t) {}

    size_t index() const { return t_; }

    double value(const std::string& key, const std::string& column, size_t i) const {
        if (i > t_) {
            throw std::out_of_range("Look-ahead: indicator '" + key + "." + column +
                                    "' index " + std::to_string(i) + " requested at cursor " +
                                    std::to_string(t_));
        }
        auto it = data_.series.find(key);
        if (it == data_.series.end()) {
            throw std::out_of_range("Indicator series not prepared: " + key);
        }
        return it->second.value(column, i);
    }

    double current(const std::string& key, const std::string& column) const {
        return value(key, column, t_);
    }

    // Value at t - 1; undefined on the first bar.
    double previous(const std::string& key, const std::string& column) const {
        if (t_ == 0) return IndicatorSeries::UNDEFINED;
        return value(key, column, t_ - 1);
    }

    IndicatorView child(size_t i) const {
        return IndicatorView(data_.children.at(i), t_);
    }

private:
    const PreparedIndicators& data_;
    size_t t_;
};

// ---------------------------------------------------------------------------
// Strategy — per-bar signal generator
//
// generate_signal() sees bars and indicators up to and including the current
// bar only. Parameters are fixed at construction and there is no other state,
// so evaluating the same series twice yields the same signals.
// ---------------------------------------------------------------------------
class Strategy {
public:
    virtual ~Strategy() = default;

    virtual std::string name() const = 0;
    virtual ParameterSet parameters() const = 0;

    // First bar index at which BUY or SELL can be emitted.
    virtual size_t warmup_bars() const = 0;

    virtual PreparedIndicators prepare(const PriceSeries& series,
                                       const IndicatorProvider& provider) const = 0;

    virtual Signal generate_signal(const SeriesView& bars,
                                   const IndicatorView& indicators) const = 0;

    // Whether the backtester's stop-loss / take-profit exits apply.
    virtual bool uses_risk_exits() const { return true; }
};

// Crossover of `a` over `b` between t - 1 and t. HOLD when any value is undefined.
inline Signal crossover_signal(double a, double b, double prev_a, double prev_b) {
    if (std::isnan(a) || std::isnan(b) || std::isnan(prev_a) || std::isnan(prev_b)) {
        return Signal::HOLD;
    }
    if (a > b && prev_a <= prev_b) return Signal::BUY;
    if (a < b && prev_a >= prev_b) return Signal::SELL;
    return Signal::HOLD;
}

// Signal for the last bar of `series`; the entry point for live decisioning.
inline Signal latest_signal(const Strategy& strategy, const PriceSeries& series,
                            const IndicatorProvider& provider) {
    if (series.empty()) return Signal::HOLD;
    auto prepared = strategy.prepare(series, provider);
    size_t t = series.size() - 1;
    if (!series[t].has_valid_close()) return Signal::HOLD;
    return strategy.generate_signal(SeriesView(series, t), IndicatorView(prepared, t));
}
