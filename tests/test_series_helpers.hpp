#pragma once

// Shared test helpers for synthetic price series and scripted strategies.

#include "series/bar.hpp"
#include "series/price_series.hpp"
#include "strategy/strategy.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <numbers>
#include <string>
#include <utility>
#include <vector>

namespace test_helpers {

constexpr uint64_t NS_PER_SEC = 1'000'000'000ULL;
constexpr uint64_t NS_PER_HOUR = 3600ULL * NS_PER_SEC;
constexpr uint64_t START_NS = 1704067200ULL * NS_PER_SEC;  // 2024-01-01 00:00 UTC
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

// Hourly bar with all prices at `close`.
inline Bar make_bar(double close, size_t index, double volume = 100.0) {
    Bar bar{};
    bar.ts = START_NS + static_cast<uint64_t>(index) * NS_PER_HOUR;
    bar.open = close;
    bar.high = close;
    bar.low = close;
    bar.close = close;
    bar.volume = volume;
    return bar;
}

inline PriceSeries make_series(const std::vector<double>& closes,
                               const std::string& interval = "1h") {
    std::vector<Bar> bars;
    bars.reserve(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) bars.push_back(make_bar(closes[i], i));
    return PriceSeries(std::move(bars), "TEST", interval);
}

// Linear ramp from `start` to `end` over `count` bars.
inline std::vector<double> ramp(double start, double end, int count) {
    std::vector<double> out;
    for (int i = 0; i < count; ++i) {
        double frac = (count > 1) ? static_cast<double>(i) / (count - 1) : 0.0;
        out.push_back(start + frac * (end - start));
    }
    return out;
}

// Deterministic oscillating series around `base`: several full sine cycles
// plus a slow drift, enough to trigger every indicator strategy.
inline std::vector<double> wave(int count, double base = 100.0, double amplitude = 10.0,
                                double period = 40.0, double drift = 0.02) {
    std::vector<double> out;
    for (int i = 0; i < count; ++i) {
        double phase = 2.0 * std::numbers::pi * static_cast<double>(i) / period;
        out.push_back(base + amplitude * std::sin(phase) + drift * i);
    }
    return out;
}

// ---------------------------------------------------------------------------
// ScriptedStrategy — emits fixed signals at chosen bar indices, HOLD elsewhere
// ---------------------------------------------------------------------------
class ScriptedStrategy : public Strategy {
public:
    explicit ScriptedStrategy(std::map<size_t, Signal> script, bool risk_exits = true)
        : script_(std::move(script)), risk_exits_(risk_exits) {}

    std::string name() const override { return "SCRIPTED"; }
    ParameterSet parameters() const override { return {}; }
    size_t warmup_bars() const override { return 0; }

    PreparedIndicators prepare(const PriceSeries&, const IndicatorProvider&) const override {
        return {};
    }

    Signal generate_signal(const SeriesView& bars, const IndicatorView&) const override {
        auto it = script_.find(bars.index());
        return it == script_.end() ? Signal::HOLD : it->second;
    }

    bool uses_risk_exits() const override { return risk_exits_; }

private:
    std::map<size_t, Signal> script_;
    bool risk_exits_;
};

}  // namespace test_helpers
