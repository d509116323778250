#pragma once

#include "errors.hpp"
#include "strategy/strategy.hpp"

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// MovingAverageCrossStrategy — golden cross BUY, death cross SELL.
// use_ema = 1 selects exponential averages, 0 simple averages.
// ---------------------------------------------------------------------------
class MovingAverageCrossStrategy : public Strategy {
public:
    static ParameterSet defaults() {
        return {{"fast", 20.0}, {"slow", 50.0}, {"use_ema", 1.0}};
    }

    static std::vector<std::string> parameter_names() {
        return {"fast", "slow", "use_ema"};
    }

    explicit MovingAverageCrossStrategy(const ParameterSet& overrides = {}) {
        params::require_known(overrides, parameter_names(), "MA_CROSS");
        auto p = params::merged(defaults(), overrides);
        fast_ = params::get_int(p, "fast", 20);
        slow_ = params::get_int(p, "slow", 50);
        int use_ema = params::get_int(p, "use_ema", 1);

        params::require_positive("fast", fast_);
        params::require_positive("slow", slow_);
        if (use_ema != 0 && use_ema != 1) {
            throw InvalidParameterError("use_ema must be 0 or 1, got " + std::to_string(use_ema));
        }
        use_ema_ = (use_ema == 1);
        if (fast_ >= slow_) {
            throw InvalidParameterError("MA fast window (" + std::to_string(fast_) +
                                        ") must be below slow window (" +
                                        std::to_string(slow_) + ")");
        }
    }

    std::string name() const override { return "MA_CROSS"; }

    ParameterSet parameters() const override {
        return {{"fast", static_cast<double>(fast_)},
                {"slow", static_cast<double>(slow_)},
                {"use_ema", use_ema_ ? 1.0 : 0.0}};
    }

    size_t warmup_bars() const override { return static_cast<size_t>(slow_); }

    PreparedIndicators prepare(const PriceSeries& series,
                               const IndicatorProvider& provider) const override {
        IndicatorKind kind = use_ema_ ? IndicatorKind::EMA : IndicatorKind::SMA;
        PreparedIndicators out;
        out.series["fast"] = provider.compute(series, kind, {{"period", static_cast<double>(fast_)}});
        out.series["slow"] = provider.compute(series, kind, {{"period", static_cast<double>(slow_)}});
        return out;
    }

    Signal generate_signal(const SeriesView& /*bars*/,
                           const IndicatorView& ind) const override {
        const std::string col = use_ema_ ? "ema" : "sma";
        return crossover_signal(ind.current("fast", col), ind.current("slow", col),
                                ind.previous("fast", col), ind.previous("slow", col));
    }

private:
    int fast_ = 20;
    int slow_ = 50;
    bool use_ema_ = true;
};
