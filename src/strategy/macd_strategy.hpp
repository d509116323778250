#pragma once

#include "errors.hpp"
#include "strategy/strategy.hpp"

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// MacdStrategy — trade crossings of the MACD line and its signal line
// ---------------------------------------------------------------------------
class MacdStrategy : public Strategy {
public:
    static ParameterSet defaults() {
        return {{"fast", 12.0}, {"slow", 26.0}, {"signal", 9.0}};
    }

    static std::vector<std::string> parameter_names() {
        return {"fast", "slow", "signal"};
    }

    explicit MacdStrategy(const ParameterSet& overrides = {}) {
        params::require_known(overrides, parameter_names(), "MACD");
        auto p = params::merged(defaults(), overrides);
        fast_ = params::get_int(p, "fast", 12);
        slow_ = params::get_int(p, "slow", 26);
        signal_ = params::get_int(p, "signal", 9);

        params::require_positive("fast", fast_);
        params::require_positive("slow", slow_);
        params::require_positive("signal", signal_);
        if (fast_ >= slow_) {
            throw InvalidParameterError("MACD fast (" + std::to_string(fast_) +
                                        ") must be below slow (" + std::to_string(slow_) + ")");
        }
    }

    std::string name() const override { return "MACD"; }

    ParameterSet parameters() const override {
        return {{"fast", static_cast<double>(fast_)},
                {"slow", static_cast<double>(slow_)},
                {"signal", static_cast<double>(signal_)}};
    }

    // Signal line is defined from slow + signal - 2; a cross also needs the bar before.
    size_t warmup_bars() const override {
        return static_cast<size_t>(slow_ + signal_ - 1);
    }

    PreparedIndicators prepare(const PriceSeries& series,
                               const IndicatorProvider& provider) const override {
        PreparedIndicators out;
        out.series["macd"] = provider.compute(series, IndicatorKind::MACD, parameters());
        return out;
    }

    Signal generate_signal(const SeriesView& /*bars*/,
                           const IndicatorView& ind) const override {
        return crossover_signal(ind.current("macd", "macd"), ind.current("macd", "signal"),
                                ind.previous("macd", "macd"), ind.previous("macd", "signal"));
    }

private:
    int fast_ = 12;
    int slow_ = 26;
    int signal_ = 9;
};
