#pragma once

#include "errors.hpp"
#include "strategy/strategy.hpp"

#include <cmath>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RsiStrategy — BUY below the oversold level, SELL above the overbought level
// ---------------------------------------------------------------------------
class RsiStrategy : public Strategy {
public:
    static ParameterSet defaults() {
        return {{"period", 14.0}, {"oversold", 30.0}, {"overbought", 70.0}};
    }

    static std::vector<std::string> parameter_names() {
        return {"period", "oversold", "overbought"};
    }

    explicit RsiStrategy(const ParameterSet& overrides = {}) {
        params::require_known(overrides, parameter_names(), "RSI");
        auto p = params::merged(defaults(), overrides);
        period_ = params::get_int(p, "period", 14);
        oversold_ = params::get(p, "oversold", 30.0);
        overbought_ = params::get(p, "overbought", 70.0);

        params::require_positive("period", period_);
        if (oversold_ < 0.0 || overbought_ > 100.0) {
            throw InvalidParameterError("RSI thresholds must lie within [0, 100]");
        }
        if (oversold_ >= overbought_) {
            throw InvalidParameterError("RSI oversold (" + std::to_string(oversold_) +
                                        ") must be below overbought (" +
                                        std::to_string(overbought_) + ")");
        }
    }

    std::string name() const override { return "RSI"; }

    ParameterSet parameters() const override {
        return {{"period", static_cast<double>(period_)},
                {"oversold", oversold_},
                {"overbought", overbought_}};
    }

    // RSI needs `period` price changes, i.e. period + 1 closes.
    size_t warmup_bars() const override { return static_cast<size_t>(period_); }

    PreparedIndicators prepare(const PriceSeries& series,
                               const IndicatorProvider& provider) const override {
        PreparedIndicators out;
        out.series["rsi"] = provider.compute(series, IndicatorKind::RSI,
                                             {{"period", static_cast<double>(period_)}});
        return out;
    }

    Signal generate_signal(const SeriesView& /*bars*/,
                           const IndicatorView& ind) const override {
        double rsi = ind.current("rsi", "rsi");
        if (std::isnan(rsi)) return Signal::HOLD;
        if (rsi < oversold_) return Signal::BUY;
        if (rsi > overbought_) return Signal::SELL;
        return Signal::HOLD;
    }

private:
    int period_ = 14;
    double oversold_ = 30.0;
    double overbought_ = 70.0;
};
