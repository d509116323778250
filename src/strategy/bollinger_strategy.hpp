#pragma once

#include "errors.hpp"
#include "strategy/strategy.hpp"

#include <cmath>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// BollingerStrategy — mean reversion off the bands
// BUY when the close touches the lower band, SELL when it touches the upper.
// A close on both bands (zero-width window) is a SELL.
// ---------------------------------------------------------------------------
class BollingerStrategy : public Strategy {
public:
    static ParameterSet defaults() {
        return {{"period", 20.0}, {"num_std", 2.0}};
    }

    static std::vector<std::string> parameter_names() {
        return {"period", "num_std"};
    }

    explicit BollingerStrategy(const ParameterSet& overrides = {}) {
        params::require_known(overrides, parameter_names(), "BOLLINGER");
        auto p = params::merged(defaults(), overrides);
        period_ = params::get_int(p, "period", 20);
        num_std_ = params::get(p, "num_std", 2.0);

        if (period_ < 2) {
            throw InvalidParameterError("Bollinger period must be >= 2, got " +
                                        std::to_string(period_));
        }
        params::require_positive("num_std", num_std_);
    }

    std::string name() const override { return "BOLLINGER"; }

    ParameterSet parameters() const override {
        return {{"period", static_cast<double>(period_)}, {"num_std", num_std_}};
    }

    size_t warmup_bars() const override { return static_cast<size_t>(period_ - 1); }

    PreparedIndicators prepare(const PriceSeries& series,
                               const IndicatorProvider& provider) const override {
        PreparedIndicators out;
        out.series["bands"] = provider.compute(series, IndicatorKind::BOLLINGER, parameters());
        return out;
    }

    Signal generate_signal(const SeriesView& bars,
                           const IndicatorView& ind) const override {
        double close = bars.current().close;
        double upper = ind.current("bands", "upper");
        double lower = ind.current("bands", "lower");
        if (std::isnan(close) || std::isnan(upper) || std::isnan(lower)) return Signal::HOLD;
        if (close >= upper) return Signal::SELL;
        if (close <= lower) return Signal::BUY;
        return Signal::HOLD;
    }

private:
    int period_ = 20;
    double num_std_ = 2.0;
};
