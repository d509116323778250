#pragma once

#include "strategy/strategy.hpp"

#include <string>

// ---------------------------------------------------------------------------
// BuyAndHoldStrategy — benchmark: enter on the first tradable bar, never exit
// before the end of data. Stop-loss and take-profit do not apply.
// ---------------------------------------------------------------------------
class BuyAndHoldStrategy : public Strategy {
public:
    explicit BuyAndHoldStrategy(const ParameterSet& overrides = {}) {
        params::require_known(overrides, {}, "BUY_AND_HOLD");
    }

    std::string name() const override { return "BUY_AND_HOLD"; }
    ParameterSet parameters() const override { return {}; }
    size_t warmup_bars() const override { return 0; }

    PreparedIndicators prepare(const PriceSeries& /*series*/,
                               const IndicatorProvider& /*provider*/) const override {
        return {};
    }

    // BUY while long is a no-op, so asking every bar enters on the first bar
    // that has a usable price.
    Signal generate_signal(const SeriesView& /*bars*/,
                           const IndicatorView& /*ind*/) const override {
        return Signal::BUY;
    }

    bool uses_risk_exits() const override { return false; }
};
