#pragma once

#include "indicators/indicator_series.hpp"
#include "series/price_series.hpp"
#include "strategy/parameter_set.hpp"

// ---------------------------------------------------------------------------
// IndicatorProvider — computes derived series for a PriceSeries.
// Values at index t may depend only on bars [0..t].
// ---------------------------------------------------------------------------
class IndicatorProvider {
public:
    virtual ~IndicatorProvider() = default;
    virtual IndicatorSeries compute(const PriceSeries& series, IndicatorKind kind,
                                    const ParameterSet& params) const = 0;
};
