#pragma once

#include "errors.hpp"
#include "indicators/indicator_provider.hpp"
#include "indicators/indicator_series.hpp"
#include "series/price_series.hpp"
#include "strategy/parameter_set.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

// ---------------------------------------------------------------------------
// Causal rolling / recursive primitives over a close vector.
// NaN inputs yield NaN for every window that contains them.
// ---------------------------------------------------------------------------
namespace indicator_math {

constexpr double NaN = IndicatorSeries::UNDEFINED;

inline std::vector<double> rolling_mean(const std::vector<double>& x, int period) {
    std::vector<double> out(x.size(), NaN);
    size_t p = static_cast<size_t>(period);
    for (size_t t = 0; t < x.size(); ++t) {
        if (t + 1 < p) continue;
        double sum = 0.0;
        bool valid = true;
        for (size_t j = t + 1 - p; j <= t; ++j) {
            if (std::isnan(x[j])) { valid = false; break; }
            sum += x[j];
        }
        if (valid) out[t] = sum / static_cast<double>(p);
    }
    return out;
}

// Sample (n - 1) standard deviation; NaN for a window of one.
inline std::vector<double> rolling_std(const std::vector<double>& x, int period) {
    std::vector<double> out(x.size(), NaN);
    size_t p = static_cast<size_t>(period);
    if (p < 2) return out;
    auto mean = rolling_mean(x, period);
    for (size_t t = 0; t < x.size(); ++t) {
        if (std::isnan(mean[t])) continue;
        double sum_sq = 0.0;
        for (size_t j = t + 1 - p; j <= t; ++j) {
            double d = x[j] - mean[t];
            sum_sq += d * d;
        }
        out[t] = std::sqrt(sum_sq / static_cast<double>(p - 1));
    }
    return out;
}

// e0 = x0, e_t = a*x_t + (1-a)*e_{t-1}, a = 2/(span+1). A NaN input leaves the
// recursion untouched and yields NaN at that index. No warm-up masking here.
inline std::vector<double> ewm_raw(const std::vector<double>& x, int span) {
    std::vector<double> out(x.size(), NaN);
    double alpha = 2.0 / (static_cast<double>(span) + 1.0);
    bool seeded = false;
    double e = 0.0;
    for (size_t t = 0; t < x.size(); ++t) {
        if (std::isnan(x[t])) continue;
        e = seeded ? alpha * x[t] + (1.0 - alpha) * e : x[t];
        seeded = true;
        out[t] = e;
    }
    return out;
}

inline void mask_before(std::vector<double>& x, size_t first_defined) {
    for (size_t t = 0; t < x.size() && t < first_defined; ++t) x[t] = NaN;
}

inline std::vector<double> ema(const std::vector<double>& x, int span) {
    auto out = ewm_raw(x, span);
    mask_before(out, static_cast<size_t>(span - 1));
    return out;
}

inline std::vector<double> rsi(const std::vector<double>& close, int period) {
    size_t n = close.size();
    std::vector<double> gains(n, NaN);
    std::vector<double> losses(n, NaN);
    for (size_t t = 1; t < n; ++t) {
        double d = close[t] - close[t - 1];
        if (std::isnan(d)) continue;
        gains[t] = d > 0.0 ? d : 0.0;
        losses[t] = d < 0.0 ? -d : 0.0;
    }
    auto avg_gain = rolling_mean(gains, period);
    auto avg_loss = rolling_mean(losses, period);

    std::vector<double> out(n, NaN);
    for (size_t t = 0; t < n; ++t) {
        double g = avg_gain[t];
        double l = avg_loss[t];
        if (std::isnan(g) || std::isnan(l)) continue;
        if (l == 0.0) {
            if (g > 0.0) out[t] = 100.0;
            continue;  // flat window: undefined
        }
        out[t] = 100.0 - 100.0 / (1.0 + g / l);
    }
    return out;
}

}  // namespace indicator_math

// ---------------------------------------------------------------------------
// TechnicalIndicators — reference IndicatorProvider
//
// Columns per kind:
//   SMA        {period}               -> "sma"
//   EMA        {period}               -> "ema"
//   RSI        {period}               -> "rsi"
//   MACD       {fast, slow, signal}   -> "macd", "signal", "histogram"
//   BOLLINGER  {period, num_std}      -> "upper", "middle", "lower"
// ---------------------------------------------------------------------------
class TechnicalIndicators : public IndicatorProvider {
public:
    IndicatorSeries compute(const PriceSeries& series, IndicatorKind kind,
                            const ParameterSet& p) const override {
        auto close = series.closes();
        IndicatorSeries out(close.size());

        switch (kind) {
            case IndicatorKind::SMA: {
                int period = params::get_int(p, "period", 20);
                params::require_positive("period", period);
                out.set_column("sma", indicator_math::rolling_mean(close, period));
                break;
            }
            case IndicatorKind::EMA: {
                int period = params::get_int(p, "period", 20);
                params::require_positive("period", period);
                out.set_column("ema", indicator_math::ema(close, period));
                break;
            }
            case IndicatorKind::RSI: {
                int period = params::get_int(p, "period", 14);
                params::require_positive("period", period);
                out.set_column("rsi", indicator_math::rsi(close, period));
                break;
            }
            case IndicatorKind::MACD:
                compute_macd(close, p, out);
                break;
            case IndicatorKind::BOLLINGER:
                compute_bollinger(close, p, out);
                break;
        }
        return out;
    }

private:
    static void compute_macd(const std::vector<double>& close, const ParameterSet& p,
                             IndicatorSeries& out) {
        int fast = params::get_int(p, "fast", 12);
        int slow = params::get_int(p, "slow", 26);
        int signal = params::get_int(p, "signal", 9);
        params::require_positive("fast", fast);
        params::require_positive("slow", slow);
        params::require_positive("signal", signal);

        auto ema_fast = indicator_math::ewm_raw(close, fast);
        auto ema_slow = indicator_math::ewm_raw(close, slow);
        std::vector<double> macd(close.size(), indicator_math::NaN);
        for (size_t t = 0; t < close.size(); ++t) {
            macd[t] = ema_fast[t] - ema_slow[t];
        }

        // The signal recursion runs over the unmasked line from bar 0.
        auto sig = indicator_math::ewm_raw(macd, signal);
        std::vector<double> hist(close.size(), indicator_math::NaN);
        for (size_t t = 0; t < close.size(); ++t) hist[t] = macd[t] - sig[t];

        size_t longest = static_cast<size_t>(std::max(fast, slow));
        indicator_math::mask_before(macd, longest - 1);
        indicator_math::mask_before(sig, longest + static_cast<size_t>(signal) - 2);
        indicator_math::mask_before(hist, longest + static_cast<size_t>(signal) - 2);

        out.set_column("macd", std::move(macd));
        out.set_column("signal", std::move(sig));
        out.set_column("histogram", std::move(hist));
    }

    static void compute_bollinger(const std::vector<double>& close, const ParameterSet& p,
                                  IndicatorSeries& out) {
        int period = params::get_int(p, "period", 20);
        double num_std = params::get(p, "num_std", 2.0);
        params::require_positive("period", period);
        params::require_positive("num_std", num_std);

        auto middle = indicator_math::rolling_mean(close, period);
        auto sd = indicator_math::rolling_std(close, period);
        std::vector<double> upper(close.size(), indicator_math::NaN);
        std::vector<double> lower(close.size(), indicator_math::NaN);
        for (size_t t = 0; t < close.size(); ++t) {
            upper[t] = middle[t] + num_std * sd[t];
            lower[t] = middle[t] - num_std * sd[t];
        }
        out.set_column("upper", std::move(upper));
        out.set_column("middle", std::move(middle));
        out.set_column("lower", std::move(lower));
    }
};
