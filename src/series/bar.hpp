#pragma once

#include <cmath>
#include <cstdint>

// ---------------------------------------------------------------------------
// Bar — one OHLCV sample at a fixed interval
// ---------------------------------------------------------------------------
struct Bar {
    uint64_t ts = 0;  // bar timestamp, ns since epoch
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    // A close that can be traded and marked against. Feeds deliver NaN for
    // missing samples.
    bool has_valid_close() const {
        return std::isfinite(close) && close > 0.0;
    }
};
