#pragma once

#include "errors.hpp"

#include <string>

// ---------------------------------------------------------------------------
// ExecutionCosts — proportional fee charged on each fill's notional.
// No spread or slippage model.
// ---------------------------------------------------------------------------
struct ExecutionCosts {
    double fee_rate = 0.001;

    double fee(double notional) const { return notional * fee_rate; }

    // Fee for a full round trip opened at `entry` and closed at `exit`.
    double round_trip_fee(double entry, double exit, double quantity) const {
        return fee(entry * quantity) + fee(exit * quantity);
    }

    void validate() const {
        if (!(fee_rate >= 0.0 && fee_rate < 1.0)) {
            throw InvalidParameterError("fee_rate must lie within [0, 1), got " +
                                        std::to_string(fee_rate));
        }
    }
};
