#pragma once

#include <cstdint>
#include <vector>

enum class PositionSide { FLAT, LONG };

// ---------------------------------------------------------------------------
// Position — the single open long position, if any
// ---------------------------------------------------------------------------
struct Position {
    PositionSide side = PositionSide::FLAT;
    double quantity = 0.0;
    double entry_price = 0.0;
    uint64_t entry_ts = 0;
    int entry_index = 0;
    double entry_fee = 0.0;

    bool is_long() const { return side == PositionSide::LONG; }
};

struct EquityPoint {
    uint64_t ts = 0;
    double equity = 0.0;
};

// ---------------------------------------------------------------------------
// PortfolioState — cash, position and one equity point per simulated bar
// ---------------------------------------------------------------------------
struct PortfolioState {
    double cash = 0.0;
    Position position;
    std::vector<EquityPoint> equity_curve;

    double equity(double mark_price) const {
        return cash + (position.is_long() ? position.quantity * mark_price : 0.0);
    }

    void record(uint64_t ts, double mark_price) {
        equity_curve.push_back({ts, equity(mark_price)});
    }
};
