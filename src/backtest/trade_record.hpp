#pragma once

#include <cstdint>

namespace exit_reason {
    constexpr int SIGNAL      = 0;
    constexpr int STOP_LOSS   = 1;
    constexpr int TAKE_PROFIT = 2;
    constexpr int END_OF_DATA = 3;
}  // namespace exit_reason

// ---------------------------------------------------------------------------
// TradeRecord — one closed long round trip
// ---------------------------------------------------------------------------
struct TradeRecord {
    uint64_t entry_ts = 0;
    uint64_t exit_ts = 0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double quantity = 0.0;
    double gross_pnl = 0.0;  // (exit - entry) * quantity
    double fee_paid = 0.0;   // entry fee + exit fee
    double net_pnl = 0.0;    // gross_pnl - fee_paid
    int entry_bar_idx = 0;
    int exit_bar_idx = 0;
    int bars_held = 0;
    int exit_reason = exit_reason::SIGNAL;

    // Closed by the engine at the end of the data, not by the strategy.
    bool is_forced_exit() const { return exit_reason == exit_reason::END_OF_DATA; }
};
