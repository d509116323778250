#pragma once

#include <string>

enum class Signal { BUY, SELL, HOLD };

inline std::string signal_str(Signal s) {
    switch (s) {
        case Signal::BUY:  return "BUY";
        case Signal::SELL: return "SELL";
        case Signal::HOLD: return "HOLD";
        default: return "UNKNOWN";
    }
}
