#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// ErrorKind — classes of failure a run or a sweep can report
// ---------------------------------------------------------------------------
enum class ErrorKind {
    NONE,
    INVALID_PARAMETER,
    EMPTY_SERIES,
    DATA_GAP,
    INSUFFICIENT_CAPITAL,
    INTERNAL
};

inline std::string error_kind_str(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                 return "NONE";
        case ErrorKind::INVALID_PARAMETER:    return "INVALID_PARAMETER";
        case ErrorKind::EMPTY_SERIES:         return "EMPTY_SERIES";
        case ErrorKind::DATA_GAP:             return "DATA_GAP";
        case ErrorKind::INSUFFICIENT_CAPITAL: return "INSUFFICIENT_CAPITAL";
        case ErrorKind::INTERNAL:             return "INTERNAL";
        default: return "UNKNOWN";
    }
}

// Configuration mistakes: bad strategy parameters, malformed grids, bad
// backtest settings. Always raised before a simulation starts.
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string& what)
        : std::invalid_argument(what) {}
};

// A price series with no bars.
class EmptySeriesError : public std::invalid_argument {
public:
    explicit EmptySeriesError(const std::string& what)
        : std::invalid_argument(what) {}
};
