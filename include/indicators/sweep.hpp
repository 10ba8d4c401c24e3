#pragma once
#include <cstddef>
#include <variant>
#include "core/types.hpp"

namespace ind {

// Which side of the book a sweep may run
enum class SweepBias { LongOnly, ShortOnly, Both };

struct SweepParams {
    std::size_t lookback{12};
    double min_wick_ratio{0.4};   // sweep-side wick / candle range, strict
    SweepBias bias{SweepBias::Both};
};

struct NoSignal {
    bool insufficient_data{false};
};

// sweep: pierces both neighbours' extreme; confirm: next candle closes in the reversal direction
struct Sweep {
    core::Side side{core::Side::Long};
    core::Candle sweep_candle;
    core::Candle confirm_candle;
};

using SweepDetection = std::variant<NoSignal, Sweep>;

inline bool has_signal(const SweepDetection& d) {
    return std::holds_alternative<Sweep>(d);
}

// Scans the newest lookback+1 candles oldest -> newest; the first qualifying
// interior candle wins.
SweepDetection detect_sweep(const core::CandleSeries& candles, const SweepParams& p = {});

// Wick beyond the body on the given side divided by the full range (0 on a flat candle).
double wick_ratio(const core::Candle& c, core::Side side);

} // namespace ind
