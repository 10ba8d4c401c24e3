#include "indicators/sweep.hpp"

namespace ind {

double wick_ratio(const core::Candle& c, core::Side side) {
    const double range = c.range();
    if (range <= 0.0) return 0.0;
    const double wick = (side == core::Side::Long)
        ? std::min(c.open, c.close) - c.low
        : c.high - std::max(c.open, c.close);
    return wick / range;
}

static bool low_sweep(const core::Candle& prev, const core::Candle& c, const core::Candle& next,
                      double min_wick) {
    return c.low < prev.low && c.low < next.low
        && wick_ratio(c, core::Side::Long) > min_wick
        && next.green();
}

static bool high_sweep(const core::Candle& prev, const core::Candle& c, const core::Candle& next,
                       double min_wick) {
    return c.high > prev.high && c.high > next.high
        && wick_ratio(c, core::Side::Short) > min_wick
        && next.red();
}

SweepDetection detect_sweep(const core::CandleSeries& candles, const SweepParams& p) {
    if (p.lookback < 2 || candles.size() < p.lookback + 2) return NoSignal{true};

    const std::size_t first = candles.size() - (p.lookback + 1);
    const bool want_long  = p.bias != SweepBias::ShortOnly;
    const bool want_short = p.bias != SweepBias::LongOnly;

    for (std::size_t i = first + 1; i + 1 < candles.size(); ++i) {
        const auto& prev = candles[i - 1];
        const auto& c    = candles[i];
        const auto& next = candles[i + 1];
        if (want_long && low_sweep(prev, c, next, p.min_wick_ratio))
            return Sweep{core::Side::Long, c, next};
        if (want_short && high_sweep(prev, c, next, p.min_wick_ratio))
            return Sweep{core::Side::Short, c, next};
    }
    return NoSignal{};
}

} // namespace ind
