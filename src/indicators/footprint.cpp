#include "indicators/footprint.hpp"

namespace ind {

static int body_sign(const core::Candle& c) {
    return c.green() ? 1 : (c.red() ? -1 : 0);
}

FootprintSignal detect_footprint(const core::CandleSeries& c, const FootprintParams& p) {
    FootprintSignal out;
    const std::size_t n = std::min(std::max(p.window, p.min_candles), c.size());
    if (n < p.min_candles || n < 2) return out;

    // feeds without volume report zeros
    bool any_volume = false;
    for (std::size_t i = c.size() - n; i < c.size(); ++i)
        if (c[i].volume > 0.0) { any_volume = true; break; }
    if (!any_volume) return out;

    double sum = 0.0;
    for (std::size_t i = c.size() - n; i + 1 < c.size(); ++i) sum += c[i].volume;
    const auto& last = c.back();
    const auto& prev = c[c.size() - 2];

    out.volume = last.volume;
    out.mean_volume = sum / static_cast<double>(n - 1);
    out.footprint = out.mean_volume > 0.0 && last.volume > out.mean_volume * p.spike_ratio;
    const int s = body_sign(last);
    out.direction_agreement = s != 0 && s == body_sign(prev);
    return out;
}

} // namespace ind
