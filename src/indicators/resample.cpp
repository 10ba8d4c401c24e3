#include "indicators/resample.hpp"

namespace ind {

core::CandleSeries resample(const core::CandleSeries& c, std::size_t factor, std::int64_t base_ms) {
    core::CandleSeries out;
    if (factor == 0 || base_ms <= 0) return out;
    const std::int64_t span = base_ms * static_cast<std::int64_t>(factor);

    core::Candle cur{};
    std::int64_t bucket = -1;
    std::size_t filled = 0;
    for (const auto& k : c) {
        const std::int64_t b = k.ts_ms - (k.ts_ms % span);
        if (b != bucket) {
            if (filled == factor) out.push_back(cur);
            bucket = b; filled = 0;
            cur = core::Candle{b, k.open, k.high, k.low, k.close, 0.0};
        }
        cur.high = std::max(cur.high, k.high);
        cur.low  = std::min(cur.low, k.low);
        cur.close = k.close;
        cur.volume += k.volume;
        ++filled;
    }
    if (filled == factor) out.push_back(cur);
    return out;
}

} // namespace ind
