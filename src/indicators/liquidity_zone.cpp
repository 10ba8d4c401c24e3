#include "indicators/liquidity_zone.hpp"
#include <algorithm>

namespace ind {

std::optional<LiquidityZone> compute_liquidity_zone(const core::CandleSeries& c) {
    if (c.empty()) return std::nullopt;
    LiquidityZone z{c.front().low, c.front().high, c.back().close};
    for (const auto& k : c) {
        z.recent_low  = std::min(z.recent_low, k.low);
        z.recent_high = std::max(z.recent_high, k.high);
    }
    return z;
}

} // namespace ind
