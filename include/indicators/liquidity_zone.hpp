#pragma once
#include <optional>
#include "core/types.hpp"

namespace ind {

struct LiquidityZone {
    double recent_low{};
    double recent_high{};
    double last_close{};
};

// Empty window -> nullopt
std::optional<LiquidityZone> compute_liquidity_zone(const core::CandleSeries& window);

} // namespace ind
