#pragma once
#include <cstddef>
#include "app/config.hpp"
#include "core/types.hpp"
#include "strategy/trade_plan.hpp"

namespace app {

enum class TradeOutcome { Open, Stopped, Target };

// Within one bar the stop is checked before the target.
TradeOutcome resolve_bar(const strategy::TradePlan& plan, const core::Candle& bar);

struct ReplayStats {
    std::size_t candles_15m{0};
    int armed{0};
    int triggered{0};
    int suppressed{0};
    int expired{0};
    int wins{0};
    int losses{0};
    int open{0};
    double total_r{0.0};
};

// Walks 5m candles forward through the live analysis and setup tracker. 15m candles are
// built from aligned 5m buckets and only seen once complete. A trade is resolved from its
// trigger bar onward.
ReplayStats run_replay(const core::Instrument& inst, const core::CandleSeries& candles_5m,
                       const AppConfig& cfg);

} // namespace app
