#pragma once
#include <string>
#include "core/types.hpp"
#include "indicators/liquidity_zone.hpp"
#include "indicators/sweep.hpp"
#include "indicators/retail_cluster.hpp"
#include "indicators/footprint.hpp"

namespace strategy {

struct PlanParams {
    double reward_risk{4.0};
    double entry_buffer{0.0};     // allowance beyond the confirm open; 0 -> one tick
    double max_confidence{0.95};
};

struct TradePlan {
    std::string symbol;
    core::Side side{core::Side::Long};
    double entry{};
    double stop_loss{};
    double take_profit{};
    double take_profit1{};
    double confidence{};
    std::string logic;
    std::int64_t sweep_ts_ms{};   // identifies the pattern the plan came from
};

// Additive score: base 0.5, +0.2 pattern, +0.15 footprint, +0.1 no cluster on the entry side.
double score_confidence(bool pattern, bool footprint, bool entry_side_cluster, double cap = 0.95);

TradePlan build_trade_plan(const core::Instrument& inst,
                           const ind::Sweep& sweep,
                           const ind::LiquidityZone& zone,
                           const ind::RetailCluster& cluster,
                           const ind::FootprintSignal& footprint,
                           const PlanParams& p = {});

} // namespace strategy
