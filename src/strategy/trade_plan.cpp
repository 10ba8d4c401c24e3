#include "strategy/trade_plan.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace strategy {

double score_confidence(bool pattern, bool footprint, bool entry_side_cluster, double cap) {
    double c = 0.5;
    if (pattern) c += 0.2;
    if (footprint) c += 0.15;
    if (!entry_side_cluster) c += 0.1;
    return std::clamp(c, 0.0, std::min(cap, 0.95));
}

TradePlan build_trade_plan(const core::Instrument& inst,
                           const ind::Sweep& sw,
                           const ind::LiquidityZone& zone,
                           const ind::RetailCluster& cluster,
                           const ind::FootprintSignal& fp,
                           const PlanParams& p) {
    const auto& s = sw.sweep_candle;
    const auto& k = sw.confirm_candle;
    const bool is_long = sw.side == core::Side::Long;
    const double dir = is_long ? 1.0 : -1.0;
    const double tick = inst.tick > 0.0 ? inst.tick : 0.01;
    const double buffer = p.entry_buffer > 0.0 ? p.entry_buffer : tick;
    const double extreme = is_long ? s.low : s.high;

    // halfway back into the sweep, capped at the confirmation open
    double entry = (k.close + extreme) / 2.0;
    entry = is_long ? std::min(entry, k.open + buffer) : std::max(entry, k.open - buffer);

    TradePlan plan;
    plan.side = is_long ? core::Side::Long : core::Side::Short;
    const bool clustered = cluster.side == ind::entry_side(plan.side);
    bool nudged = false;
    if (clustered && std::abs(entry - cluster.cluster_price) <= cluster.band) {
        // step past the resting stops instead of joining them
        entry = cluster.cluster_price - dir * (cluster.band + tick);
        nudged = true;
    }

    const double anchor = is_long ? std::min(extreme, entry) : std::max(extreme, entry);
    const double stop = anchor - dir * std::max(inst.stop_distance, tick);
    const double risk = std::abs(entry - stop);
    const double tp = entry + dir * risk * p.reward_risk;

    plan.symbol = inst.symbol;
    plan.entry = core::round_to(entry, inst.precision);
    plan.stop_loss = core::round_to(stop, inst.precision);
    plan.take_profit = core::round_to(tp, inst.precision);
    plan.take_profit1 = core::round_to((entry + tp) / 2.0, inst.precision);
    plan.confidence = score_confidence(true, fp.footprint, clustered, p.max_confidence);
    plan.sweep_ts_ms = s.ts_ms;

    plan.logic = fmt::format("{} sweep at {:.{}f} + {} confirm (range {:.{}f}-{:.{}f})",
                             is_long ? "Low" : "High", extreme, inst.precision,
                             is_long ? "green" : "red",
                             zone.recent_low, inst.precision, zone.recent_high, inst.precision);
    if (fp.footprint)
        plan.logic += fmt::format("; volume x{:.1f}", fp.volume / fp.mean_volume);
    if (nudged)
        plan.logic += fmt::format("; entry moved past {} stops at {:.{}f}",
                                  ind::to_string(cluster.side), cluster.cluster_price, inst.precision);
    return plan;
}

} // namespace strategy
