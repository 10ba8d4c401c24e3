#include "strategy/analyzer.hpp"

namespace strategy {

Analysis analyze(const core::Instrument& inst,
                 const core::CandleSeries& c15,
                 const core::CandleSeries& c5,
                 const AnalysisParams& p) {
    Analysis a;
    a.zone = ind::compute_liquidity_zone(c15);
    a.sweep = ind::detect_sweep(c15, p.sweep);
    const auto* sw = std::get_if<ind::Sweep>(&a.sweep);
    if (!sw || !a.zone) return a;

    ind::RetailClusterParams cp = p.cluster;
    if (inst.cluster_band > 0.0) cp.band = inst.cluster_band;
    a.cluster = ind::detect_retail_cluster(c5, cp);
    a.footprint = ind::detect_footprint(c5, p.footprint);
    a.plan = build_trade_plan(inst, *sw, *a.zone, a.cluster, a.footprint, p.plan);
    return a;
}

} // namespace strategy
