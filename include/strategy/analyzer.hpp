#pragma once
#include <optional>
#include "core/types.hpp"
#include "strategy/trade_plan.hpp"

namespace strategy {

struct AnalysisParams {
    ind::SweepParams sweep;
    ind::RetailClusterParams cluster;
    ind::FootprintParams footprint;
    PlanParams plan;
};

struct Analysis {
    std::optional<ind::LiquidityZone> zone;
    ind::SweepDetection sweep{ind::NoSignal{}};
    ind::RetailCluster cluster;
    ind::FootprintSignal footprint;
    std::optional<TradePlan> plan;
};

// 15m: zone + sweep. On a sweep, 5m: cluster (instrument band when set) + footprint, then the plan.
Analysis analyze(const core::Instrument& inst,
                 const core::CandleSeries& candles_15m,
                 const core::CandleSeries& candles_5m,
                 const AnalysisParams& p);

} // namespace strategy
