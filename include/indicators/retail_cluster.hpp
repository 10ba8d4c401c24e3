#pragma once
#include <cstddef>
#include <vector>
#include "core/types.hpp"

namespace ind {

// Sell: highs concentrate (stops resting above). Buy: lows concentrate (stops below).
enum class ClusterSide { None, Buy, Sell };

inline const char* to_string(ClusterSide s) {
    switch (s) {
        case ClusterSide::Buy:  return "BUY";
        case ClusterSide::Sell: return "SELL";
        default:                return "NONE";
    }
}

struct RetailClusterParams {
    double band{0.15};              // full band width, values within center +/- band/2 count
    int lookback_minutes{200};
    int candle_minutes{5};
    std::size_t min_count{3};
    double min_fraction{0.08};      // of the sample size
};

struct RetailCluster {
    ClusterSide side{ClusterSide::None};
    double cluster_price{0.0};
    std::size_t count{0};
    double band{0.0};
};

// Density scan over the newest lookback/candle_minutes candles; highs win when both sides qualify.
RetailCluster detect_retail_cluster(const core::CandleSeries& candles, const RetailClusterParams& p = {});

struct Density {
    double center{0.0};
    std::size_t count{0};
};

// Value with the most neighbours inside +/- band/2; first one wins on ties.
Density densest_value(const std::vector<double>& values, double band);

// The side whose stops an entry for this plan direction would sit among.
inline ClusterSide entry_side(core::Side s) {
    return s == core::Side::Long ? ClusterSide::Buy : ClusterSide::Sell;
}

} // namespace ind
