#include "indicators/retail_cluster.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

Density densest_value(const std::vector<double>& v, double band) {
    Density best;
    const double half = band / 2.0 + 1e-9;
    for (std::size_t i = 0; i < v.size(); ++i) {
        std::size_t n = 0;
        for (double x : v)
            if (std::abs(x - v[i]) <= half) ++n;
        if (n > best.count) { best.count = n; best.center = v[i]; }
    }
    return best;
}

RetailCluster detect_retail_cluster(const core::CandleSeries& c, const RetailClusterParams& p) {
    RetailCluster out;
    out.band = p.band;
    const int per = std::max(1, p.candle_minutes);
    const std::size_t want = static_cast<std::size_t>(std::max(1, p.lookback_minutes / per));
    const std::size_t n = std::min(want, c.size());
    if (n == 0) return out;

    std::vector<double> highs, lows;
    highs.reserve(n); lows.reserve(n);
    for (std::size_t i = c.size() - n; i < c.size(); ++i) {
        highs.push_back(c[i].high);
        lows.push_back(c[i].low);
    }

    // fractional part of the relative threshold is truncated: 8% of 40 -> 3
    const std::size_t need = std::max(p.min_count,
        static_cast<std::size_t>(p.min_fraction * static_cast<double>(n)));
    const auto hi = densest_value(highs, p.band);
    const auto lo = densest_value(lows, p.band);

    if (hi.count >= need) {
        out.side = ClusterSide::Sell; out.cluster_price = hi.center; out.count = hi.count;
    } else if (lo.count >= need) {
        out.side = ClusterSide::Buy; out.cluster_price = lo.center; out.count = lo.count;
    }
    return out;
}

} // namespace ind
