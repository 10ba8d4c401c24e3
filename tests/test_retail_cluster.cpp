#include <gtest/gtest.h>
#include "indicators/retail_cluster.hpp"
#include "test_helpers.hpp"

using namespace testutil;

namespace {

// n candles with spread-out highs/lows; overrides put selected highs or lows into a band.
core::CandleSeries spread(std::size_t n) {
    core::CandleSeries c;
    for (std::size_t i = 0; i < n; ++i) {
        const double k = static_cast<double>(i);
        c.push_back(candle(static_cast<std::int64_t>(i) * 5 * kMin,
                           1935.0 + 0.5 * k, 1960.0 + 0.5 * k, 1900.0 + 0.5 * k, 1935.2 + 0.5 * k));
    }
    return c;
}

ind::RetailClusterParams xau_params() {
    ind::RetailClusterParams p;
    p.band = 0.15;
    p.lookback_minutes = 200;
    p.candle_minutes = 5;
    return p;
}

} // namespace

TEST(RetailCluster, FiveHighsInBandReportSellSide) {
    auto c = spread(40);
    const double near[] = {1950.0, 1950.02, 1949.98, 1950.03, 1949.97};
    const std::size_t at[] = {3, 10, 17, 25, 33};
    for (int i = 0; i < 5; ++i) c[at[i]].high = near[i];

    const auto r = ind::detect_retail_cluster(c, xau_params());
    EXPECT_EQ(r.side, ind::ClusterSide::Sell);
    EXPECT_EQ(r.count, 5u);
    EXPECT_NEAR(r.cluster_price, 1950.0, 0.031);
    EXPECT_DOUBLE_EQ(r.band, 0.15);
}

TEST(RetailCluster, LowsOnlyReportBuySide) {
    auto c = spread(40);
    for (std::size_t i : {2u, 9u, 21u, 30u}) c[i].low = 1905.25;
    const auto r = ind::detect_retail_cluster(c, xau_params());
    EXPECT_EQ(r.side, ind::ClusterSide::Buy);
    EXPECT_EQ(r.count, 4u);
    EXPECT_DOUBLE_EQ(r.cluster_price, 1905.25);
}

TEST(RetailCluster, HighsTakePriorityOverLows) {
    auto c = spread(40);
    for (std::size_t i : {2u, 9u, 21u}) c[i].high = 1970.25;
    for (std::size_t i : {4u, 11u, 22u, 35u, 38u}) c[i].low = 1910.25;
    const auto r = ind::detect_retail_cluster(c, xau_params());
    EXPECT_EQ(r.side, ind::ClusterSide::Sell);
    EXPECT_EQ(r.count, 3u);
}

TEST(RetailCluster, BelowThresholdIsNone) {
    auto c = spread(40);
    c[5].high = 1950.0;
    c[6].high = 1950.05;
    const auto r = ind::detect_retail_cluster(c, xau_params());
    EXPECT_EQ(r.side, ind::ClusterSide::None);
}

TEST(RetailCluster, RelativeThresholdScalesWithSample) {
    // 100 candles -> at least 8 touches needed
    auto c = spread(100);
    for (std::size_t i : {10u, 20u, 30u, 40u, 50u}) c[i].high = 1950.0;
    auto p = xau_params();
    p.lookback_minutes = 500;
    EXPECT_EQ(ind::detect_retail_cluster(c, p).side, ind::ClusterSide::None);

    for (std::size_t i : {60u, 70u, 80u}) c[i].high = 1950.0;
    const auto r = ind::detect_retail_cluster(c, p);
    EXPECT_EQ(r.side, ind::ClusterSide::Sell);
    EXPECT_EQ(r.count, 8u);
}

TEST(RetailCluster, OlderCandlesOutsideLookbackAreIgnored) {
    auto c = spread(60);
    for (std::size_t i : {0u, 1u, 2u, 3u, 4u}) c[i].high = 1950.0;   // not in the newest 40
    EXPECT_EQ(ind::detect_retail_cluster(c, xau_params()).side, ind::ClusterSide::None);
}

TEST(RetailCluster, EmptySeries) {
    const auto r = ind::detect_retail_cluster({}, xau_params());
    EXPECT_EQ(r.side, ind::ClusterSide::None);
    EXPECT_EQ(r.count, 0u);
}

TEST(RetailCluster, DensestValueCountsInclusiveHalfBand) {
    const auto d = ind::densest_value({1.0, 1.05, 1.075, 1.2, 1.3}, 0.15);
    EXPECT_DOUBLE_EQ(d.center, 1.0);
    EXPECT_EQ(d.count, 3u);
}

TEST(RetailCluster, EntrySideMapping) {
    EXPECT_EQ(ind::entry_side(core::Side::Long), ind::ClusterSide::Buy);
    EXPECT_EQ(ind::entry_side(core::Side::Short), ind::ClusterSide::Sell);
}
