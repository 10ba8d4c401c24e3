#include <gtest/gtest.h>
#include "app/replay.hpp"
#include "test_helpers.hpp"

using namespace testutil;

namespace {

// 14 x 15m candles: falling lows, a swept low at [5] confirmed by a green [6], then rising lows.
// Every low is distinct so no buy-side stop cluster forms under the entry.
core::CandleSeries sweep_15m() {
    auto c = from_lows({1912, 1911, 1910, 1909, 1908, 1900, 1902,
                        1913, 1914, 1915, 1916, 1917, 1918, 1919});
    c[5] = candle(c[5].ts_ms, 1902.0, 1904.0, 1900.0, 1902.5);
    c[6] = candle(c[6].ts_ms, 1902.5, 1904.0, 1902.0, 1903.5);
    return c;
}

// Three 5m bars per 15m candle whose aggregate is that candle.
core::CandleSeries to_5m(const core::CandleSeries& c15) {
    core::CandleSeries out;
    for (const auto& k : c15) {
        out.push_back(candle(k.ts_ms, k.open, k.open, k.low, k.low));
        out.push_back(candle(k.ts_ms + 5 * kMin, k.low, k.high, k.low, k.high));
        out.push_back(candle(k.ts_ms + 10 * kMin, k.high, k.high, k.close, k.close));
    }
    return out;
}

app::AppConfig all_day() {
    auto c = app::default_config();
    c.instruments.resize(1);
    c.utc_offset_minutes = 0;
    c.tracker.session = exec::SessionWindow{0, 24 * 60 - 1};
    return c;
}

// plan armed after bar 41: LONG entry 1901.75, stop 1898, target 1916.75
core::CandleSeries with_bars(std::initializer_list<core::Candle> tail) {
    auto c5 = to_5m(sweep_15m());
    std::int64_t ts = c5.back().ts_ms;
    for (auto b : tail) {
        ts += 5 * kMin;
        b.ts_ms = ts;
        c5.push_back(b);
    }
    return c5;
}

} // namespace

TEST(ResolveBar, StopBeforeTarget) {
    const auto p = plan(core::Side::Long, 1900.0, 1);   // stop 1898, target 1908
    EXPECT_EQ(app::resolve_bar(p, candle(0, 1900, 1901, 1899, 1900)), app::TradeOutcome::Open);
    EXPECT_EQ(app::resolve_bar(p, candle(0, 1900, 1909, 1899, 1908)), app::TradeOutcome::Target);
    EXPECT_EQ(app::resolve_bar(p, candle(0, 1900, 1909, 1897, 1908)), app::TradeOutcome::Stopped);

    const auto s = plan(core::Side::Short, 1900.0, 1);   // stop 1902, target 1892
    EXPECT_EQ(app::resolve_bar(s, candle(0, 1900, 1901, 1891, 1892)), app::TradeOutcome::Target);
    EXPECT_EQ(app::resolve_bar(s, candle(0, 1900, 1902, 1891, 1892)), app::TradeOutcome::Stopped);
}

TEST(Replay, StopInsideTriggerBarIsCounted) {
    const auto st = app::run_replay(all_day().instruments[0],
                                    with_bars({candle(0, 1905, 1906, 1897, 1899)}), all_day());
    EXPECT_EQ(st.candles_15m, 14u);
    EXPECT_EQ(st.armed, 1);
    EXPECT_EQ(st.triggered, 1);
    EXPECT_EQ(st.losses, 1);
    EXPECT_EQ(st.wins, 0);
    EXPECT_EQ(st.open, 0);
    EXPECT_DOUBLE_EQ(st.total_r, -1.0);
}

TEST(Replay, TargetInsideTriggerBarIsCounted) {
    const auto st = app::run_replay(all_day().instruments[0],
                                    with_bars({candle(0, 1901, 1918, 1900, 1917)}), all_day());
    EXPECT_EQ(st.triggered, 1);
    EXPECT_EQ(st.wins, 1);
    EXPECT_EQ(st.open, 0);
    EXPECT_DOUBLE_EQ(st.total_r, 4.0);
}

TEST(Replay, TradeRunsUntilLaterBarResolvesIt) {
    const auto st = app::run_replay(all_day().instruments[0],
                                    with_bars({candle(0, 1902, 1903, 1901, 1902.5),
                                               candle(0, 1902, 1903, 1897, 1898)}),
                                    all_day());
    EXPECT_EQ(st.triggered, 1);
    EXPECT_EQ(st.losses, 1);
    EXPECT_EQ(st.open, 0);
}

TEST(Replay, NoSweepNoTrades) {
    std::vector<double> lows;
    for (int i = 0; i < 20; ++i) lows.push_back(1900.0 + i);
    const auto st = app::run_replay(all_day().instruments[0], to_5m(from_lows(lows)), all_day());
    EXPECT_EQ(st.armed, 0);
    EXPECT_EQ(st.triggered, 0);
    EXPECT_DOUBLE_EQ(st.total_r, 0.0);
}
