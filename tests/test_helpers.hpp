#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "core/clock.hpp"
#include "core/types.hpp"
#include "data/candle_feed.hpp"
#include "strategy/trade_plan.hpp"
#include "telemetry/telegram_notifier.hpp"

namespace testutil {

constexpr std::int64_t kMin = 60 * 1000;

inline core::Candle candle(std::int64_t ts, double o, double h, double l, double c, double v = 100.0) {
    return core::Candle{ts, o, h, l, c, v};
}

// Green candles with a 0.5 lower-wick ratio: open = low+1, close = low+1.5, high = low+2.
inline core::CandleSeries from_lows(const std::vector<double>& lows, std::int64_t step = 15 * kMin) {
    core::CandleSeries out;
    for (std::size_t i = 0; i < lows.size(); ++i) {
        const double l = lows[i];
        out.push_back(candle(static_cast<std::int64_t>(i) * step, l + 1.0, l + 2.0, l, l + 1.5));
    }
    return out;
}

// Red mirror: open = high-1, close = high-1.5, low = high-2.
inline core::CandleSeries from_highs(const std::vector<double>& highs, std::int64_t step = 15 * kMin) {
    core::CandleSeries out;
    for (std::size_t i = 0; i < highs.size(); ++i) {
        const double h = highs[i];
        out.push_back(candle(static_cast<std::int64_t>(i) * step, h - 1.0, h, h - 2.0, h - 1.5));
    }
    return out;
}

// 14 x 15m candles; candle[5] sweeps below candle[4] and candle[6], candle[6] closes green.
inline core::CandleSeries long_sweep_series() {
    auto c = from_lows({1906, 1905, 1904, 1903, 1901, 1900, 1902,
                        1903, 1904, 1905, 1906, 1907, 1908, 1909});
    c[5] = candle(c[5].ts_ms, 1902.0, 1904.0, 1900.0, 1902.5);   // lower wick 2 of range 4
    c[6] = candle(c[6].ts_ms, 1902.5, 1904.0, 1902.0, 1903.5);
    return c;
}

// 5m candles with distinct, widely spaced highs and lows (no stop cluster) and flat volume.
inline core::CandleSeries quiet_5m(std::size_t n, double volume = 100.0) {
    core::CandleSeries out;
    for (std::size_t i = 0; i < n; ++i) {
        const double lo = 1880.0 + 0.5 * static_cast<double>(i);
        const double hi = 1950.0 + 0.5 * static_cast<double>(i);
        out.push_back(candle(static_cast<std::int64_t>(i) * 5 * kMin, lo + 1.0, hi, lo, lo + 1.2, volume));
    }
    return out;
}

inline core::LocalTime at(int date_key, int hh, int mm, std::int64_t day) {
    core::LocalTime t;
    t.date_key = date_key;
    t.minute_of_day = hh * 60 + mm;
    t.day = day;
    return t;
}

inline strategy::TradePlan plan(core::Side side, double entry, std::int64_t sweep_ts) {
    strategy::TradePlan p;
    p.symbol = "XAU/USD";
    p.side = side;
    p.entry = entry;
    const double d = side == core::Side::Long ? -2.0 : 2.0;
    p.stop_loss = entry + d;
    p.take_profit = entry - 4.0 * d;
    p.take_profit1 = entry - 2.0 * d;
    p.confidence = 0.8;
    p.sweep_ts_ms = sweep_ts;
    return p;
}

// Canned responses keyed by "symbol|interval"; unknown keys fail as transport errors.
class FakeFeed : public data::ICandleFeed {
public:
    void set(const std::string& symbol, const std::string& interval, data::FeedResult r) {
        responses_[symbol + "|" + interval] = std::move(r);
    }

    data::FeedResult fetch_series(const std::string& symbol, const std::string& interval, int count) override {
        calls.push_back(symbol + "|" + interval + "|" + std::to_string(count));
        auto it = responses_.find(symbol + "|" + interval);
        if (it == responses_.end()) return data::FeedError{data::FeedErrorKind::Transport, "no route"};
        return it->second;
    }

    std::vector<std::string> calls;

private:
    std::map<std::string, data::FeedResult> responses_;
};

class RecordingNotifier : public telemetry::INotifier {
public:
    bool send(const std::string& text) override {
        sent.push_back(text);
        return !fail;
    }

    bool fail{false};
    std::vector<std::string> sent;
};

} // namespace testutil
