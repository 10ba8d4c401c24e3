#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <algorithm>
#include <cmath>

namespace core {

// Timeframe
enum class Timeframe { M1, M5, M15, M30, H1, D1 };

inline const char* to_interval(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1:  return "1min";
        case Timeframe::M5:  return "5min";
        case Timeframe::M15: return "15min";
        case Timeframe::M30: return "30min";
        case Timeframe::H1:  return "1h";
        default:             return "1day";
    }
}

// OHLCV candle, oldest-first in a series
struct Candle {
    std::int64_t ts_ms{};
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};

    bool green() const { return close > open; }
    bool red() const   { return close < open; }
    double range() const { return high - low; }
};

using CandleSeries = std::vector<Candle>;

// Plan direction
enum class Side { Long, Short };

inline const char* to_string(Side s) {
    return s == Side::Long ? "LONG" : "SHORT";
}

// Instrument identity: drives pip scaling, stop distance and rounding.
struct Instrument {
    std::string key{"XAU"};          // slot key ("XAU", "BTC")
    std::string symbol{"XAU/USD"};   // feed symbol
    double pip_size{0.1};
    double stop_distance{2.0};       // absolute price distance beyond the sweep extreme
    double tick{0.01};
    int precision{3};
    double cluster_band{0.0};        // stop-cluster band width in price units, 0 = analysis default
};

inline double round_to(double v, int decimals) {
    double m = 1.0;
    for (int i = 0; i < decimals; ++i) m *= 10.0;
    return std::round(v * m) / m;
}

} // namespace core
