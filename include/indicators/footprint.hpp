#pragma once
#include <cstddef>
#include "core/types.hpp"

namespace ind {

struct FootprintParams {
    std::size_t window{8};       // newest candles inspected, the newest included
    std::size_t min_candles{6};
    double spike_ratio{1.5};
};

struct FootprintSignal {
    bool footprint{false};
    double volume{0.0};
    double mean_volume{0.0};
    bool direction_agreement{false};
};

// Volume spike of the newest candle against the mean of the preceding ones.
FootprintSignal detect_footprint(const core::CandleSeries& candles, const FootprintParams& p = {});

} // namespace ind
