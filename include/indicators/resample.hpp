#pragma once
#include <cstddef>
#include "core/types.hpp"

namespace ind {

// N lower-timeframe candles -> 1 higher-timeframe candle. Buckets are aligned
// on ts_ms modulo the higher-timeframe length; a trailing partial bucket is dropped.
core::CandleSeries resample(const core::CandleSeries& candles, std::size_t factor,
                            std::int64_t base_ms);

} // namespace ind
