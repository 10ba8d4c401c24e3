#pragma once
#include <optional>
#include <string>
#include <variant>
#include "core/types.hpp"

namespace data {

enum class FeedErrorKind { Transport, Timeout, Http, Malformed };

inline const char* to_string(FeedErrorKind k) {
    switch (k) {
        case FeedErrorKind::Transport: return "transport";
        case FeedErrorKind::Timeout:   return "timeout";
        case FeedErrorKind::Http:      return "http";
        default:                       return "malformed";
    }
}

struct FeedError {
    FeedErrorKind kind{FeedErrorKind::Transport};
    std::string message;
};

using FeedResult = std::variant<core::CandleSeries, FeedError>;

inline bool ok(const FeedResult& r) { return std::holds_alternative<core::CandleSeries>(r); }

// Market data provider: candles oldest-first
class ICandleFeed {
public:
    virtual ~ICandleFeed() = default;
    virtual FeedResult fetch_series(const std::string& symbol, const std::string& interval, int count) = 0;
};

// Close of the newest 1-minute candle; nullopt on any feed error.
std::optional<double> latest_price(ICandleFeed& feed, const std::string& symbol);

// TwelveData time_series body -> candles, oldest-first.
FeedResult parse_time_series(const std::string& body);

// "YYYY-MM-DD[ HH:MM[:SS]]" (read as UTC) -> epoch ms, nullopt if malformed
std::optional<std::int64_t> parse_datetime_ms(const std::string& s);

} // namespace data
