#pragma once
#include <string>
#include "data/candle_feed.hpp"

namespace data {

struct FeedConfig {
    std::string api_key;
    std::string base_url{"https://api.twelvedata.com"};
    int timeout_ms{12000};
};

// GET /time_series through cpr
class TwelveDataFeed final : public ICandleFeed {
public:
    explicit TwelveDataFeed(FeedConfig cfg);
    FeedResult fetch_series(const std::string& symbol, const std::string& interval, int count) override;

private:
    FeedConfig cfg_;
};

} // namespace data
