#include "data/twelvedata_feed.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace data {

TwelveDataFeed::TwelveDataFeed(FeedConfig cfg) : cfg_(std::move(cfg)) {}

FeedResult TwelveDataFeed::fetch_series(const std::string& symbol, const std::string& interval, int count) {
    cpr::Response r = cpr::Get(cpr::Url{cfg_.base_url + "/time_series"},
                               cpr::Parameters{{"symbol", symbol},
                                               {"interval", interval},
                                               {"outputsize", std::to_string(count)},
                                               {"format", "JSON"},
                                               {"apikey", cfg_.api_key}},
                               cpr::Timeout{cfg_.timeout_ms},
                               cpr::VerifySsl{true});

    if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT)
        return FeedError{FeedErrorKind::Timeout, symbol + " " + interval + ": " + r.error.message};
    if (r.error)
        return FeedError{FeedErrorKind::Transport, symbol + " " + interval + ": " + r.error.message};
    if (r.status_code >= 400) {
        spdlog::warn("GET time_series {} {}: {} {}", symbol, interval, r.status_code, r.text);
        return FeedError{FeedErrorKind::Http, "HTTP " + std::to_string(r.status_code)};
    }

    auto res = parse_time_series(r.text);
    if (const auto* c = std::get_if<core::CandleSeries>(&res))
        spdlog::debug("fetched {} {} candles for {}", c->size(), interval, symbol);
    return res;
}

} // namespace data
