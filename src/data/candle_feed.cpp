#include "data/candle_feed.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>

using json = nlohmann::json;

namespace data {

static std::string to_s(const json& j, const char* k) {
    if (j.contains(k) && j[k].is_string()) return j[k].get<std::string>();
    return {};
}

static double to_d(const json& j, const char* k, bool* ok = nullptr){
    if (ok) *ok = true;
    if (j.contains(k)) {
        const auto& v = j[k];
        if (v.is_number()) return v.get<double>();
        if (v.is_string() && !v.get_ref<const std::string&>().empty()) {
            const auto& s = v.get_ref<const std::string&>();
            char* end = nullptr;
            double d = std::strtod(s.c_str(), &end);
            if (end != s.c_str()) return d;
        }
    }
    if (ok) *ok = false;
    return 0.0;
}

// prefix of at most n bytes that does not end inside a UTF-8 sequence
static std::string clip_utf8(const std::string& s, std::size_t n) {
    if (s.size() <= n) return s;
    while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80) --n;
    return s.substr(0, n);
}

// days since 1970-01-01 for a proleptic Gregorian date
static std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

std::optional<std::int64_t> parse_datetime_ms(const std::string& s) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, se = 0;
    const int n = std::sscanf(s.c_str(), "%d-%d-%d %d:%d:%d", &y, &mo, &d, &h, &mi, &se);
    if (n != 3 && n != 5 && n != 6) return std::nullopt;
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h < 0 || h > 23 || mi < 0 || mi > 59 || se < 0 || se > 60)
        return std::nullopt;
    const std::int64_t days = days_from_civil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
    return ((days * 24 + h) * 60 + mi) * 60000LL + se * 1000LL;
}

FeedResult parse_time_series(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return FeedError{FeedErrorKind::Malformed, std::string("invalid JSON: ") + e.what()};
    }
    if (!j.is_object() || !j.contains("values") || !j["values"].is_array()) {
        std::string msg = j.is_object() ? to_s(j, "message") : std::string{};
        if (msg.empty())
            msg = "response has no values: " + clip_utf8(j.dump(-1, ' ', false, json::error_handler_t::replace), 200);
        return FeedError{FeedErrorKind::Malformed, msg};
    }

    const auto& vals = j["values"];
    core::CandleSeries out;
    out.reserve(vals.size());
    // provider sends newest first
    for (auto it = vals.rbegin(); it != vals.rend(); ++it) {
        const auto& v = *it;
        if (!v.is_object()) return FeedError{FeedErrorKind::Malformed, "candle is not an object"};
        const auto ts = parse_datetime_ms(to_s(v, "datetime"));
        bool o_ok, h_ok, l_ok, c_ok;
        core::Candle c;
        c.open  = to_d(v, "open", &o_ok);
        c.high  = to_d(v, "high", &h_ok);
        c.low   = to_d(v, "low", &l_ok);
        c.close = to_d(v, "close", &c_ok);
        c.volume = std::max(0.0, to_d(v, "volume"));
        if (!ts || !o_ok || !h_ok || !l_ok || !c_ok)
            return FeedError{FeedErrorKind::Malformed, "candle missing datetime or OHLC: " + v.dump()};
        c.ts_ms = *ts;
        out.push_back(c);
    }
    return out;
}

std::optional<double> latest_price(ICandleFeed& feed, const std::string& symbol) {
    auto r = feed.fetch_series(symbol, core::to_interval(core::Timeframe::M1), 1);
    if (const auto* err = std::get_if<FeedError>(&r)) {
        spdlog::warn("price for {} unavailable ({}): {}", symbol, to_string(err->kind), err->message);
        return std::nullopt;
    }
    const auto& c = std::get<core::CandleSeries>(r);
    if (c.empty()) return std::nullopt;
    return c.back().close;
}

} // namespace data
