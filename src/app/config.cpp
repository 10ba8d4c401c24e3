#include "app/config.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace app {

AppConfig default_config() {
    AppConfig c;
    core::Instrument xau;
    xau.key = "XAU"; xau.symbol = "XAU/USD";
    xau.pip_size = 0.1; xau.stop_distance = 20 * xau.pip_size;
    xau.tick = 0.01; xau.precision = 3;

    core::Instrument btc;
    btc.key = "BTC"; btc.symbol = "BTC/USD";
    btc.pip_size = 1.0; btc.stop_distance = 350.0;
    btc.tick = 0.01; btc.precision = 2;
    btc.cluster_band = 5.0;

    c.instruments = {xau, btc};
    return c;
}

static bool hhmm(const json& j, const char* k, int& out, std::string* out_msg) {
    if (!j.contains(k)) return true;
    const int m = core::parse_hhmm(j.at(k).get<std::string>());
    if (m < 0) {
        if (out_msg) *out_msg = std::string("bad HH:MM for '") + k + "'";
        return false;
    }
    out = m;
    return true;
}

static core::Instrument parse_instrument(const json& j) {
    core::Instrument i;
    i.key = j.at("key").get<std::string>();
    i.symbol = j.value("symbol", i.key);
    i.pip_size = j.value("pip_size", i.pip_size);
    i.tick = j.value("tick", i.tick);
    i.precision = j.value("precision", i.precision);
    i.cluster_band = j.value("cluster_band", i.cluster_band);
    if (j.contains("stop_pips")) i.stop_distance = j.at("stop_pips").get<double>() * i.pip_size;
    else i.stop_distance = j.value("stop_distance", i.stop_distance);
    return i;
}

static bool validate(const AppConfig& c, std::string* out_msg) {
    auto fail = [&](const std::string& m) { if (out_msg) *out_msg = m; return false; };
    // spdlog maps unknown names to off
    if (spdlog::level::from_str(c.log_level) == spdlog::level::off && c.log_level != "off")
        return fail("unknown log_level '" + c.log_level + "'");
    if (c.instruments.empty()) return fail("no instruments configured");
    for (const auto& i : c.instruments) {
        if (i.key.empty() || i.symbol.empty()) return fail("instrument without key/symbol");
        if (i.stop_distance <= 0.0) return fail("stop distance must be positive for " + i.key);
        if (i.precision < 0 || i.precision > 8) return fail("precision out of range for " + i.key);
        if (i.cluster_band < 0.0) return fail("cluster_band must not be negative for " + i.key);
    }
    const auto& a = c.analysis;
    if (a.sweep.lookback < 2) return fail("sweep.lookback must be at least 2");
    if (a.cluster.band <= 0.0) return fail("cluster.band must be positive");
    if (a.footprint.min_candles < 2) return fail("footprint.min_candles must be at least 2");
    if (a.plan.reward_risk <= 0.0) return fail("plan.reward_risk must be positive");
    if (c.tracker.trigger_tolerance < 0.0) return fail("tracker.trigger_tolerance must not be negative");
    if (c.tracker.max_alerts_per_day < 0) return fail("tracker.max_alerts_per_day must not be negative");
    if (c.schedule.monitor_interval_min <= 0) return fail("schedule.monitor_interval_min must be positive");
    return true;
}

bool parse_config(const std::string& text, AppConfig& out, std::string* out_msg) {
    AppConfig c = out;
    try {
        const json j = json::parse(text);
        c.log_level = j.value("log_level", c.log_level);
        c.utc_offset_minutes = j.value("utc_offset_minutes", c.utc_offset_minutes);

        if (j.contains("feed")) {
            const auto& f = j["feed"];
            c.feed.base_url = f.value("base_url", c.feed.base_url);
            c.feed.api_key = f.value("api_key", c.feed.api_key);
            c.feed.timeout_ms = f.value("timeout_ms", c.feed.timeout_ms);
        }
        if (j.contains("telegram")) {
            const auto& t = j["telegram"];
            c.telegram.base_url = t.value("base_url", c.telegram.base_url);
            c.telegram.token = t.value("token", c.telegram.token);
            c.telegram.chat_id = t.value("chat_id", c.telegram.chat_id);
            c.telegram.timeout_ms = t.value("timeout_ms", c.telegram.timeout_ms);
        }
        if (j.contains("session")) {
            const auto& s = j["session"];
            if (!hhmm(s, "start", c.tracker.session.start_minute, out_msg)) return false;
            if (!hhmm(s, "end", c.tracker.session.end_minute, out_msg)) return false;
        }
        if (j.contains("schedule")) {
            const auto& s = j["schedule"];
            if (!hhmm(s, "pre_session", c.schedule.pre_session_minute, out_msg)) return false;
            c.schedule.monitor_interval_min = s.value("monitor_interval_min", c.schedule.monitor_interval_min);
        }
        if (j.contains("candles")) {
            const auto& k = j["candles"];
            c.candles.snapshot_15m = k.value("snapshot_15m", c.candles.snapshot_15m);
            c.candles.scan_15m = k.value("scan_15m", c.candles.scan_15m);
            c.candles.scan_5m = k.value("scan_5m", c.candles.scan_5m);
        }
        if (j.contains("sweep")) {
            const auto& s = j["sweep"];
            auto& p = c.analysis.sweep;
            p.lookback = s.value("lookback", p.lookback);
            p.min_wick_ratio = s.value("min_wick_ratio", p.min_wick_ratio);
            const auto bias = s.value("bias", std::string("both"));
            if (bias == "long") p.bias = ind::SweepBias::LongOnly;
            else if (bias == "short") p.bias = ind::SweepBias::ShortOnly;
            else if (bias == "both") p.bias = ind::SweepBias::Both;
            else { if (out_msg) *out_msg = "sweep.bias must be long, short or both"; return false; }
        }
        if (j.contains("cluster")) {
            const auto& s = j["cluster"];
            auto& p = c.analysis.cluster;
            p.band = s.value("band", p.band);
            p.lookback_minutes = s.value("lookback_minutes", p.lookback_minutes);
            p.min_count = s.value("min_count", p.min_count);
            p.min_fraction = s.value("min_fraction", p.min_fraction);
        }
        if (j.contains("footprint")) {
            const auto& s = j["footprint"];
            auto& p = c.analysis.footprint;
            p.window = s.value("window", p.window);
            p.min_candles = s.value("min_candles", p.min_candles);
            p.spike_ratio = s.value("spike_ratio", p.spike_ratio);
        }
        if (j.contains("plan")) {
            const auto& s = j["plan"];
            auto& p = c.analysis.plan;
            p.reward_risk = s.value("reward_risk", p.reward_risk);
            p.entry_buffer = s.value("entry_buffer", p.entry_buffer);
            p.max_confidence = s.value("max_confidence", p.max_confidence);
        }
        if (j.contains("tracker")) {
            const auto& s = j["tracker"];
            c.tracker.trigger_tolerance = s.value("trigger_tolerance", c.tracker.trigger_tolerance);
            c.tracker.max_alerts_per_day = s.value("max_alerts_per_day", c.tracker.max_alerts_per_day);
        }
        if (j.contains("instruments")) {
            c.instruments.clear();
            for (const auto& i : j.at("instruments")) c.instruments.push_back(parse_instrument(i));
        }
    } catch (const json::exception& e) {
        if (out_msg) *out_msg = e.what();
        return false;
    }
    if (!validate(c, out_msg)) return false;
    out = std::move(c);
    return true;
}

bool load_config(const std::string& path, AppConfig& out, std::string* out_msg) {
    std::ifstream f(path);
    if (!f.good()) {
        if (out_msg) *out_msg = "cannot open " + path;
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return parse_config(ss.str(), out, out_msg);
}

void apply_env(AppConfig& cfg) {
    if (const char* k = std::getenv("TWELVE_API_KEY")) cfg.feed.api_key = k;
    if (const char* t = std::getenv("TELEGRAM_TOKEN")) cfg.telegram.token = t;
    if (const char* c = std::getenv("TELEGRAM_CHAT_ID")) cfg.telegram.chat_id = c;
    if (cfg.feed.api_key.empty()) spdlog::warn("TWELVE_API_KEY not set, feed requests will be rejected");
}

} // namespace app
