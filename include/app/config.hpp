#pragma once
#include <string>
#include <vector>
#include "core/types.hpp"
#include "data/twelvedata_feed.hpp"
#include "exec/setup_tracker.hpp"
#include "strategy/analyzer.hpp"
#include "telemetry/telegram_notifier.hpp"

namespace app {

struct ScheduleConfig {
    int pre_session_minute{16 * 60 + 55};   // local HH:MM
    int monitor_interval_min{5};
};

struct CandleCounts {
    int snapshot_15m{96};
    int scan_15m{96};
    int scan_5m{60};
};

struct AppConfig {
    data::FeedConfig feed;
    telemetry::TelegramConfig telegram;
    std::vector<core::Instrument> instruments;
    strategy::AnalysisParams analysis;
    exec::TrackerParams tracker;
    ScheduleConfig schedule;
    CandleCounts candles;
    int utc_offset_minutes{5 * 60};
    std::string log_level{"info"};
};

// XAU/USD (20 pips stop) and BTC/USD (350 USD stop), New York session at UTC+5.
AppConfig default_config();

// Overlays a JSON document on the defaults. false + message on bad input.
bool parse_config(const std::string& json_text, AppConfig& out, std::string* out_msg);
bool load_config(const std::string& path, AppConfig& out, std::string* out_msg);

// TWELVE_API_KEY, TELEGRAM_TOKEN, TELEGRAM_CHAT_ID
void apply_env(AppConfig& cfg);

} // namespace app
