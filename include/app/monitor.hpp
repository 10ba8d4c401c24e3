#pragma once
#include "app/config.hpp"
#include "core/clock.hpp"
#include "data/candle_feed.hpp"
#include "exec/setup_tracker.hpp"
#include "telemetry/telegram_notifier.hpp"

namespace app {

// State carried between monitoring runs; owned by the scheduling loop.
struct MonitorContext {
    MonitorContext(AppConfig c, data::ICandleFeed& f, telemetry::INotifier& n)
        : cfg(std::move(c)), feed(f), notifier(n), tracker(cfg.tracker) {}

    AppConfig cfg;
    data::ICandleFeed& feed;
    telemetry::INotifier& notifier;
    exec::SetupTracker tracker;
};

struct CycleStats {
    bool in_session{false};
    int skipped{0};     // instruments dropped this cycle on a feed error
    int armed{0};
    int triggered{0};
    int expired{0};
    int notify_failures{0};
};

// Session header plus a liquidity snapshot per instrument.
void run_pre_session(MonitorContext& ctx, core::TimePoint now);

// Trigger check then scan, per instrument. No state changes outside the session window.
CycleStats run_monitor_cycle(MonitorContext& ctx, core::TimePoint now);

} // namespace app
