#include "app/monitor.hpp"
#include <spdlog/spdlog.h>
#include "telemetry/alerts.hpp"

namespace app {

static bool notify(MonitorContext& ctx, const std::string& text) {
    if (ctx.notifier.send(text)) return true;
    spdlog::warn("alert not delivered: {}", text.substr(0, 80));
    return false;
}

static const core::CandleSeries* candles_or_log(const data::FeedResult& r, const core::Instrument& inst,
                                                const char* interval) {
    if (const auto* err = std::get_if<data::FeedError>(&r)) {
        spdlog::warn("[{}] {} feed {} error, skipping this cycle: {}", inst.key, interval,
                     data::to_string(err->kind), err->message);
        return nullptr;
    }
    return &std::get<core::CandleSeries>(r);
}

void run_pre_session(MonitorContext& ctx, core::TimePoint now) {
    const auto local = core::to_local(now, ctx.cfg.utc_offset_minutes);
    spdlog::info("pre-session job at {}", core::format_hhmm(local.minute_of_day));
    notify(ctx, telemetry::alerts::pre_session_header(local));

    const char* m15 = core::to_interval(core::Timeframe::M15);
    for (const auto& inst : ctx.cfg.instruments) {
        const auto r = ctx.feed.fetch_series(inst.symbol, m15, ctx.cfg.candles.snapshot_15m);
        if (const auto* err = std::get_if<data::FeedError>(&r)) {
            spdlog::warn("[{}] pre-session snapshot failed: {}", inst.key, err->message);
            notify(ctx, telemetry::alerts::job_error("Pre-alert " + inst.symbol, err->message));
            continue;
        }
        const auto zone = ind::compute_liquidity_zone(std::get<core::CandleSeries>(r));
        if (!zone) {
            spdlog::warn("[{}] pre-session snapshot: no candles", inst.key);
            continue;
        }
        notify(ctx, telemetry::alerts::liquidity_snapshot(inst, *zone));
    }
}

CycleStats run_monitor_cycle(MonitorContext& ctx, core::TimePoint now) {
    CycleStats st;
    const auto local = core::to_local(now, ctx.cfg.utc_offset_minutes);
    if (!ctx.tracker.params().session.contains(local)) {
        spdlog::debug("outside session hours ({})", core::format_hhmm(local.minute_of_day));
        return st;
    }
    st.in_session = true;
    spdlog::info("monitoring {}", core::format_hhmm(local.minute_of_day));

    for (const auto& [key, plan] : ctx.tracker.expire_stale(local)) {
        ++st.expired;
        if (!notify(ctx, telemetry::alerts::plan_expired(key, plan, "new session"))) ++st.notify_failures;
    }

    const char* m15 = core::to_interval(core::Timeframe::M15);
    const char* m5 = core::to_interval(core::Timeframe::M5);
    for (const auto& inst : ctx.cfg.instruments) {
        if (ctx.tracker.get(inst.key).state == exec::SetupState::Armed) {
            const auto price = data::latest_price(ctx.feed, inst.symbol);
            if (!price) { ++st.skipped; continue; }
            strategy::TradePlan fired;
            const auto res = ctx.tracker.on_price(inst.key, *price, local, &fired);
            spdlog::debug("[{}] price {} -> {}", inst.key, *price, exec::to_string(res));
            if (res == exec::CheckResult::Triggered) {
                ++st.triggered;
                if (!notify(ctx, telemetry::alerts::plan_triggered(fired, *price, inst.precision)))
                    ++st.notify_failures;
            }
        }

        const auto r15 = ctx.feed.fetch_series(inst.symbol, m15, ctx.cfg.candles.scan_15m);
        const auto* c15 = candles_or_log(r15, inst, m15);
        if (!c15) { ++st.skipped; continue; }
        if (!ind::has_signal(ind::detect_sweep(*c15, ctx.cfg.analysis.sweep))) continue;

        const auto r5 = ctx.feed.fetch_series(inst.symbol, m5, ctx.cfg.candles.scan_5m);
        const auto* c5 = candles_or_log(r5, inst, m5);
        if (!c5) { ++st.skipped; continue; }

        const auto a = strategy::analyze(inst, *c15, *c5, ctx.cfg.analysis);
        if (!a.plan) continue;
        const auto res = ctx.tracker.arm(inst.key, *a.plan, local);
        spdlog::debug("[{}] arm -> {}", inst.key, exec::to_string(res));
        if (res == exec::ArmResult::Armed || res == exec::ArmResult::Replaced) ++st.armed;
    }
    return st;
}

} // namespace app
