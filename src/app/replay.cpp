#include "app/replay.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <vector>
#include "core/clock.hpp"
#include "exec/setup_tracker.hpp"
#include "indicators/resample.hpp"
#include "strategy/analyzer.hpp"

namespace app {

static constexpr std::int64_t kFiveMinMs = 5 * 60 * 1000;

TradeOutcome resolve_bar(const strategy::TradePlan& p, const core::Candle& bar) {
    const bool is_long = p.side == core::Side::Long;
    if (is_long ? bar.low <= p.stop_loss : bar.high >= p.stop_loss) return TradeOutcome::Stopped;
    if (is_long ? bar.high >= p.take_profit : bar.low <= p.take_profit) return TradeOutcome::Target;
    return TradeOutcome::Open;
}

ReplayStats run_replay(const core::Instrument& inst, const core::CandleSeries& c5, const AppConfig& cfg) {
    ReplayStats st;
    const auto c15_all = ind::resample(c5, 3, kFiveMinMs);
    st.candles_15m = c15_all.size();

    exec::SetupTracker tracker(cfg.tracker);
    std::vector<strategy::TradePlan> open;
    const double rr = cfg.analysis.plan.reward_risk;
    const std::size_t n5 = static_cast<std::size_t>(std::max(1, cfg.candles.scan_5m));
    const std::size_t n15 = static_cast<std::size_t>(std::max(1, cfg.candles.scan_15m));

    // false while the trade is still running
    auto settle = [&](const strategy::TradePlan& p, const core::Candle& bar) {
        switch (resolve_bar(p, bar)) {
            case TradeOutcome::Stopped: st.total_r -= 1.0; ++st.losses; return true;
            case TradeOutcome::Target:  st.total_r += rr;  ++st.wins;   return true;
            default: return false;
        }
    };

    std::size_t next15 = 0;
    core::CandleSeries c15;
    for (std::size_t i = 0; i < c5.size(); ++i) {
        const auto& bar = c5[i];
        const std::int64_t now_ms = bar.ts_ms + kFiveMinMs;
        const auto local = core::to_local(core::from_ms(now_ms), cfg.utc_offset_minutes);

        open.erase(std::remove_if(open.begin(), open.end(),
                                  [&](const strategy::TradePlan& p) { return settle(p, bar); }),
                   open.end());

        while (next15 < c15_all.size() && c15_all[next15].ts_ms + 3 * kFiveMinMs <= now_ms)
            c15.push_back(c15_all[next15++]);

        if (!tracker.params().session.contains(local)) continue;
        st.expired += static_cast<int>(tracker.expire_stale(local).size());

        const auto& slot = tracker.get(inst.key);
        if (slot.state == exec::SetupState::Armed) {
            const double touch = std::clamp(slot.plan->entry, bar.low, bar.high);
            strategy::TradePlan fired;
            const auto res = tracker.on_price(inst.key, touch, local, &fired);
            if (res == exec::CheckResult::Triggered) {
                ++st.triggered;
                spdlog::debug("[{}] filled {} at {}", inst.key, core::to_string(fired.side), fired.entry);
                if (!settle(fired, bar)) open.push_back(fired);
            } else if (res == exec::CheckResult::Suppressed) {
                ++st.suppressed;
            }
        }

        if (c15.empty()) continue;
        const core::CandleSeries w15(c15.end() - static_cast<std::ptrdiff_t>(std::min(n15, c15.size())), c15.end());
        const std::size_t from5 = i + 1 > n5 ? i + 1 - n5 : 0;
        const core::CandleSeries w5(c5.begin() + static_cast<std::ptrdiff_t>(from5),
                                    c5.begin() + static_cast<std::ptrdiff_t>(i + 1));
        const auto a = strategy::analyze(inst, w15, w5, cfg.analysis);
        if (!a.plan) continue;
        const auto res = tracker.arm(inst.key, *a.plan, local);
        if (res == exec::ArmResult::Armed || res == exec::ArmResult::Replaced) ++st.armed;
    }
    st.open = static_cast<int>(open.size());
    return st;
}

} // namespace app
