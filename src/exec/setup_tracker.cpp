#include "exec/setup_tracker.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace exec {

const char* to_string(ArmResult r) {
    switch (r) {
        case ArmResult::Armed:     return "armed";
        case ArmResult::Replaced:  return "replaced";
        case ArmResult::Rejected:  return "rejected";
        case ArmResult::Duplicate: return "duplicate";
        default:                   return "out-of-session";
    }
}

const char* to_string(CheckResult r) {
    switch (r) {
        case CheckResult::Idle:       return "idle";
        case CheckResult::Waiting:    return "waiting";
        case CheckResult::Triggered:  return "triggered";
        case CheckResult::Suppressed: return "suppressed";
        case CheckResult::Expired:    return "expired";
        default:                      return "out-of-session";
    }
}

SetupTracker::SetupTracker(TrackerParams p) : p_(p), budget_(p.max_alerts_per_day) {}

bool SetupTracker::stale(const Setup& s, const core::LocalTime& now) const {
    return s.state == SetupState::Armed && s.session_day != p_.session.session_day(now);
}

void SetupTracker::clear(Setup& s) {
    s.state = SetupState::Empty;
    s.plan.reset();
}

ArmResult SetupTracker::arm(const std::string& key, strategy::TradePlan plan, const core::LocalTime& now) {
    if (!p_.session.contains(now)) return ArmResult::OutOfSession;
    auto& s = slots_[key];
    if (plan.sweep_ts_ms == s.last_sweep_ts_ms) return ArmResult::Duplicate;

    if (stale(s, now)) {
        spdlog::info("[{}] setup from an earlier session expired", key);
        clear(s);
    }

    ArmResult res = ArmResult::Armed;
    if (s.state == SetupState::Armed) {
        if (s.plan->side == plan.side) {
            spdlog::debug("[{}] {} plan already armed, new one ignored", key, core::to_string(plan.side));
            return ArmResult::Rejected;
        }
        spdlog::info("[{}] {} setup expired by opposite {} setup", key,
                     core::to_string(s.plan->side), core::to_string(plan.side));
        clear(s);
        res = ArmResult::Replaced;
    }

    spdlog::info("[{}] ARMED {} entry={} sl={} tp={} conf={:.2f}", key, core::to_string(plan.side),
                 plan.entry, plan.stop_loss, plan.take_profit, plan.confidence);
    s.last_sweep_ts_ms = plan.sweep_ts_ms;
    s.session_day = p_.session.session_day(now);
    s.plan = std::move(plan);
    s.state = SetupState::Armed;
    return res;
}

CheckResult SetupTracker::on_price(const std::string& key, double price, const core::LocalTime& now,
                                   strategy::TradePlan* fired) {
    if (!p_.session.contains(now)) return CheckResult::OutOfSession;
    auto it = slots_.find(key);
    if (it == slots_.end() || it->second.state != SetupState::Armed) return CheckResult::Idle;
    auto& s = it->second;

    if (stale(s, now)) {
        spdlog::info("[{}] setup from an earlier session expired", key);
        clear(s);
        return CheckResult::Expired;
    }

    const double entry = s.plan->entry;
    if (entry <= 0.0 || std::abs(price - entry) / entry > p_.trigger_tolerance) return CheckResult::Waiting;

    if (!budget_.try_consume(now.date_key)) {
        spdlog::warn("[{}] entry touched at {} but daily alert cap {} reached", key, price,
                     budget_.max_per_day());
        return CheckResult::Suppressed;
    }

    s.state = SetupState::Triggered;
    spdlog::info("[{}] TRIGGERED {} at {} (entry {}) alerts today {}/{}", key,
                 core::to_string(s.plan->side), price, entry, budget_.count(), budget_.max_per_day());
    if (fired) *fired = *s.plan;
    clear(s);
    return CheckResult::Triggered;
}

std::vector<std::pair<std::string, strategy::TradePlan>> SetupTracker::expire_stale(const core::LocalTime& now) {
    std::vector<std::pair<std::string, strategy::TradePlan>> out;
    for (auto& [key, s] : slots_) {
        if (!stale(s, now)) continue;
        spdlog::info("[{}] setup from an earlier session expired", key);
        out.emplace_back(key, *s.plan);
        clear(s);
    }
    return out;
}

const Setup& SetupTracker::get(const std::string& key) const {
    static const Setup empty{};
    auto it = slots_.find(key);
    return it == slots_.end() ? empty : it->second;
}

std::size_t SetupTracker::armed_count() const {
    std::size_t n = 0;
    for (const auto& [key, s] : slots_)
        if (s.state == SetupState::Armed) ++n;
    return n;
}

} // namespace exec
