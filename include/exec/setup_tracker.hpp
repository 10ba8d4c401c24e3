#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "core/clock.hpp"
#include "exec/alert_budget.hpp"
#include "exec/session.hpp"
#include "strategy/trade_plan.hpp"

namespace exec {

enum class SetupState { Empty, Armed, Triggered };

inline const char* to_string(SetupState s) {
    switch (s) {
        case SetupState::Armed:     return "ARMED";
        case SetupState::Triggered: return "TRIGGERED";
        default:                    return "EMPTY";
    }
}

struct Setup {
    SetupState state{SetupState::Empty};
    std::optional<strategy::TradePlan> plan;
    std::int64_t session_day{0};       // session the plan was armed in
    std::int64_t last_sweep_ts_ms{-1}; // newest pattern already turned into a plan
};

enum class ArmResult {
    Armed,         // EMPTY -> ARMED
    Replaced,      // opposite-direction plan expired, new one armed
    Rejected,      // same-direction plan already armed, kept
    Duplicate,     // plan from an already used sweep
    OutOfSession
};

enum class CheckResult {
    Idle,          // nothing armed
    Waiting,       // armed, price not at entry
    Triggered,     // alert due, slot reset to EMPTY
    Suppressed,    // price at entry but the daily budget is spent; stays armed
    Expired,       // armed in an earlier session, dropped
    OutOfSession
};

const char* to_string(ArmResult r);
const char* to_string(CheckResult r);

struct TrackerParams {
    double trigger_tolerance{0.001};   // relative distance to the entry
    int max_alerts_per_day{3};
    SessionWindow session;
};

// One slot per instrument key, at most one armed plan each. Single writer: the monitoring job.
class SetupTracker {
public:
    explicit SetupTracker(TrackerParams p);

    ArmResult arm(const std::string& key, strategy::TradePlan plan, const core::LocalTime& now);

    // Compares the latest price with the armed entry. On Triggered the plan is copied into *fired.
    CheckResult on_price(const std::string& key, double price, const core::LocalTime& now,
                         strategy::TradePlan* fired = nullptr);

    // Drops plans armed in an earlier session, returning them keyed by instrument.
    std::vector<std::pair<std::string, strategy::TradePlan>> expire_stale(const core::LocalTime& now);

    const Setup& get(const std::string& key) const;
    std::size_t armed_count() const;
    const DailyAlertBudget& budget() const { return budget_; }
    const TrackerParams& params() const { return p_; }

private:
    bool stale(const Setup& s, const core::LocalTime& now) const;
    static void clear(Setup& s);

    TrackerParams p_;
    DailyAlertBudget budget_;
    std::unordered_map<std::string, Setup> slots_;
};

} // namespace exec
