#include "app/scheduler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace app {

using std::chrono::seconds;
using std::chrono::system_clock;

static std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    return a >= 0 ? a / b : (a - b + 1) / b;
}

void Scheduler::add_daily(std::string name, int minute_of_day, Job job) {
    if (minute_of_day < 0 || minute_of_day >= 24 * 60)
        throw std::invalid_argument("daily job '" + name + "' needs a minute of day in [0, 1440)");
    entries_.push_back({std::move(name), true, minute_of_day, std::move(job), {}});
}

void Scheduler::add_interval(std::string name, int interval_min, Job job) {
    if (interval_min <= 0)
        throw std::invalid_argument("interval job '" + name + "' needs a positive period");
    entries_.push_back({std::move(name), false, interval_min, std::move(job), {}});
}

core::TimePoint Scheduler::compute_next(const Entry& e, core::TimePoint after) const {
    const std::int64_t offset = static_cast<std::int64_t>(utc_offset_minutes_) * 60;
    const std::int64_t local =
        std::chrono::duration_cast<seconds>(after.time_since_epoch()).count() + offset;
    std::int64_t next = 0;
    if (e.daily) {
        next = floor_div(local, 86400) * 86400 + static_cast<std::int64_t>(e.minute) * 60;
        if (next <= local) next += 86400;
    } else {
        const std::int64_t period = static_cast<std::int64_t>(e.minute) * 60;
        next = (floor_div(local, period) + 1) * period;
    }
    return core::TimePoint(seconds(next - offset));
}

core::TimePoint Scheduler::next_due(const std::string& name, core::TimePoint after) const {
    for (const auto& e : entries_)
        if (e.name == name) return compute_next(e, after);
    throw std::out_of_range("no scheduled job named '" + name + "'");
}

void Scheduler::fire(Entry& e, core::TimePoint now) {
    spdlog::debug("job '{}' start", e.name);
    try {
        e.job(now);
    } catch (const std::exception& ex) {
        spdlog::error("job '{}' failed: {}", e.name, ex.what());
    }
    spdlog::debug("job '{}' done", e.name);
}

void Scheduler::run() {
    running_.store(true);
    const auto start = system_clock::now();
    for (auto& e : entries_) {
        e.due = compute_next(e, start);
        spdlog::info("job '{}' first run at +{}s", e.name,
                     std::chrono::duration_cast<seconds>(e.due - start).count());
    }
    if (entries_.empty()) { running_.store(false); return; }

    while (!stop_requested_.load()) {
        auto it = std::min_element(entries_.begin(), entries_.end(),
                                   [](const Entry& a, const Entry& b) { return a.due < b.due; });
        {
            std::unique_lock<std::mutex> lk(mtx_);
            if (cv_.wait_until(lk, it->due, [this] { return stop_requested_.load(); })) break;
        }
        const auto now = system_clock::now();
        if (now < it->due) continue;
        fire(*it, now);
        it->due = compute_next(*it, std::max(now, system_clock::now()));
    }
    running_.store(false);
    spdlog::info("scheduler stopped");
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_requested_.store(true);
    }
    cv_.notify_all();
}

} // namespace app
