#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "core/clock.hpp"

namespace app {

// Runs jobs one at a time at wall-clock times; sleeps on a condition variable between them.
class Scheduler {
public:
    using Job = std::function<void(core::TimePoint)>;

    explicit Scheduler(int utc_offset_minutes) : utc_offset_minutes_(utc_offset_minutes) {}

    // Once per local day at minute_of_day
    void add_daily(std::string name, int minute_of_day, Job job);
    // Every interval_min minutes, aligned to the local clock (e.g. :00, :05, ...)
    void add_interval(std::string name, int interval_min, Job job);

    // Blocks until stop(), which may come before run() starts. Exceptions thrown by a job are logged and the loop continues.
    void run();
    void stop();
    bool running() const { return running_.load(); }

    // Next firing strictly after `after`
    core::TimePoint next_due(const std::string& name, core::TimePoint after) const;

private:
    struct Entry {
        std::string name;
        bool daily{false};
        int minute{0};     // daily: minute of day, interval: period in minutes
        Job job;
        core::TimePoint due{};
    };

    core::TimePoint compute_next(const Entry& e, core::TimePoint after) const;
    void fire(Entry& e, core::TimePoint now);

    int utc_offset_minutes_{0};
    std::vector<Entry> entries_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace app
