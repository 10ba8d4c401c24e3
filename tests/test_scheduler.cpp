#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "app/scheduler.hpp"

namespace {
constexpr std::int64_t k10utc = 1792404000000LL;   // 2026-10-19 10:00 UTC
constexpr std::int64_t kHour = 3600 * 1000LL;
void noop(core::TimePoint) {}
}

TEST(Scheduler, DailyJobUsesLocalClock) {
    app::Scheduler s(300);
    s.add_daily("pre", 16 * 60 + 55, noop);
    // 15:00 local -> 16:55 local the same day = 11:55 UTC
    EXPECT_EQ(core::to_ms(s.next_due("pre", core::from_ms(k10utc))), k10utc + 115 * 60000LL);
    // 17:00 local -> tomorrow
    EXPECT_EQ(core::to_ms(s.next_due("pre", core::from_ms(k10utc + 2 * kHour))),
              k10utc + 115 * 60000LL + 24 * kHour);
    // exactly at the due time -> next day
    EXPECT_EQ(core::to_ms(s.next_due("pre", core::from_ms(k10utc + 115 * 60000LL))),
              k10utc + 115 * 60000LL + 24 * kHour);
}

TEST(Scheduler, IntervalJobAlignsToPeriod) {
    app::Scheduler s(300);
    s.add_interval("monitor", 5, noop);
    EXPECT_EQ(core::to_ms(s.next_due("monitor", core::from_ms(k10utc))), k10utc + 5 * 60000LL);
    EXPECT_EQ(core::to_ms(s.next_due("monitor", core::from_ms(k10utc + 150000))), k10utc + 5 * 60000LL);
}

TEST(Scheduler, RejectsBadJobs) {
    app::Scheduler s(0);
    EXPECT_THROW(s.add_daily("x", -1, noop), std::invalid_argument);
    EXPECT_THROW(s.add_daily("x", 24 * 60, noop), std::invalid_argument);
    EXPECT_THROW(s.add_interval("x", 0, noop), std::invalid_argument);
    EXPECT_THROW(s.next_due("missing", core::from_ms(k10utc)), std::out_of_range);
}

TEST(Scheduler, StopFromAnotherThreadEndsRun) {
    app::Scheduler s(0);
    s.add_daily("never", 0, noop);
    std::thread t([&] { s.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    s.stop();
    t.join();
    EXPECT_FALSE(s.running());
}

TEST(Scheduler, StopBeforeRunReturnsImmediately) {
    app::Scheduler s(0);
    s.add_interval("tick", 60, noop);
    s.stop();
    s.run();
    EXPECT_FALSE(s.running());
}
