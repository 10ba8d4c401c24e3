#include <gtest/gtest.h>
#include "core/clock.hpp"
#include "exec/session.hpp"
#include "test_helpers.hpp"

TEST(Clock, FixedOffsetCrossesIntoNextDate) {
    // 2026-10-19 20:00 UTC is 01:00 on the 20th at UTC+5
    const auto t = core::to_local(core::from_ms(1792440000000LL), 300);
    EXPECT_EQ(t.date_key, 20261020);
    EXPECT_EQ(t.minute_of_day, 60);
    EXPECT_EQ(t.hour(), 1);
    EXPECT_EQ(t.day, 20746);
}

TEST(Clock, ParseAndFormatHHMM) {
    EXPECT_EQ(core::parse_hhmm("17:00"), 1020);
    EXPECT_EQ(core::parse_hhmm("0:05"), 5);
    EXPECT_EQ(core::parse_hhmm("24:00"), -1);
    EXPECT_EQ(core::parse_hhmm("12:60"), -1);
    EXPECT_EQ(core::parse_hhmm("noon"), -1);
    EXPECT_EQ(core::parse_hhmm("12:00x"), -1);
    EXPECT_EQ(core::format_hhmm(1015), "16:55");
}

TEST(Clock, MillisecondRoundTrip) {
    EXPECT_EQ(core::to_ms(core::from_ms(1792432800000LL)), 1792432800000LL);
}

TEST(SessionWindow, InclusiveBounds) {
    exec::SessionWindow w{17 * 60, 22 * 60};
    EXPECT_FALSE(w.contains(testutil::at(20261019, 16, 59, 100)));
    EXPECT_TRUE(w.contains(testutil::at(20261019, 17, 0, 100)));
    EXPECT_TRUE(w.contains(testutil::at(20261019, 22, 0, 100)));
    EXPECT_FALSE(w.contains(testutil::at(20261019, 22, 1, 100)));
    EXPECT_EQ(w.session_day(testutil::at(20261019, 18, 0, 100)), 100);
}

TEST(SessionWindow, OvernightSessionBelongsToItsOpeningDay) {
    exec::SessionWindow w{22 * 60, 2 * 60};
    EXPECT_TRUE(w.contains(testutil::at(20261019, 23, 0, 100)));
    EXPECT_TRUE(w.contains(testutil::at(20261020, 1, 30, 101)));
    EXPECT_FALSE(w.contains(testutil::at(20261020, 12, 0, 101)));
    EXPECT_EQ(w.session_day(testutil::at(20261019, 23, 0, 100)), 100);
    EXPECT_EQ(w.session_day(testutil::at(20261020, 1, 30, 101)), 100);
}
