#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace core {

using TimePoint = std::chrono::system_clock::time_point;

// Wall-clock reading in the configured local timezone (fixed UTC offset).
struct LocalTime {
    int date_key{0};       // yyyymmdd
    int minute_of_day{0};  // 0..1439
    std::int64_t day{0};   // local days since epoch

    int hour() const   { return minute_of_day / 60; }
    int minute() const { return minute_of_day % 60; }
};

LocalTime to_local(TimePoint tp, int utc_offset_minutes);

// "HH:MM" -> minute of day, -1 if malformed
int parse_hhmm(const std::string& s);
std::string format_hhmm(int minute_of_day);

TimePoint from_ms(std::int64_t ms);
std::int64_t to_ms(TimePoint tp);

} // namespace core
