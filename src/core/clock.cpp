#include "core/clock.hpp"
#include <ctime>
#include <cstdio>

namespace core {

LocalTime to_local(TimePoint tp, int utc_offset_minutes) {
    using namespace std::chrono;
    auto shifted = tp + minutes(utc_offset_minutes);
    time_t t = system_clock::to_time_t(shifted);
    tm ut{};
    #ifdef _WIN32
    gmtime_s(&ut, &t);
    #else
    gmtime_r(&t, &ut);
    #endif
    LocalTime lt;
    lt.date_key = (ut.tm_year + 1900) * 10000 + (ut.tm_mon + 1) * 100 + ut.tm_mday;
    lt.minute_of_day = ut.tm_hour * 60 + ut.tm_min;
    const auto secs = duration_cast<seconds>(shifted.time_since_epoch()).count();
    lt.day = secs >= 0 ? secs / 86400 : (secs - 86399) / 86400;
    return lt;
}

int parse_hhmm(const std::string& s) {
    int h = -1, m = -1;
    char extra = 0;
    if (std::sscanf(s.c_str(), "%d:%d%c", &h, &m, &extra) != 2) return -1;
    if (h < 0 || h > 23 || m < 0 || m > 59) return -1;
    return h * 60 + m;
}

std::string format_hhmm(int minute_of_day) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", (minute_of_day / 60) % 24, minute_of_day % 60);
    return buf;
}

TimePoint from_ms(std::int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

std::int64_t to_ms(TimePoint tp) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

} // namespace core
