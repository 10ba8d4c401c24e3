#pragma once
#include <cstdint>
#include "core/clock.hpp"

namespace exec {

// [start, end] in local minutes of day, both ends inclusive. start > end crosses midnight.
struct SessionWindow {
    int start_minute{17 * 60};
    int end_minute{22 * 60};

    bool crosses_midnight() const { return start_minute > end_minute; }

    bool contains(const core::LocalTime& t) const {
        const int m = t.minute_of_day;
        if (!crosses_midnight()) return m >= start_minute && m <= end_minute;
        return m >= start_minute || m <= end_minute;
    }

    // Local day the session containing t opened on.
    std::int64_t session_day(const core::LocalTime& t) const {
        if (crosses_midnight() && t.minute_of_day <= end_minute) return t.day - 1;
        return t.day;
    }
};

} // namespace exec
