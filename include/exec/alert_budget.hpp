#pragma once

namespace exec {

// Caps plan alerts per calendar date; the count resets when the date changes.
class DailyAlertBudget {
public:
    explicit DailyAlertBudget(int max_per_day) : max_per_day_(max_per_day) {}

    int max_per_day() const { return max_per_day_; }
    int count() const { return count_; }
    int date() const { return date_; }

    bool available(int date_key) {
        roll(date_key);
        return count_ < max_per_day_;
    }

    // true if an alert may go out and was counted
    bool try_consume(int date_key) {
        if (!available(date_key)) return false;
        ++count_;
        return true;
    }

private:
    void roll(int date_key) {
        if (date_key != date_) { date_ = date_key; count_ = 0; } // new day -> reset
    }

    int max_per_day_{3};
    int count_{0};
    int date_{0};
};

} // namespace exec
