#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace slotbook {

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    // A calendar day in local time. Booking capacity is keyed on this, never on a timestamp.
    struct CalendarDate {
        int year = 1970;
        unsigned month = 1;
        unsigned day = 1;

        // days since 1970-01-01
        int64_t toDays() const;
        static CalendarDate fromDays(int64_t days);

        CalendarDate addDays(int64_t n) const;
        CalendarDate subtractMonths(int months) const;
        std::string toString() const;
    };

    inline bool operator==(const CalendarDate& a, const CalendarDate& b) {
        return a.year == b.year && a.month == b.month && a.day == b.day;
    }
    inline bool operator!=(const CalendarDate& a, const CalendarDate& b) {
        return !(a == b);
    }
    inline bool operator<(const CalendarDate& a, const CalendarDate& b) {
        return a.toDays() < b.toDays();
    }
    inline bool operator<=(const CalendarDate& a, const CalendarDate& b) {
        return !(b < a);
    }
    inline bool operator>(const CalendarDate& a, const CalendarDate& b) {
        return b < a;
    }

    TimePoint now();
    CalendarDate today();
    CalendarDate localDate(TimePoint tp);
    TimePoint startOfDay(const CalendarDate& date);

    // Accepts "YYYY-MM-DD" or a full ISO-8601 timestamp (the date part is taken).
    std::optional<CalendarDate> parseDate(const std::string& text);

    // UTC, millisecond precision: 2024-05-01T10:15:30.123Z
    std::string formatIso(TimePoint tp);
    std::optional<TimePoint> parseIso(const std::string& text);

    // Filesystem-safe and lexicographically sortable: 2024-05-01_10-15-30-123
    std::string fileStamp(TimePoint tp);

    int64_t toUnixMillis(TimePoint tp);

    // Strictly increasing across calls within the process, so names built from it never collide.
    int64_t uniqueMillis();

    TimePoint fromFileTime(std::filesystem::file_time_type ft);

} // namespace slotbook
