#include <slotbook/timeutil.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace slotbook {

    namespace {

        // Howard Hinnant's civil calendar algorithms.
        int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
            y -= m <= 2;
            const int64_t era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<int64_t>(doe) - 719468;
        }

        unsigned daysInMonth(int year, unsigned month) {
            static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (month == 2) {
                bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
                return leap ? 29 : 28;
            }
            return kDays[month - 1];
        }

        std::tm toUtcTm(TimePoint tp) {
            std::time_t t = Clock::to_time_t(tp);
            std::tm out{};
            gmtime_r(&t, &out);
            return out;
        }

        int millisPart(TimePoint tp) {
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
            return static_cast<int>(ms < 0 ? ms + 1000 : ms);
        }

    } // namespace

    int64_t CalendarDate::toDays() const {
        return daysFromCivil(year, month, day);
    }

    CalendarDate CalendarDate::fromDays(int64_t z) {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const int64_t y = static_cast<int64_t>(yoe) + era * 400;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        const unsigned d = doy - (153 * mp + 2) / 5 + 1;
        const unsigned m = mp < 10 ? mp + 3 : mp - 9;
        return CalendarDate{static_cast<int>(y + (m <= 2)), m, d};
    }

    CalendarDate CalendarDate::addDays(int64_t n) const {
        return fromDays(toDays() + n);
    }

    CalendarDate CalendarDate::subtractMonths(int months) const {
        int total = year * 12 + static_cast<int>(month) - 1 - months;
        CalendarDate out;
        out.year = total / 12;
        out.month = static_cast<unsigned>(total % 12) + 1;
        out.day = std::min(day, daysInMonth(out.year, out.month));
        return out;
    }

    std::string CalendarDate::toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
        return buf;
    }

    TimePoint now() {
        return Clock::now();
    }

    CalendarDate today() {
        return localDate(now());
    }

    CalendarDate localDate(TimePoint tp) {
        std::time_t t = Clock::to_time_t(tp);
        std::tm local{};
        localtime_r(&t, &local);
        return CalendarDate{local.tm_year + 1900, static_cast<unsigned>(local.tm_mon + 1), static_cast<unsigned>(local.tm_mday)};
    }

    TimePoint startOfDay(const CalendarDate& date) {
        std::tm local{};
        local.tm_year = date.year - 1900;
        local.tm_mon = static_cast<int>(date.month) - 1;
        local.tm_mday = static_cast<int>(date.day);
        local.tm_isdst = -1;
        return Clock::from_time_t(std::mktime(&local));
    }

    // Accepts "YYYY-MM-DD", optionally followed by an ISO time part starting with 'T'.
    std::optional<CalendarDate> parseDate(const std::string& text) {
        if (text.size() < 10 || (text.size() > 10 && text[10] != 'T')) {
            return std::nullopt;
        }
        for (std::size_t i = 0; i < 10; ++i) {
            bool ok = (i == 4 || i == 7) ? text[i] == '-' : std::isdigit(static_cast<unsigned char>(text[i])) != 0;
            if (!ok) {
                return std::nullopt;
            }
        }
        auto digits = [&](std::size_t pos, std::size_t len) {
            unsigned v = 0;
            for (std::size_t i = pos; i < pos + len; ++i) {
                v = v * 10 + static_cast<unsigned>(text[i] - '0');
            }
            return v;
        };
        int y = static_cast<int>(digits(0, 4));
        unsigned m = digits(5, 2);
        unsigned d = digits(8, 2);
        if (m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) {
            return std::nullopt;
        }
        return CalendarDate{y, m, d};
    }

    std::string formatIso(TimePoint tp) {
        std::tm utc = toUtcTm(tp);
        std::ostringstream out;
        out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << millisPart(tp) << 'Z';
        return out.str();
    }

    std::optional<TimePoint> parseIso(const std::string& text) {
        std::tm utc{};
        int ms = 0;
        int fields = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d",
                                 &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                                 &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &ms);
        if (fields < 6) {
            return std::nullopt;
        }
        utc.tm_year -= 1900;
        utc.tm_mon -= 1;
        std::time_t t = timegm(&utc);
        return Clock::from_time_t(t) + std::chrono::milliseconds(fields == 7 ? ms : 0);
    }

    std::string fileStamp(TimePoint tp) {
        std::tm utc = toUtcTm(tp);
        std::ostringstream out;
        out << std::put_time(&utc, "%Y-%m-%d_%H-%M-%S") << '-'
            << std::setw(3) << std::setfill('0') << millisPart(tp);
        return out.str();
    }

    int64_t toUnixMillis(TimePoint tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    int64_t uniqueMillis() {
        static std::atomic<int64_t> last{0};
        int64_t prev = last.load();
        int64_t next = 0;
        do {
            next = std::max(toUnixMillis(now()), prev + 1);
        } while (!last.compare_exchange_weak(prev, next));
        return next;
    }

    TimePoint fromFileTime(std::filesystem::file_time_type ft) {
        using namespace std::chrono;
        return time_point_cast<Clock::duration>(ft - std::filesystem::file_time_type::clock::now() + Clock::now());
    }

} // namespace slotbook
