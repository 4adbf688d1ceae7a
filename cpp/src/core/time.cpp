#include "kairos/core/time.hpp"

#include <cctype>
#include <cstdio>

namespace kairos::core {
    namespace {
        [[nodiscard]] constexpr i64 floor_div(i64 a, i64 b) noexcept {
            const i64 q = a / b;
            return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
        }

        [[nodiscard]] bool read_digits(const char*& p, int count, u32* out) noexcept {
            u32 v = 0;
            for (int i = 0; i < count; ++i) {
                if (!std::isdigit(static_cast<unsigned char>(p[i]))) {
                    return false;
                }
                v = v * 10 + static_cast<u32>(p[i] - '0');
            }
            p += count;
            *out = v;
            return true;
        }

        [[nodiscard]] constexpr bool is_leap(i64 y) noexcept {
            return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        }

        [[nodiscard]] constexpr u32 days_in_month(i64 y, u32 m) noexcept {
            constexpr u32 kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (m == 2 && is_leap(y)) {
                return 29;
            }
            return kDays[m - 1];
        }
    } // namespace

    CivilTime civil_from_timestamp(Timestamp t) noexcept {
        const i64 days = floor_div(t, kSecondsPerDay);
        const i64 secs = t - days * kSecondsPerDay;

        const i64 z = days + 719468;
        const i64 era = (z >= 0 ? z : z - 146096) / 146097;
        const i64 doe = z - era * 146097;
        const i64 yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const i64 doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const i64 mp = (5 * doy + 2) / 153;
        const i64 d = doy - (153 * mp + 2) / 5 + 1;
        const i64 m = mp < 10 ? mp + 3 : mp - 9;

        CivilTime c{};
        c.year = yoe + era * 400 + (m <= 2 ? 1 : 0);
        c.month = static_cast<u32>(m);
        c.day = static_cast<u32>(d);
        c.hour = static_cast<u32>(secs / kSecondsPerHour);
        c.minute = static_cast<u32>((secs % kSecondsPerHour) / kSecondsPerMinute);
        c.second = static_cast<u32>(secs % kSecondsPerMinute);
        return c;
    }

    i64 granularity_bucket(Timestamp t, Granularity g) noexcept {
        switch (g) {
            case Granularity::Seconds:
                return t;
            case Granularity::Minutes:
                return floor_div(t, kSecondsPerMinute);
            case Granularity::Hours:
                return floor_div(t, kSecondsPerHour);
            case Granularity::Days:
                return floor_div(t, kSecondsPerDay);
            case Granularity::Weeks:
                // 1970-01-01 was a Thursday; shift so buckets open on Monday.
                return floor_div(floor_div(t, kSecondsPerDay) + 3, 7);
            case Granularity::Months: {
                const CivilTime c = civil_from_timestamp(t);
                return c.year * 12 + static_cast<i64>(c.month) - 1;
            }
            case Granularity::Years:
                return civil_from_timestamp(t).year;
        }
        return t;
    }

    std::string format_timestamp(Timestamp t, TimestampStyle style) {
        const CivilTime c = civil_from_timestamp(t);
        char buf[48];
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u%c%02u:%02u:%02u",
                      static_cast<long long>(c.year), c.month, c.day,
                      style == TimestampStyle::Iso ? 'T' : ' ',
                      c.hour, c.minute, c.second);
        return std::string(buf);
    }

    Status parse_timestamp(const char* text, Timestamp* out) noexcept {
        if (text == nullptr || out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        const char* p = text;
        u32 year = 0;
        u32 month = 0;
        u32 day = 0;
        u32 hour = 0;
        u32 minute = 0;
        u32 second = 0;

        if (!read_digits(p, 4, &year) || *p++ != '-' ||
            !read_digits(p, 2, &month) || *p++ != '-' ||
            !read_digits(p, 2, &day)) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        if (*p == 'T' || *p == ' ') {
            ++p;
            if (!read_digits(p, 2, &hour) || *p++ != ':' || !read_digits(p, 2, &minute)) {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            if (*p == ':') {
                ++p;
                if (!read_digits(p, 2, &second)) {
                    return make_status(StatusDomain::Core, StatusCode::Invalid);
                }
            }
        }
        if (*p == 'Z') {
            ++p;
        }
        if (*p != '\0') {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
            hour > 23 || minute > 59 || second > 59) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        *out = make_timestamp(year, month, day, hour, minute, second);
        return ok_status();
    }

} // namespace kairos::core
