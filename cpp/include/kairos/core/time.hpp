#pragma once

#include <string>

#include "kairos/core/errors.hpp"
#include "kairos/core/types.hpp"

namespace kairos::core {

    inline constexpr i64 kSecondsPerMinute = 60;
    inline constexpr i64 kSecondsPerHour = 3600;
    inline constexpr i64 kSecondsPerDay = 86400;

    struct CivilTime {
        i64 year{1970};
        u32 month{1};   // 1..12
        u32 day{1};     // 1..31
        u32 hour{0};
        u32 minute{0};
        u32 second{0};
    };

    // Days since 1970-01-01 for a proleptic Gregorian date.
    [[nodiscard]] constexpr i64 days_from_civil(i64 y, u32 m, u32 d) noexcept {
        y -= m <= 2 ? 1 : 0;
        const i64 era = (y >= 0 ? y : y - 399) / 400;
        const i64 yoe = y - era * 400;
        const i64 mp = (static_cast<i64>(m) + 9) % 12;
        const i64 doy = (153 * mp + 2) / 5 + static_cast<i64>(d) - 1;
        const i64 doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    [[nodiscard]] constexpr Timestamp make_timestamp(i64 year, u32 month, u32 day,
                                                     u32 hour = 0, u32 minute = 0, u32 second = 0) noexcept {
        return days_from_civil(year, month, day) * kSecondsPerDay +
               static_cast<i64>(hour) * kSecondsPerHour +
               static_cast<i64>(minute) * kSecondsPerMinute +
               static_cast<i64>(second);
    }

    [[nodiscard]] CivilTime civil_from_timestamp(Timestamp t) noexcept;

    // Index of the calendar bucket t falls into at granularity g. Weeks start
    // on Monday; all buckets are UTC.
    [[nodiscard]] i64 granularity_bucket(Timestamp t, Granularity g) noexcept;

    // The coarser of two granularities.
    [[nodiscard]] constexpr Granularity granularity_coarser(Granularity a, Granularity b) noexcept {
        return static_cast<u8>(a) >= static_cast<u8>(b) ? a : b;
    }

    enum class TimestampStyle : u8 {
        Readable = 0,   // 2024-01-01 09:00:00
        Iso = 1,        // 2024-01-01T09:00:00
    };

    std::string format_timestamp(Timestamp t, TimestampStyle style = TimestampStyle::Readable);

    // Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS]" and the ISO "T" form,
    // with an optional trailing "Z".
    [[nodiscard]] Status parse_timestamp(const char* text, Timestamp* out) noexcept;

} // namespace kairos::core
