/**
 * IntKit: Integer Conversion Kit
 *
 * Unix Time Conversion
 *
 * Maps int32 seconds since 1970-01-01T00:00:00Z onto a UTC time point.
 * The whole int32 range (1901-12-13T20:45:52Z .. 2038-01-19T03:14:07Z) is
 * representable, so there is no validation.
 *
 * Calendar fields use the proleptic Gregorian calendar
 * (days-from-civil algorithm, H. Hinnant).
 */

#ifndef INTKIT_UNIX_TIME_HPP
#define INTKIT_UNIX_TIME_HPP

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

namespace intkit {

/// UTC instant with one-second resolution.
using UtcTime = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

/// Broken-down UTC calendar time.
struct CivilTime {
    int32_t year;
    uint32_t month;   // 1..12
    uint32_t day;     // 1..31
    uint32_t hour;    // 0..23
    uint32_t minute;  // 0..59
    uint32_t second;  // 0..59
};

inline constexpr bool operator==(const CivilTime& a, const CivilTime& b) noexcept {
    return a.year == b.year && a.month == b.month && a.day == b.day &&
           a.hour == b.hour && a.minute == b.minute && a.second == b.second;
}

/**
 * Seconds since the Unix epoch to a UTC time point.
 * from_unix_seconds(0) is the epoch itself.
 */
constexpr UtcTime from_unix_seconds(int32_t value) noexcept {
    return UtcTime(std::chrono::seconds(value));
}

/// Seconds since the Unix epoch for a time point.
constexpr int64_t to_unix_seconds(UtcTime t) noexcept {
    return static_cast<int64_t>(t.time_since_epoch().count());
}

/**
 * Split a UTC time point into calendar fields.
 */
constexpr CivilTime to_civil(UtcTime t) noexcept {
    const int64_t secs = to_unix_seconds(t);

    // Floor division so times before the epoch land on the previous day
    int64_t days = secs / 86400;
    int64_t sod = secs % 86400;
    if (sod < 0) {
        sod += 86400;
        --days;
    }

    // Shift the era start to 0000-03-01
    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;                                 // [0, 146096]
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365; // [0, 399]
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);          // [0, 365]
    const int64_t mp = (5 * doy + 2) / 153;                               // [0, 11]
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;                       // [1, 31]
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;                          // [1, 12]
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);

    return CivilTime{static_cast<int32_t>(y),
                     static_cast<uint32_t>(m),
                     static_cast<uint32_t>(d),
                     static_cast<uint32_t>(sod / 3600),
                     static_cast<uint32_t>(sod % 3600 / 60),
                     static_cast<uint32_t>(sod % 60)};
}

/**
 * ISO-8601 text, e.g. "1970-01-01T00:00:00Z".
 */
inline std::string to_iso8601(const CivilTime& c) {
    char buf[32];
    const int n = std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02u:%02u:%02uZ",
                                static_cast<int>(c.year), c.month, c.day,
                                c.hour, c.minute, c.second);
    return std::string(buf, static_cast<size_t>(n));
}

inline std::string to_iso8601(UtcTime t) {
    return to_iso8601(to_civil(t));
}

} // namespace intkit

#endif // INTKIT_UNIX_TIME_HPP
