/**
 * @file date_time.hpp
 * @brief UTC calendar conversion for microsecond timestamps
 * @brief 微秒时间戳的 UTC 日历转换
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <cstdint>
#include <ctime>

namespace silink {
namespace internal {

constexpr int64_t kMicrosPerSecond = 1000000LL;
constexpr int64_t kMicrosPerDayValue = 86400LL * kMicrosPerSecond;

struct UtcTime {
    int year{1970};
    int month{1};  ///< 1-12
    int day{1};    ///< 1-31
    int hour{0};
    int minute{0};
    int second{0};
    int microsecond{0};
    int weekday{4};  ///< 0 = Sunday / 0 表示周日
};

constexpr int64_t FloorDiv(int64_t a, int64_t b) noexcept {
    return a / b - ((a % b != 0) && ((a < 0) != (b < 0)) ? 1 : 0);
}

/// Days since 1970-01-01 for a civil date / 民用日期距 1970-01-01 的天数
constexpr int64_t DaysFromCivil(int64_t y, int m, int d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = FloorDiv(y, 400);
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

inline UtcTime ToUtc(int64_t micros) noexcept {
    const int64_t days = FloorDiv(micros, kMicrosPerDayValue);
    int64_t rem = micros - days * kMicrosPerDayValue;

    UtcTime t;
    t.hour = static_cast<int>(rem / (3600 * kMicrosPerSecond));
    rem %= 3600 * kMicrosPerSecond;
    t.minute = static_cast<int>(rem / (60 * kMicrosPerSecond));
    rem %= 60 * kMicrosPerSecond;
    t.second = static_cast<int>(rem / kMicrosPerSecond);
    t.microsecond = static_cast<int>(rem % kMicrosPerSecond);

    // Civil from days (proleptic Gregorian) / 由天数求民用日期
    const int64_t z = days + 719468;
    const int64_t era = FloorDiv(z, 146097);
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    t.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    t.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    t.year = static_cast<int>(yoe + era * 400 + (t.month <= 2 ? 1 : 0));
    t.weekday = static_cast<int>(((days % 7) + 11) % 7);  // 1970-01-01 was a Thursday
    return t;
}

inline int64_t FromUtc(const UtcTime& t) noexcept {
    const int64_t days = DaysFromCivil(t.year, t.month, t.day);
    return days * kMicrosPerDayValue +
           (static_cast<int64_t>(t.hour) * 3600 + t.minute * 60 + t.second) * kMicrosPerSecond +
           t.microsecond;
}

inline std::tm ToTm(const UtcTime& t) noexcept {
    std::tm tm{};
    tm.tm_year = t.year - 1900;
    tm.tm_mon = t.month - 1;
    tm.tm_mday = t.day;
    tm.tm_hour = t.hour;
    tm.tm_min = t.minute;
    tm.tm_sec = t.second;
    tm.tm_wday = t.weekday;
    return tm;
}

}  // namespace internal
}  // namespace silink
