/**
 * @file file_rotater.hpp
 * @brief Time based log file rotation tracking
 * @brief 基于时间的日志文件轮转跟踪
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <cstdint>

#include "silink/common.hpp"
#include "silink/internal/date_time.hpp"

namespace silink {

/**
 * @brief Tracks the current rotation period of a log file
 * @brief 跟踪日志文件当前所处的轮转周期
 *
 * Each mode maps a UTC timestamp to a period number. Update() reports whether the
 * period number changed since Initialize() or the previous Update().
 *
 * 每种模式将 UTC 时间戳映射为周期编号。Update() 报告自 Initialize() 或上一次
 * Update() 以来周期编号是否改变。
 *
 * Not thread-safe / 非线程安全
 */
class FileRotater {
public:
    explicit FileRotater(FileRotate mode = FileRotate::NoRotate) noexcept : m_mode(mode) {}

    /// Call Initialize() after changing the mode / 修改模式后需调用 Initialize()
    void SetMode(FileRotate mode) noexcept { m_mode = mode; }
    FileRotate Mode() const noexcept { return m_mode; }

    void Initialize(int64_t timestampMicros) noexcept { m_timeValue = TimeValue(timestampMicros); }

    /**
     * @brief Update the period, true when a rotation boundary was crossed
     * @brief 更新周期，跨越轮转边界时返回 true
     */
    bool Update(int64_t timestampMicros) noexcept {
        const int64_t value = TimeValue(timestampMicros);
        if (value == m_timeValue) {
            return false;
        }
        m_timeValue = value;
        return true;
    }

    int64_t TimeValue(int64_t timestampMicros) const noexcept {
        const int64_t days = internal::FloorDiv(timestampMicros, internal::kMicrosPerDayValue);
        switch (m_mode) {
            case FileRotate::Hourly:
                return days * 24 + internal::ToUtc(timestampMicros).hour;
            case FileRotate::Daily:
                return days;
            case FileRotate::Weekly:
                // Day number of the Monday starting the week (1970-01-05 was a Monday)
                // 本周周一的天数编号
                return days - (((days - 4) % 7) + 7) % 7;
            case FileRotate::Monthly: {
                const internal::UtcTime t = internal::ToUtc(timestampMicros);
                return static_cast<int64_t>(t.year) * 12 + t.month;
            }
            default:
                return 0;
        }
    }

private:
    FileRotate m_mode;
    int64_t m_timeValue{0};
};

}  // namespace silink
