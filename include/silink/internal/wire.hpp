/**
 * @file wire.hpp
 * @brief Little-endian encoding helpers and timestamp conversion
 * @brief 小端编码辅助函数与时间戳转换
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "silink/error.hpp"

namespace silink {
namespace internal {

constexpr double kOleEpochDays = 25569.0;          ///< 1899-12-30 to 1970-01-01 / 天数差
constexpr int64_t kMicrosecondsPerDay = 86400000000LL;

/**
 * @brief Convert Unix microseconds to an OLE automation date
 * @brief 将 Unix 微秒转换为 OLE 自动化日期
 *
 * Round trips exactly for dates before 2079 (ulp of the day fraction < 0.5us).
 * 对 2079 年之前的日期可精确往返（日小数的 ulp < 0.5 微秒）。
 */
inline double TimestampToOleDate(int64_t micros) noexcept {
    int64_t days = micros / kMicrosecondsPerDay;
    int64_t rem = micros % kMicrosecondsPerDay;
    if (rem < 0) {
        rem += kMicrosecondsPerDay;
        --days;
    }
    return (static_cast<double>(days) + kOleEpochDays) +
           static_cast<double>(rem) / static_cast<double>(kMicrosecondsPerDay);
}

inline int64_t OleDateToTimestamp(double value) noexcept {
    const double days = std::floor(value);
    const double fraction = value - days;
    return (static_cast<int64_t>(days) - static_cast<int64_t>(kOleEpochDays)) * kMicrosecondsPerDay +
           std::llround(fraction * static_cast<double>(kMicrosecondsPerDay));
}

// ==============================================================================
// Writing / 写入
// ==============================================================================

inline void AppendUInt16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

inline void AppendInt32(std::vector<uint8_t>& out, int32_t value) {
    const auto v = static_cast<uint32_t>(value);
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

inline void AppendDouble(std::vector<uint8_t>& out, double value) {
    uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((bits >> (8 * i)) & 0xFF));
    }
}

inline void AppendBytes(std::vector<uint8_t>& out, const void* data, size_t size) {
    const auto* bytes = static_cast<const uint8_t*>(data);
    out.insert(out.end(), bytes, bytes + size);
}

// ==============================================================================
// Reading / 读取
// ==============================================================================

/**
 * @brief Bounds-checked little-endian reader
 * @brief 带边界检查的小端读取器
 */
class WireReader {
public:
    WireReader(const uint8_t* data, size_t size) : m_data(data), m_size(size) {}

    uint16_t ReadUInt16() {
        Require(2);
        const uint16_t value =
            static_cast<uint16_t>(m_data[m_offset] | (static_cast<uint16_t>(m_data[m_offset + 1]) << 8));
        m_offset += 2;
        return value;
    }

    int32_t ReadInt32() {
        Require(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(m_data[m_offset + i]) << (8 * i);
        }
        m_offset += 4;
        return static_cast<int32_t>(v);
    }

    double ReadDouble() {
        Require(8);
        uint64_t bits = 0;
        for (int i = 0; i < 8; ++i) {
            bits |= static_cast<uint64_t>(m_data[m_offset + i]) << (8 * i);
        }
        m_offset += 8;
        double value = 0.0;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    std::string ReadString(int32_t length) {
        const size_t n = CheckedLength(length);
        std::string value(reinterpret_cast<const char*>(m_data + m_offset), n);
        m_offset += n;
        return value;
    }

    std::vector<uint8_t> ReadBytes(int32_t length) {
        const size_t n = CheckedLength(length);
        std::vector<uint8_t> value(m_data + m_offset, m_data + m_offset + n);
        m_offset += n;
        return value;
    }

    size_t Offset() const noexcept { return m_offset; }
    size_t Remaining() const noexcept { return m_size - m_offset; }

private:
    size_t CheckedLength(int32_t length) {
        if (length < 0) {
            throw Error(ErrorCode::InvalidArgument, "Negative field length in packet");
        }
        Require(static_cast<size_t>(length));
        return static_cast<size_t>(length);
    }

    void Require(size_t n) const {
        if (m_size - m_offset < n) {
            throw Error(ErrorCode::BufferUnderflow, "Truncated packet data");
        }
    }

    const uint8_t* m_data;
    size_t m_size;
    size_t m_offset{0};
};

}  // namespace internal
}  // namespace silink
