/**
 * @file option_table.hpp
 * @brief Typed lookup over parsed protocol options
 * @brief 已解析协议选项的类型化查找
 *
 * Value syntax / 值语法:
 * - bool: "true", "1" or "yes" are true, anything else is false
 * - size: number with optional "kb", "mb" or "gb" suffix, bare numbers are KB
 * - timespan: number with optional "s", "m", "h" or "d" suffix, bare numbers are seconds
 *
 * - 布尔：“true”、“1”或“yes”为真，其余为假
 * - 大小：数字加可选后缀 “kb”、“mb”、“gb”，无后缀按 KB 计
 * - 时间：数字加可选后缀 “s”、“m”、“h”、“d”，无后缀按秒计
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "silink/common.hpp"

namespace silink {

/**
 * @brief Case-insensitive option map with typed getters
 * @brief 带类型化读取的不区分大小写选项表
 *
 * Getters return the default when the key is missing and throw
 * silink::Error(ConfigInvalidValue) when a present value is malformed.
 *
 * 键不存在时返回默认值；值格式错误时抛出 silink::Error(ConfigInvalidValue)。
 */
class OptionTable {
public:
    void Put(std::string_view key, std::string value);
    bool Remove(std::string_view key);
    bool Contains(std::string_view key) const;
    void Clear() noexcept { m_items.clear(); }
    size_t Size() const noexcept { return m_items.size(); }

    /// Lower-cased keys in sorted order / 排序后的小写键
    std::vector<std::string> Keys() const;

    std::string GetString(std::string_view key, std::string_view defaultValue) const;
    bool GetBoolean(std::string_view key, bool defaultValue) const;
    int64_t GetInteger(std::string_view key, int64_t defaultValue) const;

    /// Size in bytes / 字节数
    int64_t GetSize(std::string_view key, int64_t defaultBytes) const;

    std::chrono::milliseconds GetTimespan(std::string_view key,
                                          std::chrono::milliseconds defaultValue) const;

    Level GetLevel(std::string_view key, Level defaultValue) const;
    FileRotate GetRotate(std::string_view key, FileRotate defaultValue) const;

    /// UTF-8 bytes of the value, empty when missing / 值的 UTF-8 字节，不存在时为空
    std::vector<uint8_t> GetBytes(std::string_view key) const;

private:
    static std::string Normalize(std::string_view key);
    const std::string* Find(std::string_view key) const;

    std::map<std::string, std::string> m_items;
};

}  // namespace silink
