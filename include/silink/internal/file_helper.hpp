/**
 * @file file_helper.hpp
 * @brief Log file naming, discovery and retention helpers
 * @brief 日志文件命名、查找与保留辅助函数
 *
 * Rotated file names / 轮转文件名:
 *   <dir>/<stem>-yyyy-MM-dd-HH-mm-ss<ext>
 * An "a" is appended to the stem on collision (log-2024-01-01-00-00-00a.sil).
 * 名称冲突时在主干后追加 "a"。
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace silink {
namespace internal {

/**
 * @brief Replace %appname% and %machinename% (case-insensitive)
 * @brief 替换 %appname% 与 %machinename%（不区分大小写）
 */
std::string ExpandFileName(std::string_view fileName, std::string_view appName,
                           std::string_view hostName);

/**
 * @brief Build a timestamped file name that does not exist yet
 * @brief 生成尚不存在的带时间戳文件名
 */
std::string MakeRotatedFileName(const std::string& baseName, int64_t timestampMicros);

/**
 * @brief Existing rotated files of baseName, oldest first
 * @brief baseName 已存在的轮转文件，按从旧到新排序
 */
std::vector<std::string> GetRotatedFiles(const std::string& baseName);

/**
 * @brief Parse the timestamp embedded in a rotated file name
 * @brief 解析轮转文件名中嵌入的时间戳
 *
 * @return false if path is not a rotated file of baseName
 */
bool TryGetFileDate(const std::string& baseName, const std::string& path,
                    int64_t& timestampMicros);

/**
 * @brief File to open for a rotating log
 * @brief 轮转日志需要打开的文件
 *
 * With append the newest existing file is reused, otherwise (or when none exists)
 * a new name is generated from timestampMicros.
 * append 时复用最新的已有文件，否则（或不存在时）根据 timestampMicros 生成新名称。
 */
std::string GetFileName(const std::string& baseName, bool append, int64_t timestampMicros);

/**
 * @brief Delete the oldest rotated files so that at most maxParts remain
 * @brief 删除最旧的轮转文件，使剩余数量不超过 maxParts
 *
 * @return Number of files removed / 删除的文件数
 */
size_t DeleteOldFiles(const std::string& baseName, int64_t maxParts);

/**
 * @brief Create the parent directories of path when missing
 * @brief 在缺失时创建 path 的父目录
 *
 * @throws Error FileOpenFailed
 */
void CreateParentDirectories(const std::string& path);

}  // namespace internal
}  // namespace silink
