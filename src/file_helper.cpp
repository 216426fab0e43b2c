/**
 * @file file_helper.cpp
 * @brief Log file naming, discovery and retention helpers
 * @brief 日志文件命名、查找与保留辅助函数
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/internal/file_helper.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include <fmt/format.h>

#include "silink/error.hpp"
#include "silink/internal/date_time.hpp"

namespace silink {
namespace internal {

namespace fs = std::filesystem;

namespace {

constexpr size_t kDateLength = 19;  ///< yyyy-MM-dd-HH-mm-ss
constexpr char kAlreadyExistsSuffix = 'a';

std::string ToLower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void ReplaceAllIgnoreCase(std::string& text, std::string_view token, std::string_view value) {
    const std::string lowerToken = ToLower(token);
    size_t pos = 0;
    while (true) {
        const std::string lower = ToLower(text);
        pos = lower.find(lowerToken, pos);
        if (pos == std::string::npos) {
            break;
        }
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

bool ParseNumber(std::string_view text, int& value) {
    value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    return !text.empty();
}

bool TryParseFileDate(std::string_view text, int64_t& timestampMicros) {
    if (text.size() != kDateLength) {
        return false;
    }
    // yyyy-MM-dd-HH-mm-ss
    int values[6];
    const size_t offsets[6] = {0, 5, 8, 11, 14, 17};
    const size_t widths[6] = {4, 2, 2, 2, 2, 2};
    for (size_t i = 0; i < 6; ++i) {
        if (i > 0 && text[offsets[i] - 1] != '-') {
            return false;
        }
        if (!ParseNumber(text.substr(offsets[i], widths[i]), values[i])) {
            return false;
        }
    }

    UtcTime t;
    t.year = values[0];
    t.month = values[1];
    t.day = values[2];
    t.hour = values[3];
    t.minute = values[4];
    t.second = values[5];
    if (t.month < 1 || t.month > 12 || t.day < 1 || t.hour > 23 || t.minute > 59 ||
        t.second > 59) {
        return false;
    }
    // Reject dates like 02-30 that normalize into the next month / 拒绝越界日期
    timestampMicros = FromUtc(t);
    const UtcTime check = ToUtc(timestampMicros);
    return check.day == t.day && check.month == t.month;
}

}  // namespace

std::string ExpandFileName(std::string_view fileName, std::string_view appName,
                           std::string_view hostName) {
    std::string result(fileName);
    ReplaceAllIgnoreCase(result, "%appname%", appName);
    ReplaceAllIgnoreCase(result, "%machinename%", hostName);
    return result;
}

std::string MakeRotatedFileName(const std::string& baseName, int64_t timestampMicros) {
    const fs::path base(baseName);
    const std::string extension = base.extension().string();
    const UtcTime t = ToUtc(timestampMicros);

    std::string stem = (base.parent_path() / base.stem()).string();
    stem += fmt::format("-{:04}-{:02}-{:02}-{:02}-{:02}-{:02}", t.year, t.month, t.day, t.hour,
                        t.minute, t.second);

    std::error_code ec;
    while (fs::exists(stem + extension, ec)) {
        stem += kAlreadyExistsSuffix;
    }
    return stem + extension;
}

bool TryGetFileDate(const std::string& baseName, const std::string& path,
                    int64_t& timestampMicros) {
    const std::string fileName = fs::path(path).filename().string();
    const std::string baseStem = fs::path(baseName).stem().string();
    const std::string extension = fs::path(baseName).extension().string();

    if (fileName.compare(0, baseStem.size(), baseStem) != 0 ||
        fileName.size() < baseStem.size() + 1 + extension.size() ||
        fileName[baseStem.size()] != '-') {
        return false;
    }
    if (fileName.compare(fileName.size() - extension.size(), extension.size(), extension) != 0) {
        return false;
    }

    std::string value = fileName.substr(baseStem.size() + 1,
                                        fileName.size() - baseStem.size() - 1 - extension.size());
    // Collision suffixes follow the date / 冲突后缀位于日期之后
    const size_t suffix = value.find_first_not_of(kAlreadyExistsSuffix, kDateLength);
    if (value.size() > kDateLength) {
        if (suffix != std::string::npos) {
            return false;
        }
        value.resize(kDateLength);
    }
    return TryParseFileDate(value, timestampMicros);
}

std::vector<std::string> GetRotatedFiles(const std::string& baseName) {
    std::vector<std::string> files;
    fs::path dir = fs::path(baseName).parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return files;
    }
    for (const fs::directory_entry& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const std::string path = entry.path().string();
        int64_t date = 0;
        if (TryGetFileDate(baseName, path, date)) {
            files.push_back(path);
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string GetFileName(const std::string& baseName, bool append, int64_t timestampMicros) {
    if (append) {
        const std::vector<std::string> files = GetRotatedFiles(baseName);
        if (!files.empty()) {
            return files.back();
        }
    }
    return MakeRotatedFileName(baseName, timestampMicros);
}

size_t DeleteOldFiles(const std::string& baseName, int64_t maxParts) {
    if (maxParts <= 0) {
        return 0;
    }
    const std::vector<std::string> files = GetRotatedFiles(baseName);
    size_t removed = 0;
    for (size_t i = 0; i + static_cast<size_t>(maxParts) < files.size(); ++i) {
        std::error_code ec;
        if (fs::remove(files[i], ec)) {
            ++removed;
        }
    }
    return removed;
}

void CreateParentDirectories(const std::string& path) {
    const fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    if (fs::exists(parent, ec)) {
        return;
    }
    fs::create_directories(parent, ec);
    if (ec) {
        throw Error(ErrorCode::FileOpenFailed,
                    fmt::format("Failed to create directory: {} ({})", parent.string(), ec.message()));
    }
}

}  // namespace internal
}  // namespace silink
