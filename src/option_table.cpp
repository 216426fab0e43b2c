/**
 * @file option_table.cpp
 * @brief OptionTable implementation
 * @brief OptionTable 实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/option_table.hpp"

#include <cctype>
#include <limits>

#include <fmt/format.h>

#include "silink/error.hpp"

namespace silink {

namespace {

constexpr int64_t kKb = 1024;
constexpr int64_t kMb = 1024 * kKb;
constexpr int64_t kGb = 1024 * kMb;

std::string Lower(std::string_view text) {
    std::string result(text);
    for (auto& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string_view TrimView(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool EndsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

/// Parse an optionally signed decimal integer, false on junk / 解析十进制整数，非法时返回 false
bool ParseInt64(std::string_view text, int64_t& out) {
    text = TrimView(text);
    if (text.empty()) {
        return false;
    }
    bool negative = false;
    size_t pos = 0;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        pos = 1;
    }
    if (pos >= text.size()) {
        return false;
    }
    int64_t value = 0;
    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (c < '0' || c > '9') {
            return false;
        }
        if (value > (std::numeric_limits<int64_t>::max() - (c - '0')) / 10) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = negative ? -value : value;
    return true;
}

[[noreturn]] void ThrowInvalid(std::string_view key, const std::string& value, std::string_view kind) {
    throw Error(ErrorCode::ConfigInvalidValue,
                fmt::format("Invalid {} value \"{}\" for option \"{}\"", kind, value, key));
}

}  // namespace

std::string OptionTable::Normalize(std::string_view key) {
    return Lower(TrimView(key));
}

const std::string* OptionTable::Find(std::string_view key) const {
    auto it = m_items.find(Normalize(key));
    return it == m_items.end() ? nullptr : &it->second;
}

void OptionTable::Put(std::string_view key, std::string value) {
    m_items[Normalize(key)] = std::move(value);
}

bool OptionTable::Remove(std::string_view key) {
    return m_items.erase(Normalize(key)) > 0;
}

bool OptionTable::Contains(std::string_view key) const {
    return Find(key) != nullptr;
}

std::vector<std::string> OptionTable::Keys() const {
    std::vector<std::string> keys;
    keys.reserve(m_items.size());
    for (const auto& item : m_items) {
        keys.push_back(item.first);
    }
    return keys;
}

std::string OptionTable::GetString(std::string_view key, std::string_view defaultValue) const {
    const std::string* value = Find(key);
    return value != nullptr ? *value : std::string(defaultValue);
}

bool OptionTable::GetBoolean(std::string_view key, bool defaultValue) const {
    const std::string* value = Find(key);
    if (value == nullptr) {
        return defaultValue;
    }
    const std::string v = Lower(TrimView(*value));
    return v == "true" || v == "1" || v == "yes";
}

int64_t OptionTable::GetInteger(std::string_view key, int64_t defaultValue) const {
    const std::string* value = Find(key);
    if (value == nullptr) {
        return defaultValue;
    }
    int64_t result = 0;
    if (!ParseInt64(*value, result)) {
        ThrowInvalid(key, *value, "integer");
    }
    return result;
}

int64_t OptionTable::GetSize(std::string_view key, int64_t defaultBytes) const {
    const std::string* value = Find(key);
    if (value == nullptr) {
        return defaultBytes;
    }
    const std::string v = Lower(TrimView(*value));
    int64_t factor = kKb;
    std::string_view number = v;
    if (EndsWith(v, "kb")) {
        number = std::string_view(v).substr(0, v.size() - 2);
    } else if (EndsWith(v, "mb")) {
        factor = kMb;
        number = std::string_view(v).substr(0, v.size() - 2);
    } else if (EndsWith(v, "gb")) {
        factor = kGb;
        number = std::string_view(v).substr(0, v.size() - 2);
    }
    int64_t result = 0;
    if (!ParseInt64(number, result) || result < 0 ||
        result > std::numeric_limits<int64_t>::max() / factor) {
        ThrowInvalid(key, *value, "size");
    }
    return result * factor;
}

std::chrono::milliseconds OptionTable::GetTimespan(std::string_view key,
                                                   std::chrono::milliseconds defaultValue) const {
    const std::string* value = Find(key);
    if (value == nullptr) {
        return defaultValue;
    }
    const std::string v = Lower(TrimView(*value));
    int64_t factor = 1000;
    std::string_view number = v;
    if (!v.empty()) {
        switch (v.back()) {
            case 's':
                factor = 1000;
                break;
            case 'm':
                factor = 60 * 1000;
                break;
            case 'h':
                factor = 60 * 60 * 1000;
                break;
            case 'd':
                factor = 24 * 60 * 60 * 1000;
                break;
            default:
                break;
        }
        if (v.back() == 's' || v.back() == 'm' || v.back() == 'h' || v.back() == 'd') {
            number = std::string_view(v).substr(0, v.size() - 1);
        }
    }
    int64_t result = 0;
    if (!ParseInt64(number, result) || result < 0 ||
        result > std::numeric_limits<int64_t>::max() / factor) {
        ThrowInvalid(key, *value, "timespan");
    }
    return std::chrono::milliseconds(result * factor);
}

Level OptionTable::GetLevel(std::string_view key, Level defaultValue) const {
    const std::string* value = Find(key);
    if (value == nullptr) {
        return defaultValue;
    }
    const std::string_view v = TrimView(*value);
    constexpr auto kInvalid = static_cast<Level>(0xFF);
    const Level level = StringToLevel(v, kInvalid);
    if (level == kInvalid) {
        ThrowInvalid(key, *value, "level");
    }
    return level;
}

FileRotate OptionTable::GetRotate(std::string_view key, FileRotate defaultValue) const {
    const std::string* value = Find(key);
    if (value == nullptr) {
        return defaultValue;
    }
    constexpr auto kInvalid = static_cast<FileRotate>(0xFF);
    const FileRotate rotate = StringToFileRotate(TrimView(*value), kInvalid);
    if (rotate == kInvalid) {
        ThrowInvalid(key, *value, "rotate");
    }
    return rotate;
}

std::vector<uint8_t> OptionTable::GetBytes(std::string_view key) const {
    const std::string* value = Find(key);
    if (value == nullptr) {
        return {};
    }
    return std::vector<uint8_t>(value->begin(), value->end());
}

}  // namespace silink
