/**
 * @file text_formatter.cpp
 * @brief PatternParser and TextFormatter implementation
 * @brief PatternParser 与 TextFormatter 实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/text_formatter.hpp"

#include <cstdlib>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "silink/common.hpp"
#include "silink/internal/date_time.hpp"

namespace silink {

namespace {

constexpr std::string_view kIndentSpaces = "   ";

struct TokenName {
    std::string_view name;
    PatternParser::TokenKind kind;
};

constexpr TokenName kTokenNames[] = {
    {"%appname%", PatternParser::TokenKind::AppName},
    {"%session%", PatternParser::TokenKind::Session},
    {"%hostname%", PatternParser::TokenKind::HostName},
    {"%title%", PatternParser::TokenKind::Title},
    {"%timestamp%", PatternParser::TokenKind::Timestamp},
    {"%level%", PatternParser::TokenKind::Level},
    {"%color%", PatternParser::TokenKind::Color},
    {"%logentrytype%", PatternParser::TokenKind::LogEntryType},
    {"%viewerid%", PatternParser::TokenKind::ViewerId},
    {"%thread%", PatternParser::TokenKind::Thread},
    {"%process%", PatternParser::TokenKind::Process}};

std::string_view Trim(std::string_view text) {
    const size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

int ParseWidth(std::string_view text) {
    const std::string value(Trim(text));
    if (value.empty()) {
        return 0;
    }
    char* end = nullptr;
    const long width = std::strtol(value.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') {
        return 0;
    }
    return static_cast<int>(width);
}

std::string DefaultTimestamp(const internal::UtcTime& t) {
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:06}", t.year, t.month, t.day, t.hour,
                       t.minute, t.second, t.microsecond);
}

}  // namespace

// ==============================================================================
// Timestamp / 时间戳
// ==============================================================================

std::string FormatTimestamp(int64_t timestampMicros, std::string_view format) {
    const internal::UtcTime t = internal::ToUtc(timestampMicros);
    if (format.empty()) {
        return DefaultTimestamp(t);
    }

    // %f is not a strftime conversion, expand it first / %f 不是 strftime 转换符，先展开
    std::string pattern;
    pattern.reserve(format.size() + 8);
    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] == '%' && i + 1 < format.size()) {
            if (format[i + 1] == 'f') {
                pattern += fmt::format("{:06}", t.microsecond);
                ++i;
                continue;
            }
            pattern += format[i];
            pattern += format[++i];
            continue;
        }
        pattern += format[i];
    }

    try {
        return fmt::format(fmt::runtime("{:" + pattern + "}"), internal::ToTm(t));
    } catch (const fmt::format_error&) {
        return DefaultTimestamp(t);
    }
}

// ==============================================================================
// PatternParser / 模式解析器
// ==============================================================================

PatternParser::Token PatternParser::MakeToken(std::string_view text) {
    Token token;
    token.value = std::string(text);
    if (text.size() <= 2 || text.front() != '%' || text.back() != '%') {
        return token;
    }

    std::string name(text);
    // %name{options}% / 带选项
    if (name[name.size() - 2] == '}') {
        const size_t open = name.find('{');
        if (open != std::string::npos) {
            token.options = name.substr(open + 1, name.size() - 2 - open - 1);
            name.erase(open, name.size() - 1 - open);
        }
    }
    // %name,width% / 带宽度
    const size_t comma = name.find(',');
    if (comma != std::string::npos) {
        token.width = ParseWidth(std::string_view(name).substr(comma + 1, name.size() - comma - 2));
        name.erase(comma, name.size() - 1 - comma);
    }

    for (const auto& entry : kTokenNames) {
        if (EqualsIgnoreCase(name, entry.name)) {
            token.kind = entry.kind;
            return token;
        }
    }
    token.options.clear();
    token.width = 0;
    return token;
}

void PatternParser::SetPattern(std::string_view pattern) {
    m_pattern = std::string(Trim(pattern));
    m_indentLevel = 0;
    m_tokens.clear();

    size_t position = 0;
    const size_t length = m_pattern.size();
    while (position < length) {
        size_t pos = position;
        const bool isVariable = m_pattern[pos] == '%';
        if (isVariable) {
            ++pos;
        }
        while (pos < length) {
            // Options may contain '%' (strftime) / 选项中可能含有 '%'
            if (isVariable && m_pattern[pos] == '{') {
                const size_t close = m_pattern.find('}', pos);
                if (close != std::string::npos) {
                    pos = close + 1;
                    continue;
                }
            }
            if (m_pattern[pos] == '%') {
                if (isVariable) {
                    ++pos;
                }
                break;
            }
            ++pos;
        }
        m_tokens.push_back(MakeToken(std::string_view(m_pattern).substr(position, pos - position)));
        position = pos;
    }
}

std::string PatternParser::ExpandToken(const Token& token, const LogEntry& entry) {
    switch (token.kind) {
        case TokenKind::AppName:
            return entry.appName;
        case TokenKind::Session:
            return entry.sessionName;
        case TokenKind::HostName:
            return entry.hostName;
        case TokenKind::Title:
            return entry.title;
        case TokenKind::Timestamp:
            return FormatTimestamp(entry.timestamp, token.options);
        case TokenKind::Level:
            return std::string(LevelToString(entry.level));
        case TokenKind::Color:
            if (entry.color == kDefaultColor) {
                return "<default>";
            }
            return fmt::format("0x{:08X}", entry.color.ToArgbValue());
        case TokenKind::LogEntryType:
            return std::string(LogEntryTypeToString(entry.logEntryType));
        case TokenKind::ViewerId:
            return std::string(ViewerIdToString(entry.viewerId));
        case TokenKind::Thread:
            return fmt::format("{}", entry.threadId);
        case TokenKind::Process:
            return fmt::format("{}", entry.processId);
        case TokenKind::Literal:
        default:
            return token.value;
    }
}

std::string PatternParser::Expand(const LogEntry& entry) {
    if (m_tokens.empty()) {
        return {};
    }
    if (entry.logEntryType == LogEntryType::LeaveMethod && m_indentLevel > 0) {
        --m_indentLevel;
    }

    fmt::memory_buffer out;
    for (const Token& token : m_tokens) {
        if (m_indent && token.kind == TokenKind::Title) {
            for (int i = 0; i < m_indentLevel; ++i) {
                fmt::format_to(std::back_inserter(out), "{}", kIndentSpaces);
            }
        }
        const std::string expanded = ExpandToken(token, entry);
        if (token.width < 0) {
            fmt::format_to(std::back_inserter(out), "{:<{}}", expanded,
                           static_cast<size_t>(-token.width));
        } else if (token.width > 0) {
            fmt::format_to(std::back_inserter(out), "{:>{}}", expanded,
                           static_cast<size_t>(token.width));
        } else {
            fmt::format_to(std::back_inserter(out), "{}", expanded);
        }
    }

    if (entry.logEntryType == LogEntryType::EnterMethod) {
        ++m_indentLevel;
    }
    return fmt::to_string(out);
}

// ==============================================================================
// TextFormatter / 文本格式化器
// ==============================================================================

size_t TextFormatter::Compile(const Packet& packet) {
    m_line.clear();
    if (packet.Type() != PacketType::LogEntry) {
        return 0;
    }
    m_line = m_parser.Expand(static_cast<const LogEntry&>(packet));
    m_line += "\r\n";
    return m_line.size();
}

void TextFormatter::Write(OutputStream& stream) {
    if (!m_line.empty()) {
        stream.Write(std::string_view(m_line));
    }
}

}  // namespace silink
