/**
 * @file text_formatter.hpp
 * @brief Pattern based text rendering of log entries
 * @brief 基于模式的日志条目文本渲染
 *
 * Pattern tokens / 模式标记:
 *   %appname% %session% %hostname% %title% %timestamp% %level% %color%
 *   %logentrytype% %viewerid% %thread% %process%
 *
 * - %timestamp{fmt}% takes a strftime style format, %f expands to microseconds
 *   %timestamp{fmt}% 接受 strftime 风格格式，%f 展开为微秒
 * - %title,20% right-aligns to width 20, %title,-20% left-aligns
 *   %title,20% 右对齐到宽度 20，%title,-20% 左对齐
 * - Unknown tokens are kept literally / 未知标记按原文保留
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "silink/formatter.hpp"
#include "silink/packet.hpp"

namespace silink {

constexpr std::string_view kDefaultTextPattern = "[%timestamp%] %level%: %title%";

// ==============================================================================
// PatternParser / 模式解析器
// ==============================================================================

class PatternParser {
public:
    enum class TokenKind : uint8_t {
        Literal,
        AppName,
        Session,
        HostName,
        Title,
        Timestamp,
        Level,
        Color,
        LogEntryType,
        ViewerId,
        Thread,
        Process
    };

    struct Token {
        TokenKind kind{TokenKind::Literal};
        std::string value;    ///< Original text / 原始文本
        std::string options;  ///< Text between "{" and "}" / 花括号内文本
        int width{0};
    };

    PatternParser() { SetPattern(kDefaultTextPattern); }

    /// Leading and trailing whitespace is removed / 去除首尾空白
    void SetPattern(std::string_view pattern);
    const std::string& Pattern() const noexcept { return m_pattern; }

    void SetIndent(bool indent) noexcept { m_indent = indent; }
    bool Indent() const noexcept { return m_indent; }

    const std::vector<Token>& Tokens() const noexcept { return m_tokens; }

    /**
     * @brief Render one entry, tracking method nesting for indentation
     * @brief 渲染一个条目，并跟踪方法嵌套用于缩进
     */
    std::string Expand(const LogEntry& entry);

    static Token MakeToken(std::string_view text);

private:
    static std::string ExpandToken(const Token& token, const LogEntry& entry);

    std::string m_pattern;
    std::vector<Token> m_tokens;
    bool m_indent{false};
    int m_indentLevel{0};
};

/**
 * @brief Render a microsecond timestamp (UTC) with a strftime style format
 * @brief 使用 strftime 风格格式渲染微秒时间戳（UTC）
 *
 * An empty or invalid format yields "yyyy-MM-dd HH:mm:ss.ffffff".
 * 空或无效格式时输出 "yyyy-MM-dd HH:mm:ss.ffffff"。
 */
std::string FormatTimestamp(int64_t timestampMicros, std::string_view format);

// ==============================================================================
// TextFormatter / 文本格式化器
// ==============================================================================

/**
 * @brief Formats log entries as CRLF terminated UTF-8 lines
 * @brief 将日志条目格式化为以 CRLF 结尾的 UTF-8 行
 *
 * Other packet types compile to nothing.
 * 其他数据包类型不产生输出。
 */
class TextFormatter : public Formatter {
public:
    size_t Compile(const Packet& packet) override;
    void Write(OutputStream& stream) override;

    void SetPattern(std::string_view pattern) { m_parser.SetPattern(pattern); }
    const std::string& Pattern() const noexcept { return m_parser.Pattern(); }
    void SetIndent(bool indent) noexcept { m_parser.SetIndent(indent); }
    bool Indent() const noexcept { return m_parser.Indent(); }

private:
    PatternParser m_parser;
    std::string m_line;
};

}  // namespace silink
