/**
 * @file connections_parser.cpp
 * @brief Connections string and options parser implementation
 * @brief 连接字符串与选项解析器实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/connections_parser.hpp"

#include <cctype>

#include <fmt/format.h>

#include "silink/error.hpp"

namespace silink {

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

size_t SkipSpace(std::string_view text, size_t pos) {
    while (pos < text.size() && IsSpace(text[pos])) {
        ++pos;
    }
    return pos;
}

std::string_view Trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && IsSpace(text[begin])) {
        ++begin;
    }
    while (end > begin && IsSpace(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

[[noreturn]] void ThrowParseError(const std::string& message) {
    throw Error(ErrorCode::ConfigParseError, message);
}

}  // namespace

// ==============================================================================
// ConnectionsParser / 连接字符串解析器
// ==============================================================================

std::vector<ConnectionDescriptor> ConnectionsParser::Parse(std::string_view connections) const {
    std::vector<ConnectionDescriptor> result;
    const size_t length = connections.size();
    size_t pos = SkipSpace(connections, 0);

    while (pos < length) {
        // Protocol name / 协议名
        const size_t nameStart = pos;
        while (pos < length && connections[pos] != '(') {
            const char c = connections[pos];
            if (c == ',' || c == ')' || c == '"') {
                break;
            }
            ++pos;
        }
        if (pos >= length || connections[pos] != '(') {
            ThrowParseError(fmt::format("Missing \"(\" at position {}", pos));
        }
        const std::string name(Trim(connections.substr(nameStart, pos - nameStart)));
        if (name.empty()) {
            ThrowParseError(fmt::format("Missing protocol name at position {}", nameStart));
        }

        // Options up to the matching ")" / 选项直到匹配的 ")"
        const size_t optionsStart = ++pos;
        bool quoted = false;
        size_t quoteStart = 0;
        while (pos < length) {
            const char c = connections[pos];
            if (quoted) {
                if (c == '\\' && pos + 1 < length) {
                    ++pos;
                } else if (c == '"') {
                    quoted = false;
                }
            } else if (c == '"') {
                quoted = true;
                quoteStart = pos;
            } else if (c == ')') {
                break;
            }
            ++pos;
        }
        if (quoted) {
            ThrowParseError(fmt::format("Quoted options not closed in \"{}\" (quote at position {})",
                                        name, quoteStart));
        }
        if (pos >= length) {
            ThrowParseError(fmt::format("Missing \")\" at position {}", pos));
        }

        ConnectionDescriptor descriptor{name,
                                        std::string(connections.substr(optionsStart, pos - optionsStart))};
        m_listeners.Invoke(descriptor);
        result.push_back(std::move(descriptor));

        // Section separator / 段分隔符
        pos = SkipSpace(connections, pos + 1);
        if (pos < length) {
            if (connections[pos] != ',') {
                ThrowParseError(fmt::format("Expected \",\" at position {}", pos));
            }
            pos = SkipSpace(connections, pos + 1);
        }
    }
    return result;
}

// ==============================================================================
// OptionsParser / 选项解析器
// ==============================================================================

std::vector<OptionsParser::Option> OptionsParser::Parse(std::string_view protocol,
                                                        std::string_view options) const {
    std::vector<Option> result;
    const size_t length = options.size();
    size_t pos = SkipSpace(options, 0);

    while (pos < length) {
        // Key / 键
        const size_t keyStart = pos;
        while (pos < length && options[pos] != '=' && options[pos] != ',') {
            ++pos;
        }
        const std::string key(Trim(options.substr(keyStart, pos - keyStart)));
        if (pos >= length || options[pos] != '=') {
            ThrowParseError(fmt::format("Missing \"=\" after option \"{}\" of \"{}\" at position {}",
                                        key, protocol, pos));
        }
        if (key.empty()) {
            ThrowParseError(
                fmt::format("Missing option name in \"{}\" at position {}", protocol, keyStart));
        }

        // Value / 值
        pos = SkipSpace(options, pos + 1);
        std::string value;
        size_t keep = 0;  // bytes of value that must survive trimming / 不能被裁剪的字节数
        bool quoted = false;
        size_t quoteStart = 0;
        while (pos < length) {
            const char c = options[pos];
            if (quoted) {
                if (c == '\\' && pos + 1 < length) {
                    value.push_back(options[++pos]);
                } else if (c == '"') {
                    quoted = false;
                } else {
                    value.push_back(c);
                }
                keep = value.size();
            } else if (c == '"') {
                quoted = true;
                quoteStart = pos;
            } else if (c == ',') {
                break;
            } else {
                value.push_back(c);
            }
            ++pos;
        }
        if (quoted) {
            ThrowParseError(fmt::format("Quoted value of \"{}\" not closed in \"{}\" (quote at position {})",
                                        key, protocol, quoteStart));
        }
        while (value.size() > keep && IsSpace(value.back())) {
            value.pop_back();
        }

        m_listeners.Invoke(protocol, key, value);
        result.emplace_back(key, std::move(value));

        if (pos < length) {
            pos = SkipSpace(options, pos + 1);
        }
    }
    return result;
}

std::string QuoteOptionValue(std::string_view value) {
    std::string result;
    result.reserve(value.size() + 2);
    result.push_back('"');
    for (char c : value) {
        if (c == '"' || c == '\\') {
            result.push_back('\\');
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

}  // namespace silink
