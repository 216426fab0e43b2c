/**
 * @file connections_parser.hpp
 * @brief Parsers for connections strings and protocol options
 * @brief 连接字符串与协议选项解析器
 *
 * Grammar / 语法:
 *   connections := section ("," section)*
 *   section     := name "(" options ")"
 *   options     := (key "=" value ("," key "=" value)*)?
 *   value       := plain | '"' (char | '\"' | '\\')* '"'
 *
 * Example / 示例:
 *   tcp(host=localhost, port=4228), file(filename="c:\\log.sil", append=true)
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "silink/internal/callback_list.hpp"

namespace silink {

/**
 * @brief One protocol section of a connections string
 * @brief 连接字符串中的一个协议段
 */
struct ConnectionDescriptor {
    std::string protocolName;  ///< Protocol name as written / 书写的协议名
    std::string rawOptions;    ///< Options verbatim, quotes kept / 原样选项（保留引号）

    bool operator==(const ConnectionDescriptor& other) const {
        return protocolName == other.protocolName && rawOptions == other.rawOptions;
    }
};

// ==============================================================================
// ConnectionsParser / 连接字符串解析器
// ==============================================================================

/**
 * @brief Splits a connections string into ConnectionDescriptor sections
 * @brief 将连接字符串拆分为 ConnectionDescriptor 段
 *
 * Throws silink::Error(ConfigParseError) naming the offending position.
 * Registered listeners see each section, in order, as soon as it is complete.
 *
 * 抛出 silink::Error(ConfigParseError) 并指出出错位置。
 * 已注册的监听器会在每个段完成时按顺序收到通知。
 */
class ConnectionsParser {
public:
    using Listener = std::function<void(const ConnectionDescriptor&)>;

    CallbackId AddListener(Listener listener) { return m_listeners.Add(std::move(listener)); }
    bool RemoveListener(CallbackId id) { return m_listeners.Remove(id); }

    std::vector<ConnectionDescriptor> Parse(std::string_view connections) const;

private:
    internal::CallbackList<const ConnectionDescriptor&> m_listeners;
};

// ==============================================================================
// OptionsParser / 选项解析器
// ==============================================================================

/**
 * @brief Splits one protocol's option string into key/value pairs
 * @brief 将单个协议的选项字符串拆分为键值对
 *
 * Keys and unquoted values are trimmed, quoted values are unescaped
 * ('\"' becomes '"', '\\' becomes '\'). Listeners receive
 * (protocol, key, value) for every option in left-to-right order.
 *
 * 键和未加引号的值会去除首尾空白，带引号的值会反转义。
 * 监听器按从左到右的顺序收到每个选项的 (protocol, key, value)。
 */
class OptionsParser {
public:
    using Option = std::pair<std::string, std::string>;
    using Listener =
        std::function<void(std::string_view, const std::string&, const std::string&)>;

    CallbackId AddListener(Listener listener) { return m_listeners.Add(std::move(listener)); }
    bool RemoveListener(CallbackId id) { return m_listeners.Remove(id); }

    std::vector<Option> Parse(std::string_view protocol, std::string_view options) const;

private:
    internal::CallbackList<std::string_view, const std::string&, const std::string&> m_listeners;
};

/**
 * @brief Quote a value so that OptionsParser returns it unchanged
 * @brief 为值加引号，使 OptionsParser 原样返回
 */
std::string QuoteOptionValue(std::string_view value);

}  // namespace silink
