/**
 * @file connections_builder.hpp
 * @brief Builds connections strings that round trip through the parsers
 * @brief 构建可经解析器往返的连接字符串
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "silink/common.hpp"
#include "silink/connections_parser.hpp"

namespace silink {

/**
 * @brief Incremental connections string builder
 * @brief 增量连接字符串构建器
 *
 * builder.BeginProtocol("file");
 * builder.AddOption("filename", "log.sil");
 * builder.EndProtocol();
 * builder.ToString();  // file(filename="log.sil")
 */
class ConnectionsBuilder {
public:
    void BeginProtocol(std::string_view name) {
        if (!m_connections.empty()) {
            m_connections += ", ";
        }
        m_connections.append(name.data(), name.size());
        m_options.clear();
    }

    void EndProtocol() {
        m_connections += '(';
        m_connections += m_options;
        m_connections += ')';
    }

    void AddOption(std::string_view key, std::string_view value) {
        AddRaw(key, QuoteOptionValue(value));
    }
    void AddOption(std::string_view key, const char* value) {
        AddOption(key, std::string_view(value));
    }
    void AddOption(std::string_view key, const std::string& value) {
        AddOption(key, std::string_view(value));
    }
    void AddOption(std::string_view key, bool value) { AddRaw(key, value ? "true" : "false"); }
    void AddOption(std::string_view key, int64_t value) { AddRaw(key, fmt::format("{}", value)); }
    void AddOption(std::string_view key, int value) { AddOption(key, static_cast<int64_t>(value)); }
    void AddOption(std::string_view key, Level value) {
        AddRaw(key, std::string(LevelToString(value)));
    }
    void AddOption(std::string_view key, FileRotate value) {
        AddRaw(key, std::string(FileRotateToString(value)));
    }

    /// Size in bytes, written in KB / 字节大小，以 KB 写出
    void AddSizeOption(std::string_view key, int64_t bytes) {
        AddRaw(key, fmt::format("{}kb", bytes / 1024));
    }

    /// Timespan written in seconds / 以秒写出的时间
    void AddTimespanOption(std::string_view key, std::chrono::milliseconds value) {
        AddRaw(key, fmt::format("{}s", value.count() / 1000));
    }

    /// Options of the protocol currently being built / 当前正在构建的协议的选项
    const std::string& Options() const noexcept { return m_options; }

    const std::string& ToString() const noexcept { return m_connections; }

    void Clear() noexcept {
        m_connections.clear();
        m_options.clear();
    }

private:
    void AddRaw(std::string_view key, const std::string& value) {
        if (!m_options.empty()) {
            m_options += ", ";
        }
        m_options.append(key.data(), key.size());
        m_options += '=';
        m_options += value;
    }

    std::string m_connections;
    std::string m_options;
};

}  // namespace silink
