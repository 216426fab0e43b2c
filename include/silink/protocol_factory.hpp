/**
 * @file protocol_factory.hpp
 * @brief Creates protocols by connections string name
 * @brief 按连接字符串中的名称创建协议
 *
 * Built in: tcp, pipe, file, text, mem / 内置: tcp, pipe, file, text, mem
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "silink/protocol.hpp"

namespace silink {

class ProtocolFactory {
public:
    using Creator = std::function<std::shared_ptr<Protocol>()>;

    /**
     * @brief Create a protocol and initialize it with an option string
     * @brief 创建协议并用选项字符串初始化
     *
     * @throws Error ConfigUnknownProtocol for unknown names, or the option errors of
     *         Protocol::Initialize
     */
    static std::shared_ptr<Protocol> Create(std::string_view name, std::string_view options = {});

    /**
     * @brief Register or replace a protocol (name is case-insensitive)
     * @brief 注册或替换协议（名称不区分大小写）
     */
    static void Register(std::string_view name, Creator creator);

    static bool IsRegistered(std::string_view name);

    /// Registered names in lower case, sorted / 已注册名称（小写，已排序）
    static std::vector<std::string> Names();
};

}  // namespace silink
