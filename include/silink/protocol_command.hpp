/**
 * @file protocol_command.hpp
 * @brief Custom action passed to Protocol::Dispatch
 * @brief 传递给 Protocol::Dispatch 的自定义动作
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <memory>
#include <ostream>
#include <variant>

namespace silink {

class Protocol;

/**
 * @brief Protocol specific action with its target
 * @brief 带目标的协议专用动作
 *
 * The meaning of action is defined by each protocol. The memory protocol uses
 * action 0 to flush its packets to either an output stream or another protocol.
 *
 * action 的含义由各协议定义。内存协议使用 action 0 将数据包刷新到输出流或另一个协议。
 */
struct ProtocolCommand {
    using State = std::variant<std::monostate, std::shared_ptr<std::ostream>, std::shared_ptr<Protocol>>;

    int action{0};
    State state;
};

}  // namespace silink
