/**
 * @file error.hpp
 * @brief Exception types for silink
 * @brief silink 异常类型
 *
 * - Error: runtime error carrying an ErrorCode
 * - ProtocolError: Error raised by a protocol, carries the protocol name and options
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "silink/common.hpp"

namespace silink {

/**
 * @brief Base exception of the library
 * @brief 库的基础异常
 */
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    ErrorCode Code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

/**
 * @brief Exception raised by a protocol operation
 * @brief 协议操作引发的异常
 *
 * what() reads "<protocol> protocol: <message>".
 */
class ProtocolError : public Error {
public:
    ProtocolError(ErrorCode code, const std::string& message, std::string protocolName,
                  std::string protocolOptions)
        : Error(code, fmt::format("{} protocol: {}", protocolName, message)),
          m_message(message),
          m_protocolName(std::move(protocolName)),
          m_protocolOptions(std::move(protocolOptions)) {}

    /// Message without the protocol prefix / 不带协议前缀的消息
    const std::string& Message() const noexcept { return m_message; }
    const std::string& ProtocolName() const noexcept { return m_protocolName; }
    const std::string& ProtocolOptions() const noexcept { return m_protocolOptions; }

private:
    std::string m_message;
    std::string m_protocolName;
    std::string m_protocolOptions;
};

}  // namespace silink
