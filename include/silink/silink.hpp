/**
 * @file silink.hpp
 * @brief Main header for silink
 * @brief silink 主头文件
 *
 * silink delivers trace packets (log entries, watches, process flow, control
 * commands) to a SmartInspect console, log files or memory through configurable
 * protocols.
 *
 * silink 通过可配置的协议将跟踪数据包（日志条目、监视、流程、控制命令）
 * 传送到 SmartInspect 控制台、日志文件或内存。
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

// Core / 核心
#include "silink/common.hpp"
#include "silink/error.hpp"
#include "silink/packet.hpp"

// Configuration / 配置
#include "silink/connections_builder.hpp"
#include "silink/connections_parser.hpp"
#include "silink/option_table.hpp"

// Formatting / 格式化
#include "silink/formatter.hpp"
#include "silink/text_formatter.hpp"

// Protocols / 协议
#include "silink/file_protocol.hpp"
#include "silink/memory_protocol.hpp"
#include "silink/protocol.hpp"
#include "silink/protocol_factory.hpp"
#include "silink/socket_protocol.hpp"
#include "silink/text_protocol.hpp"

// Client / 客户端
#include "silink/client.hpp"
