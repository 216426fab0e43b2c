/**
 * @file diagnostics.hpp
 * @brief Default spdlog loggers for library diagnostics
 * @brief 库诊断使用的默认 spdlog 日志器
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <memory>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace silink {
namespace internal {

/**
 * @brief Create an unregistered logger "silink.<name>" on stderr at level warn
 * @brief 创建未注册的日志器 "silink.<name>"，输出到 stderr，级别为 warn
 *
 * All default loggers share one stderr sink. Nothing is added to the spdlog registry.
 * 所有默认日志器共享一个 stderr sink。不会向 spdlog 注册表添加任何内容。
 */
inline std::shared_ptr<spdlog::logger> MakeDefaultLogger(std::string_view name) {
    static const auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(fmt::format("silink.{}", name), sink);
    logger->set_level(spdlog::level::warn);
    return logger;
}

}  // namespace internal
}  // namespace silink
