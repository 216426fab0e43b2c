/**
 * @file common.hpp
 * @brief Common definitions for silink (Level, Mode, ErrorCode)
 * @brief silink 通用定义（级别、运行模式、错误码）
 *
 * - Level: packet severity, Control always passes filters
 *   Level：数据包严重级别，Control 总是通过过滤
 * - Mode: sync or async protocol / 同步或异步协议
 * - FileRotate: time based rotation / 基于时间的轮转
 * - ErrorCode: codes carried by silink::Error / silink::Error 携带的错误码
 *
 * @copyright Copyright (c) 2024 silink
 */

#ifndef SILINK_COMMON_HPP
#define SILINK_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace silink {

constexpr std::string_view kVersion = "1.0.0";  ///< Library version / 库版本

// ==============================================================================
// Helpers / 辅助函数
// ==============================================================================

/**
 * @brief ASCII case-insensitive comparison
 * @brief ASCII 不区分大小写比较
 */
constexpr bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'A' && ca <= 'Z') {
            ca = static_cast<char>(ca - 'A' + 'a');
        }
        if (cb >= 'A' && cb <= 'Z') {
            cb = static_cast<char>(cb - 'A' + 'a');
        }
        if (ca != cb) {
            return false;
        }
    }
    return true;
}

// ==============================================================================
// Level / 级别
// ==============================================================================

/**
 * @brief Packet level enumeration
 * @brief 数据包级别枚举
 *
 * Levels are ordered by severity from lowest (Debug) to highest (Fatal).
 * Control is reserved for control commands and always passes level filters.
 *
 * 级别按严重程度从低（Debug）到高（Fatal）排序。
 * Control 保留给控制命令，总是通过级别过滤。
 */
enum class Level : uint8_t {
    Debug = 0,    ///< Debug information / 调试信息
    Verbose = 1,  ///< Verbose tracing / 详细跟踪
    Message = 2,  ///< Regular messages / 普通消息
    Warning = 3,  ///< Warnings / 警告
    Error = 4,    ///< Errors / 错误
    Fatal = 5,    ///< Fatal errors / 致命错误
    Control = 6   ///< Control packets / 控制数据包
};

/**
 * @brief Convert level to string representation
 * @brief 将级别转换为字符串表示
 */
constexpr std::string_view LevelToString(Level level) noexcept {
    constexpr std::string_view kNames[] = {"Debug", "Verbose", "Message", "Warning",
                                           "Error", "Fatal",   "Control"};
    const auto idx = static_cast<size_t>(level);
    if (idx > static_cast<size_t>(Level::Control)) {
        return "Unknown";
    }
    return kNames[idx];
}

/**
 * @brief Convert string to level (case-insensitive)
 * @brief 将字符串转换为级别（不区分大小写）
 *
 * @param name Level name / 级别名称
 * @param defaultLevel Returned when the name is unknown / 名称未知时返回
 */
constexpr Level StringToLevel(std::string_view name, Level defaultLevel) noexcept {
    for (uint8_t i = 0; i <= static_cast<uint8_t>(Level::Control); ++i) {
        if (EqualsIgnoreCase(name, LevelToString(static_cast<Level>(i)))) {
            return static_cast<Level>(i);
        }
    }
    return defaultLevel;
}

/**
 * @brief Check if a packet level passes a level filter
 * @brief 检查数据包级别是否通过级别过滤
 */
constexpr bool ShouldWrite(Level packetLevel, Level filterLevel) noexcept {
    return packetLevel == Level::Control ||
           static_cast<uint8_t>(packetLevel) >= static_cast<uint8_t>(filterLevel);
}

// ==============================================================================
// Operating Mode / 运行模式
// ==============================================================================

/**
 * @brief Operating mode of a protocol
 * @brief 协议运行模式
 *
 * - Sync: the calling thread performs the I/O and receives errors as exceptions
 * - Async: a scheduler thread performs the I/O, errors go to error handlers
 *
 * - Sync：调用线程执行 I/O，错误以异常形式返回
 * - Async：调度线程执行 I/O，错误交给错误处理器
 */
enum class Mode : uint8_t {
    Sync = 0,  ///< Synchronous mode / 同步模式
    Async = 1  ///< Asynchronous mode / 异步模式
};

// ==============================================================================
// File Rotation Mode / 文件轮转模式
// ==============================================================================

/**
 * @brief Time-based file rotation granularity
 * @brief 基于时间的文件轮转粒度
 */
enum class FileRotate : uint8_t {
    NoRotate = 0,  ///< Never rotate by time / 不按时间轮转
    Hourly = 1,    ///< Rotate every hour / 每小时轮转
    Daily = 2,     ///< Rotate every day / 每天轮转
    Weekly = 3,    ///< Rotate every week (Monday) / 每周轮转（周一）
    Monthly = 4    ///< Rotate every month / 每月轮转
};

constexpr std::string_view FileRotateToString(FileRotate rotate) noexcept {
    constexpr std::string_view kNames[] = {"NoRotate", "Hourly", "Daily", "Weekly", "Monthly"};
    const auto idx = static_cast<size_t>(rotate);
    if (idx > static_cast<size_t>(FileRotate::Monthly)) {
        return "Unknown";
    }
    return kNames[idx];
}

/**
 * @brief Convert string to rotate mode (case-insensitive, "none" means NoRotate)
 * @brief 将字符串转换为轮转模式（不区分大小写，"none" 表示 NoRotate）
 */
constexpr FileRotate StringToFileRotate(std::string_view name, FileRotate defaultRotate) noexcept {
    if (EqualsIgnoreCase(name, "none")) {
        return FileRotate::NoRotate;
    }
    for (uint8_t i = 0; i <= static_cast<uint8_t>(FileRotate::Monthly); ++i) {
        if (EqualsIgnoreCase(name, FileRotateToString(static_cast<FileRotate>(i)))) {
            return static_cast<FileRotate>(i);
        }
    }
    return defaultRotate;
}

// ==============================================================================
// Error Code / 错误码
// ==============================================================================

/**
 * @brief Error codes carried by silink::Error
 * @brief silink::Error 携带的错误码
 *
 * Grouped by hundreds: 1xx data, 3xx file, 4xx network, 6xx configuration,
 * 7xx thread, 8xx crypto, 9xx general.
 * 按百位分组：1xx 数据、3xx 文件、4xx 网络、6xx 配置、7xx 线程、8xx 加密、9xx 通用。
 */
enum class ErrorCode : int32_t {
    Success = 0,

    BufferUnderflow = 103,  ///< Packet data ends early / 数据包数据提前结束

    FileOpenFailed = 300,   ///< Could not open or create the log file / 无法打开或创建日志文件
    FileWriteFailed = 301,  ///< Write to a log file failed / 写日志文件失败
    FileCloseFailed = 304,
    FileFlushFailed = 305,

    NetworkConnectFailed = 400,  ///< Connection refused or unreachable / 连接被拒绝或不可达
    NetworkSendFailed = 401,
    NetworkReceiveFailed = 402,
    NetworkDisconnected = 403,  ///< Peer closed the connection / 对端关闭连接
    NetworkTimeout = 404,
    NetworkResolveFailed = 405,  ///< Host name lookup failed / 主机名解析失败

    ConfigParseError = 600,       ///< Malformed connections or options string / 字符串格式错误
    ConfigInvalidValue = 601,     ///< Unknown option or bad value / 未知选项或非法值
    ConfigMissingRequired = 602,  ///< Required option missing / 缺少必需选项
    ConfigUnknownProtocol = 603,  ///< No protocol registered under the name / 协议名未注册

    ThreadCreateFailed = 700,

    CryptoInitFailed = 800,    ///< Cipher or digest setup failed / 密码或摘要初始化失败
    CryptoUpdateFailed = 801,
    CryptoFinalFailed = 802,   ///< Bad padding or truncated ciphertext / 填充错误或密文截断

    InvalidArgument = 900,
    NotSupported = 903,
    InternalError = 999
};

constexpr std::string_view ErrorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::BufferUnderflow: return "BufferUnderflow";
        case ErrorCode::FileOpenFailed: return "FileOpenFailed";
        case ErrorCode::FileWriteFailed: return "FileWriteFailed";
        case ErrorCode::FileCloseFailed: return "FileCloseFailed";
        case ErrorCode::FileFlushFailed: return "FileFlushFailed";
        case ErrorCode::NetworkConnectFailed: return "NetworkConnectFailed";
        case ErrorCode::NetworkSendFailed: return "NetworkSendFailed";
        case ErrorCode::NetworkReceiveFailed: return "NetworkReceiveFailed";
        case ErrorCode::NetworkDisconnected: return "NetworkDisconnected";
        case ErrorCode::NetworkTimeout: return "NetworkTimeout";
        case ErrorCode::NetworkResolveFailed: return "NetworkResolveFailed";
        case ErrorCode::ConfigParseError: return "ConfigParseError";
        case ErrorCode::ConfigInvalidValue: return "ConfigInvalidValue";
        case ErrorCode::ConfigMissingRequired: return "ConfigMissingRequired";
        case ErrorCode::ConfigUnknownProtocol: return "ConfigUnknownProtocol";
        case ErrorCode::ThreadCreateFailed: return "ThreadCreateFailed";
        case ErrorCode::CryptoInitFailed: return "CryptoInitFailed";
        case ErrorCode::CryptoUpdateFailed: return "CryptoUpdateFailed";
        case ErrorCode::CryptoFinalFailed: return "CryptoFinalFailed";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotSupported: return "NotSupported";
        case ErrorCode::InternalError: return "InternalError";
        default: return "UnknownError";
    }
}

}  // namespace silink

#endif  // SILINK_COMMON_HPP
