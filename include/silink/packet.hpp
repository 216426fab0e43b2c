/**
 * @file packet.hpp
 * @brief Packet model (LogEntry, Watch, ProcessFlow, ControlCommand, LogHeader)
 * @brief 数据包模型（日志条目、监视、流程、控制命令、日志头）
 *
 * Packets are plain structs. Once a packet is handed to a protocol as
 * std::shared_ptr<const Packet> it must not be modified.
 *
 * 数据包是普通结构体。一旦以 std::shared_ptr<const Packet> 交给协议，就不能再修改。
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "silink/common.hpp"
#include "silink/internal/platform.hpp"

namespace silink {

// ==============================================================================
// Enumerations / 枚举
// ==============================================================================

/**
 * @brief Packet type tag written to the wire
 * @brief 写入线路的数据包类型标签
 */
enum class PacketType : uint16_t {
    ControlCommand = 1,
    LogEntry = 4,
    Watch = 5,
    ProcessFlow = 6,
    LogHeader = 7
};

constexpr std::string_view PacketTypeToString(PacketType type) noexcept {
    switch (type) {
        case PacketType::ControlCommand:
            return "ControlCommand";
        case PacketType::LogEntry:
            return "LogEntry";
        case PacketType::Watch:
            return "Watch";
        case PacketType::ProcessFlow:
            return "ProcessFlow";
        case PacketType::LogHeader:
            return "LogHeader";
        default:
            return "Unknown";
    }
}

/**
 * @brief Kind of a log entry
 * @brief 日志条目种类
 */
enum class LogEntryType : int32_t {
    Separator = 0,
    EnterMethod = 1,
    LeaveMethod = 2,
    ResetCallstack = 3,
    Message = 100,
    Warning = 101,
    Error = 102,
    InternalError = 103,
    Comment = 104,
    VariableValue = 105,
    Checkpoint = 106,
    Debug = 107,
    Verbose = 108,
    Fatal = 109,
    Conditional = 110,
    Assert = 111,
    Text = 200,
    Binary = 201,
    Graphic = 202,
    Source = 203,
    Object = 204,
    WebContent = 205,
    System = 206,
    MemoryStatistic = 207,
    DatabaseResult = 208,
    DatabaseStructure = 209
};

std::string_view LogEntryTypeToString(LogEntryType type) noexcept;

/**
 * @brief Console viewer used to display the entry data
 * @brief 控制台用于显示条目数据的查看器
 */
enum class ViewerId : int32_t {
    NoViewer = -1,
    Title = 0,
    Data = 1,
    List = 2,
    ValueList = 3,
    Inspector = 4,
    Table = 5,
    Web = 100,
    Binary = 200,
    HtmlSource = 300,
    JavaScriptSource = 301,
    VbScriptSource = 302,
    PerlSource = 303,
    SqlSource = 304,
    IniSource = 305,
    PythonSource = 306,
    XmlSource = 307,
    Bitmap = 400,
    Jpeg = 401,
    Icon = 402,
    Metafile = 403,
    Png = 404
};

std::string_view ViewerIdToString(ViewerId id) noexcept;

enum class WatchType : int32_t {
    Char = 0,
    String = 1,
    Integer = 2,
    Float = 3,
    Boolean = 4,
    Address = 5,
    Timestamp = 6,
    Object = 7
};

enum class ProcessFlowType : int32_t {
    EnterMethod = 0,
    LeaveMethod = 1,
    EnterThread = 2,
    LeaveThread = 3,
    EnterProcess = 4,
    LeaveProcess = 5
};

enum class ControlCommandType : int32_t {
    ClearLog = 0,
    ClearWatches = 1,
    ClearAutoViews = 2,
    ClearAll = 3,
    ClearProcessFlow = 4
};

/**
 * @brief RGBA color
 * @brief RGBA 颜色
 *
 * Packed on the wire as R | G << 8 | B << 16 | A << 24.
 */
struct Color {
    uint8_t r{0xFF};
    uint8_t g{0xFF};
    uint8_t b{0xFF};
    uint8_t a{0x00};

    constexpr uint32_t ToArgbValue() const noexcept {
        return static_cast<uint32_t>(r) | (static_cast<uint32_t>(g) << 8) |
               (static_cast<uint32_t>(b) << 16) | (static_cast<uint32_t>(a) << 24);
    }

    static constexpr Color FromValue(uint32_t value) noexcept {
        return Color{static_cast<uint8_t>(value & 0xFF), static_cast<uint8_t>((value >> 8) & 0xFF),
                     static_cast<uint8_t>((value >> 16) & 0xFF),
                     static_cast<uint8_t>((value >> 24) & 0xFF)};
    }

    constexpr bool operator==(const Color& other) const noexcept {
        return ToArgbValue() == other.ToArgbValue();
    }
    constexpr bool operator!=(const Color& other) const noexcept { return !(*this == other); }
};

/// Default transparent white / 默认透明白色
constexpr Color kDefaultColor{0xFF, 0xFF, 0xFF, 0x00};

// ==============================================================================
// Packet / 数据包
// ==============================================================================

constexpr size_t kPacketHeaderSize = 6;  ///< uint16 type + int32 payload size / 类型 + 负载长度

/**
 * @brief Base of all packets
 * @brief 所有数据包的基类
 *
 * level, timestamp, processId and threadId are stamped at construction. Only the
 * packet types whose wire layout includes a field serialize it; level is never
 * serialized and is used for filtering only.
 *
 * level、timestamp、processId 和 threadId 在构造时填充。只有线路布局包含该字段的
 * 数据包类型才序列化它；level 从不序列化，仅用于过滤。
 */
struct Packet {
    virtual ~Packet() = default;

    virtual PacketType Type() const noexcept = 0;

    /// Number of payload bytes after the 6-byte header / 6 字节头之后的负载字节数
    virtual size_t PayloadSize() const noexcept = 0;

    /// Exact serialized size including the header / 包括头在内的精确序列化大小
    size_t Size() const noexcept { return kPacketHeaderSize + PayloadSize(); }

    Level level{Level::Message};
    int64_t timestamp{internal::GetMicrosecondTimestamp()};  ///< Microseconds since epoch / 微秒
    uint32_t processId{internal::GetCurrentProcessId()};
    uint32_t threadId{internal::GetCurrentThreadId()};

protected:
    Packet() = default;
    Packet(const Packet&) = default;
    Packet& operator=(const Packet&) = default;
};

using PacketPtr = std::shared_ptr<const Packet>;

/**
 * @brief Log entry packet
 * @brief 日志条目数据包
 *
 * Payload layout / 负载布局:
 * +------------------------------------------+
 * | logEntryType, viewerId (int32 x 2)       |
 * | len(appName, sessionName, title,         |
 * |     hostName, data) (int32 x 5)          |
 * | processId, threadId (int32 x 2)          |
 * | timestamp (double, OLE date)             |
 * | color (int32)                            |
 * +------------------------------------------+
 * | appName | sessionName | title | hostName |
 * | data                                     |
 * +------------------------------------------+
 */
struct LogEntry : Packet {
    static constexpr size_t kFixedSize = 48;

    LogEntry() = default;
    LogEntry(LogEntryType type, ViewerId viewer) : logEntryType(type), viewerId(viewer) {}

    PacketType Type() const noexcept override { return PacketType::LogEntry; }
    size_t PayloadSize() const noexcept override {
        return kFixedSize + appName.size() + sessionName.size() + title.size() + hostName.size() +
               data.size();
    }

    LogEntryType logEntryType{LogEntryType::Message};
    ViewerId viewerId{ViewerId::Title};
    std::string appName;
    std::string sessionName;
    std::string title;
    std::string hostName;
    std::vector<uint8_t> data;
    Color color{kDefaultColor};
};

/**
 * @brief Watch packet (named variable value)
 * @brief 监视数据包（命名变量值）
 */
struct Watch : Packet {
    static constexpr size_t kFixedSize = 20;

    Watch() = default;
    Watch(std::string watchName, std::string watchValue, WatchType type)
        : name(std::move(watchName)), value(std::move(watchValue)), watchType(type) {}

    PacketType Type() const noexcept override { return PacketType::Watch; }
    size_t PayloadSize() const noexcept override { return kFixedSize + name.size() + value.size(); }

    std::string name;
    std::string value;
    WatchType watchType{WatchType::String};
};

/**
 * @brief Process flow packet (enter/leave method, thread, process)
 * @brief 流程数据包（进入/离开方法、线程、进程）
 */
struct ProcessFlow : Packet {
    static constexpr size_t kFixedSize = 28;

    ProcessFlow() = default;
    explicit ProcessFlow(ProcessFlowType type) : processFlowType(type) {}

    PacketType Type() const noexcept override { return PacketType::ProcessFlow; }
    size_t PayloadSize() const noexcept override {
        return kFixedSize + title.size() + hostName.size();
    }

    ProcessFlowType processFlowType{ProcessFlowType::EnterMethod};
    std::string title;
    std::string hostName;
};

/**
 * @brief Control command packet
 * @brief 控制命令数据包
 */
struct ControlCommand : Packet {
    static constexpr size_t kFixedSize = 8;

    ControlCommand() { level = Level::Control; }
    explicit ControlCommand(ControlCommandType type) : controlCommandType(type) {
        level = Level::Control;
    }

    PacketType Type() const noexcept override { return PacketType::ControlCommand; }
    size_t PayloadSize() const noexcept override { return kFixedSize + data.size(); }

    ControlCommandType controlCommandType{ControlCommandType::ClearAll};
    std::vector<uint8_t> data;
};

/**
 * @brief Log header packet sent after a stream handshake
 * @brief 在流握手后发送的日志头数据包
 */
struct LogHeader : Packet {
    static constexpr size_t kFixedSize = 4;
    static constexpr size_t kContentOverhead = 21;  ///< Key names and line breaks / 键名与换行

    LogHeader() { level = Level::Control; }
    LogHeader(std::string host, std::string app)
        : hostName(std::move(host)), appName(std::move(app)) {
        level = Level::Control;
    }

    PacketType Type() const noexcept override { return PacketType::LogHeader; }
    size_t PayloadSize() const noexcept override {
        return kFixedSize + kContentOverhead + hostName.size() + appName.size();
    }

    /// "hostname=<host>\r\nappname=<app>\r\n"
    std::string Content() const {
        return "hostname=" + hostName + "\r\nappname=" + appName + "\r\n";
    }

    std::string hostName;
    std::string appName;
};

}  // namespace silink
