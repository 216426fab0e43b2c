/**
 * @file protocol.hpp
 * @brief Protocol base class shared by all transports
 * @brief 所有传输共享的协议基类
 *
 * State machine / 状态机:
 *
 *   Disconnected --Connect--> Connecting --ok--> Connected
 *        ^                        |                  |
 *        +-------- error ---------+---- error -------+
 *        +------------------ Disconnect -------------+
 *
 * Options common to every protocol / 所有协议共有的选项:
 * - caption, level
 * - reconnect, reconnect.interval
 * - backlog.enabled, backlog.queue, backlog.flushon, backlog.keepopen
 *   (legacy: backlog, flushon, keepopen)
 * - async.enabled, async.queue, async.throttle, async.clearondisconnect
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "silink/common.hpp"
#include "silink/connections_builder.hpp"
#include "silink/error.hpp"
#include "silink/internal/callback_list.hpp"
#include "silink/option_table.hpp"
#include "silink/packet.hpp"
#include "silink/packet_queue.hpp"
#include "silink/protocol_command.hpp"
#include "silink/scheduler.hpp"

namespace silink {

enum class ProtocolState : uint8_t {
    Disconnected = 0,
    Connecting = 1,
    Connected = 2
};

constexpr std::string_view ProtocolStateToString(ProtocolState state) noexcept {
    switch (state) {
        case ProtocolState::Disconnected:
            return "Disconnected";
        case ProtocolState::Connecting:
            return "Connecting";
        case ProtocolState::Connected:
            return "Connected";
        default:
            return "Unknown";
    }
}

// ==============================================================================
// Protocol Base Class / 协议基类
// ==============================================================================

/**
 * @brief Base class for transports
 * @brief 传输基类
 *
 * Public operations are thread-safe. In synchronous mode they perform the I/O on the
 * calling thread and throw ProtocolError. In asynchronous mode they only queue a
 * command; failures are delivered to the error handlers and the diagnostics logger.
 *
 * 公共操作是线程安全的。同步模式下在调用线程执行 I/O 并抛出 ProtocolError。
 * 异步模式下只排队命令；失败交给错误处理器和诊断日志器。
 *
 * Concrete protocols must call Dispose() from their destructor.
 * 具体协议必须在析构函数中调用 Dispose()。
 */
class Protocol {
public:
    using ErrorHandler = std::function<void(const ProtocolError&)>;
    using InfoHandler = std::function<void(const std::string&)>;

    static constexpr int64_t kDefaultQueueSize = 2048 * 1024;

    virtual ~Protocol() = default;

    // Non-copyable, non-movable
    Protocol(const Protocol&) = delete;
    Protocol& operator=(const Protocol&) = delete;
    Protocol(Protocol&&) = delete;
    Protocol& operator=(Protocol&&) = delete;

    /// Protocol name used in connections strings / 连接字符串中使用的协议名
    const std::string& Name() const noexcept { return m_name; }

    // --------------------------------------------------------------------------
    // Configuration / 配置
    // --------------------------------------------------------------------------

    /**
     * @brief Parse an option string and load it
     * @brief 解析选项字符串并加载
     *
     * @throws Error ConfigParseError or ConfigInvalidValue
     */
    void Initialize(std::string_view options);

    /**
     * @brief Validate every key against IsValidOption() and apply the values
     * @brief 用 IsValidOption() 校验所有键并应用其值
     *
     * @throws Error ConfigInvalidValue for unknown options or malformed values
     */
    void LoadOptions(const OptionTable& options);

    virtual bool IsValidOption(std::string_view name) const;

    /// Current options as an option string / 当前选项的字符串形式
    std::string GetOptions() const;

    // --------------------------------------------------------------------------
    // Operations / 操作
    // --------------------------------------------------------------------------

    void Connect();
    void Disconnect();
    void WritePacket(PacketPtr packet);
    void Dispatch(ProtocolCommand command);

    /**
     * @brief Disconnect and release handlers, safe to call repeatedly
     * @brief 断开并释放处理器，可重复调用
     */
    void Dispose();

    // --------------------------------------------------------------------------
    // State / 状态
    // --------------------------------------------------------------------------

    ProtocolState State() const noexcept { return m_state.load(std::memory_order_acquire); }
    bool IsConnected() const noexcept { return State() == ProtocolState::Connected; }
    bool Failed() const noexcept { return m_failed.load(std::memory_order_acquire); }
    Mode GetMode() const noexcept { return m_asyncEnabled ? Mode::Async : Mode::Sync; }
    const std::string& Caption() const noexcept { return m_caption; }
    Level GetLevel() const;

    /// Packets dropped by the async queue / 异步队列丢弃的数据包数
    size_t DroppedCount() const;

    /**
     * @brief Names stamped into file names and the LogHeader, safe to change while connected
     * @brief 写入文件名与 LogHeader 的名称，连接期间可安全修改
     *
     * The getters return copies because the async worker reads them concurrently.
     * 异步工作线程会并发读取，因此访问器返回副本。
     */
    void SetAppName(std::string appName);
    std::string AppName() const;
    void SetHostName(std::string hostName);
    std::string HostName() const;

    void SetLogger(std::shared_ptr<spdlog::logger> logger);
    std::shared_ptr<spdlog::logger> Logger() const { return m_logger; }

    // --------------------------------------------------------------------------
    // Events / 事件
    // --------------------------------------------------------------------------

    CallbackId AddErrorHandler(ErrorHandler handler) { return m_errorHandlers.Add(std::move(handler)); }
    bool RemoveErrorHandler(CallbackId id) { return m_errorHandlers.Remove(id); }
    CallbackId AddInfoHandler(InfoHandler handler) { return m_infoHandlers.Add(std::move(handler)); }
    bool RemoveInfoHandler(CallbackId id) { return m_infoHandlers.Remove(id); }

protected:
    explicit Protocol(std::string name);

    /**
     * @brief Read option values, overrides call the base version first
     * @brief 读取选项值，重写时先调用基类版本
     */
    virtual void ApplyOptions(const OptionTable& options);

    /// Append current option values / 追加当前选项值
    virtual void BuildOptions(ConnectionsBuilder& builder) const;

    /**
     * @brief Check option consistency before connecting
     * @brief 连接前检查选项一致性
     *
     * @throws Error ConfigInvalidValue or ConfigMissingRequired
     */
    virtual void ValidateOptions() const {}

    virtual void InternalConnect() = 0;
    virtual bool InternalReconnect();
    virtual void InternalDisconnect() = 0;
    virtual void InternalWritePacket(const PacketPtr& packet) = 0;
    virtual void InternalDispatch(const ProtocolCommand& command);

    /// Send the LogHeader packet after a stream handshake / 流握手后发送 LogHeader
    void WriteLogHeader();

    void RaiseInfo(const std::string& message);

    spdlog::logger& Log() const { return *m_logger; }

private:
    void ImplConnect();
    void ImplDisconnect();
    void ImplWritePacket(const PacketPtr& packet);
    void ImplDispatch(const ProtocolCommand& command);
    void ExecuteCommand(const SchedulerCommand& command);

    /// ValidateOptions() then InternalConnect() / 先 ValidateOptions() 再 InternalConnect()
    void ConnectTransport();
    void ForwardPacket(const PacketPtr& packet, bool disconnect);
    void FlushBacklog();
    void Reconnect();
    void Reset();
    void HandleException(const std::exception& ex);
    void RaiseError(const ProtocolError& error);

    std::string m_name;
    std::string m_appName;
    std::string m_hostName;
    mutable std::mutex m_nameMutex;  // Guards m_appName and m_hostName / 保护应用名与主机名
    std::shared_ptr<spdlog::logger> m_logger;

    // Options / 选项
    std::string m_caption;
    Level m_level{Level::Debug};
    bool m_reconnect{false};
    std::chrono::milliseconds m_reconnectInterval{0};
    bool m_backlogEnabled{false};
    int64_t m_backlogQueue{kDefaultQueueSize};
    Level m_flushOn{Level::Error};
    bool m_backlogKeepOpen{false};
    bool m_keepOpen{true};
    bool m_asyncEnabled{false};
    int64_t m_asyncQueue{kDefaultQueueSize};
    bool m_asyncThrottle{true};
    bool m_asyncClearOnDisconnect{false};

    // Runtime / 运行时
    std::atomic<ProtocolState> m_state{ProtocolState::Disconnected};
    std::atomic<bool> m_failed{false};
    std::chrono::steady_clock::time_point m_reconnectTime{};
    PacketQueue m_backlog;
    std::unique_ptr<Scheduler> m_scheduler;
    size_t m_droppedTotal{0};

    internal::CallbackList<const ProtocolError&> m_errorHandlers;
    internal::CallbackList<const std::string&> m_infoHandlers;

    mutable std::mutex m_mutex;
};

}  // namespace silink
