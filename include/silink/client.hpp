/**
 * @file client.hpp
 * @brief Client: owns the configured protocols and fans packets out to them
 * @brief 客户端：持有已配置的协议并将数据包分发给它们
 *
 * Usage / 用法:
 * @code
 * silink::ClientConfig config;
 * config.appName = "Demo";
 * silink::Client client(config);
 * client.SetVariable("logdir", "/var/log/demo");
 * client.SetConnections("file(filename=\"$logdir$/demo.sil\", rotate=daily)");
 * client.SetEnabled(true);
 *
 * auto entry = std::make_shared<silink::LogEntry>(silink::LogEntryType::Message,
 *                                                 silink::ViewerId::Title);
 * entry->title = "Hello";
 * client.SendLogEntry(entry);
 * @endcode
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "silink/common.hpp"
#include "silink/error.hpp"
#include "silink/internal/callback_list.hpp"
#include "silink/packet.hpp"
#include "silink/protocol.hpp"
#include "silink/protocol_command.hpp"

namespace silink {

/**
 * @brief Client configuration
 * @brief 客户端配置
 */
struct ClientConfig {
    std::string appName{"Auto"};                 ///< Stamped on entries / 写入条目
    std::string hostName;                        ///< Empty: local host name / 空：本机主机名
    Level level{Level::Debug};                   ///< Minimum packet level / 最低数据包级别
    std::shared_ptr<spdlog::logger> logger;      ///< Diagnostics, null: default / 诊断，空：默认
};

class Client {
public:
    using ErrorHandler = std::function<void(const ProtocolError&)>;
    using InfoHandler = std::function<void(const std::string&)>;

    explicit Client(ClientConfig config = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // --------------------------------------------------------------------------
    // Configuration / 配置
    // --------------------------------------------------------------------------

    /**
     * @brief Replace all protocols with the ones described by a connections string
     * @brief 用连接字符串描述的协议替换全部协议
     *
     * Connection variables ($name$) are expanded first. On any parse or option error
     * the exception propagates and the current protocols stay in place.
     * 先展开连接变量（$name$）。出现解析或选项错误时异常向外传播，当前协议保持不变。
     *
     * @throws Error ConfigParseError, ConfigInvalidValue or ConfigUnknownProtocol
     */
    void SetConnections(std::string_view connections);
    std::string Connections() const;

    /// Connect (true) or disconnect (false) every protocol / 连接或断开所有协议
    void SetEnabled(bool enabled);
    bool IsEnabled() const;

    void SetLevel(Level level);
    Level GetLevel() const;

    void SetAppName(std::string appName);
    std::string AppName() const;
    std::string HostName() const;

    // --------------------------------------------------------------------------
    // Connection variables / 连接变量
    // --------------------------------------------------------------------------

    /// Keys are case-insensitive / 键不区分大小写
    void SetVariable(std::string_view key, std::string value);
    std::string GetVariable(std::string_view key) const;
    bool UnsetVariable(std::string_view key);

    /// Replace every known $key$, unknown ones stay untouched / 替换已知的 $key$
    std::string ExpandVariables(std::string_view connections) const;

    // --------------------------------------------------------------------------
    // Sending / 发送
    // --------------------------------------------------------------------------

    void SendLogEntry(std::shared_ptr<LogEntry> entry);
    void SendWatch(std::shared_ptr<Watch> watch);
    void SendProcessFlow(std::shared_ptr<ProcessFlow> flow);
    void SendControlCommand(std::shared_ptr<ControlCommand> command);

    /**
     * @brief Send a protocol specific command to the protocol with this caption
     * @brief 向具有此标题的协议发送专用命令
     *
     * @throws Error InvalidArgument when no protocol has this caption
     */
    void Dispatch(std::string_view caption, ProtocolCommand command);

    /// Case-insensitive caption lookup, null if absent / 按标题查找（不区分大小写）
    std::shared_ptr<Protocol> GetProtocol(std::string_view caption) const;

    size_t ProtocolCount() const;

    // --------------------------------------------------------------------------
    // Events / 事件
    // --------------------------------------------------------------------------

    CallbackId AddErrorHandler(ErrorHandler handler) { return m_errorHandlers.Add(std::move(handler)); }
    bool RemoveErrorHandler(CallbackId id) { return m_errorHandlers.Remove(id); }
    CallbackId AddInfoHandler(InfoHandler handler) { return m_infoHandlers.Add(std::move(handler)); }
    bool RemoveInfoHandler(CallbackId id) { return m_infoHandlers.Remove(id); }

private:
    using ProtocolList = std::vector<std::shared_ptr<Protocol>>;

    ProtocolList Snapshot() const;
    void Send(const PacketPtr& packet);
    void Attach(Protocol& protocol);
    void Connect(const ProtocolList& protocols);
    void Disconnect(const ProtocolList& protocols);
    void Release(const ProtocolList& protocols);

    void ReportError(const Protocol& protocol, const std::exception& ex);
    void RaiseError(const ProtocolError& error);
    void RaiseInfo(const std::string& message);

    ClientConfig m_config;
    std::shared_ptr<spdlog::logger> m_logger;

    ProtocolList m_protocols;
    std::string m_connections;
    bool m_enabled{false};
    std::map<std::string, std::string> m_variables;

    internal::CallbackList<const ProtocolError&> m_errorHandlers;
    internal::CallbackList<const std::string&> m_infoHandlers;

    mutable std::mutex m_mutex;
};

}  // namespace silink
