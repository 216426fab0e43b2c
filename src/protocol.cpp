/**
 * @file protocol.cpp
 * @brief Protocol base class implementation
 * @brief 协议基类实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/protocol.hpp"

#include <exception>

#include <fmt/format.h>

#include "silink/connections_parser.hpp"
#include "silink/internal/diagnostics.hpp"
#include "silink/internal/platform.hpp"

namespace silink {

namespace {

constexpr std::string_view kCommonOptions[] = {
    "caption",         "level",           "reconnect",        "reconnect.interval",
    "backlog",         "flushon",         "keepopen",         "backlog.enabled",
    "backlog.queue",   "backlog.flushon", "backlog.keepopen", "async.enabled",
    "async.queue",     "async.throttle",  "async.clearondisconnect"};

}  // namespace

Protocol::Protocol(std::string name)
    : m_name(std::move(name)),
      m_hostName(internal::GetHostName()),
      m_logger(internal::MakeDefaultLogger(m_name)),
      m_caption(m_name),
      m_backlog(kDefaultQueueSize) {}

// ==============================================================================
// Configuration / 配置
// ==============================================================================

void Protocol::Initialize(std::string_view options) {
    OptionsParser parser;
    OptionTable table;
    for (auto& option : parser.Parse(m_name, options)) {
        table.Put(option.first, std::move(option.second));
    }
    LoadOptions(table);
}

void Protocol::LoadOptions(const OptionTable& options) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& key : options.Keys()) {
        if (!IsValidOption(key)) {
            throw Error(ErrorCode::ConfigInvalidValue,
                        fmt::format("Option \"{}\" is not available for protocol \"{}\"", key, m_name));
        }
    }
    ApplyOptions(options);
}

bool Protocol::IsValidOption(std::string_view name) const {
    for (const auto& option : kCommonOptions) {
        if (option == name) {
            return true;
        }
    }
    return false;
}

void Protocol::ApplyOptions(const OptionTable& options) {
    m_caption = options.GetString("caption", m_name);
    m_level = options.GetLevel("level", Level::Debug);
    m_reconnect = options.GetBoolean("reconnect", false);
    m_reconnectInterval = options.GetTimespan("reconnect.interval", std::chrono::milliseconds(0));

    // Legacy backlog options map onto backlog.* / 旧版积压选项映射到 backlog.*
    if (options.Contains("backlog")) {
        const int64_t backlog = options.GetSize("backlog", 0);
        m_backlogEnabled = backlog > 0;
        m_backlogQueue = backlog > 0 ? backlog : kDefaultQueueSize;
    } else {
        m_backlogEnabled = options.GetBoolean("backlog.enabled", false);
        m_backlogQueue = options.GetSize("backlog.queue", kDefaultQueueSize);
    }
    m_flushOn = options.GetLevel("backlog.flushon", options.GetLevel("flushon", Level::Error));
    m_backlogKeepOpen =
        options.GetBoolean("backlog.keepopen", options.GetBoolean("keepopen", false));
    m_keepOpen = !m_backlogEnabled || m_backlogKeepOpen;
    m_backlog.SetBacklog(m_backlogQueue);

    m_asyncEnabled = options.GetBoolean("async.enabled", false);
    m_asyncQueue = options.GetSize("async.queue", kDefaultQueueSize);
    m_asyncThrottle = options.GetBoolean("async.throttle", true);
    m_asyncClearOnDisconnect = options.GetBoolean("async.clearondisconnect", false);
}

void Protocol::BuildOptions(ConnectionsBuilder& builder) const {
    builder.AddOption("caption", m_caption);
    builder.AddOption("level", m_level);
    builder.AddOption("reconnect", m_reconnect);
    builder.AddTimespanOption("reconnect.interval", m_reconnectInterval);
    builder.AddOption("backlog.enabled", m_backlogEnabled);
    builder.AddSizeOption("backlog.queue", m_backlogQueue);
    builder.AddOption("backlog.flushon", m_flushOn);
    builder.AddOption("backlog.keepopen", m_backlogKeepOpen);
    builder.AddOption("async.enabled", m_asyncEnabled);
    builder.AddSizeOption("async.queue", m_asyncQueue);
    builder.AddOption("async.throttle", m_asyncThrottle);
    builder.AddOption("async.clearondisconnect", m_asyncClearOnDisconnect);
}

std::string Protocol::GetOptions() const {
    ConnectionsBuilder builder;
    builder.BeginProtocol(m_name);
    BuildOptions(builder);
    return builder.Options();
}

Level Protocol::GetLevel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_level;
}

void Protocol::SetAppName(std::string appName) {
    std::lock_guard<std::mutex> lock(m_nameMutex);
    m_appName = std::move(appName);
}

std::string Protocol::AppName() const {
    std::lock_guard<std::mutex> lock(m_nameMutex);
    return m_appName;
}

void Protocol::SetHostName(std::string hostName) {
    std::lock_guard<std::mutex> lock(m_nameMutex);
    m_hostName = std::move(hostName);
}

std::string Protocol::HostName() const {
    std::lock_guard<std::mutex> lock(m_nameMutex);
    return m_hostName;
}

void Protocol::SetLogger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (logger) {
        m_logger = std::move(logger);
    }
}

size_t Protocol::DroppedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_droppedTotal + (m_scheduler ? m_scheduler->DroppedCount() : 0);
}

// ==============================================================================
// Public Operations / 公共操作
// ==============================================================================

void Protocol::Connect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_asyncEnabled) {
        ImplConnect();
        return;
    }
    if (m_scheduler) {
        return;  // Already connected / 已连接
    }
    m_scheduler = std::make_unique<Scheduler>(
        [this](const SchedulerCommand& command) { ExecuteCommand(command); },
        [this]() { return Failed(); });
    m_scheduler->SetThreshold(static_cast<size_t>(m_asyncQueue));
    m_scheduler->SetThrottle(m_asyncThrottle);
    m_scheduler->SetLogger(m_logger);
    if (!m_scheduler->Start()) {
        m_scheduler.reset();
        throw ProtocolError(ErrorCode::ThreadCreateFailed, "Failed to start scheduler", m_name,
                            GetOptions());
    }
    m_scheduler->Schedule(SchedulerCommand::Connect());
}

void Protocol::Disconnect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_asyncEnabled) {
        ImplDisconnect();
        return;
    }
    if (!m_scheduler) {
        return;  // Not connected / 未连接
    }
    if (m_asyncClearOnDisconnect) {
        m_scheduler->Clear();
    }
    m_scheduler->Schedule(SchedulerCommand::Disconnect());
    m_scheduler->Stop();
    m_droppedTotal += m_scheduler->DroppedCount();
    m_scheduler.reset();
}

void Protocol::WritePacket(PacketPtr packet) {
    if (!packet) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ShouldWrite(packet->level, m_level)) {
        return;
    }
    if (!m_asyncEnabled) {
        ImplWritePacket(packet);
        return;
    }
    if (m_scheduler) {
        m_scheduler->Schedule(SchedulerCommand::Write(std::move(packet)));
    }
}

void Protocol::Dispatch(ProtocolCommand command) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_asyncEnabled) {
        ImplDispatch(command);
        return;
    }
    if (m_scheduler) {
        m_scheduler->Schedule(SchedulerCommand::Dispatch(std::move(command)));
    }
}

void Protocol::Dispose() {
    try {
        Disconnect();
    } catch (const std::exception& ex) {
        m_logger->warn("{} protocol: disconnect during dispose failed: {}", m_name, ex.what());
    }
    m_errorHandlers.Clear();
    m_infoHandlers.Clear();
}

// ==============================================================================
// Implementation / 实现
// ==============================================================================

void Protocol::ExecuteCommand(const SchedulerCommand& command) {
    switch (command.action) {
        case SchedulerAction::Connect:
            ImplConnect();
            break;
        case SchedulerAction::WritePacket:
            ImplWritePacket(command.packet);
            break;
        case SchedulerAction::Disconnect:
            ImplDisconnect();
            break;
        case SchedulerAction::Dispatch:
            if (command.command) {
                ImplDispatch(*command.command);
            }
            break;
    }
}

void Protocol::ImplConnect() {
    if (IsConnected()) {
        return;
    }
    if (!m_keepOpen) {
        // Backlog mode opens the transport on flush, only check options here
        // 积压模式在刷新时才打开传输，此处只检查选项
        try {
            ValidateOptions();
        } catch (const std::exception& ex) {
            HandleException(ex);
        }
        return;
    }
    try {
        m_state.store(ProtocolState::Connecting, std::memory_order_release);
        ConnectTransport();
        m_state.store(ProtocolState::Connected, std::memory_order_release);
        m_failed.store(false, std::memory_order_release);
        m_logger->debug("{} protocol connected", m_caption);
    } catch (const std::exception& ex) {
        try {
            Reset();
        } catch (const std::exception& resetError) {
            m_logger->debug("{} protocol: cleanup after failed connect: {}", m_caption,
                            resetError.what());
        }
        HandleException(ex);
    }
}

void Protocol::ImplDisconnect() {
    if (!IsConnected()) {
        m_backlog.Clear();
        return;
    }
    try {
        Reset();
    } catch (const std::exception& ex) {
        HandleException(ex);
    }
}

void Protocol::ImplWritePacket(const PacketPtr& packet) {
    if (!packet) {
        return;
    }
    if (!IsConnected() && !m_reconnect && m_keepOpen) {
        return;
    }
    try {
        try {
            bool skip = false;
            if (m_backlogEnabled) {
                if (packet->level != Level::Control &&
                    static_cast<uint8_t>(packet->level) >= static_cast<uint8_t>(m_flushOn)) {
                    FlushBacklog();
                } else {
                    m_backlog.Push(packet);
                    skip = true;
                }
            }
            if (!skip) {
                ForwardPacket(packet, !m_keepOpen);
            }
        } catch (const std::exception&) {
            Reset();
            throw;
        }
    } catch (const std::exception& ex) {
        HandleException(ex);
    }
}

void Protocol::ImplDispatch(const ProtocolCommand& command) {
    if (!IsConnected()) {
        return;
    }
    try {
        InternalDispatch(command);
    } catch (const std::exception& ex) {
        HandleException(ex);
    }
}

void Protocol::FlushBacklog() {
    while (PacketPtr packet = m_backlog.Pop()) {
        ForwardPacket(packet, false);
    }
}

void Protocol::ForwardPacket(const PacketPtr& packet, bool disconnect) {
    if (!IsConnected()) {
        if (!m_keepOpen) {
            ConnectTransport();
            m_state.store(ProtocolState::Connected, std::memory_order_release);
            m_failed.store(false, std::memory_order_release);
        } else {
            Reconnect();
        }
    }

    if (IsConnected()) {
        InternalWritePacket(packet);
        if (disconnect) {
            m_state.store(ProtocolState::Disconnected, std::memory_order_release);
            InternalDisconnect();
        }
    }
}

void Protocol::Reconnect() {
    if (m_reconnectInterval.count() > 0 &&
        std::chrono::steady_clock::now() - m_reconnectTime < m_reconnectInterval) {
        return;  // Too early / 尚未到重连时间
    }

    // Configuration errors are reported, not treated as a failed attempt / 配置错误直接报告，不视为一次失败的重连
    ValidateOptions();

    bool connected = false;
    try {
        connected = InternalReconnect();
    } catch (const std::exception& ex) {
        m_logger->debug("{} protocol reconnect failed: {}", m_caption, ex.what());
    }

    if (connected) {
        m_state.store(ProtocolState::Connected, std::memory_order_release);
        m_failed.store(false, std::memory_order_release);
        m_logger->info("{} protocol reconnected", m_caption);
    } else {
        m_failed.store(true, std::memory_order_release);
        Reset();
    }
}

void Protocol::ConnectTransport() {
    ValidateOptions();
    InternalConnect();
}

bool Protocol::InternalReconnect() {
    InternalConnect();
    return true;
}

void Protocol::InternalDispatch(const ProtocolCommand& /*command*/) {}

void Protocol::Reset() {
    m_state.store(ProtocolState::Disconnected, std::memory_order_release);
    m_backlog.Clear();
    try {
        InternalDisconnect();
    } catch (const std::exception&) {
        m_reconnectTime = std::chrono::steady_clock::now();
        throw;
    }
    m_reconnectTime = std::chrono::steady_clock::now();
}

void Protocol::HandleException(const std::exception& ex) {
    m_failed.store(true, std::memory_order_release);

    ErrorCode code = ErrorCode::InternalError;
    std::string message = ex.what();
    if (const auto* protocolError = dynamic_cast<const ProtocolError*>(&ex)) {
        code = protocolError->Code();
        message = protocolError->Message();
    } else if (const auto* error = dynamic_cast<const Error*>(&ex)) {
        code = error->Code();
    }

    ProtocolError error(code, message, m_name, GetOptions());
    if (m_asyncEnabled) {
        m_logger->error("{} [{}]", error.what(), ErrorCodeToString(code));
        RaiseError(error);
    } else {
        throw error;
    }
}

void Protocol::RaiseError(const ProtocolError& error) {
    try {
        m_errorHandlers.Invoke(error);
    } catch (const std::exception& ex) {
        m_logger->error("{} protocol: error handler threw: {}", m_name, ex.what());
    }
}

void Protocol::RaiseInfo(const std::string& message) {
    try {
        m_infoHandlers.Invoke(message);
    } catch (const std::exception& ex) {
        m_logger->error("{} protocol: info handler threw: {}", m_name, ex.what());
    }
}

void Protocol::WriteLogHeader() {
    InternalWritePacket(std::make_shared<LogHeader>(HostName(), AppName()));
}

}  // namespace silink
