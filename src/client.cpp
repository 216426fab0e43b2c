/**
 * @file client.cpp
 * @brief Client implementation
 * @brief 客户端实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/client.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "silink/connections_parser.hpp"
#include "silink/internal/diagnostics.hpp"
#include "silink/internal/platform.hpp"
#include "silink/protocol_factory.hpp"

namespace silink {

namespace {

std::string ToLower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace

Client::Client(ClientConfig config)
    : m_config(std::move(config)),
      m_logger(m_config.logger ? m_config.logger : internal::MakeDefaultLogger("client")) {
    if (m_config.hostName.empty()) {
        m_config.hostName = internal::GetHostName();
    }
}

Client::~Client() {
    ProtocolList protocols;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        protocols.swap(m_protocols);
        m_enabled = false;
    }
    Release(protocols);
}

// ==============================================================================
// Configuration / 配置
// ==============================================================================

void Client::SetConnections(std::string_view connections) {
    const std::string expanded = ExpandVariables(connections);

    // Build the complete new set before touching the current one / 先完整构建新集合
    ConnectionsParser parser;
    ProtocolList created;
    for (const auto& descriptor : parser.Parse(expanded)) {
        created.push_back(ProtocolFactory::Create(descriptor.protocolName, descriptor.rawOptions));
    }
    for (auto& protocol : created) {
        Attach(*protocol);
    }

    ProtocolList previous;
    bool enabled = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous.swap(m_protocols);
        m_protocols = created;
        m_connections = std::string(connections);
        enabled = m_enabled;
    }

    Release(previous);
    if (enabled) {
        Connect(created);
    }
    m_logger->debug("client: {} protocol(s) configured", created.size());
}

std::string Client::Connections() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connections;
}

void Client::SetEnabled(bool enabled) {
    ProtocolList protocols;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_enabled == enabled) {
            return;
        }
        m_enabled = enabled;
        protocols = m_protocols;
    }
    if (enabled) {
        Connect(protocols);
    } else {
        Disconnect(protocols);
    }
}

bool Client::IsEnabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_enabled;
}

void Client::SetLevel(Level level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config.level = level;
}

Level Client::GetLevel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config.level;
}

void Client::SetAppName(std::string appName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config.appName = std::move(appName);
    for (auto& protocol : m_protocols) {
        protocol->SetAppName(m_config.appName);
    }
}

std::string Client::AppName() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config.appName;
}

std::string Client::HostName() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config.hostName;
}

// ==============================================================================
// Connection variables / 连接变量
// ==============================================================================

void Client::SetVariable(std::string_view key, std::string value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_variables[ToLower(key)] = std::move(value);
}

std::string Client::GetVariable(std::string_view key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_variables.find(ToLower(key));
    return it != m_variables.end() ? it->second : std::string();
}

bool Client::UnsetVariable(std::string_view key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_variables.erase(ToLower(key)) != 0;
}

std::string Client::ExpandVariables(std::string_view connections) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string result;
    result.reserve(connections.size());

    size_t pos = 0;
    while (pos < connections.size()) {
        const size_t open = connections.find('$', pos);
        if (open == std::string_view::npos) {
            break;
        }
        const size_t close = connections.find('$', open + 1);
        if (close == std::string_view::npos) {
            break;
        }
        result.append(connections.substr(pos, open - pos));
        auto it = m_variables.find(ToLower(connections.substr(open + 1, close - open - 1)));
        if (it != m_variables.end()) {
            result += it->second;
            pos = close + 1;
        } else {
            // Keep the first '$', the second may open a known key / 保留第一个 '$'
            result += '$';
            pos = open + 1;
        }
    }
    result.append(connections.substr(pos));
    return result;
}

// ==============================================================================
// Sending / 发送
// ==============================================================================

void Client::SendLogEntry(std::shared_ptr<LogEntry> entry) {
    if (!entry) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        entry->appName = m_config.appName;
        entry->hostName = m_config.hostName;
    }
    Send(std::move(entry));
}

void Client::SendWatch(std::shared_ptr<Watch> watch) {
    if (watch) {
        Send(std::move(watch));
    }
}

void Client::SendProcessFlow(std::shared_ptr<ProcessFlow> flow) {
    if (!flow) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        flow->hostName = m_config.hostName;
    }
    Send(std::move(flow));
}

void Client::SendControlCommand(std::shared_ptr<ControlCommand> command) {
    if (command) {
        Send(std::move(command));
    }
}

void Client::Send(const PacketPtr& packet) {
    if (!ShouldWrite(packet->level, GetLevel())) {
        return;
    }
    for (const auto& protocol : Snapshot()) {
        try {
            protocol->WritePacket(packet);
        } catch (const std::exception& ex) {
            ReportError(*protocol, ex);
        }
    }
}

void Client::Dispatch(std::string_view caption, ProtocolCommand command) {
    std::shared_ptr<Protocol> protocol = GetProtocol(caption);
    if (!protocol) {
        throw Error(ErrorCode::InvalidArgument,
                    fmt::format("No protocol could be found with the caption \"{}\"", caption));
    }
    try {
        protocol->Dispatch(std::move(command));
    } catch (const std::exception& ex) {
        ReportError(*protocol, ex);
    }
}

std::shared_ptr<Protocol> Client::GetProtocol(std::string_view caption) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& protocol : m_protocols) {
        if (EqualsIgnoreCase(protocol->Caption(), caption)) {
            return protocol;
        }
    }
    return nullptr;
}

size_t Client::ProtocolCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_protocols.size();
}

// ==============================================================================
// Implementation / 实现
// ==============================================================================

Client::ProtocolList Client::Snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_protocols;
}

void Client::Attach(Protocol& protocol) {
    std::lock_guard<std::mutex> lock(m_mutex);
    protocol.SetAppName(m_config.appName);
    protocol.SetHostName(m_config.hostName);
    if (m_config.logger) {
        protocol.SetLogger(m_config.logger);
    }
    protocol.AddErrorHandler([this](const ProtocolError& error) { RaiseError(error); });
    protocol.AddInfoHandler([this](const std::string& message) { RaiseInfo(message); });
}

void Client::Connect(const ProtocolList& protocols) {
    for (const auto& protocol : protocols) {
        try {
            protocol->Connect();
        } catch (const std::exception& ex) {
            ReportError(*protocol, ex);
        }
    }
}

void Client::Disconnect(const ProtocolList& protocols) {
    for (const auto& protocol : protocols) {
        try {
            protocol->Disconnect();
        } catch (const std::exception& ex) {
            ReportError(*protocol, ex);
        }
    }
}

void Client::Release(const ProtocolList& protocols) {
    Disconnect(protocols);
    for (const auto& protocol : protocols) {
        protocol->Dispose();
    }
}

void Client::ReportError(const Protocol& protocol, const std::exception& ex) {
    if (const auto* protocolError = dynamic_cast<const ProtocolError*>(&ex)) {
        RaiseError(*protocolError);
        return;
    }
    const auto* error = dynamic_cast<const Error*>(&ex);
    RaiseError(ProtocolError(error ? error->Code() : ErrorCode::InternalError, ex.what(),
                             protocol.Name(), protocol.GetOptions()));
}

void Client::RaiseError(const ProtocolError& error) {
    m_logger->debug("client: {} [{}]", error.what(), ErrorCodeToString(error.Code()));
    try {
        m_errorHandlers.Invoke(error);
    } catch (const std::exception& ex) {
        m_logger->error("client: error handler threw: {}", ex.what());
    }
}

void Client::RaiseInfo(const std::string& message) {
    try {
        m_infoHandlers.Invoke(message);
    } catch (const std::exception& ex) {
        m_logger->error("client: info handler threw: {}", ex.what());
    }
}

}  // namespace silink
