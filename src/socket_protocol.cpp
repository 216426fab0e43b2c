/**
 * @file socket_protocol.cpp
 * @brief TCP and pipe transport implementation
 * @brief TCP 与管道传输实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/socket_protocol.hpp"

#include <fmt/format.h>

namespace silink {

std::string ClientBanner() {
    return fmt::format("SmartInspect silink v{}\r\n", kVersion);
}

// ==============================================================================
// SocketProtocol / 套接字协议基类
// ==============================================================================

void SocketProtocol::InternalConnect() {
    m_socket = OpenSocket();
    DoHandshake();
    WriteLogHeader();
}

void SocketProtocol::InternalDisconnect() {
    m_socket.Close();
}

void SocketProtocol::DoHandshake() {
    std::string banner;
    try {
        banner = m_socket.ReceiveLine(kMaxBannerLength);
    } catch (const Error& ex) {
        throw Error(ex.Code(),
                    fmt::format("Could not read server banner correctly: {}", ex.what()));
    }
    while (!banner.empty() && (banner.back() == '\n' || banner.back() == '\r')) {
        banner.pop_back();
    }
    RaiseInfo(fmt::format("Server banner: \"{}\"", banner));
    Log().debug("{} protocol: server banner \"{}\"", Caption(), banner);

    m_socket.SendAll(ClientBanner());
}

void SocketProtocol::InternalWritePacket(const PacketPtr& packet) {
    m_formatter.Compile(*packet);
    const auto& buffer = m_formatter.Buffer();
    m_socket.SendAll(buffer.data(), buffer.size());

    if (ReadsAnswer()) {
        uint8_t answer[kServerAnswerSize];
        m_socket.ReceiveExact(answer, sizeof(answer));
    }
}

// ==============================================================================
// TcpProtocol / TCP 协议
// ==============================================================================

TcpProtocol::TcpProtocol() : SocketProtocol("tcp") {}

TcpProtocol::~TcpProtocol() {
    Dispose();
}

bool TcpProtocol::IsValidOption(std::string_view name) const {
    return name == "host" || name == "port" || name == "timeout" || Protocol::IsValidOption(name);
}

void TcpProtocol::ApplyOptions(const OptionTable& options) {
    Protocol::ApplyOptions(options);
    m_host = options.GetString("host", "localhost");
    m_port = options.GetInteger("port", kDefaultPort);
    m_timeout = options.GetInteger("timeout", kDefaultTimeout);
}

void TcpProtocol::BuildOptions(ConnectionsBuilder& builder) const {
    Protocol::BuildOptions(builder);
    builder.AddOption("host", m_host);
    builder.AddOption("port", m_port);
    builder.AddOption("timeout", m_timeout);
}

void TcpProtocol::ValidateOptions() const {
    if (m_host.empty()) {
        throw Error(ErrorCode::ConfigMissingRequired, "Missing host name");
    }
    if (m_port <= 0 || m_port > 65535) {
        throw Error(ErrorCode::ConfigInvalidValue, fmt::format("Invalid port: {}", m_port));
    }
}

internal::Socket TcpProtocol::OpenSocket() {
    return internal::Socket::ConnectTcp(m_host, static_cast<uint16_t>(m_port),
                                        std::chrono::milliseconds(m_timeout));
}

// ==============================================================================
// PipeProtocol / 管道协议
// ==============================================================================

PipeProtocol::PipeProtocol() : SocketProtocol("pipe") {}

PipeProtocol::~PipeProtocol() {
    Dispose();
}

bool PipeProtocol::IsValidOption(std::string_view name) const {
    return name == "pipename" || Protocol::IsValidOption(name);
}

void PipeProtocol::ApplyOptions(const OptionTable& options) {
    Protocol::ApplyOptions(options);
    m_pipeName = options.GetString("pipename", "smartinspect");
}

void PipeProtocol::BuildOptions(ConnectionsBuilder& builder) const {
    Protocol::BuildOptions(builder);
    builder.AddOption("pipename", m_pipeName);
}

std::string PipeProtocol::PipePath() const {
    if (m_pipeName.find('/') != std::string::npos) {
        return m_pipeName;
    }
    return "/tmp/" + m_pipeName;
}

internal::Socket PipeProtocol::OpenSocket() {
    return internal::Socket::ConnectUnix(PipePath(),
                                         std::chrono::milliseconds(TcpProtocol::kDefaultTimeout));
}

}  // namespace silink
