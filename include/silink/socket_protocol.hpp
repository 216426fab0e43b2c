/**
 * @file socket_protocol.hpp
 * @brief Stream socket transports: TCP and local pipe
 * @brief 流套接字传输：TCP 与本地管道
 *
 * Handshake / 握手:
 *   server → "<banner>\n"
 *   client → "SmartInspect silink v<version>\r\n"
 *   client → LogHeader packet
 *
 * The TCP server acknowledges every packet with a 2-byte answer.
 * TCP 服务器对每个数据包回复 2 字节应答。
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <chrono>
#include <string>

#include "silink/formatter.hpp"
#include "silink/internal/socket.hpp"
#include "silink/protocol.hpp"

namespace silink {

constexpr size_t kMaxBannerLength = 255;
constexpr size_t kServerAnswerSize = 2;

/// "SmartInspect silink v<version>\r\n"
std::string ClientBanner();

// ==============================================================================
// SocketProtocol / 套接字协议基类
// ==============================================================================

class SocketProtocol : public Protocol {
protected:
    using Protocol::Protocol;

    /// Open the transport socket / 打开传输套接字
    virtual internal::Socket OpenSocket() = 0;

    /// Whether the server answers every packet / 服务器是否应答每个数据包
    virtual bool ReadsAnswer() const noexcept { return false; }

    void InternalConnect() override;
    void InternalDisconnect() override;
    void InternalWritePacket(const PacketPtr& packet) override;

private:
    void DoHandshake();

    internal::Socket m_socket;
    BinaryFormatter m_formatter;
};

// ==============================================================================
// TcpProtocol / TCP 协议
// ==============================================================================

/**
 * @brief TCP transport to a SmartInspect console
 * @brief 连接 SmartInspect 控制台的 TCP 传输
 *
 * Options / 选项: host ("localhost"), port (4228), timeout (milliseconds, 30000)
 */
class TcpProtocol : public SocketProtocol {
public:
    static constexpr int64_t kDefaultPort = 4228;
    static constexpr int64_t kDefaultTimeout = 30000;

    TcpProtocol();
    ~TcpProtocol() override;

    bool IsValidOption(std::string_view name) const override;

protected:
    void ApplyOptions(const OptionTable& options) override;
    void BuildOptions(ConnectionsBuilder& builder) const override;
    void ValidateOptions() const override;

    internal::Socket OpenSocket() override;
    bool ReadsAnswer() const noexcept override { return true; }

private:
    std::string m_host{"localhost"};
    int64_t m_port{kDefaultPort};
    int64_t m_timeout{kDefaultTimeout};
};

// ==============================================================================
// PipeProtocol / 管道协议
// ==============================================================================

/**
 * @brief Local transport over a Unix domain socket
 * @brief 基于 Unix 域套接字的本地传输
 *
 * Option / 选项: pipename ("smartinspect"). The socket lives at /tmp/<pipename>
 * unless the name contains '/', in which case it is used as the path.
 * 套接字位于 /tmp/<pipename>；若名称包含 '/' 则直接作为路径。
 */
class PipeProtocol : public SocketProtocol {
public:
    PipeProtocol();
    ~PipeProtocol() override;

    bool IsValidOption(std::string_view name) const override;

    /// Socket path derived from pipename / 由 pipename 得出的套接字路径
    std::string PipePath() const;

protected:
    void ApplyOptions(const OptionTable& options) override;
    void BuildOptions(ConnectionsBuilder& builder) const override;

    internal::Socket OpenSocket() override;

private:
    std::string m_pipeName{"smartinspect"};
};

}  // namespace silink
