/**
 * @file socket.hpp
 * @brief Blocking POSIX stream socket with timeouts
 * @brief 带超时的阻塞式 POSIX 流套接字
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace silink {
namespace internal {

/**
 * @brief RAII owner of a connected stream socket
 * @brief 已连接流套接字的 RAII 持有者
 *
 * All failures throw silink::Error with a Network* code.
 * 所有失败都会抛出带 Network* 错误码的 silink::Error。
 */
class Socket {
public:
    Socket() = default;
    ~Socket() { Close(); }

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept : m_fd(other.m_fd) { other.m_fd = -1; }
    Socket& operator=(Socket&& other) noexcept {
        if (this != &other) {
            Close();
            m_fd = other.m_fd;
            other.m_fd = -1;
        }
        return *this;
    }

    /// Resolve host and connect over TCP / 解析主机并通过 TCP 连接
    static Socket ConnectTcp(const std::string& host, uint16_t port,
                             std::chrono::milliseconds timeout);

    /// Connect to a Unix domain socket / 连接 Unix 域套接字
    static Socket ConnectUnix(const std::string& path, std::chrono::milliseconds timeout);

    void SendAll(const uint8_t* data, size_t size);
    void SendAll(const std::string& text) {
        SendAll(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }

    /// Read exactly size bytes / 精确读取 size 字节
    void ReceiveExact(uint8_t* data, size_t size);

    /**
     * @brief Read up to and including '\n', at most maxLength bytes
     * @brief 读取到 '\n'（含），最多 maxLength 字节
     */
    std::string ReceiveLine(size_t maxLength);

    bool IsOpen() const noexcept { return m_fd >= 0; }
    void Close() noexcept;

private:
    explicit Socket(int fd) noexcept : m_fd(fd) {}

    static void ConnectWithTimeout(int fd, const void* address, unsigned int length,
                                   std::chrono::milliseconds timeout, const std::string& target);
    void ApplyTimeout(std::chrono::milliseconds timeout);

    int m_fd{-1};
};

}  // namespace internal
}  // namespace silink
