/**
 * @file socket.cpp
 * @brief POSIX socket implementation
 * @brief POSIX 套接字实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/internal/socket.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <fmt/format.h>

#include "silink/error.hpp"

namespace silink {
namespace internal {

namespace {

#if defined(MSG_NOSIGNAL)
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

std::string LastError() {
    return std::strerror(errno);
}

bool IsTimeout(int error) {
    return error == EAGAIN || error == EWOULDBLOCK;
}

}  // namespace

Socket Socket::ConnectTcp(const std::string& host, uint16_t port,
                          std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* result = nullptr;
    const std::string service = fmt::format("{}", port);
    const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        throw Error(ErrorCode::NetworkResolveFailed,
                    fmt::format("Cannot resolve host \"{}\": {}", host, ::gai_strerror(rc)));
    }

    std::string lastError = "no addresses";
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastError = LastError();
            continue;
        }
        Socket socket(fd);
        try {
            ConnectWithTimeout(fd, ai->ai_addr, static_cast<unsigned int>(ai->ai_addrlen), timeout,
                               fmt::format("{}:{}", host, port));
            const int noDelay = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay));
            socket.ApplyTimeout(timeout);
            ::freeaddrinfo(result);
            return socket;
        } catch (const Error& ex) {
            lastError = ex.what();
        }
    }
    ::freeaddrinfo(result);
    throw Error(ErrorCode::NetworkConnectFailed,
                fmt::format("Cannot connect to {}:{}: {}", host, port, lastError));
}

Socket Socket::ConnectUnix(const std::string& path, std::chrono::milliseconds timeout) {
    sockaddr_un address{};
    if (path.size() >= sizeof(address.sun_path)) {
        throw Error(ErrorCode::InvalidArgument, fmt::format("Socket path too long: {}", path));
    }
    address.sun_family = AF_UNIX;
    std::memcpy(address.sun_path, path.c_str(), path.size() + 1);

    const int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        throw Error(ErrorCode::NetworkConnectFailed,
                    fmt::format("Cannot create socket: {}", LastError()));
    }
    Socket socket(fd);
    ConnectWithTimeout(fd, &address, static_cast<unsigned int>(sizeof(address)), timeout, path);
    socket.ApplyTimeout(timeout);
    return socket;
}

void Socket::ConnectWithTimeout(int fd, const void* address, unsigned int length,
                                std::chrono::milliseconds timeout, const std::string& target) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, static_cast<const sockaddr*>(address), static_cast<socklen_t>(length));
    if (rc != 0 && errno != EINPROGRESS) {
        throw Error(ErrorCode::NetworkConnectFailed,
                    fmt::format("Cannot connect to {}: {}", target, LastError()));
    }
    if (rc != 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        const int waitMs = timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1;
        do {
            rc = ::poll(&pfd, 1, waitMs);
        } while (rc < 0 && errno == EINTR);
        if (rc == 0) {
            throw Error(ErrorCode::NetworkTimeout,
                        fmt::format("Connect to {} timed out after {}ms", target, timeout.count()));
        }
        int error = 0;
        socklen_t errorLength = sizeof(error);
        if (rc < 0 || ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &errorLength) != 0 ||
            error != 0) {
            throw Error(ErrorCode::NetworkConnectFailed,
                        fmt::format("Cannot connect to {}: {}", target,
                                    std::strerror(error != 0 ? error : errno)));
        }
    }
    ::fcntl(fd, F_SETFL, flags);
}

void Socket::ApplyTimeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return;
    }
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    ::setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(m_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void Socket::SendAll(const uint8_t* data, size_t size) {
    if (m_fd < 0) {
        throw Error(ErrorCode::NetworkDisconnected, "Socket is not connected");
    }
    while (size > 0) {
        const ssize_t n = ::send(m_fd, data, size, kSendFlags);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw Error(IsTimeout(errno) ? ErrorCode::NetworkTimeout : ErrorCode::NetworkSendFailed,
                        fmt::format("Send failed: {}", LastError()));
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
}

void Socket::ReceiveExact(uint8_t* data, size_t size) {
    if (m_fd < 0) {
        throw Error(ErrorCode::NetworkDisconnected, "Socket is not connected");
    }
    while (size > 0) {
        const ssize_t n = ::recv(m_fd, data, size, 0);
        if (n == 0) {
            throw Error(ErrorCode::NetworkDisconnected, "Connection has been closed unexpectedly");
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw Error(IsTimeout(errno) ? ErrorCode::NetworkTimeout
                                         : ErrorCode::NetworkReceiveFailed,
                        fmt::format("Receive failed: {}", LastError()));
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
}

std::string Socket::ReceiveLine(size_t maxLength) {
    std::string line;
    while (line.size() < maxLength) {
        uint8_t c = 0;
        ReceiveExact(&c, 1);
        line += static_cast<char>(c);
        if (c == '\n') {
            break;
        }
    }
    return line;
}

void Socket::Close() noexcept {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

}  // namespace internal
}  // namespace silink
