/**
 * @file packet_queue.hpp
 * @brief Byte-bounded FIFO of packets (backlog and memory protocol)
 * @brief 字节上限的数据包先进先出队列（积压与内存协议）
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <cstdint>
#include <deque>

#include "silink/packet.hpp"

namespace silink {

/**
 * @brief Packet queue that drops its oldest packets when over its backlog
 * @brief 超出积压上限时丢弃最早数据包的队列
 *
 * Size() is the sum of (packet.Size() + kOverhead). After every Push() the oldest
 * packets are removed until Size() <= Backlog(). Not thread-safe.
 *
 * Size() 为 (packet.Size() + kOverhead) 之和。每次 Push() 后删除最早的数据包，
 * 直到 Size() <= Backlog()。非线程安全。
 */
class PacketQueue {
public:
    static constexpr size_t kOverhead = 24;  ///< Fixed per-packet cost / 每个数据包的固定开销

    explicit PacketQueue(int64_t backlog = 0) : m_backlog(backlog) {}

    void Push(PacketPtr packet) {
        m_size += static_cast<int64_t>(packet->Size() + kOverhead);
        m_packets.push_back(std::move(packet));
        Resize();
    }

    /// Oldest packet or nullptr when empty / 最早的数据包，空时返回 nullptr
    PacketPtr Pop() {
        if (m_packets.empty()) {
            return nullptr;
        }
        PacketPtr packet = std::move(m_packets.front());
        m_packets.pop_front();
        m_size -= static_cast<int64_t>(packet->Size() + kOverhead);
        return packet;
    }

    void Clear() noexcept {
        m_packets.clear();
        m_size = 0;
    }

    void SetBacklog(int64_t backlog) {
        m_backlog = backlog;
        Resize();
    }

    int64_t Backlog() const noexcept { return m_backlog; }
    int64_t Size() const noexcept { return m_size; }
    size_t Count() const noexcept { return m_packets.size(); }
    bool IsEmpty() const noexcept { return m_packets.empty(); }

private:
    void Resize() {
        while (m_size > m_backlog && !m_packets.empty()) {
            Pop();
        }
    }

    std::deque<PacketPtr> m_packets;
    int64_t m_backlog;
    int64_t m_size{0};
};

}  // namespace silink
