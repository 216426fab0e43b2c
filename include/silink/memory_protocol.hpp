/**
 * @file memory_protocol.hpp
 * @brief In-memory packet buffer transport
 * @brief 内存数据包缓冲传输
 *
 * Options / 选项:
 * - maxsize (size, 8MB, oldest packets are dropped / 丢弃最旧的数据包)
 * - astext  (bool, false)
 * - pattern (string, "[%timestamp%] %level%: %title%")
 * - indent  (bool, false)
 *
 * Dispatch action 0 flushes the buffered packets / Dispatch 动作 0 刷新缓冲的数据包:
 * - to a std::ostream, prefixed with "SILF" (binary) or a UTF-8 BOM (astext)
 *   写入 std::ostream，前缀为 "SILF"（二进制）或 UTF-8 BOM（astext）
 * - to another Protocol through its WritePacket
 *   通过 WritePacket 写入另一个协议
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <memory>

#include "silink/formatter.hpp"
#include "silink/packet_queue.hpp"
#include "silink/protocol.hpp"

namespace silink {

class MemoryProtocol : public Protocol {
public:
    static constexpr int64_t kDefaultMaxSize = 8 * 1024 * 1024;
    static constexpr int kFlushAction = 0;

    MemoryProtocol();
    ~MemoryProtocol() override;

    bool IsValidOption(std::string_view name) const override;

    /// Packets currently buffered / 当前缓冲的数据包数
    size_t Count() const;

protected:
    void ApplyOptions(const OptionTable& options) override;
    void BuildOptions(ConnectionsBuilder& builder) const override;

    void InternalConnect() override;
    void InternalDisconnect() override;
    void InternalWritePacket(const PacketPtr& packet) override;
    void InternalDispatch(const ProtocolCommand& command) override;

private:
    void FlushToStream(std::ostream& stream);
    void FlushToProtocol(Protocol& protocol);

    int64_t m_maxSize{kDefaultMaxSize};
    bool m_asText{false};
    std::string m_pattern;
    bool m_indent{false};

    std::unique_ptr<Formatter> m_formatter;
    PacketQueue m_queue;
    mutable std::mutex m_queueMutex;
};

}  // namespace silink
