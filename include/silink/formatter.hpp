/**
 * @file formatter.hpp
 * @brief Packet formatters and the binary packet reader
 * @brief 数据包格式化器与二进制数据包读取器
 *
 * A formatter works in two steps: Compile() renders a packet into an internal
 * buffer and returns its exact byte size, Write() emits that buffer. Protocols
 * use the compiled size for rotation and queue accounting before writing.
 *
 * 格式化器分两步工作：Compile() 将数据包渲染到内部缓冲区并返回精确字节数，
 * Write() 输出该缓冲区。协议在写入前用编译后的大小进行轮转和队列计量。
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "silink/packet.hpp"
#include "silink/stream.hpp"

namespace silink {

constexpr std::string_view kPlainEyeCatcher = "SILF";      ///< Plain log file / 明文日志文件
constexpr std::string_view kEncryptedEyeCatcher = "SILE";  ///< Encrypted log file / 加密日志文件

// ==============================================================================
// Formatter Base Class / 格式化器基类
// ==============================================================================

class Formatter {
public:
    virtual ~Formatter() = default;

    /**
     * @brief Render a packet and return the number of bytes Write() will emit
     * @brief 渲染数据包并返回 Write() 将输出的字节数
     */
    virtual size_t Compile(const Packet& packet) = 0;

    /**
     * @brief Emit the packet compiled last
     * @brief 输出最近编译的数据包
     */
    virtual void Write(OutputStream& stream) = 0;

    /// Compile() followed by Write() / 先 Compile() 再 Write()
    void Format(const Packet& packet, OutputStream& stream) {
        Compile(packet);
        Write(stream);
    }
};

// ==============================================================================
// BinaryFormatter / 二进制格式化器
// ==============================================================================

/**
 * @brief Serializes packets into the binary wire format
 * @brief 将数据包序列化为二进制线路格式
 *
 * Packet layout / 数据包布局:
 * +---------------------+
 * | packetType (uint16) |
 * | payloadSize (int32) |
 * +---------------------+
 * | payload             |  Per-type layout, see packet.hpp / 各类型布局见 packet.hpp
 * +---------------------+
 */
class BinaryFormatter : public Formatter {
public:
    size_t Compile(const Packet& packet) override;
    void Write(OutputStream& stream) override;

    const std::vector<uint8_t>& Buffer() const noexcept { return m_buffer; }

private:
    void CompileLogEntry(const LogEntry& entry);
    void CompileWatch(const Watch& watch);
    void CompileProcessFlow(const ProcessFlow& flow);
    void CompileControlCommand(const ControlCommand& command);
    void CompileLogHeader(const LogHeader& header);

    std::vector<uint8_t> m_buffer;
};

// ==============================================================================
// PacketReader / 数据包读取器
// ==============================================================================

/**
 * @brief Decodes binary packets produced by BinaryFormatter
 * @brief 解码由 BinaryFormatter 生成的二进制数据包
 *
 * Throws silink::Error on truncated data or unknown packet types.
 * 在数据截断或数据包类型未知时抛出 silink::Error。
 */
class PacketReader {
public:
    /**
     * @brief Decode one packet starting at data
     * @brief 从 data 开始解码一个数据包
     *
     * @param consumed Receives the number of bytes used / 接收使用的字节数
     */
    static std::shared_ptr<Packet> ReadPacket(const uint8_t* data, size_t size, size_t& consumed);

    /**
     * @brief Decode a packet stream, optionally starting with the SILF eye-catcher
     * @brief 解码数据包流，可选以 SILF 标识开头
     */
    static std::vector<std::shared_ptr<Packet>> ReadAll(const std::vector<uint8_t>& bytes);
};

}  // namespace silink
