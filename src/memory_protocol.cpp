/**
 * @file memory_protocol.cpp
 * @brief Memory transport implementation
 * @brief 内存传输实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/memory_protocol.hpp"

#include <ostream>
#include <vector>

#include "silink/stream.hpp"
#include "silink/text_formatter.hpp"
#include "silink/text_protocol.hpp"

namespace silink {

namespace {

constexpr std::string_view kMemoryOptions[] = {"maxsize", "astext", "pattern", "indent"};

}  // namespace

MemoryProtocol::MemoryProtocol()
    : Protocol("mem"),
      m_pattern(kDefaultTextPattern),
      m_formatter(std::make_unique<BinaryFormatter>()),
      m_queue(kDefaultMaxSize) {}

MemoryProtocol::~MemoryProtocol() {
    Dispose();
}

size_t MemoryProtocol::Count() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_queue.Count();
}

bool MemoryProtocol::IsValidOption(std::string_view name) const {
    for (const auto& option : kMemoryOptions) {
        if (option == name) {
            return true;
        }
    }
    return Protocol::IsValidOption(name);
}

void MemoryProtocol::ApplyOptions(const OptionTable& options) {
    Protocol::ApplyOptions(options);
    m_maxSize = options.GetSize("maxsize", kDefaultMaxSize);
    m_asText = options.GetBoolean("astext", false);
    m_pattern = options.GetString("pattern", kDefaultTextPattern);
    m_indent = options.GetBoolean("indent", false);

    if (m_asText) {
        auto formatter = std::make_unique<TextFormatter>();
        formatter->SetPattern(m_pattern);
        formatter->SetIndent(m_indent);
        m_formatter = std::move(formatter);
    } else {
        m_formatter = std::make_unique<BinaryFormatter>();
    }

    std::lock_guard<std::mutex> lock(m_queueMutex);
    m_queue.SetBacklog(m_maxSize);
}

void MemoryProtocol::BuildOptions(ConnectionsBuilder& builder) const {
    Protocol::BuildOptions(builder);
    builder.AddSizeOption("maxsize", m_maxSize);
    builder.AddOption("astext", m_asText);
    builder.AddOption("indent", m_indent);
    builder.AddOption("pattern", m_pattern);
}

void MemoryProtocol::InternalConnect() {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    m_queue.Clear();
    m_queue.SetBacklog(m_maxSize);
}

void MemoryProtocol::InternalDisconnect() {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    m_queue.Clear();
}

void MemoryProtocol::InternalWritePacket(const PacketPtr& packet) {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    m_queue.Push(packet);
}

void MemoryProtocol::InternalDispatch(const ProtocolCommand& command) {
    if (command.action != kFlushAction) {
        return;
    }
    if (const auto* stream = std::get_if<std::shared_ptr<std::ostream>>(&command.state)) {
        if (*stream) {
            FlushToStream(**stream);
            return;
        }
    } else if (const auto* protocol = std::get_if<std::shared_ptr<Protocol>>(&command.state)) {
        if (protocol->get() == this) {
            throw Error(ErrorCode::InvalidArgument, "Cannot flush a memory protocol into itself");
        }
        if (*protocol) {
            FlushToProtocol(**protocol);
            return;
        }
    }
    throw Error(ErrorCode::InvalidArgument,
                "Dispatch state is neither an output stream nor a protocol");
}

void MemoryProtocol::FlushToStream(std::ostream& stream) {
    StdOutputStream output(stream);
    if (m_asText) {
        output.Write(kTextFileBom);
    } else {
        output.Write(kPlainEyeCatcher);
    }

    std::lock_guard<std::mutex> lock(m_queueMutex);
    while (PacketPtr packet = m_queue.Pop()) {
        m_formatter->Format(*packet, output);
    }
    output.Flush();
}

void MemoryProtocol::FlushToProtocol(Protocol& protocol) {
    // Drain first so the target never runs under our queue lock / 先取出，避免在队列锁内调用目标
    std::vector<PacketPtr> packets;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        packets.reserve(m_queue.Count());
        while (PacketPtr packet = m_queue.Pop()) {
            packets.push_back(std::move(packet));
        }
    }
    for (auto& packet : packets) {
        protocol.WritePacket(std::move(packet));
    }
}

}  // namespace silink
