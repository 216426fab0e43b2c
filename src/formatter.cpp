/**
 * @file formatter.cpp
 * @brief BinaryFormatter and PacketReader implementation
 * @brief BinaryFormatter 与 PacketReader 实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/formatter.hpp"

#include <fmt/format.h>

#include "silink/error.hpp"
#include "silink/internal/wire.hpp"

namespace silink {

namespace {

int32_t Length(size_t size) {
    return static_cast<int32_t>(size);
}

}  // namespace

// ==============================================================================
// BinaryFormatter / 二进制格式化器
// ==============================================================================

size_t BinaryFormatter::Compile(const Packet& packet) {
    m_buffer.clear();
    m_buffer.reserve(packet.Size());

    internal::AppendUInt16(m_buffer, static_cast<uint16_t>(packet.Type()));
    internal::AppendInt32(m_buffer, Length(packet.PayloadSize()));

    switch (packet.Type()) {
        case PacketType::LogEntry:
            CompileLogEntry(static_cast<const LogEntry&>(packet));
            break;
        case PacketType::Watch:
            CompileWatch(static_cast<const Watch&>(packet));
            break;
        case PacketType::ProcessFlow:
            CompileProcessFlow(static_cast<const ProcessFlow&>(packet));
            break;
        case PacketType::ControlCommand:
            CompileControlCommand(static_cast<const ControlCommand&>(packet));
            break;
        case PacketType::LogHeader:
            CompileLogHeader(static_cast<const LogHeader&>(packet));
            break;
        default:
            m_buffer.clear();
            throw Error(ErrorCode::NotSupported,
                        fmt::format("Unknown packet type {}", static_cast<int>(packet.Type())));
    }
    return m_buffer.size();
}

void BinaryFormatter::Write(OutputStream& stream) {
    if (!m_buffer.empty()) {
        stream.Write(m_buffer);
    }
}

void BinaryFormatter::CompileLogEntry(const LogEntry& entry) {
    internal::AppendInt32(m_buffer, static_cast<int32_t>(entry.logEntryType));
    internal::AppendInt32(m_buffer, static_cast<int32_t>(entry.viewerId));
    internal::AppendInt32(m_buffer, Length(entry.appName.size()));
    internal::AppendInt32(m_buffer, Length(entry.sessionName.size()));
    internal::AppendInt32(m_buffer, Length(entry.title.size()));
    internal::AppendInt32(m_buffer, Length(entry.hostName.size()));
    internal::AppendInt32(m_buffer, Length(entry.data.size()));
    internal::AppendInt32(m_buffer, static_cast<int32_t>(entry.processId));
    internal::AppendInt32(m_buffer, static_cast<int32_t>(entry.threadId));
    internal::AppendDouble(m_buffer, internal::TimestampToOleDate(entry.timestamp));
    internal::AppendInt32(m_buffer, static_cast<int32_t>(entry.color.ToArgbValue()));
    internal::AppendBytes(m_buffer, entry.appName.data(), entry.appName.size());
    internal::AppendBytes(m_buffer, entry.sessionName.data(), entry.sessionName.size());
    internal::AppendBytes(m_buffer, entry.title.data(), entry.title.size());
    internal::AppendBytes(m_buffer, entry.hostName.data(), entry.hostName.size());
    internal::AppendBytes(m_buffer, entry.data.data(), entry.data.size());
}

void BinaryFormatter::CompileWatch(const Watch& watch) {
    internal::AppendInt32(m_buffer, Length(watch.name.size()));
    internal::AppendInt32(m_buffer, Length(watch.value.size()));
    internal::AppendInt32(m_buffer, static_cast<int32_t>(watch.watchType));
    internal::AppendDouble(m_buffer, internal::TimestampToOleDate(watch.timestamp));
    internal::AppendBytes(m_buffer, watch.name.data(), watch.name.size());
    internal::AppendBytes(m_buffer, watch.value.data(), watch.value.size());
}

void BinaryFormatter::CompileProcessFlow(const ProcessFlow& flow) {
    internal::AppendInt32(m_buffer, static_cast<int32_t>(flow.processFlowType));
    internal::AppendInt32(m_buffer, Length(flow.title.size()));
    internal::AppendInt32(m_buffer, Length(flow.hostName.size()));
    internal::AppendInt32(m_buffer, static_cast<int32_t>(flow.processId));
    internal::AppendInt32(m_buffer, static_cast<int32_t>(flow.threadId));
    internal::AppendDouble(m_buffer, internal::TimestampToOleDate(flow.timestamp));
    internal::AppendBytes(m_buffer, flow.title.data(), flow.title.size());
    internal::AppendBytes(m_buffer, flow.hostName.data(), flow.hostName.size());
}

void BinaryFormatter::CompileControlCommand(const ControlCommand& command) {
    internal::AppendInt32(m_buffer, static_cast<int32_t>(command.controlCommandType));
    internal::AppendInt32(m_buffer, Length(command.data.size()));
    internal::AppendBytes(m_buffer, command.data.data(), command.data.size());
}

void BinaryFormatter::CompileLogHeader(const LogHeader& header) {
    const std::string content = header.Content();
    internal::AppendInt32(m_buffer, Length(content.size()));
    internal::AppendBytes(m_buffer, content.data(), content.size());
}

// ==============================================================================
// PacketReader / 数据包读取器
// ==============================================================================

namespace {

std::string ContentValue(const std::string& content, std::string_view key) {
    size_t pos = 0;
    while (pos < content.size()) {
        size_t end = content.find("\r\n", pos);
        if (end == std::string::npos) {
            end = content.size();
        }
        const std::string_view line(content.data() + pos, end - pos);
        const size_t eq = line.find('=');
        if (eq != std::string_view::npos && line.substr(0, eq) == key) {
            return std::string(line.substr(eq + 1));
        }
        pos = end + 2;
    }
    return {};
}

}  // namespace

std::shared_ptr<Packet> PacketReader::ReadPacket(const uint8_t* data, size_t size,
                                                 size_t& consumed) {
    internal::WireReader header(data, size);
    const auto type = static_cast<PacketType>(header.ReadUInt16());
    const int32_t payloadSize = header.ReadInt32();
    if (payloadSize < 0 || static_cast<size_t>(payloadSize) > header.Remaining()) {
        throw Error(ErrorCode::BufferUnderflow, "Truncated packet data");
    }
    internal::WireReader in(data + kPacketHeaderSize, static_cast<size_t>(payloadSize));

    std::shared_ptr<Packet> result;
    switch (type) {
        case PacketType::LogEntry: {
            auto entry = std::make_shared<LogEntry>();
            entry->logEntryType = static_cast<LogEntryType>(in.ReadInt32());
            entry->viewerId = static_cast<ViewerId>(in.ReadInt32());
            const int32_t appLen = in.ReadInt32();
            const int32_t sessionLen = in.ReadInt32();
            const int32_t titleLen = in.ReadInt32();
            const int32_t hostLen = in.ReadInt32();
            const int32_t dataLen = in.ReadInt32();
            entry->processId = static_cast<uint32_t>(in.ReadInt32());
            entry->threadId = static_cast<uint32_t>(in.ReadInt32());
            entry->timestamp = internal::OleDateToTimestamp(in.ReadDouble());
            entry->color = Color::FromValue(static_cast<uint32_t>(in.ReadInt32()));
            entry->appName = in.ReadString(appLen);
            entry->sessionName = in.ReadString(sessionLen);
            entry->title = in.ReadString(titleLen);
            entry->hostName = in.ReadString(hostLen);
            entry->data = in.ReadBytes(dataLen);
            result = entry;
            break;
        }
        case PacketType::Watch: {
            auto watch = std::make_shared<Watch>();
            const int32_t nameLen = in.ReadInt32();
            const int32_t valueLen = in.ReadInt32();
            watch->watchType = static_cast<WatchType>(in.ReadInt32());
            watch->timestamp = internal::OleDateToTimestamp(in.ReadDouble());
            watch->name = in.ReadString(nameLen);
            watch->value = in.ReadString(valueLen);
            result = watch;
            break;
        }
        case PacketType::ProcessFlow: {
            auto flow = std::make_shared<ProcessFlow>();
            flow->processFlowType = static_cast<ProcessFlowType>(in.ReadInt32());
            const int32_t titleLen = in.ReadInt32();
            const int32_t hostLen = in.ReadInt32();
            flow->processId = static_cast<uint32_t>(in.ReadInt32());
            flow->threadId = static_cast<uint32_t>(in.ReadInt32());
            flow->timestamp = internal::OleDateToTimestamp(in.ReadDouble());
            flow->title = in.ReadString(titleLen);
            flow->hostName = in.ReadString(hostLen);
            result = flow;
            break;
        }
        case PacketType::ControlCommand: {
            auto command = std::make_shared<ControlCommand>();
            command->controlCommandType = static_cast<ControlCommandType>(in.ReadInt32());
            command->data = in.ReadBytes(in.ReadInt32());
            result = command;
            break;
        }
        case PacketType::LogHeader: {
            auto logHeader = std::make_shared<LogHeader>();
            const std::string content = in.ReadString(in.ReadInt32());
            logHeader->hostName = ContentValue(content, "hostname");
            logHeader->appName = ContentValue(content, "appname");
            result = logHeader;
            break;
        }
        default:
            throw Error(ErrorCode::NotSupported,
                        fmt::format("Unknown packet type {}", static_cast<int>(type)));
    }

    consumed = kPacketHeaderSize + static_cast<size_t>(payloadSize);
    return result;
}

std::vector<std::shared_ptr<Packet>> PacketReader::ReadAll(const std::vector<uint8_t>& bytes) {
    std::vector<std::shared_ptr<Packet>> packets;
    size_t offset = 0;
    if (bytes.size() >= kPlainEyeCatcher.size() &&
        std::string_view(reinterpret_cast<const char*>(bytes.data()), kPlainEyeCatcher.size()) ==
            kPlainEyeCatcher) {
        offset = kPlainEyeCatcher.size();
    }
    while (offset < bytes.size()) {
        size_t consumed = 0;
        packets.push_back(ReadPacket(bytes.data() + offset, bytes.size() - offset, consumed));
        offset += consumed;
    }
    return packets;
}

}  // namespace silink
