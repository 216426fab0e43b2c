/**
 * @file test_formatter.cpp
 * @brief Unit tests for BinaryFormatter and PacketReader
 * @brief BinaryFormatter 与 PacketReader 的单元测试
 *
 * @copyright Copyright (c) 2024 silink
 */

#include <gtest/gtest.h>
#ifdef SILINK_HAS_RAPIDCHECK
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>
#endif

#include <memory>
#include <string>
#include <vector>

#include <silink/error.hpp>
#include <silink/formatter.hpp>
#include <silink/stream.hpp>

namespace silink {
namespace test {

namespace {

constexpr int64_t kTimestamp = 1700000000123456LL;  // 2023-11-14 22:13:20.123456 UTC

std::shared_ptr<Packet> RoundTrip(const Packet& packet) {
    BinaryFormatter formatter;
    MemoryOutputStream stream;
    const size_t size = formatter.Compile(packet);
    EXPECT_EQ(size, packet.Size());
    formatter.Write(stream);
    EXPECT_EQ(stream.Size(), size);

    size_t consumed = 0;
    auto decoded = PacketReader::ReadPacket(stream.Data().data(), stream.Size(), consumed);
    EXPECT_EQ(consumed, size);
    return decoded;
}

}  // namespace

// ==============================================================================
// Unit Tests / 单元测试
// ==============================================================================

/**
 * @brief Test the exact bytes of a control command
 * @brief 测试控制命令的精确字节
 */
TEST(BinaryFormatterTest, ControlCommandLayout) {
    ControlCommand command(ControlCommandType::ClearLog);
    command.data = {0xAA, 0xBB, 0xCC};

    BinaryFormatter formatter;
    ASSERT_EQ(formatter.Compile(command), 17u);

    const std::vector<uint8_t> expected = {
        0x01, 0x00,              // type / 类型
        0x0B, 0x00, 0x00, 0x00,  // payload size / 负载长度
        0x00, 0x00, 0x00, 0x00,  // ClearLog
        0x03, 0x00, 0x00, 0x00,  // data length / 数据长度
        0xAA, 0xBB, 0xCC};
    EXPECT_EQ(formatter.Buffer(), expected);
}

/**
 * @brief Test that a log entry survives encode and decode
 * @brief 测试日志条目经编码解码后不变
 */
TEST(BinaryFormatterTest, LogEntryRoundTrip) {
    LogEntry entry(LogEntryType::Warning, ViewerId::Data);
    entry.appName = "App";
    entry.sessionName = "Main";
    entry.title = "Disk almost full";
    entry.hostName = "build-01";
    entry.data = {1, 2, 3, 4};
    entry.color = Color{0x10, 0x20, 0x30, 0x40};
    entry.timestamp = kTimestamp;
    entry.processId = 1234;
    entry.threadId = 5678;

    auto decoded = std::dynamic_pointer_cast<LogEntry>(RoundTrip(entry));
    ASSERT_NE(decoded, nullptr);
    EXPECT_EQ(decoded->logEntryType, LogEntryType::Warning);
    EXPECT_EQ(decoded->viewerId, ViewerId::Data);
    EXPECT_EQ(decoded->appName, "App");
    EXPECT_EQ(decoded->sessionName, "Main");
    EXPECT_EQ(decoded->title, "Disk almost full");
    EXPECT_EQ(decoded->hostName, "build-01");
    EXPECT_EQ(decoded->data, entry.data);
    EXPECT_EQ(decoded->color, entry.color);
    EXPECT_EQ(decoded->timestamp, kTimestamp);
    EXPECT_EQ(decoded->processId, 1234u);
    EXPECT_EQ(decoded->threadId, 5678u);
}

/**
 * @brief Test watch and process flow round trips
 * @brief 测试监视与流程数据包往返
 */
TEST(BinaryFormatterTest, WatchAndProcessFlowRoundTrip) {
    Watch watch("counter", "42", WatchType::Integer);
    watch.timestamp = kTimestamp;
    auto decodedWatch = std::dynamic_pointer_cast<Watch>(RoundTrip(watch));
    ASSERT_NE(decodedWatch, nullptr);
    EXPECT_EQ(decodedWatch->name, "counter");
    EXPECT_EQ(decodedWatch->value, "42");
    EXPECT_EQ(decodedWatch->watchType, WatchType::Integer);
    EXPECT_EQ(decodedWatch->timestamp, kTimestamp);

    ProcessFlow flow(ProcessFlowType::EnterThread);
    flow.title = "worker";
    flow.hostName = "host";
    flow.timestamp = kTimestamp;
    flow.processId = 7;
    flow.threadId = 8;
    auto decodedFlow = std::dynamic_pointer_cast<ProcessFlow>(RoundTrip(flow));
    ASSERT_NE(decodedFlow, nullptr);
    EXPECT_EQ(decodedFlow->processFlowType, ProcessFlowType::EnterThread);
    EXPECT_EQ(decodedFlow->title, "worker");
    EXPECT_EQ(decodedFlow->hostName, "host");
    EXPECT_EQ(decodedFlow->processId, 7u);
    EXPECT_EQ(decodedFlow->threadId, 8u);
    EXPECT_EQ(decodedFlow->timestamp, kTimestamp);
}

/**
 * @brief Test the log header content and round trip
 * @brief 测试日志头内容与往返
 */
TEST(BinaryFormatterTest, LogHeaderRoundTrip) {
    LogHeader header("host-a", "Demo");
    EXPECT_EQ(header.Content(), "hostname=host-a\r\nappname=Demo\r\n");

    auto decoded = std::dynamic_pointer_cast<LogHeader>(RoundTrip(header));
    ASSERT_NE(decoded, nullptr);
    EXPECT_EQ(decoded->hostName, "host-a");
    EXPECT_EQ(decoded->appName, "Demo");
}

/**
 * @brief Test decoding a stream that starts with the SILF eye-catcher
 * @brief 测试解码以 SILF 标识开头的流
 */
TEST(PacketReaderTest, ReadAllWithEyeCatcher) {
    BinaryFormatter formatter;
    MemoryOutputStream stream;
    stream.Write(kPlainEyeCatcher);
    formatter.Format(LogHeader("h", "a"), stream);
    formatter.Format(Watch("w", "v", WatchType::String), stream);
    formatter.Format(ControlCommand(ControlCommandType::ClearAll), stream);

    auto packets = PacketReader::ReadAll(stream.Data());
    ASSERT_EQ(packets.size(), 3u);
    EXPECT_EQ(packets[0]->Type(), PacketType::LogHeader);
    EXPECT_EQ(packets[1]->Type(), PacketType::Watch);
    EXPECT_EQ(packets[2]->Type(), PacketType::ControlCommand);
}

/**
 * @brief Test truncated and unknown packets
 * @brief 测试截断和未知数据包
 */
TEST(PacketReaderTest, MalformedData) {
    BinaryFormatter formatter;
    formatter.Compile(Watch("name", "value", WatchType::String));
    std::vector<uint8_t> truncated = formatter.Buffer();
    truncated.pop_back();

    size_t consumed = 0;
    try {
        PacketReader::ReadPacket(truncated.data(), truncated.size(), consumed);
        FAIL() << "expected BufferUnderflow";
    } catch (const Error& ex) {
        EXPECT_EQ(ex.Code(), ErrorCode::BufferUnderflow);
    }

    const std::vector<uint8_t> unknown = {0x09, 0x00, 0x00, 0x00, 0x00, 0x00};
    try {
        PacketReader::ReadPacket(unknown.data(), unknown.size(), consumed);
        FAIL() << "expected NotSupported";
    } catch (const Error& ex) {
        EXPECT_EQ(ex.Code(), ErrorCode::NotSupported);
    }
}

// ==============================================================================
// Property-Based Tests / 属性测试
// ==============================================================================

#ifdef SILINK_HAS_RAPIDCHECK

/**
 * @brief Property: compiled size always equals Packet::Size()
 * @brief 属性：编译大小总是等于 Packet::Size()
 */
RC_GTEST_PROP(BinaryFormatterPropertyTest, CompiledSizeMatches,
              (const std::string& title, const std::string& app, std::vector<uint8_t> data)) {
    LogEntry entry;
    entry.title = title;
    entry.appName = app;
    entry.data = std::move(data);

    BinaryFormatter formatter;
    RC_ASSERT(formatter.Compile(entry) == entry.Size());
}

/**
 * @brief Property: log entries round trip for timestamps between 1970 and 2070
 * @brief 属性：1970 到 2070 年之间的时间戳可往返
 */
RC_GTEST_PROP(BinaryFormatterPropertyTest, LogEntryRoundTrip,
              (const std::string& title, const std::string& host)) {
    LogEntry entry;
    entry.title = title;
    entry.hostName = host;
    entry.timestamp = *rc::gen::inRange<int64_t>(0, 3155760000000000LL);

    BinaryFormatter formatter;
    formatter.Compile(entry);
    size_t consumed = 0;
    auto decoded = std::dynamic_pointer_cast<LogEntry>(
        PacketReader::ReadPacket(formatter.Buffer().data(), formatter.Buffer().size(), consumed));

    RC_ASSERT(decoded != nullptr);
    RC_ASSERT(decoded->title == title);
    RC_ASSERT(decoded->hostName == host);
    RC_ASSERT(decoded->timestamp == entry.timestamp);
}

#endif  // SILINK_HAS_RAPIDCHECK

}  // namespace test
}  // namespace silink
