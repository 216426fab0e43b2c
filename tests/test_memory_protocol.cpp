/**
 * @file test_memory_protocol.cpp
 * @brief Unit tests for MemoryProtocol
 * @brief MemoryProtocol 的单元测试
 *
 * @copyright Copyright (c) 2024 silink
 */

#include <gtest/gtest.h>
#ifdef SILINK_HAS_RAPIDCHECK
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>
#endif

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <silink/error.hpp>
#include <silink/formatter.hpp>
#include <silink/memory_protocol.hpp>
#include <silink/text_protocol.hpp>

namespace silink {
namespace test {

namespace {

/// Watch whose serialized size is exactly `size` bytes / 序列化大小恰为 size 的监视
PacketPtr MakeWatch(size_t size, const std::string& name = "w") {
    std::string value(size - kPacketHeaderSize - Watch::kFixedSize - name.size(), 'v');
    return std::make_shared<Watch>(name, std::move(value), WatchType::String);
}

PacketPtr MakeEntry(const std::string& title) {
    auto entry = std::make_shared<LogEntry>();
    entry->title = title;
    return entry;
}

std::vector<uint8_t> Bytes(const std::ostringstream& stream) {
    const std::string text = stream.str();
    return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace

// ==============================================================================
// Unit Tests / 单元测试
// ==============================================================================

/**
 * @brief Test defaults and the options string
 * @brief 测试默认值与选项字符串
 */
TEST(MemoryProtocolTest, Options) {
    MemoryProtocol protocol;
    EXPECT_EQ(protocol.Name(), "mem");
    EXPECT_TRUE(protocol.IsValidOption("maxsize"));
    EXPECT_TRUE(protocol.IsValidOption("astext"));
    EXPECT_FALSE(protocol.IsValidOption("filename"));
    EXPECT_THROW(protocol.Initialize("filename=log.sil"), Error);

    protocol.Initialize("");
    EXPECT_NE(protocol.GetOptions().find("maxsize=8192kb"), std::string::npos);

    protocol.Initialize("maxsize=1, astext=true");
    const std::string options = protocol.GetOptions();
    EXPECT_NE(options.find("maxsize=1kb"), std::string::npos);
    EXPECT_NE(options.find("astext=true"), std::string::npos);
}

/**
 * @brief Test that the oldest packets are dropped past maxsize
 * @brief 测试超过 maxsize 时丢弃最旧的数据包
 */
TEST(MemoryProtocolTest, MaxSizeDropsOldest) {
    MemoryProtocol protocol;
    protocol.Initialize("maxsize=1");
    protocol.Connect();

    // 100 bytes + 24 overhead each, 1024 bytes hold 8 / 每个 124 字节，1024 字节容纳 8 个
    for (int i = 0; i < 10; ++i) {
        protocol.WritePacket(MakeWatch(100, "w" + std::to_string(i)));
    }
    EXPECT_EQ(protocol.Count(), 8u);

    auto stream = std::make_shared<std::ostringstream>();
    protocol.Dispatch(ProtocolCommand{MemoryProtocol::kFlushAction, stream});
    const auto packets = PacketReader::ReadAll(Bytes(*stream));
    ASSERT_EQ(packets.size(), 8u);
    EXPECT_EQ(static_cast<const Watch&>(*packets.front()).name, "w2");
    EXPECT_EQ(static_cast<const Watch&>(*packets.back()).name, "w9");
}

/**
 * @brief Test flushing into a stream in binary form
 * @brief 测试以二进制形式刷新到流
 */
TEST(MemoryProtocolTest, FlushToStream) {
    MemoryProtocol protocol;
    protocol.Initialize("");
    protocol.Connect();
    protocol.WritePacket(MakeEntry("a"));
    protocol.WritePacket(MakeWatch(40));
    protocol.WritePacket(std::make_shared<ControlCommand>(ControlCommandType::ClearLog));
    EXPECT_EQ(protocol.Count(), 3u);

    auto stream = std::make_shared<std::ostringstream>();
    protocol.Dispatch(ProtocolCommand{MemoryProtocol::kFlushAction, stream});
    EXPECT_EQ(protocol.Count(), 0u);

    const std::string text = stream->str();
    ASSERT_GE(text.size(), 4u);
    EXPECT_EQ(text.substr(0, 4), std::string(kPlainEyeCatcher));

    const auto packets = PacketReader::ReadAll(Bytes(*stream));
    ASSERT_EQ(packets.size(), 3u);
    EXPECT_EQ(packets[0]->Type(), PacketType::LogEntry);
    EXPECT_EQ(packets[1]->Type(), PacketType::Watch);
    EXPECT_EQ(packets[2]->Type(), PacketType::ControlCommand);
}

/**
 * @brief Test flushing into a stream as text
 * @brief 测试以文本形式刷新到流
 */
TEST(MemoryProtocolTest, FlushAsText) {
    MemoryProtocol protocol;
    protocol.Initialize("astext=true, pattern=\"%title%\"");
    protocol.Connect();
    protocol.WritePacket(MakeEntry("first"));
    protocol.WritePacket(MakeWatch(40));
    protocol.WritePacket(MakeEntry("second"));

    auto stream = std::make_shared<std::ostringstream>();
    protocol.Dispatch(ProtocolCommand{MemoryProtocol::kFlushAction, stream});
    EXPECT_EQ(stream->str(), std::string(kTextFileBom) + "first\r\nsecond\r\n");
}

/**
 * @brief Test flushing into another protocol
 * @brief 测试刷新到另一个协议
 */
TEST(MemoryProtocolTest, FlushToProtocol) {
    MemoryProtocol source;
    source.Initialize("");
    source.Connect();
    source.WritePacket(MakeEntry("a"));
    source.WritePacket(MakeEntry("b"));

    auto target = std::make_shared<MemoryProtocol>();
    target->Initialize("");
    target->Connect();

    source.Dispatch(ProtocolCommand{MemoryProtocol::kFlushAction, target});
    EXPECT_EQ(source.Count(), 0u);
    EXPECT_EQ(target->Count(), 2u);
}

/**
 * @brief Test invalid dispatch targets
 * @brief 测试无效的分派目标
 */
TEST(MemoryProtocolTest, InvalidDispatch) {
    auto protocol = std::make_shared<MemoryProtocol>();
    protocol->Initialize("");
    protocol->Connect();
    protocol->WritePacket(MakeEntry("a"));

    try {
        protocol->Dispatch(ProtocolCommand{MemoryProtocol::kFlushAction, protocol});
        FAIL() << "Expected ProtocolError";
    } catch (const ProtocolError& ex) {
        EXPECT_EQ(ex.Code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(ex.ProtocolName(), "mem");
    }

    EXPECT_THROW(protocol->Dispatch(ProtocolCommand{MemoryProtocol::kFlushAction, {}}),
                 ProtocolError);
}

/**
 * @brief Test that unknown actions and disconnected protocols ignore dispatch
 * @brief 测试未知动作与未连接的协议忽略分派
 */
TEST(MemoryProtocolTest, IgnoredDispatch) {
    MemoryProtocol protocol;
    protocol.Initialize("");
    protocol.Connect();
    protocol.WritePacket(MakeEntry("a"));

    auto stream = std::make_shared<std::ostringstream>();
    protocol.Dispatch(ProtocolCommand{5, stream});
    EXPECT_EQ(protocol.Count(), 1u);
    EXPECT_TRUE(stream->str().empty());

    protocol.Disconnect();
    EXPECT_EQ(protocol.Count(), 0u);
    protocol.Dispatch(ProtocolCommand{MemoryProtocol::kFlushAction, stream});
    EXPECT_TRUE(stream->str().empty());
}

/**
 * @brief Test the memory protocol running asynchronously
 * @brief 测试异步运行的内存协议
 */
TEST(MemoryProtocolTest, Async) {
    MemoryProtocol protocol;
    protocol.Initialize("async.enabled=true");
    protocol.Connect();
    for (int i = 0; i < 50; ++i) {
        protocol.WritePacket(MakeEntry("e" + std::to_string(i)));
    }

    auto stream = std::make_shared<std::ostringstream>();
    protocol.Dispatch(ProtocolCommand{MemoryProtocol::kFlushAction, stream});
    protocol.Disconnect();

    // Commands run in order, so the flush sees every write / 命令按序执行
    EXPECT_EQ(PacketReader::ReadAll(Bytes(*stream)).size(), 50u);
}

// ==============================================================================
// Property-Based Tests / 属性测试
// ==============================================================================

#ifdef SILINK_HAS_RAPIDCHECK

/**
 * @brief Property: the buffer never holds more than maxsize bytes
 * @brief 属性：缓冲区从不超过 maxsize 字节
 */
RC_GTEST_PROP(MemoryProtocolPropTest, BoundedBuffer, ()) {
    const auto sizes = *rc::gen::container<std::vector<size_t>>(rc::gen::inRange<size_t>(27, 600));
    MemoryProtocol protocol;
    protocol.Initialize("maxsize=2");
    protocol.Connect();

    size_t total = 0;
    for (size_t size : sizes) {
        protocol.WritePacket(MakeWatch(size));
        total += size + PacketQueue::kOverhead;
    }
    RC_ASSERT(protocol.Count() <= sizes.size());

    auto stream = std::make_shared<std::ostringstream>();
    protocol.Dispatch(ProtocolCommand{MemoryProtocol::kFlushAction, stream});
    const auto packets = PacketReader::ReadAll(Bytes(*stream));
    size_t kept = 0;
    for (const auto& packet : packets) {
        kept += packet->Size() + PacketQueue::kOverhead;
    }
    RC_ASSERT(kept <= 2048u);
    if (total <= 2048u) {
        RC_ASSERT(packets.size() == sizes.size());
    }
}

#endif  // SILINK_HAS_RAPIDCHECK

}  // namespace test
}  // namespace silink
