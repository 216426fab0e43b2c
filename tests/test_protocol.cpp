/**
 * @file test_protocol.cpp
 * @brief Unit tests for the Protocol base class (state, backlog, reconnect, async)
 * @brief Protocol 基类的单元测试（状态、积压、重连、异步）
 *
 * @copyright Copyright (c) 2024 silink
 */

#include <gtest/gtest.h>
#ifdef SILINK_HAS_RAPIDCHECK
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>
#endif

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <silink/protocol.hpp>

namespace silink {
namespace test {

namespace {

/**
 * @brief In-memory protocol recording every internal call
 * @brief 记录每次内部调用的内存协议
 */
class RecordingProtocol : public Protocol {
public:
    RecordingProtocol() : Protocol("recording") {}
    ~RecordingProtocol() override { Dispose(); }

    std::vector<std::string> Titles() const {
        std::lock_guard<std::mutex> lock(m_recordMutex);
        return m_titles;
    }

    std::atomic<bool> failConnect{false};
    std::atomic<bool> failWrite{false};
    std::atomic<int> connects{0};
    std::atomic<int> disconnects{0};
    std::atomic<int> dispatched{-1};

protected:
    void InternalConnect() override {
        ++connects;
        if (failConnect) {
            throw Error(ErrorCode::NetworkConnectFailed, "refused");
        }
    }

    void InternalDisconnect() override { ++disconnects; }

    void InternalWritePacket(const PacketPtr& packet) override {
        if (failWrite) {
            throw Error(ErrorCode::NetworkSendFailed, "broken pipe");
        }
        std::lock_guard<std::mutex> lock(m_recordMutex);
        if (packet->Type() == PacketType::LogEntry) {
            m_titles.push_back(static_cast<const LogEntry&>(*packet).title);
        } else {
            m_titles.push_back(std::string(PacketTypeToString(packet->Type())));
        }
    }

    void InternalDispatch(const ProtocolCommand& command) override { dispatched = command.action; }

private:
    mutable std::mutex m_recordMutex;
    std::vector<std::string> m_titles;
};

PacketPtr Entry(const std::string& title, Level level = Level::Message) {
    auto entry = std::make_shared<LogEntry>();
    entry->title = title;
    entry->level = level;
    return entry;
}

}  // namespace

// ==============================================================================
// Unit Tests / 单元测试
// ==============================================================================

/**
 * @brief Test synchronous connect, write and disconnect
 * @brief 测试同步连接、写入与断开
 */
TEST(ProtocolTest, SyncLifecycle) {
    RecordingProtocol protocol;
    protocol.Initialize("");
    EXPECT_EQ(protocol.State(), ProtocolState::Disconnected);
    EXPECT_EQ(protocol.GetMode(), Mode::Sync);
    EXPECT_EQ(protocol.Caption(), "recording");

    protocol.Connect();
    EXPECT_TRUE(protocol.IsConnected());
    protocol.WritePacket(Entry("one"));
    protocol.WritePacket(Entry("two"));
    protocol.Disconnect();

    EXPECT_EQ(protocol.State(), ProtocolState::Disconnected);
    EXPECT_EQ(protocol.Titles(), (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(protocol.connects.load(), 1);
    EXPECT_EQ(protocol.disconnects.load(), 1);
}

/**
 * @brief Test that packets below the level option are ignored
 * @brief 测试低于级别选项的数据包会被忽略
 */
TEST(ProtocolTest, LevelFilter) {
    RecordingProtocol protocol;
    protocol.Initialize("level=warning");
    protocol.Connect();

    protocol.WritePacket(Entry("debug", Level::Debug));
    protocol.WritePacket(Entry("warning", Level::Warning));
    protocol.WritePacket(std::make_shared<ControlCommand>(ControlCommandType::ClearAll));

    EXPECT_EQ(protocol.Titles(), (std::vector<std::string>{"warning", "ControlCommand"}));
}

/**
 * @brief Test option validation and the options string
 * @brief 测试选项校验与选项字符串
 */
TEST(ProtocolTest, Options) {
    RecordingProtocol protocol;
    try {
        protocol.Initialize("host=localhost");
        FAIL() << "expected ConfigInvalidValue";
    } catch (const Error& ex) {
        EXPECT_EQ(ex.Code(), ErrorCode::ConfigInvalidValue);
    }

    protocol.Initialize("caption=main, level=error, reconnect=true, async.queue=4mb");
    EXPECT_EQ(protocol.Caption(), "main");
    EXPECT_EQ(protocol.GetLevel(), Level::Error);

    const std::string options = protocol.GetOptions();
    EXPECT_NE(options.find("caption=\"main\""), std::string::npos);
    EXPECT_NE(options.find("level=Error"), std::string::npos);
    EXPECT_NE(options.find("reconnect=true"), std::string::npos);
    EXPECT_NE(options.find("async.queue=4096kb"), std::string::npos);

    // The options string loads back into an equivalent protocol / 选项字符串可重新加载
    RecordingProtocol copy;
    copy.Initialize(options);
    EXPECT_EQ(copy.GetOptions(), options);
}

/**
 * @brief Test that a synchronous connect failure throws ProtocolError
 * @brief 测试同步连接失败抛出 ProtocolError
 */
TEST(ProtocolTest, SyncConnectFailure) {
    RecordingProtocol protocol;
    protocol.failConnect = true;

    try {
        protocol.Connect();
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& ex) {
        EXPECT_EQ(ex.Code(), ErrorCode::NetworkConnectFailed);
        EXPECT_EQ(ex.ProtocolName(), "recording");
        EXPECT_EQ(ex.Message(), "refused");
        EXPECT_STREQ(ex.what(), "recording protocol: refused");
        EXPECT_FALSE(ex.ProtocolOptions().empty());
    }
    EXPECT_EQ(protocol.State(), ProtocolState::Disconnected);
    EXPECT_TRUE(protocol.Failed());

    // Without reconnect, writes while disconnected are ignored / 未开启重连时忽略写入
    protocol.failConnect = false;
    EXPECT_NO_THROW(protocol.WritePacket(Entry("ignored")));
    EXPECT_TRUE(protocol.Titles().empty());
}

/**
 * @brief Test that a write failure throws and resets the connection
 * @brief 测试写入失败会抛出异常并重置连接
 */
TEST(ProtocolTest, SyncWriteFailure) {
    RecordingProtocol protocol;
    protocol.Connect();
    protocol.failWrite = true;

    EXPECT_THROW(protocol.WritePacket(Entry("lost")), ProtocolError);
    EXPECT_EQ(protocol.State(), ProtocolState::Disconnected);
    EXPECT_EQ(protocol.disconnects.load(), 1);
}

/**
 * @brief Test that writes reconnect when the reconnect option is on
 * @brief 测试开启重连选项时写入会重新连接
 */
TEST(ProtocolTest, ReconnectOnWrite) {
    RecordingProtocol protocol;
    protocol.Initialize("reconnect=true");
    protocol.failConnect = true;
    EXPECT_THROW(protocol.Connect(), ProtocolError);

    // Reconnect fails quietly / 重连失败时不抛出
    EXPECT_NO_THROW(protocol.WritePacket(Entry("dropped")));
    EXPECT_TRUE(protocol.Failed());

    protocol.failConnect = false;
    protocol.WritePacket(Entry("delivered"));
    EXPECT_TRUE(protocol.IsConnected());
    EXPECT_FALSE(protocol.Failed());
    EXPECT_EQ(protocol.Titles(), std::vector<std::string>{"delivered"});
}

/**
 * @brief Test that the reconnect interval suppresses early attempts
 * @brief 测试重连间隔会抑制过早的尝试
 */
TEST(ProtocolTest, ReconnectInterval) {
    RecordingProtocol protocol;
    protocol.Initialize("reconnect=true, reconnect.interval=1h");
    protocol.failConnect = true;
    EXPECT_THROW(protocol.Connect(), ProtocolError);
    EXPECT_EQ(protocol.connects.load(), 1);

    protocol.failConnect = false;
    protocol.WritePacket(Entry("too early"));
    EXPECT_EQ(protocol.connects.load(), 1);
    EXPECT_FALSE(protocol.IsConnected());
    EXPECT_TRUE(protocol.Titles().empty());
}

/**
 * @brief Test that the backlog holds packets until one reaches flushon
 * @brief 测试积压会保存数据包直到某个达到 flushon
 */
TEST(ProtocolTest, BacklogFlushOn) {
    RecordingProtocol protocol;
    protocol.Initialize("backlog.enabled=true, backlog.flushon=error, backlog.keepopen=true");
    protocol.Connect();

    protocol.WritePacket(Entry("a"));
    protocol.WritePacket(Entry("b", Level::Warning));
    EXPECT_TRUE(protocol.Titles().empty());

    protocol.WritePacket(Entry("boom", Level::Error));
    EXPECT_EQ(protocol.Titles(), (std::vector<std::string>{"a", "b", "boom"}));
}

/**
 * @brief Test that without keepopen the connection only lives for a flush
 * @brief 测试未开启 keepopen 时连接只在刷新期间存在
 */
TEST(ProtocolTest, BacklogWithoutKeepOpen) {
    RecordingProtocol protocol;
    protocol.Initialize("backlog=64kb, flushon=error");
    protocol.Connect();
    EXPECT_EQ(protocol.connects.load(), 0);

    protocol.WritePacket(Entry("a"));
    protocol.WritePacket(Entry("b"));
    EXPECT_EQ(protocol.connects.load(), 0);

    protocol.WritePacket(Entry("c", Level::Fatal));
    EXPECT_EQ(protocol.Titles(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(protocol.connects.load(), 1);
    EXPECT_EQ(protocol.disconnects.load(), 1);
    EXPECT_FALSE(protocol.IsConnected());
}

/**
 * @brief Test that Dispatch only reaches a connected protocol
 * @brief 测试 Dispatch 只到达已连接的协议
 */
TEST(ProtocolTest, Dispatch) {
    RecordingProtocol protocol;
    protocol.Dispatch(ProtocolCommand{7, {}});
    EXPECT_EQ(protocol.dispatched.load(), -1);

    protocol.Connect();
    protocol.Dispatch(ProtocolCommand{7, {}});
    EXPECT_EQ(protocol.dispatched.load(), 7);
}

/**
 * @brief Test asynchronous delivery in order
 * @brief 测试异步按顺序投递
 */
TEST(ProtocolTest, AsyncDelivery) {
    RecordingProtocol protocol;
    protocol.Initialize("async.enabled=true");
    EXPECT_EQ(protocol.GetMode(), Mode::Async);

    protocol.Connect();
    std::vector<std::string> expected;
    for (int i = 0; i < 100; ++i) {
        expected.push_back(std::to_string(i));
        protocol.WritePacket(Entry(expected.back()));
    }
    protocol.Disconnect();

    EXPECT_EQ(protocol.Titles(), expected);
    EXPECT_EQ(protocol.State(), ProtocolState::Disconnected);
    EXPECT_EQ(protocol.DroppedCount(), 0u);
}

/**
 * @brief Test that asynchronous failures reach the error handlers
 * @brief 测试异步失败会交给错误处理器
 */
TEST(ProtocolTest, AsyncErrorHandler) {
    RecordingProtocol protocol;
    protocol.Initialize("async.enabled=true");

    std::mutex mutex;
    std::vector<ErrorCode> codes;
    protocol.AddErrorHandler([&](const ProtocolError& error) {
        std::lock_guard<std::mutex> lock(mutex);
        codes.push_back(error.Code());
    });

    protocol.failConnect = true;
    EXPECT_NO_THROW(protocol.Connect());
    protocol.Disconnect();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(codes.size(), 1u);
    EXPECT_EQ(codes[0], ErrorCode::NetworkConnectFailed);
}

/**
 * @brief Test that Dispose can be called repeatedly
 * @brief 测试 Dispose 可重复调用
 */
TEST(ProtocolTest, DisposeTwice) {
    RecordingProtocol protocol;
    protocol.Connect();
    protocol.Dispose();
    EXPECT_FALSE(protocol.IsConnected());
    EXPECT_NO_THROW(protocol.Dispose());
}

// ==============================================================================
// Property-Based Tests / 属性测试
// ==============================================================================

#ifdef SILINK_HAS_RAPIDCHECK

/**
 * @brief Property: a packet is written exactly when it passes the level filter
 * @brief 属性：数据包当且仅当通过级别过滤时被写入
 */
RC_GTEST_PROP(ProtocolPropertyTest, LevelFilterMatchesShouldWrite, ()) {
    const auto filter = static_cast<Level>(*rc::gen::inRange<uint8_t>(0, 6));
    const auto level = static_cast<Level>(*rc::gen::inRange<uint8_t>(0, 7));

    RecordingProtocol protocol;
    protocol.Initialize(fmt::format("level={}", LevelToString(filter)));
    protocol.Connect();
    protocol.WritePacket(Entry("x", level));

    RC_ASSERT(protocol.Titles().size() == (ShouldWrite(level, filter) ? 1u : 0u));
}

#endif  // SILINK_HAS_RAPIDCHECK

}  // namespace test
}  // namespace silink
