/**
 * @file test_packet_queue.cpp
 * @brief Unit tests for PacketQueue
 * @brief PacketQueue 的单元测试
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

#include <silink/packet_queue.hpp>

namespace silink {
namespace test {

namespace {

/// Watch whose serialized size is exactly `size` bytes (size >= 26) / 序列化大小恰为 size 的监视
PacketPtr MakePacket(size_t size, const std::string& name = "") {
    auto watch = std::make_shared<Watch>();
    watch->name = name;
    watch->value.assign(size - kPacketHeaderSize - Watch::kFixedSize - name.size(), 'x');
    return watch;
}

}  // namespace

// ==============================================================================
// Unit Tests / 单元测试
// ==============================================================================

/**
 * @brief Test FIFO order and size accounting
 * @brief 测试先进先出顺序与大小计量
 */
TEST(PacketQueueTest, FifoAndSize) {
    PacketQueue queue(1024 * 1024);
    EXPECT_TRUE(queue.IsEmpty());
    EXPECT_EQ(queue.Pop(), nullptr);

    queue.Push(MakePacket(100, "a"));
    queue.Push(MakePacket(200, "b"));
    EXPECT_EQ(queue.Count(), 2u);
    EXPECT_EQ(queue.Size(), 100 + 200 + 2 * static_cast<int64_t>(PacketQueue::kOverhead));

    auto first = std::static_pointer_cast<const Watch>(queue.Pop());
    EXPECT_EQ(first->name, "a");
    auto second = std::static_pointer_cast<const Watch>(queue.Pop());
    EXPECT_EQ(second->name, "b");
    EXPECT_EQ(queue.Size(), 0);
}

/**
 * @brief Test that the oldest packets are dropped past the backlog
 * @brief 测试超出积压上限时丢弃最早的数据包
 */
TEST(PacketQueueTest, DropsOldestOverBacklog) {
    PacketQueue queue(300);
    queue.Push(MakePacket(76, "a"));
    queue.Push(MakePacket(76, "b"));
    queue.Push(MakePacket(76, "c"));
    EXPECT_EQ(queue.Count(), 3u);
    EXPECT_EQ(queue.Size(), 300);

    queue.Push(MakePacket(76, "d"));
    EXPECT_EQ(queue.Count(), 3u);
    auto oldest = std::static_pointer_cast<const Watch>(queue.Pop());
    EXPECT_EQ(oldest->name, "b");
}

/**
 * @brief Test that a single packet larger than the backlog is not kept
 * @brief 测试大于积压上限的单个数据包不会保留
 */
TEST(PacketQueueTest, OversizedPacket) {
    PacketQueue queue(50);
    queue.Push(MakePacket(100));
    EXPECT_TRUE(queue.IsEmpty());
    EXPECT_EQ(queue.Size(), 0);
}

/**
 * @brief Test shrinking the backlog and clearing
 * @brief 测试缩小积压上限与清空
 */
TEST(PacketQueueTest, SetBacklogAndClear) {
    PacketQueue queue(1000);
    for (int i = 0; i < 5; ++i) {
        queue.Push(MakePacket(76));
    }
    EXPECT_EQ(queue.Count(), 5u);

    queue.SetBacklog(200);
    EXPECT_EQ(queue.Backlog(), 200);
    EXPECT_EQ(queue.Count(), 2u);

    queue.Clear();
    EXPECT_TRUE(queue.IsEmpty());
    EXPECT_EQ(queue.Size(), 0);
}

// ==============================================================================
// Property-Based Tests / 属性测试
// ==============================================================================

#ifdef SILINK_HAS_RAPIDCHECK

/**
 * @brief Property: Size() never exceeds the backlog after Push()
 * @brief 属性：Push() 之后 Size() 从不超过积压上限
 */
RC_GTEST_PROP(PacketQueuePropertyTest, SizeWithinBacklog, ()) {
    const auto backlog = *rc::gen::inRange<int64_t>(0, 10000);
    const auto sizes = *rc::gen::container<std::vector<size_t>>(rc::gen::inRange<size_t>(26, 2000));

    PacketQueue queue(backlog);
    for (size_t size : sizes) {
        queue.Push(MakePacket(size));
        RC_ASSERT(queue.Size() <= queue.Backlog());
    }
}

#endif  // SILINK_HAS_RAPIDCHECK

}  // namespace test
}  // namespace silink
