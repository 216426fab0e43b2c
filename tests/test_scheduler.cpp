/**
 * @file test_scheduler.cpp
 * @brief Unit tests for SchedulerQueue and Scheduler
 * @brief SchedulerQueue 与 Scheduler 的单元测试
 *
 * @copyright Copyright (c) 2024 silink
 */

#include <gtest/gtest.h>
#ifdef SILINK_HAS_RAPIDCHECK
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>
#endif

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <silink/scheduler.hpp>

namespace silink {
namespace test {

namespace {

SchedulerCommand MakeWrite(size_t size) {
    SchedulerCommand command;
    command.action = SchedulerAction::WritePacket;
    command.size = size;
    return command;
}

/// Holds the executor inside its first command until Open() / 在 Open() 前阻塞执行器
class Gate {
public:
    void WaitEntered() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_entered; });
    }

    void Enter() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_entered = true;
        m_cv.notify_all();
        m_cv.wait(lock, [this] { return m_open; });
    }

    void Open() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = true;
        m_cv.notify_all();
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_entered{false};
    bool m_open{false};
};

}  // namespace

// ==============================================================================
// Unit Tests / 单元测试
// ==============================================================================

/**
 * @brief Test byte accounting of the queue
 * @brief 测试队列的字节计量
 */
TEST(SchedulerQueueTest, SizeAccounting) {
    SchedulerQueue queue;
    queue.Enqueue(MakeWrite(50));
    queue.Enqueue(MakeWrite(70));

    EXPECT_EQ(queue.Count(), 2u);
    EXPECT_EQ(queue.Size(), 168u);

    SchedulerCommand command;
    ASSERT_TRUE(queue.Dequeue(command));
    EXPECT_EQ(command.size, 50u);
    EXPECT_EQ(queue.Size(), 94u);
    ASSERT_TRUE(queue.Dequeue(command));
    EXPECT_FALSE(queue.Dequeue(command));
    EXPECT_EQ(queue.Size(), 0u);
}

/**
 * @brief Test that Trim removes the oldest writes only when it can free enough
 * @brief 测试 Trim 仅在能释放足够空间时删除最早的写命令
 */
TEST(SchedulerQueueTest, Trim) {
    SchedulerQueue queue;
    queue.Enqueue(MakeWrite(76));
    queue.Enqueue(MakeWrite(76));
    queue.Enqueue(MakeWrite(76));
    ASSERT_EQ(queue.Size(), 300u);

    EXPECT_FALSE(queue.Trim(500));
    EXPECT_EQ(queue.Count(), 3u);
    EXPECT_EQ(queue.Size(), 300u);

    EXPECT_TRUE(queue.Trim(200));
    EXPECT_EQ(queue.Count(), 1u);
    EXPECT_EQ(queue.Size(), 100u);

    EXPECT_TRUE(queue.Trim(0));
    EXPECT_EQ(queue.Count(), 1u);
}

/**
 * @brief Test Trim with 100 byte writes (124 bytes queued each)
 * @brief 测试 100 字节写命令的 Trim（每个入队占 124 字节）
 */
TEST(SchedulerQueueTest, TrimHundredByteWrites) {
    SchedulerQueue queue;
    queue.Enqueue(MakeWrite(100));
    queue.Enqueue(MakeWrite(100));
    queue.Enqueue(MakeWrite(100));
    ASSERT_EQ(queue.Size(), 372u);
    ASSERT_EQ(queue.Count(), 3u);

    // Freeing 200 bytes takes the first two commands / 释放 200 字节需要删除前两个命令
    EXPECT_TRUE(queue.Trim(200));
    EXPECT_EQ(queue.Count(), 1u);
    EXPECT_EQ(queue.Size(), 124u);

    EXPECT_FALSE(queue.Trim(500));
    EXPECT_EQ(queue.Count(), 1u);
    EXPECT_EQ(queue.Size(), 124u);

    SchedulerCommand command;
    ASSERT_TRUE(queue.Dequeue(command));
    EXPECT_EQ(command.size, 100u);
    EXPECT_EQ(queue.Size(), 0u);
}

/**
 * @brief Test that Trim never removes structural commands
 * @brief 测试 Trim 从不删除结构性命令
 */
TEST(SchedulerQueueTest, TrimKeepsStructuralCommands) {
    SchedulerQueue queue;
    queue.Enqueue(SchedulerCommand::Connect());
    queue.Enqueue(MakeWrite(76));
    queue.Enqueue(SchedulerCommand::Disconnect());
    queue.Enqueue(MakeWrite(76));

    EXPECT_FALSE(queue.Trim(250));
    EXPECT_TRUE(queue.Trim(150));
    ASSERT_EQ(queue.Count(), 2u);

    SchedulerCommand command;
    ASSERT_TRUE(queue.Dequeue(command));
    EXPECT_EQ(command.action, SchedulerAction::Connect);
    ASSERT_TRUE(queue.Dequeue(command));
    EXPECT_EQ(command.action, SchedulerAction::Disconnect);
}

/**
 * @brief Test that a write command carries the packet size
 * @brief 测试写命令携带数据包大小
 */
TEST(SchedulerQueueTest, WriteCommandSize) {
    auto packet = std::make_shared<ControlCommand>(ControlCommandType::ClearAll);
    auto command = SchedulerCommand::Write(packet);
    EXPECT_EQ(command.action, SchedulerAction::WritePacket);
    EXPECT_EQ(command.size, packet->Size());
    EXPECT_EQ(SchedulerCommand::Connect().size, 0u);
}

/**
 * @brief Test that commands run in order and Stop drains the queue
 * @brief 测试命令按顺序执行且 Stop 会排空队列
 */
TEST(SchedulerTest, ExecutesInOrder) {
    std::vector<SchedulerAction> executed;
    Scheduler scheduler([&](const SchedulerCommand& command) { executed.push_back(command.action); },
                        [] { return false; });

    EXPECT_FALSE(scheduler.Schedule(SchedulerCommand::Connect()));  // not started / 未启动
    ASSERT_TRUE(scheduler.Start());
    EXPECT_FALSE(scheduler.Start());
    EXPECT_TRUE(scheduler.IsRunning());

    EXPECT_TRUE(scheduler.Schedule(SchedulerCommand::Connect()));
    for (int i = 0; i < 40; ++i) {
        EXPECT_TRUE(scheduler.Schedule(MakeWrite(10)));
    }
    EXPECT_TRUE(scheduler.Schedule(SchedulerCommand::Disconnect()));
    scheduler.Stop();

    EXPECT_FALSE(scheduler.IsRunning());
    ASSERT_EQ(executed.size(), 42u);
    EXPECT_EQ(executed.front(), SchedulerAction::Connect);
    EXPECT_EQ(executed.back(), SchedulerAction::Disconnect);
    EXPECT_FALSE(scheduler.Schedule(SchedulerCommand::Connect()));
}

/**
 * @brief Test that the default logger stays out of the spdlog registry
 * @brief 测试默认日志器不进入 spdlog 注册表
 */
TEST(SchedulerTest, DefaultLoggerIsPrivate) {
    Scheduler scheduler([](const SchedulerCommand&) {}, [] { return false; });
    auto logger = scheduler.Logger();
    ASSERT_TRUE(logger);
    EXPECT_EQ(logger->name(), "silink.scheduler");
    EXPECT_NE(logger, spdlog::default_logger());
    EXPECT_EQ(spdlog::get("silink.scheduler"), nullptr);
}

/**
 * @brief Test that a write larger than the threshold is dropped
 * @brief 测试大于阈值的写命令会被丢弃
 */
TEST(SchedulerTest, DropsOversizedWrite) {
    std::atomic<int> executed{0};
    Scheduler scheduler([&](const SchedulerCommand&) { ++executed; }, [] { return false; });
    scheduler.SetThreshold(100);
    ASSERT_TRUE(scheduler.Start());

    EXPECT_FALSE(scheduler.Schedule(MakeWrite(200)));
    EXPECT_EQ(scheduler.DroppedCount(), 1u);
    EXPECT_TRUE(scheduler.Schedule(MakeWrite(10)));
    scheduler.Stop();
    EXPECT_EQ(executed.load(), 1);
}

/**
 * @brief Test that without throttling the oldest writes are trimmed
 * @brief 测试不节流时会裁剪最早的写命令
 */
TEST(SchedulerTest, TrimsWhenNotThrottled) {
    Gate gate;
    std::vector<size_t> sizes;
    Scheduler scheduler(
        [&](const SchedulerCommand& command) {
            if (command.action == SchedulerAction::Connect) {
                gate.Enter();
            } else {
                sizes.push_back(command.size);
            }
        },
        [] { return false; });
    scheduler.SetThreshold(300);
    scheduler.SetThrottle(false);
    ASSERT_TRUE(scheduler.Start());

    ASSERT_TRUE(scheduler.Schedule(SchedulerCommand::Connect()));
    gate.WaitEntered();

    EXPECT_TRUE(scheduler.Schedule(MakeWrite(76)));
    EXPECT_TRUE(scheduler.Schedule(MakeWrite(76)));
    EXPECT_TRUE(scheduler.Schedule(MakeWrite(76)));
    EXPECT_EQ(scheduler.QueueSize(), 300u);
    EXPECT_TRUE(scheduler.Schedule(MakeWrite(26)));  // evicts the first write / 挤出第一个写命令
    EXPECT_EQ(scheduler.QueueCount(), 3u);
    EXPECT_EQ(scheduler.QueueSize(), 250u);
    EXPECT_EQ(scheduler.DroppedCount(), 0u);

    gate.Open();
    scheduler.Stop();
    EXPECT_EQ(sizes, (std::vector<size_t>{76, 76, 26}));
}

/**
 * @brief Test that with throttling the producer waits for free space
 * @brief 测试节流时生产者等待空闲空间
 */
TEST(SchedulerTest, ThrottleBlocksProducer) {
    Gate gate;
    std::atomic<int> writes{0};
    Scheduler scheduler(
        [&](const SchedulerCommand& command) {
            if (command.action == SchedulerAction::Connect) {
                gate.Enter();
            } else {
                ++writes;
            }
        },
        [] { return false; });
    scheduler.SetThreshold(200);
    ASSERT_TRUE(scheduler.Start());

    ASSERT_TRUE(scheduler.Schedule(SchedulerCommand::Connect()));
    gate.WaitEntered();
    ASSERT_TRUE(scheduler.Schedule(MakeWrite(76)));
    ASSERT_TRUE(scheduler.Schedule(MakeWrite(76)));

    std::atomic<bool> done{false};
    std::thread producer([&] {
        EXPECT_TRUE(scheduler.Schedule(MakeWrite(76)));
        done = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(done.load());

    gate.Open();
    producer.join();
    scheduler.Stop();
    EXPECT_TRUE(done.load());
    EXPECT_EQ(writes.load(), 3);
    EXPECT_EQ(scheduler.DroppedCount(), 0u);
}

/**
 * @brief Test that Clear discards pending commands
 * @brief 测试 Clear 丢弃待处理命令
 */
TEST(SchedulerTest, ClearDiscardsPending) {
    Gate gate;
    std::atomic<int> writes{0};
    Scheduler scheduler(
        [&](const SchedulerCommand& command) {
            if (command.action == SchedulerAction::Connect) {
                gate.Enter();
            } else {
                ++writes;
            }
        },
        [] { return false; });
    ASSERT_TRUE(scheduler.Start());

    ASSERT_TRUE(scheduler.Schedule(SchedulerCommand::Connect()));
    gate.WaitEntered();
    scheduler.Schedule(MakeWrite(10));
    scheduler.Schedule(MakeWrite(10));
    scheduler.Clear();
    EXPECT_EQ(scheduler.QueueCount(), 0u);

    gate.Open();
    scheduler.Stop();
    EXPECT_EQ(writes.load(), 0);
}

// ==============================================================================
// Property-Based Tests / 属性测试
// ==============================================================================

#ifdef SILINK_HAS_RAPIDCHECK

/**
 * @brief Property: Size() equals the sum of (size + overhead)
 * @brief 属性：Size() 等于 (size + overhead) 之和
 */
RC_GTEST_PROP(SchedulerQueuePropertyTest, SizeIsSumOfItems, ()) {
    const auto sizes = *rc::gen::container<std::vector<size_t>>(rc::gen::inRange<size_t>(0, 4096));
    SchedulerQueue queue;
    size_t expected = 0;
    for (size_t size : sizes) {
        queue.Enqueue(MakeWrite(size));
        expected += size + SchedulerQueue::kOverhead;
    }
    RC_ASSERT(queue.Size() == expected);
    RC_ASSERT(queue.Count() == sizes.size());
}

/**
 * @brief Property: a successful Trim frees at least the requested bytes
 * @brief 属性：成功的 Trim 至少释放请求的字节数
 */
RC_GTEST_PROP(SchedulerQueuePropertyTest, TrimFreesEnough, ()) {
    const auto sizes = *rc::gen::container<std::vector<size_t>>(rc::gen::inRange<size_t>(0, 1024));
    const auto required = *rc::gen::inRange<size_t>(1, 8192);
    SchedulerQueue queue;
    for (size_t size : sizes) {
        queue.Enqueue(MakeWrite(size));
    }
    const size_t before = queue.Size();
    if (queue.Trim(required)) {
        RC_ASSERT(before - queue.Size() >= required);
    } else {
        RC_ASSERT(queue.Size() == before);
        RC_ASSERT(before < required);
    }
}

#endif  // SILINK_HAS_RAPIDCHECK

}  // namespace test
}  // namespace silink
