/**
 * @file scheduler.hpp
 * @brief Asynchronous command scheduler with a byte-bounded queue
 * @brief 带字节上限队列的异步命令调度器
 *
 * Data flow / 数据流:
 *   producer → Scheduler::Schedule → SchedulerQueue → worker thread → executor
 *   生产者 → Scheduler::Schedule → SchedulerQueue → 工作线程 → 执行器
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "silink/packet.hpp"
#include "silink/protocol_command.hpp"

namespace silink {

// ==============================================================================
// SchedulerCommand / 调度命令
// ==============================================================================

enum class SchedulerAction : uint8_t {
    Connect = 0,
    WritePacket = 1,
    Disconnect = 2,
    Dispatch = 3
};

/**
 * @brief One queued protocol operation
 * @brief 一个排队的协议操作
 *
 * size is the packet size for WritePacket and 0 for every other action.
 * 对于 WritePacket，size 为数据包大小，其他动作为 0。
 */
struct SchedulerCommand {
    SchedulerAction action{SchedulerAction::Connect};
    PacketPtr packet;                                ///< WritePacket only / 仅 WritePacket
    std::shared_ptr<const ProtocolCommand> command;  ///< Dispatch only / 仅 Dispatch
    size_t size{0};

    static SchedulerCommand Connect() { return SchedulerCommand{SchedulerAction::Connect, {}, {}, 0}; }

    static SchedulerCommand Disconnect() {
        return SchedulerCommand{SchedulerAction::Disconnect, {}, {}, 0};
    }

    static SchedulerCommand Write(PacketPtr packet) {
        const size_t size = packet ? packet->Size() : 0;
        return SchedulerCommand{SchedulerAction::WritePacket, std::move(packet), {}, size};
    }

    static SchedulerCommand Dispatch(ProtocolCommand command) {
        return SchedulerCommand{SchedulerAction::Dispatch, {},
                                std::make_shared<const ProtocolCommand>(std::move(command)), 0};
    }
};

// ==============================================================================
// SchedulerQueue / 调度队列
// ==============================================================================

/**
 * @brief FIFO of scheduler commands with byte accounting
 * @brief 带字节计量的调度命令先进先出队列
 *
 * Size() is the sum of (command.size + kOverhead) over all queued commands.
 * Not thread-safe; Scheduler guards it with its mutex.
 *
 * Size() 为所有排队命令 (command.size + kOverhead) 之和。
 * 非线程安全；由 Scheduler 的互斥锁保护。
 */
class SchedulerQueue {
public:
    static constexpr size_t kOverhead = 24;  ///< Fixed per-item cost / 每项固定开销

    void Enqueue(SchedulerCommand command);

    /// Pop the oldest command, false when empty / 弹出最早的命令，空时返回 false
    bool Dequeue(SchedulerCommand& command);

    /**
     * @brief Remove the oldest WritePacket commands until requiredBytes are freed
     * @brief 删除最早的 WritePacket 命令直到释放 requiredBytes 字节
     *
     * Structural commands are never removed. Returns false and leaves the queue
     * untouched when all WritePacket commands together free less than requiredBytes.
     *
     * 结构性命令从不删除。当所有 WritePacket 命令加起来也不足 requiredBytes 时，
     * 返回 false 且队列保持不变。
     */
    bool Trim(size_t requiredBytes);

    void Clear() noexcept;

    size_t Count() const noexcept { return m_items.size(); }
    size_t Size() const noexcept { return m_size; }
    bool IsEmpty() const noexcept { return m_items.empty(); }

private:
    std::deque<SchedulerCommand> m_items;
    size_t m_size{0};
};

// ==============================================================================
// Scheduler / 调度器
// ==============================================================================

/**
 * @brief Single worker thread executing queued commands in order
 * @brief 按顺序执行排队命令的单个工作线程
 *
 * Queue overflow policy / 队列溢出策略:
 * - throttle on and target not failed: the producer blocks until space is free
 * - otherwise: Trim(), and when that fails the new WritePacket is dropped
 * - WritePacket larger than the threshold: dropped
 * - Connect/Disconnect/Dispatch: always queued
 *
 * - 开启节流且目标未失败：生产者阻塞直到有空间
 * - 否则：执行 Trim()，失败时丢弃新的 WritePacket
 * - 大于阈值的 WritePacket：丢弃
 * - Connect/Disconnect/Dispatch：总是入队
 */
class Scheduler {
public:
    using Executor = std::function<void(const SchedulerCommand&)>;
    using FailedPredicate = std::function<bool()>;

    static constexpr size_t kBatchSize = 16;  ///< Commands taken per wake-up / 每次唤醒取出的命令数

    Scheduler(Executor executor, FailedPredicate failed);
    ~Scheduler();

    // Non-copyable, non-movable
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    void SetThreshold(size_t bytes) noexcept { m_threshold = bytes; }
    size_t GetThreshold() const noexcept { return m_threshold; }
    void SetThrottle(bool throttle) noexcept { m_throttle = throttle; }
    bool GetThrottle() const noexcept { return m_throttle; }
    void SetLogger(std::shared_ptr<spdlog::logger> logger) { m_logger = std::move(logger); }
    std::shared_ptr<spdlog::logger> Logger() const { return m_logger; }

    /**
     * @brief Start the worker thread
     * @brief 启动工作线程
     */
    bool Start();

    /**
     * @brief Stop the worker and wait for it
     * @brief 停止工作线程并等待其结束
     *
     * Remaining commands are executed unless the target is in the failed state.
     * 除非目标处于失败状态，否则剩余命令会被执行。
     */
    void Stop();

    /**
     * @brief Queue a command
     * @brief 将命令入队
     *
     * @return false when the scheduler is not running or the command was dropped
     *         调度器未运行或命令被丢弃时返回 false
     */
    bool Schedule(SchedulerCommand command);

    void Clear();

    bool IsRunning() const noexcept { return m_running.load(std::memory_order_acquire); }
    size_t DroppedCount() const noexcept { return m_dropped.load(std::memory_order_relaxed); }
    size_t QueueCount() const;
    size_t QueueSize() const;

private:
    void ThreadFunc();
    void Drop(const SchedulerCommand& command, const char* reason);

    Executor m_executor;
    FailedPredicate m_failed;
    std::shared_ptr<spdlog::logger> m_logger;

    SchedulerQueue m_queue;
    size_t m_threshold{2048 * 1024};
    bool m_throttle{true};
    bool m_started{false};
    bool m_stopped{false};

    std::atomic<bool> m_running{false};
    std::atomic<size_t> m_dropped{0};

    mutable std::mutex m_mutex;
    std::condition_variable m_itemAvailable;
    std::condition_variable m_spaceAvailable;
    std::thread m_thread;
};

}  // namespace silink
