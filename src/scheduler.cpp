/**
 * @file scheduler.cpp
 * @brief SchedulerQueue and Scheduler implementation
 * @brief SchedulerQueue 与 Scheduler 实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/scheduler.hpp"

#include <exception>
#include <system_error>

#include "silink/internal/diagnostics.hpp"

namespace silink {

// ==============================================================================
// SchedulerQueue / 调度队列
// ==============================================================================

void SchedulerQueue::Enqueue(SchedulerCommand command) {
    m_size += command.size + kOverhead;
    m_items.push_back(std::move(command));
}

bool SchedulerQueue::Dequeue(SchedulerCommand& command) {
    if (m_items.empty()) {
        return false;
    }
    command = std::move(m_items.front());
    m_items.pop_front();
    m_size -= command.size + kOverhead;
    return true;
}

bool SchedulerQueue::Trim(size_t requiredBytes) {
    if (requiredBytes == 0) {
        return true;
    }

    // First pass: can enough be freed at all? / 第一遍：能否释放足够空间
    size_t available = 0;
    for (const auto& item : m_items) {
        if (item.action == SchedulerAction::WritePacket) {
            available += item.size + kOverhead;
            if (available >= requiredBytes) {
                break;
            }
        }
    }
    if (available < requiredBytes) {
        return false;
    }

    // Second pass: remove oldest writes / 第二遍：删除最早的写命令
    size_t freed = 0;
    std::deque<SchedulerCommand> kept;
    for (auto& item : m_items) {
        if (freed < requiredBytes && item.action == SchedulerAction::WritePacket) {
            freed += item.size + kOverhead;
            continue;
        }
        kept.push_back(std::move(item));
    }
    m_items.swap(kept);
    m_size -= freed;
    return true;
}

void SchedulerQueue::Clear() noexcept {
    m_items.clear();
    m_size = 0;
}

// ==============================================================================
// Scheduler / 调度器
// ==============================================================================

Scheduler::Scheduler(Executor executor, FailedPredicate failed)
    : m_executor(std::move(executor)),
      m_failed(std::move(failed)),
      m_logger(internal::MakeDefaultLogger("scheduler")) {}

Scheduler::~Scheduler() {
    Stop();
}

bool Scheduler::Start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_started) {
        return false;  // Already started / 已经启动
    }
    try {
        m_thread = std::thread(&Scheduler::ThreadFunc, this);
    } catch (const std::system_error& ex) {
        m_logger->error("Failed to start scheduler thread: {}", ex.what());
        return false;
    }
    m_started = true;
    m_running.store(true, std::memory_order_release);
    return true;
}

void Scheduler::Stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_started || m_stopped) {
            return;  // Not running / 未运行
        }
        m_stopped = true;
    }
    m_itemAvailable.notify_all();
    m_spaceAvailable.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running.store(false, std::memory_order_release);
}

bool Scheduler::Schedule(SchedulerCommand command) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_started || m_stopped) {
        return false;
    }

    if (command.action == SchedulerAction::WritePacket) {
        const size_t needed = command.size + SchedulerQueue::kOverhead;
        if (needed > m_threshold) {
            Drop(command, "larger than the queue");
            return false;
        }

        if (m_throttle && !m_failed()) {
            m_spaceAvailable.wait(lock, [&] {
                return m_stopped || m_queue.Size() + needed <= m_threshold || m_failed();
            });
            if (m_stopped) {
                return false;
            }
        }

        if (m_queue.Size() + needed > m_threshold &&
            !m_queue.Trim(m_queue.Size() + needed - m_threshold)) {
            Drop(command, "queue full");
            return false;
        }
    }

    m_queue.Enqueue(std::move(command));
    lock.unlock();
    m_itemAvailable.notify_one();
    return true;
}

void Scheduler::Clear() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.Clear();
    }
    m_spaceAvailable.notify_all();
}

size_t Scheduler::QueueCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.Count();
}

size_t Scheduler::QueueSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.Size();
}

void Scheduler::Drop(const SchedulerCommand& command, const char* reason) {
    const size_t total = m_dropped.fetch_add(1, std::memory_order_relaxed) + 1;
    m_logger->warn("Dropped packet of {} bytes ({}), {} dropped so far", command.size, reason, total);
}

void Scheduler::ThreadFunc() {
    std::vector<SchedulerCommand> batch;
    batch.reserve(kBatchSize);

    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_itemAvailable.wait(lock, [this] { return m_stopped || !m_queue.IsEmpty(); });
            if (m_queue.IsEmpty()) {
                break;  // Stopped and drained / 已停止且已排空
            }
            if (m_stopped && m_failed()) {
                m_queue.Clear();
                break;
            }
            SchedulerCommand command;
            while (batch.size() < kBatchSize && m_queue.Dequeue(command)) {
                batch.push_back(std::move(command));
            }
        }
        m_spaceAvailable.notify_all();

        for (const auto& command : batch) {
            bool abandon = false;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                abandon = m_stopped && m_failed();
            }
            if (abandon) {
                break;
            }
            try {
                m_executor(command);
            } catch (const std::exception& ex) {
                m_logger->error("Scheduler command failed: {}", ex.what());
            }
        }
        batch.clear();
    }
    m_spaceAvailable.notify_all();
}

}  // namespace silink
