/**
 * @file callback_list.hpp
 * @brief Ordered list of registered callbacks
 * @brief 已注册回调的有序列表
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace silink {

/// Handle returned by callback registration / 回调注册返回的句柄
using CallbackId = uint64_t;

namespace internal {

/**
 * @brief Thread-safe list of handlers invoked in registration order
 * @brief 按注册顺序调用的线程安全处理器列表
 *
 * Invoke() copies the handler list under the lock and calls the handlers outside of it,
 * so a handler may register or remove handlers. Exceptions from handlers propagate.
 *
 * Invoke() 在锁内复制处理器列表并在锁外调用，因此处理器可以注册或移除处理器。
 * 处理器抛出的异常会向外传播。
 */
template <typename... Args>
class CallbackList {
public:
    using Handler = std::function<void(Args...)>;

    CallbackId Add(Handler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        const CallbackId id = ++m_nextId;
        m_handlers.emplace_back(id, std::move(handler));
        return id;
    }

    bool Remove(CallbackId id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_handlers.begin(), m_handlers.end(),
                               [id](const Entry& entry) { return entry.first == id; });
        if (it == m_handlers.end()) {
            return false;
        }
        m_handlers.erase(it);
        return true;
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handlers.clear();
    }

    bool Empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_handlers.empty();
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_handlers.size();
    }

    void Invoke(Args... args) const {
        std::vector<Entry> snapshot;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            snapshot = m_handlers;
        }
        for (const auto& entry : snapshot) {
            entry.second(args...);
        }
    }

private:
    using Entry = std::pair<CallbackId, Handler>;

    std::vector<Entry> m_handlers;
    CallbackId m_nextId{0};
    mutable std::mutex m_mutex;
};

}  // namespace internal
}  // namespace silink
