/**
 * @file platform.hpp
 * @brief Platform helpers (process/thread id, clock, host name)
 * @brief 平台辅助函数（进程/线程 ID、时钟、主机名）
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <pthread.h>
#include <unistd.h>

namespace silink {
namespace internal {

/**
 * @brief Get current thread ID (platform-specific)
 * @brief 获取当前线程 ID（平台特定）
 */
inline uint32_t GetCurrentThreadId() noexcept {
#if defined(__APPLE__)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return static_cast<uint32_t>(tid);
#else
    // Linux: use gettid() for actual thread ID
    // Linux：使用 gettid() 获取实际线程 ID
    return static_cast<uint32_t>(gettid());
#endif
}

inline uint32_t GetCurrentProcessId() noexcept {
    return static_cast<uint32_t>(::getpid());
}

/**
 * @brief Microseconds since the Unix epoch
 * @brief 自 Unix 纪元以来的微秒数
 */
inline int64_t GetMicrosecondTimestamp() noexcept {
    auto now = std::chrono::system_clock::now();
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count());
}

inline std::string GetHostName() {
    char buffer[256] = {};
    if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "localhost";
    }
    return std::string(buffer);
}

}  // namespace internal
}  // namespace silink
