/**
 * @file benchmark_file.cpp
 * @brief File protocol throughput benchmark for silink
 * @brief silink 文件协议吞吐量基准测试
 *
 * Measures packets per second written by the file and text protocols in sync
 * and async mode, with an spdlog file logger writing comparable lines as a
 * reference.
 *
 * 测量文件与文本协议在同步与异步模式下每秒写入的数据包数，并以写入相近内容的
 * spdlog 文件日志器作为参照。
 *
 * Usage / 用法: benchmark_file [iterations]
 *
 * @copyright Copyright (c) 2024 silink
 */

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>

#include <silink/silink.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace {

// ==============================================================================
// Configuration / 配置
// ==============================================================================

constexpr size_t kDefaultIterations = 200000;
constexpr size_t kWarmupIterations = 1000;
constexpr const char* kTitle = "Benchmark message with a number";

using Clock = std::chrono::steady_clock;

void Report(const char* name, size_t iterations, Clock::duration elapsed) {
    const double seconds = std::chrono::duration<double>(elapsed).count();
    const double opsPerSec = seconds > 0 ? static_cast<double>(iterations) / seconds : 0.0;
    std::printf("%-28s %12.0f ops/sec %10.2f ns/op\n", name, opsPerSec,
                seconds * 1e9 / static_cast<double>(iterations));
}

std::shared_ptr<silink::LogEntry> MakeEntry(size_t i) {
    auto entry = std::make_shared<silink::LogEntry>(silink::LogEntryType::Message,
                                                    silink::ViewerId::Title);
    entry->title = kTitle;
    entry->title += ' ';
    entry->title += std::to_string(i);
    return entry;
}

// ==============================================================================
// Benchmarks / 基准测试
// ==============================================================================

void RunSilink(const char* name, const char* protocolName, const std::string& options,
               size_t iterations) {
    auto protocol = silink::ProtocolFactory::Create(protocolName, options);
    protocol->Connect();
    for (size_t i = 0; i < kWarmupIterations; ++i) {
        protocol->WritePacket(MakeEntry(i));
    }

    const auto start = Clock::now();
    for (size_t i = 0; i < iterations; ++i) {
        protocol->WritePacket(MakeEntry(i));
    }
    protocol->Disconnect();  // Drains the async queue / 排空异步队列
    Report(name, iterations, Clock::now() - start);
}

void RunSpdlog(const char* name, const std::string& path, bool async, size_t iterations) {
    std::shared_ptr<spdlog::logger> logger;
    if (async) {
        spdlog::init_thread_pool(8192, 1);
        logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("bench_async", path, true);
    } else {
        logger = spdlog::basic_logger_mt("bench_sync", path, true);
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%f] %l: %v");

    const auto start = Clock::now();
    for (size_t i = 0; i < iterations; ++i) {
        logger->info("{} {}", kTitle, i);
    }
    logger->flush();
    spdlog::drop(logger->name());
    logger.reset();
    if (async) {
        spdlog::shutdown();
    }
    Report(name, iterations, Clock::now() - start);
}

}  // namespace

int main(int argc, char* argv[]) {
    size_t iterations = kDefaultIterations;
    if (argc > 1) {
        iterations = static_cast<size_t>(std::strtoull(argv[1], nullptr, 10));
        if (iterations == 0) {
            iterations = kDefaultIterations;
        }
    }

    const auto dir = std::filesystem::temp_directory_path() / "silink_bench";
    std::filesystem::create_directories(dir);
    const auto path = [&dir](const char* name) { return (dir / name).string(); };

    std::printf("silink file benchmark, %zu iterations / 次迭代\n\n", iterations);

    try {
        RunSilink("silink file (sync)", "file",
                  "filename=\"" + path("sync.sil") + "\", buffer=64", iterations);
        RunSilink("silink file (async)", "file",
                  "filename=\"" + path("async.sil") +
                      "\", buffer=64, async.enabled=true, async.queue=8192, async.throttle=true",
                  iterations);
        RunSilink("silink text (sync)", "text",
                  "filename=\"" + path("sync.txt") + "\", buffer=64", iterations);
    } catch (const silink::Error& ex) {
        std::fprintf(stderr, "Error: %s\n", ex.what());
        return 1;
    }
    RunSpdlog("spdlog basic_file (sync)", path("spdlog_sync.txt"), false, iterations);
    RunSpdlog("spdlog basic_file (async)", path("spdlog_async.txt"), true, iterations);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return 0;
}
