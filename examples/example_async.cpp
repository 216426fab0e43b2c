/**
 * @file example_async.cpp
 * @brief Asynchronous protocol example for silink
 * @brief silink 异步协议示例
 *
 * Features demonstrated / 演示的功能:
 * - async.enabled: packets are written on a background thread
 *   async.enabled: 数据包在后台线程中写入
 * - Error events for an unreachable console / 控制台不可达时的错误事件
 * - Backlog that only flushes on errors / 仅在错误时刷新的积压队列
 *
 * @copyright Copyright (c) 2024 silink
 */

#include <atomic>
#include <filesystem>
#include <iostream>
#include <silink/silink.hpp>
#include <thread>
#include <vector>

int main() {
    std::cout << "silink async example / silink 异步示例" << std::endl;

    const auto dir = std::filesystem::temp_directory_path() / "silink_examples";
    std::filesystem::create_directories(dir);

    silink::ClientConfig config;
    config.appName = "AsyncExample";
    silink::Client client(config);
    client.SetVariable("logdir", dir.string());

    std::atomic<int> errors{0};
    client.AddErrorHandler([&errors](const silink::ProtocolError& error) {
        if (errors.fetch_add(1) == 0) {
            std::cerr << "First error: " << error.what() << std::endl;
        }
    });

    // The tcp console is usually not running, its failures arrive as events
    // tcp 控制台通常未运行，其失败以事件形式到达
    try {
        client.SetConnections(
            "tcp(host=localhost, port=4228, timeout=500, async.enabled=true, reconnect=true, "
            "reconnect.interval=2s), "
            "file(filename=\"$logdir$/async.sil\", async.enabled=true, async.queue=1024, "
            "backlog.enabled=true, backlog.queue=512, backlog.flushon=error, "
            "backlog.keepopen=true)");
    } catch (const silink::Error& ex) {
        std::cerr << "Invalid connections: " << ex.what() << std::endl;
        return 1;
    }
    client.SetEnabled(true);

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&client, t] {
            for (int i = 0; i < 1000; ++i) {
                auto entry = std::make_shared<silink::LogEntry>(silink::LogEntryType::Message,
                                                                silink::ViewerId::Title);
                entry->title = "worker " + std::to_string(t) + " step " + std::to_string(i);
                entry->level = (i % 250 == 249) ? silink::Level::Error : silink::Level::Debug;
                client.SendLogEntry(entry);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    // Disabling drains the queues / 禁用时排空队列
    client.SetEnabled(false);
    std::cout << "Errors reported: " << errors.load() << std::endl;
    std::cout << "Dropped by file protocol: " << client.GetProtocol("file")->DroppedCount()
              << std::endl;
    return 0;
}
