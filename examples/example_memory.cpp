/**
 * @file example_memory.cpp
 * @brief Memory protocol example for silink
 * @brief silink 内存协议示例
 *
 * Packets are kept in memory and only written out on demand, either to a
 * stream or to another protocol.
 *
 * 数据包保存在内存中，仅在需要时写入流或另一个协议。
 *
 * @copyright Copyright (c) 2024 silink
 */

#include <iostream>
#include <memory>
#include <silink/silink.hpp>

int main() {
    std::cout << "silink memory example / silink 内存示例" << std::endl;

    silink::ClientConfig config;
    config.appName = "MemoryExample";
    silink::Client client(config);
    client.SetConnections(
        "mem(caption=recent, maxsize=64, astext=true, pattern=\"%level%: %title%\")");
    client.SetEnabled(true);

    for (int i = 0; i < 10; ++i) {
        auto entry = std::make_shared<silink::LogEntry>(silink::LogEntryType::Message,
                                                        silink::ViewerId::Title);
        entry->title = "Request " + std::to_string(i) + " handled";
        client.SendLogEntry(entry);
    }

    // Write the buffered entries to stdout, the stream is not owned
    // 将缓冲的条目写到标准输出，流不被持有
    std::shared_ptr<std::ostream> out(&std::cout, [](std::ostream*) {});
    client.Dispatch("recent", silink::ProtocolCommand{silink::MemoryProtocol::kFlushAction, out});
    std::cout << std::endl;

    // Flush into another protocol / 刷新到另一个协议
    auto text = silink::ProtocolFactory::Create("mem", "astext=true, pattern=\"> %title%\"");
    text->Connect();
    client.SendLogEntry(std::make_shared<silink::LogEntry>(silink::LogEntryType::Message,
                                                           silink::ViewerId::Title));
    client.Dispatch("recent", silink::ProtocolCommand{silink::MemoryProtocol::kFlushAction, text});
    std::cout << "Forwarded packets: "
              << static_cast<silink::MemoryProtocol&>(*text).Count() << std::endl;
    return 0;
}
