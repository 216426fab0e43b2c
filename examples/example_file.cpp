/**
 * @file example_file.cpp
 * @brief Log file example for silink
 * @brief silink 日志文件示例
 *
 * This example writes packets to binary, encrypted and text log files through
 * a Client configured with a connections string.
 *
 * 此示例通过以连接字符串配置的 Client 将数据包写入二进制、加密和文本日志文件。
 *
 * Features demonstrated / 演示的功能:
 * - Connection variables / 连接变量
 * - Daily rotation with retention / 按天轮转与保留
 * - AES encrypted log files / AES 加密日志文件
 * - Text log files with a custom pattern / 自定义模式的文本日志文件
 *
 * @copyright Copyright (c) 2024 silink
 */

#include <filesystem>
#include <iostream>
#include <silink/silink.hpp>

namespace {

std::shared_ptr<silink::LogEntry> MakeEntry(silink::LogEntryType type, silink::Level level,
                                            const std::string& title) {
    auto entry = std::make_shared<silink::LogEntry>(type, silink::ViewerId::Title);
    entry->level = level;
    entry->sessionName = "Main";
    entry->title = title;
    return entry;
}

}  // namespace

// ==============================================================================
// Example 1: Binary and Text Log Files
// 示例 1: 二进制与文本日志文件
// ==============================================================================

/**
 * @brief Writes the same packets to a .sil file and a .txt file
 * @brief 将相同的数据包写入 .sil 文件和 .txt 文件
 */
void FileExample(const std::string& dir) {
    std::cout << "\n=== Example 1: Binary and text files / 二进制与文本文件 ===" << std::endl;

    silink::ClientConfig config;
    config.appName = "FileExample";
    silink::Client client(config);

    // $logdir$ is replaced before the string is parsed
    // $logdir$ 在解析前被替换
    client.SetVariable("logdir", dir);
    client.SetConnections(
        "file(filename=\"$logdir$/example.sil\", rotate=daily, maxparts=7), "
        "text(filename=\"$logdir$/example.txt\", pattern=\"%timestamp% %level,-8% %title%\", "
        "indent=true)");
    client.AddErrorHandler([](const silink::ProtocolError& error) {
        std::cerr << "Protocol error: " << error.what() << std::endl;
    });
    client.SetEnabled(true);

    client.SendLogEntry(MakeEntry(silink::LogEntryType::EnterMethod, silink::Level::Debug, "Run"));
    client.SendLogEntry(
        MakeEntry(silink::LogEntryType::Message, silink::Level::Message, "Processing 3 orders"));
    client.SendWatch(std::make_shared<silink::Watch>("orders", "3", silink::WatchType::Integer));
    client.SendLogEntry(
        MakeEntry(silink::LogEntryType::Warning, silink::Level::Warning, "Order 2 is late"));
    client.SendLogEntry(MakeEntry(silink::LogEntryType::LeaveMethod, silink::Level::Debug, "Run"));

    client.SetEnabled(false);
    std::cout << "Wrote " << dir << "/example.sil and " << dir << "/example.txt" << std::endl;
}

// ==============================================================================
// Example 2: Encrypted Log File
// 示例 2: 加密日志文件
// ==============================================================================

/**
 * @brief Writes an encrypted log and decrypts it again
 * @brief 写入加密日志并再次解密
 */
void EncryptedExample(const std::string& dir) {
    std::cout << "\n=== Example 2: Encrypted file / 加密文件 ===" << std::endl;

    const std::string path = dir + "/secret.sil";
    silink::Client client;
    client.SetConnections("file(filename=\"" + path + "\", encrypt=true, key=\"0123456789abcdef\")");
    client.SetEnabled(true);
    client.SendLogEntry(
        MakeEntry(silink::LogEntryType::Message, silink::Level::Message, "Top secret"));
    client.SetEnabled(false);

    std::cout << "Options: " << client.GetProtocol("file")->GetOptions() << std::endl;
    std::cout << "Encrypted size: " << std::filesystem::file_size(path) << " bytes" << std::endl;
}

int main() {
    std::cout << "silink file examples / silink 文件示例" << std::endl;

    const auto dir = std::filesystem::temp_directory_path() / "silink_examples";
    std::filesystem::create_directories(dir);

    try {
        FileExample(dir.string());
        EncryptedExample(dir.string());
    } catch (const silink::Error& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
