/**
 * @file file_protocol.hpp
 * @brief Log file transport with rotation, retention and encryption
 * @brief 支持轮转、保留与加密的日志文件传输
 *
 * Options / 选项:
 * - filename   (string, "log.sil", supports %appname% and %machinename%)
 * - append     (bool, false)
 * - buffer     (size, 0: flush after every packet / 每个包后刷新)
 * - rotate     (none|hourly|daily|weekly|monthly, none)
 * - maxsize    (size, 0: unlimited / 不限)
 * - maxparts   (integer, 2 when maxsize is set otherwise 0 / 设置 maxsize 时为 2，否则为 0)
 * - encrypt    (bool, false, forces append=false / 强制 append=false)
 * - key        (16 bytes, required when encrypt is set / encrypt 时必需)
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "silink/file_rotater.hpp"
#include "silink/formatter.hpp"
#include "silink/internal/platform.hpp"
#include "silink/protocol.hpp"
#include "silink/stream.hpp"

namespace silink {

class FileProtocol : public Protocol {
public:
    /// Source of the current time in microseconds / 当前时间（微秒）来源
    using Clock = std::function<int64_t()>;

    FileProtocol();
    ~FileProtocol() override;

    bool IsValidOption(std::string_view name) const override;

    /**
     * @brief Replace the time source used for file names and rotation
     * @brief 替换用于文件名与轮转的时间来源
     */
    void SetClock(Clock clock);

    /// Path of the file currently open, empty when disconnected / 当前打开文件的路径
    std::string CurrentFile() const;

protected:
    FileProtocol(std::string name, std::string defaultFileName);

    void ApplyOptions(const OptionTable& options) override;
    void BuildOptions(ConnectionsBuilder& builder) const override;
    void ValidateOptions() const override;

    void InternalConnect() override;
    void InternalDisconnect() override;
    void InternalWritePacket(const PacketPtr& packet) override;

    virtual Formatter& GetFormatter() { return m_formatter; }

    /**
     * @brief Write the file header when the file is empty
     * @brief 在文件为空时写入文件头
     *
     * @return File size after the header / 写入文件头后的文件大小
     */
    virtual uint64_t WriteHeader(OutputStream& stream, uint64_t size);

    virtual bool SupportsEncryption() const noexcept { return true; }

private:
    bool IsRotating() const noexcept {
        return m_rotate != FileRotate::NoRotate || m_maxSize > 0;
    }

    int64_t Now() const { return m_clock ? m_clock() : internal::GetMicrosecondTimestamp(); }

    void Open(bool append);
    void Rotate();
    std::unique_ptr<OutputStream> WrapStream(std::unique_ptr<FileOutputStream> file);

    std::string m_defaultFileName;
    Clock m_clock;

    // Options / 选项
    std::string m_fileName;
    bool m_append{false};
    int64_t m_bufferSize{0};
    FileRotate m_rotate{FileRotate::NoRotate};
    int64_t m_maxSize{0};
    int64_t m_maxParts{0};
    bool m_encrypt{false};
    std::vector<uint8_t> m_key;

    // Runtime / 运行时
    BinaryFormatter m_formatter;
    FileRotater m_rotater;
    std::unique_ptr<OutputStream> m_stream;
    std::string m_currentFile;
    uint64_t m_fileSize{0};
    uint64_t m_unflushed{0};
    mutable std::mutex m_fileMutex;
};

}  // namespace silink
