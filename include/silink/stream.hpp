/**
 * @file stream.hpp
 * @brief Byte output streams used by formatters and protocols
 * @brief 格式化器和协议使用的字节输出流
 *
 * - OutputStream: Base class for all byte streams
 * - MemoryOutputStream: Growable in-memory buffer
 * - StdOutputStream: Adapter over a std::ostream
 * - FileOutputStream: stdio file with optional write buffer
 *
 * All streams throw silink::Error on failure.
 * 所有流在失败时抛出 silink::Error。
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace silink {

// ==============================================================================
// OutputStream Base Class / 输出流基类
// ==============================================================================

/**
 * @brief Base class for byte output streams
 * @brief 字节输出流基类
 */
class OutputStream {
public:
    virtual ~OutputStream() = default;

    virtual void Write(const uint8_t* data, size_t size) = 0;
    virtual void Flush() = 0;
    virtual void Close() = 0;

    void Write(std::string_view text) {
        Write(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }

    void Write(const std::vector<uint8_t>& bytes) { Write(bytes.data(), bytes.size()); }
};

// ==============================================================================
// MemoryOutputStream / 内存输出流
// ==============================================================================

class MemoryOutputStream : public OutputStream {
public:
    void Write(const uint8_t* data, size_t size) override {
        m_buffer.insert(m_buffer.end(), data, data + size);
    }
    using OutputStream::Write;

    void Flush() override {}
    void Close() override {}

    const std::vector<uint8_t>& Data() const noexcept { return m_buffer; }
    size_t Size() const noexcept { return m_buffer.size(); }
    void Clear() noexcept { m_buffer.clear(); }

private:
    std::vector<uint8_t> m_buffer;
};

// ==============================================================================
// StdOutputStream / 标准流适配器
// ==============================================================================

/**
 * @brief Adapter writing into a caller-owned std::ostream
 * @brief 写入调用方拥有的 std::ostream 的适配器
 */
class StdOutputStream : public OutputStream {
public:
    explicit StdOutputStream(std::ostream& stream) : m_stream(stream) {}

    void Write(const uint8_t* data, size_t size) override;
    using OutputStream::Write;

    void Flush() override;
    void Close() override { Flush(); }

private:
    std::ostream& m_stream;
};

// ==============================================================================
// FileOutputStream / 文件输出流
// ==============================================================================

/**
 * @brief stdio-backed file stream
 * @brief 基于 stdio 的文件流
 *
 * bufferSize > 0 installs a full buffer of that size, otherwise the stdio default is kept.
 * bufferSize > 0 时安装该大小的完全缓冲，否则保持 stdio 默认值。
 */
class FileOutputStream : public OutputStream {
public:
    FileOutputStream(const std::string& path, bool append, size_t bufferSize = 0);
    ~FileOutputStream() override;

    FileOutputStream(const FileOutputStream&) = delete;
    FileOutputStream& operator=(const FileOutputStream&) = delete;

    void Write(const uint8_t* data, size_t size) override;
    using OutputStream::Write;

    void Flush() override;
    void Close() override;

    /// Current file size including unflushed bytes / 当前文件大小（含未刷新字节）
    uint64_t Size() const noexcept { return m_size; }
    const std::string& Path() const noexcept { return m_path; }

private:
    std::string m_path;
    std::FILE* m_file{nullptr};
    std::vector<char> m_buffer;
    uint64_t m_size{0};
};

}  // namespace silink
