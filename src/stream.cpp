/**
 * @file stream.cpp
 * @brief Byte output stream implementations
 * @brief 字节输出流实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/stream.hpp"

#include <cerrno>
#include <cstring>

#include <fmt/format.h>

#include "silink/error.hpp"

namespace silink {

// ==============================================================================
// StdOutputStream / 标准流适配器
// ==============================================================================

void StdOutputStream::Write(const uint8_t* data, size_t size) {
    m_stream.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (m_stream.fail()) {
        throw Error(ErrorCode::FileWriteFailed, "Write to output stream failed");
    }
}

void StdOutputStream::Flush() {
    m_stream.flush();
    if (m_stream.fail()) {
        throw Error(ErrorCode::FileFlushFailed, "Flush of output stream failed");
    }
}

// ==============================================================================
// FileOutputStream / 文件输出流
// ==============================================================================

FileOutputStream::FileOutputStream(const std::string& path, bool append, size_t bufferSize)
    : m_path(path) {
    m_file = std::fopen(path.c_str(), append ? "ab" : "wb");
    if (m_file == nullptr) {
        throw Error(ErrorCode::FileOpenFailed,
                    fmt::format("Failed to open file: {} ({})", path, std::strerror(errno)));
    }
    if (bufferSize > 0) {
        m_buffer.resize(bufferSize);
        std::setvbuf(m_file, m_buffer.data(), _IOFBF, m_buffer.size());
    }
    if (append) {
        std::fseek(m_file, 0, SEEK_END);
        const long position = std::ftell(m_file);
        m_size = position > 0 ? static_cast<uint64_t>(position) : 0;
    }
}

FileOutputStream::~FileOutputStream() {
    if (m_file != nullptr) {
        std::fclose(m_file);
        m_file = nullptr;
    }
}

void FileOutputStream::Write(const uint8_t* data, size_t size) {
    if (m_file == nullptr) {
        throw Error(ErrorCode::FileWriteFailed, fmt::format("File not open: {}", m_path));
    }
    if (size == 0) {
        return;
    }
    if (std::fwrite(data, 1, size, m_file) != size) {
        throw Error(ErrorCode::FileWriteFailed,
                    fmt::format("Write failed: {} ({})", m_path, std::strerror(errno)));
    }
    m_size += size;
}

void FileOutputStream::Flush() {
    if (m_file != nullptr && std::fflush(m_file) != 0) {
        throw Error(ErrorCode::FileFlushFailed,
                    fmt::format("Flush failed: {} ({})", m_path, std::strerror(errno)));
    }
}

void FileOutputStream::Close() {
    if (m_file == nullptr) {
        return;
    }
    std::FILE* file = m_file;
    m_file = nullptr;
    if (std::fclose(file) != 0) {
        throw Error(ErrorCode::FileCloseFailed,
                    fmt::format("Close failed: {} ({})", m_path, std::strerror(errno)));
    }
}

}  // namespace silink
