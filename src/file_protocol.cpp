/**
 * @file file_protocol.cpp
 * @brief File transport implementation
 * @brief 文件传输实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/file_protocol.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "silink/crypto_stream.hpp"
#include "silink/internal/file_helper.hpp"

namespace silink {

namespace {

constexpr std::string_view kFileOptions[] = {"filename", "append",  "buffer", "rotate",
                                             "maxsize",  "maxparts"};
constexpr std::string_view kEncryptionOptions[] = {"encrypt", "key"};

}  // namespace

FileProtocol::FileProtocol() : FileProtocol("file", "log.sil") {}

FileProtocol::FileProtocol(std::string name, std::string defaultFileName)
    : Protocol(std::move(name)),
      m_defaultFileName(std::move(defaultFileName)),
      m_fileName(m_defaultFileName) {}

FileProtocol::~FileProtocol() {
    Dispose();
}

void FileProtocol::SetClock(Clock clock) {
    m_clock = std::move(clock);
}

std::string FileProtocol::CurrentFile() const {
    std::lock_guard<std::mutex> lock(m_fileMutex);
    return m_currentFile;
}

// ==============================================================================
// Options / 选项
// ==============================================================================

bool FileProtocol::IsValidOption(std::string_view name) const {
    for (const auto& option : kFileOptions) {
        if (option == name) {
            return true;
        }
    }
    if (SupportsEncryption()) {
        for (const auto& option : kEncryptionOptions) {
            if (option == name) {
                return true;
            }
        }
    }
    return Protocol::IsValidOption(name);
}

void FileProtocol::ApplyOptions(const OptionTable& options) {
    Protocol::ApplyOptions(options);

    m_fileName = options.GetString("filename", m_defaultFileName);
    m_append = options.GetBoolean("append", false);
    m_bufferSize = options.GetSize("buffer", 0);
    m_rotate = options.GetRotate("rotate", FileRotate::NoRotate);
    m_maxSize = options.GetSize("maxsize", 0);
    m_maxParts = options.GetInteger("maxparts", m_maxSize > 0 ? 2 : 0);

    if (SupportsEncryption()) {
        m_encrypt = options.GetBoolean("encrypt", false);
        m_key = options.GetBytes("key");
    }
    if (m_encrypt) {
        m_append = false;  // Cannot append to a cipher stream / 无法追加到密文流
    }
    m_rotater.SetMode(m_rotate);
}

void FileProtocol::BuildOptions(ConnectionsBuilder& builder) const {
    Protocol::BuildOptions(builder);
    builder.AddOption("filename", m_fileName);
    builder.AddOption("append", m_append);
    builder.AddSizeOption("buffer", m_bufferSize);
    builder.AddOption("rotate", m_rotate);
    builder.AddSizeOption("maxsize", m_maxSize);
    builder.AddOption("maxparts", m_maxParts);
    if (SupportsEncryption()) {
        // The key is never echoed into option strings / 密钥不会写入选项字符串
        builder.AddOption("encrypt", m_encrypt);
    }
}

void FileProtocol::ValidateOptions() const {
    if (!m_encrypt) {
        return;
    }
    if (m_key.empty()) {
        throw Error(ErrorCode::ConfigMissingRequired, "No encryption key!");
    }
    if (m_key.size() != kCipherKeySize) {
        throw Error(ErrorCode::ConfigInvalidValue, "Invalid encryption key size!");
    }
}

// ==============================================================================
// Connection / 连接
// ==============================================================================

void FileProtocol::InternalConnect() {
    Open(m_append);
}

void FileProtocol::InternalDisconnect() {
    std::unique_ptr<OutputStream> stream = std::move(m_stream);
    {
        std::lock_guard<std::mutex> lock(m_fileMutex);
        m_currentFile.clear();
    }
    m_fileSize = 0;
    m_unflushed = 0;
    if (stream) {
        stream->Close();
    }
}

void FileProtocol::Open(bool append) {
    const std::string baseName = internal::ExpandFileName(m_fileName, AppName(), HostName());
    const int64_t now = Now();
    const std::string path =
        IsRotating() ? internal::GetFileName(baseName, append, now) : baseName;

    internal::CreateParentDirectories(path);
    auto file = std::make_unique<FileOutputStream>(path, append,
                                                   static_cast<size_t>(std::max<int64_t>(m_bufferSize, 0)));
    const uint64_t existing = file->Size();
    m_stream = WrapStream(std::move(file));
    m_fileSize = WriteHeader(*m_stream, m_encrypt ? 0 : existing);
    m_stream->Flush();
    m_unflushed = 0;

    {
        std::lock_guard<std::mutex> lock(m_fileMutex);
        m_currentFile = path;
    }

    if (m_rotate != FileRotate::NoRotate) {
        // Start from the period of the file being appended / 以被追加文件的周期为起点
        int64_t fileDate = now;
        if (!internal::TryGetFileDate(baseName, path, fileDate)) {
            fileDate = now;
        }
        m_rotater.Initialize(fileDate);
    }

    if (m_maxParts > 0) {
        const size_t removed = internal::DeleteOldFiles(baseName, m_maxParts);
        if (removed > 0) {
            Log().debug("{} protocol: removed {} old log file(s) of {}", Caption(), removed,
                        baseName);
        }
    }
}

std::unique_ptr<OutputStream> FileProtocol::WrapStream(std::unique_ptr<FileOutputStream> file) {
    if (!m_encrypt) {
        return file;
    }
    if (m_key.size() != kCipherKeySize) {
        throw Error(ErrorCode::ConfigInvalidValue, "Invalid encryption key size!");
    }
    CipherKey key{};
    std::copy_n(m_key.begin(), kCipherKeySize, key.begin());
    const CipherIv iv = MakeTimeSeededIv();

    file->Write(kEncryptedEyeCatcher);
    file->Write(iv.data(), iv.size());
    return std::make_unique<CryptoOutputStream>(std::move(file), key, iv);
}

uint64_t FileProtocol::WriteHeader(OutputStream& stream, uint64_t size) {
    if (size != 0) {
        return size;
    }
    stream.Write(kPlainEyeCatcher);
    return kPlainEyeCatcher.size();
}

void FileProtocol::Rotate() {
    InternalDisconnect();
    Open(false);
    Log().debug("{} protocol: rotated to {}", Caption(), CurrentFile());
}

// ==============================================================================
// Writing / 写入
// ==============================================================================

void FileProtocol::InternalWritePacket(const PacketPtr& packet) {
    Formatter& formatter = GetFormatter();
    const size_t packetSize = formatter.Compile(*packet);
    if (packetSize == 0) {
        return;
    }

    if (m_rotate != FileRotate::NoRotate && m_rotater.Update(Now())) {
        Rotate();
    }

    if (m_maxSize > 0) {
        m_fileSize += packetSize;
        if (m_fileSize > static_cast<uint64_t>(m_maxSize)) {
            Rotate();
            if (packetSize > static_cast<uint64_t>(m_maxSize)) {
                return;  // Would never fit / 永远放不下
            }
            m_fileSize += packetSize;
        }
    }

    formatter.Write(*m_stream);

    if (m_bufferSize > 0) {
        m_unflushed += packetSize;
        if (m_unflushed > static_cast<uint64_t>(m_bufferSize)) {
            m_stream->Flush();
            m_unflushed = 0;
        }
    } else {
        m_stream->Flush();
    }
}

}  // namespace silink
