/**
 * @file crypto_stream.hpp
 * @brief AES-128/CBC output stream and log file decryption helpers (OpenSSL EVP)
 * @brief AES-128/CBC 输出流与日志文件解密辅助函数（OpenSSL EVP）
 *
 * Encrypted log file layout / 加密日志文件布局:
 * +----------------------+
 * | "SILE" (4B)          |
 * | IV (16B)             |  Plain / 明文
 * +----------------------+
 * | AES-128-CBC(         |
 * |   "SILF" packets...) |  PKCS7 padded / PKCS7 填充
 * +----------------------+
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

#include "silink/stream.hpp"

struct evp_cipher_ctx_st;

namespace silink {

constexpr size_t kCipherKeySize = 16;    ///< AES-128 key size / AES-128 密钥长度
constexpr size_t kCipherBlockSize = 16;  ///< AES block and IV size / AES 块与 IV 长度

using CipherKey = std::array<uint8_t, kCipherKeySize>;
using CipherIv = std::array<uint8_t, kCipherBlockSize>;

/// Frees an OpenSSL cipher context / 释放 OpenSSL 加密上下文
struct CipherCtxDeleter {
    void operator()(evp_cipher_ctx_st* ctx) const noexcept;
};

using CipherCtxPtr = std::unique_ptr<evp_cipher_ctx_st, CipherCtxDeleter>;

/**
 * @brief MD5 digest of a buffer
 * @brief 缓冲区的 MD5 摘要
 */
std::array<uint8_t, 16> Md5Digest(const void* data, size_t size);

/**
 * @brief Time-seeded IV: MD5 of the current tick count as decimal text
 * @brief 基于时间的 IV：当前刻度数十进制文本的 MD5
 */
CipherIv MakeTimeSeededIv();

// ==============================================================================
// CryptoOutputStream / 加密输出流
// ==============================================================================

/**
 * @brief Encrypting stream wrapper
 * @brief 加密流包装器
 *
 * Bytes are encrypted as full blocks accumulate. Close() pads the last block (PKCS7),
 * writes it and closes the inner stream. Flush() only flushes whole blocks.
 *
 * 数据在凑满整块时加密。Close() 对最后一块做 PKCS7 填充、写出并关闭内部流。
 * Flush() 只刷新完整的块。
 */
class CryptoOutputStream : public OutputStream {
public:
    CryptoOutputStream(std::unique_ptr<OutputStream> inner, const CipherKey& key, const CipherIv& iv);
    ~CryptoOutputStream() override = default;

    CryptoOutputStream(const CryptoOutputStream&) = delete;
    CryptoOutputStream& operator=(const CryptoOutputStream&) = delete;

    void Write(const uint8_t* data, size_t size) override;
    using OutputStream::Write;

    void Flush() override;
    void Close() override;

    OutputStream& Inner() noexcept { return *m_inner; }

private:
    std::unique_ptr<OutputStream> m_inner;
    CipherCtxPtr m_ctx;
    std::vector<uint8_t> m_out;
    bool m_closed{false};
};

// ==============================================================================
// One-shot helpers / 一次性辅助函数
// ==============================================================================

std::vector<uint8_t> AesCbcEncrypt(const CipherKey& key, const CipherIv& iv,
                                   const std::vector<uint8_t>& plaintext);

/// @throws Error CryptoFinalFailed on bad padding / 填充错误时抛出
std::vector<uint8_t> AesCbcDecrypt(const CipherKey& key, const CipherIv& iv,
                                   const std::vector<uint8_t>& ciphertext);

/**
 * @brief Decrypt a "SILE" log file image into its plain "SILF" image
 * @brief 将 "SILE" 日志文件映像解密为明文 "SILF" 映像
 */
std::vector<uint8_t> DecryptLogFile(const std::vector<uint8_t>& file, const CipherKey& key);

}  // namespace silink
