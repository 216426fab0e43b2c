/**
 * @file crypto_stream.cpp
 * @brief OpenSSL EVP based encryption implementation
 * @brief 基于 OpenSSL EVP 的加密实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/crypto_stream.hpp"

#include <algorithm>
#include <string>

#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/evp.h>

#include "silink/error.hpp"
#include "silink/formatter.hpp"
#include "silink/internal/platform.hpp"

namespace silink {

namespace {

constexpr int64_t kTicksPerMicrosecond = 10;
constexpr int64_t kTicksAtUnixEpoch = 621355968000000000LL;  ///< 0001-01-01 to 1970-01-01

std::string OpenSslError(const char* operation) {
    const unsigned long err = ERR_get_error();
    if (err == 0) {
        return fmt::format("{} failed", operation);
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return fmt::format("{} failed: {}", operation, buf);
}

std::vector<uint8_t> RunCipher(const CipherKey& key, const CipherIv& iv,
                               const std::vector<uint8_t>& input, bool encrypt) {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw Error(ErrorCode::CryptoInitFailed, OpenSslError("EVP_CIPHER_CTX_new"));
    }
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key.data(), iv.data(),
                          encrypt ? 1 : 0) != 1) {
        throw Error(ErrorCode::CryptoInitFailed, OpenSslError("EVP_CipherInit_ex"));
    }

    std::vector<uint8_t> output(input.size() + kCipherBlockSize);
    int len = 0;
    if (!input.empty() && EVP_CipherUpdate(ctx.get(), output.data(), &len, input.data(),
                                           static_cast<int>(input.size())) != 1) {
        throw Error(ErrorCode::CryptoUpdateFailed, OpenSslError("EVP_CipherUpdate"));
    }
    int total = len;
    if (EVP_CipherFinal_ex(ctx.get(), output.data() + total, &len) != 1) {
        throw Error(ErrorCode::CryptoFinalFailed, OpenSslError("EVP_CipherFinal_ex"));
    }
    total += len;
    output.resize(static_cast<size_t>(total));
    return output;
}

}  // namespace

std::array<uint8_t, 16> Md5Digest(const void* data, size_t size) {
    std::array<uint8_t, 16> digest{};
    unsigned int len = 0;
    if (EVP_Digest(data, size, digest.data(), &len, EVP_md5(), nullptr) != 1 ||
        len != digest.size()) {
        throw Error(ErrorCode::CryptoInitFailed, OpenSslError("EVP_Digest(EVP_md5)"));
    }
    return digest;
}

CipherIv MakeTimeSeededIv() {
    const int64_t ticks =
        internal::GetMicrosecondTimestamp() * kTicksPerMicrosecond + kTicksAtUnixEpoch;
    const std::string text = fmt::format("{}", ticks);
    return Md5Digest(text.data(), text.size());
}

void CipherCtxDeleter::operator()(evp_cipher_ctx_st* ctx) const noexcept {
    EVP_CIPHER_CTX_free(ctx);
}

// ==============================================================================
// CryptoOutputStream / 加密输出流
// ==============================================================================

CryptoOutputStream::CryptoOutputStream(std::unique_ptr<OutputStream> inner, const CipherKey& key,
                                       const CipherIv& iv)
    : m_inner(std::move(inner)), m_ctx(EVP_CIPHER_CTX_new()) {
    if (!m_ctx) {
        throw Error(ErrorCode::CryptoInitFailed, OpenSslError("EVP_CIPHER_CTX_new"));
    }
    if (EVP_EncryptInit_ex(m_ctx.get(), EVP_aes_128_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw Error(ErrorCode::CryptoInitFailed, OpenSslError("EVP_EncryptInit_ex"));
    }
}

void CryptoOutputStream::Write(const uint8_t* data, size_t size) {
    if (m_closed) {
        throw Error(ErrorCode::FileWriteFailed, "Write to closed encrypted stream");
    }
    if (size == 0) {
        return;
    }
    m_out.resize(size + kCipherBlockSize);
    int len = 0;
    if (EVP_EncryptUpdate(m_ctx.get(), m_out.data(), &len, data, static_cast<int>(size)) != 1) {
        throw Error(ErrorCode::CryptoUpdateFailed, OpenSslError("EVP_EncryptUpdate"));
    }
    if (len > 0) {
        m_inner->Write(m_out.data(), static_cast<size_t>(len));
    }
}

void CryptoOutputStream::Flush() {
    if (!m_closed) {
        m_inner->Flush();
    }
}

void CryptoOutputStream::Close() {
    if (m_closed) {
        return;
    }
    m_closed = true;
    uint8_t last[kCipherBlockSize];
    int len = 0;
    if (EVP_EncryptFinal_ex(m_ctx.get(), last, &len) != 1) {
        m_inner->Close();
        throw Error(ErrorCode::CryptoFinalFailed, OpenSslError("EVP_EncryptFinal_ex"));
    }
    if (len > 0) {
        m_inner->Write(last, static_cast<size_t>(len));
    }
    m_inner->Flush();
    m_inner->Close();
}

// ==============================================================================
// One-shot helpers / 一次性辅助函数
// ==============================================================================

std::vector<uint8_t> AesCbcEncrypt(const CipherKey& key, const CipherIv& iv,
                                   const std::vector<uint8_t>& plaintext) {
    return RunCipher(key, iv, plaintext, true);
}

std::vector<uint8_t> AesCbcDecrypt(const CipherKey& key, const CipherIv& iv,
                                   const std::vector<uint8_t>& ciphertext) {
    return RunCipher(key, iv, ciphertext, false);
}

std::vector<uint8_t> DecryptLogFile(const std::vector<uint8_t>& file, const CipherKey& key) {
    const size_t headerSize = kEncryptedEyeCatcher.size() + kCipherBlockSize;
    if (file.size() < headerSize ||
        std::string_view(reinterpret_cast<const char*>(file.data()), kEncryptedEyeCatcher.size()) !=
            kEncryptedEyeCatcher) {
        throw Error(ErrorCode::InvalidArgument, "Not an encrypted log file");
    }
    CipherIv iv{};
    std::copy(file.begin() + kEncryptedEyeCatcher.size(), file.begin() + headerSize, iv.begin());
    const std::vector<uint8_t> ciphertext(file.begin() + headerSize, file.end());
    return AesCbcDecrypt(key, iv, ciphertext);
}

}  // namespace silink
