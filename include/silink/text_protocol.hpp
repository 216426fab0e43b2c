/**
 * @file text_protocol.hpp
 * @brief Plain text log file transport
 * @brief 纯文本日志文件传输
 *
 * Accepts the file options except encrypt and key, plus / 接受除 encrypt 与 key 外的文件选项，以及:
 * - pattern (string, "[%timestamp%] %level%: %title%")
 * - indent  (bool, false)
 *
 * New files start with a UTF-8 BOM. / 新文件以 UTF-8 BOM 开头。
 *
 * @copyright Copyright (c) 2024 silink
 */

#pragma once

#include <string>

#include "silink/file_protocol.hpp"
#include "silink/text_formatter.hpp"

namespace silink {

constexpr std::string_view kTextFileBom = "\xEF\xBB\xBF";

class TextProtocol : public FileProtocol {
public:
    TextProtocol();
    ~TextProtocol() override;

    bool IsValidOption(std::string_view name) const override;

protected:
    void ApplyOptions(const OptionTable& options) override;
    void BuildOptions(ConnectionsBuilder& builder) const override;

    Formatter& GetFormatter() override { return m_textFormatter; }
    uint64_t WriteHeader(OutputStream& stream, uint64_t size) override;
    bool SupportsEncryption() const noexcept override { return false; }

private:
    TextFormatter m_textFormatter;
};

}  // namespace silink
