/**
 * @file text_protocol.cpp
 * @brief Text file transport implementation
 * @brief 文本文件传输实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/text_protocol.hpp"

namespace silink {

TextProtocol::TextProtocol() : FileProtocol("text", "log.txt") {}

TextProtocol::~TextProtocol() {
    Dispose();
}

bool TextProtocol::IsValidOption(std::string_view name) const {
    return name == "pattern" || name == "indent" || FileProtocol::IsValidOption(name);
}

void TextProtocol::ApplyOptions(const OptionTable& options) {
    FileProtocol::ApplyOptions(options);
    m_textFormatter.SetPattern(options.GetString("pattern", kDefaultTextPattern));
    m_textFormatter.SetIndent(options.GetBoolean("indent", false));
}

void TextProtocol::BuildOptions(ConnectionsBuilder& builder) const {
    FileProtocol::BuildOptions(builder);
    builder.AddOption("indent", m_textFormatter.Indent());
    builder.AddOption("pattern", m_textFormatter.Pattern());
}

uint64_t TextProtocol::WriteHeader(OutputStream& stream, uint64_t size) {
    if (size != 0) {
        return size;
    }
    stream.Write(kTextFileBom);
    return kTextFileBom.size();
}

}  // namespace silink
