/**
 * @file packet.cpp
 * @brief Packet enumeration names
 * @brief 数据包枚举名称
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/packet.hpp"

namespace silink {

std::string_view LogEntryTypeToString(LogEntryType type) noexcept {
    switch (type) {
        case LogEntryType::Separator: return "Separator";
        case LogEntryType::EnterMethod: return "EnterMethod";
        case LogEntryType::LeaveMethod: return "LeaveMethod";
        case LogEntryType::ResetCallstack: return "ResetCallstack";
        case LogEntryType::Message: return "Message";
        case LogEntryType::Warning: return "Warning";
        case LogEntryType::Error: return "Error";
        case LogEntryType::InternalError: return "InternalError";
        case LogEntryType::Comment: return "Comment";
        case LogEntryType::VariableValue: return "VariableValue";
        case LogEntryType::Checkpoint: return "Checkpoint";
        case LogEntryType::Debug: return "Debug";
        case LogEntryType::Verbose: return "Verbose";
        case LogEntryType::Fatal: return "Fatal";
        case LogEntryType::Conditional: return "Conditional";
        case LogEntryType::Assert: return "Assert";
        case LogEntryType::Text: return "Text";
        case LogEntryType::Binary: return "Binary";
        case LogEntryType::Graphic: return "Graphic";
        case LogEntryType::Source: return "Source";
        case LogEntryType::Object: return "Object";
        case LogEntryType::WebContent: return "WebContent";
        case LogEntryType::System: return "System";
        case LogEntryType::MemoryStatistic: return "MemoryStatistic";
        case LogEntryType::DatabaseResult: return "DatabaseResult";
        case LogEntryType::DatabaseStructure: return "DatabaseStructure";
        default: return "Unknown";
    }
}

std::string_view ViewerIdToString(ViewerId id) noexcept {
    switch (id) {
        case ViewerId::NoViewer: return "NoViewer";
        case ViewerId::Title: return "Title";
        case ViewerId::Data: return "Data";
        case ViewerId::List: return "List";
        case ViewerId::ValueList: return "ValueList";
        case ViewerId::Inspector: return "Inspector";
        case ViewerId::Table: return "Table";
        case ViewerId::Web: return "Web";
        case ViewerId::Binary: return "Binary";
        case ViewerId::HtmlSource: return "HtmlSource";
        case ViewerId::JavaScriptSource: return "JavaScriptSource";
        case ViewerId::VbScriptSource: return "VbScriptSource";
        case ViewerId::PerlSource: return "PerlSource";
        case ViewerId::SqlSource: return "SqlSource";
        case ViewerId::IniSource: return "IniSource";
        case ViewerId::PythonSource: return "PythonSource";
        case ViewerId::XmlSource: return "XmlSource";
        case ViewerId::Bitmap: return "Bitmap";
        case ViewerId::Jpeg: return "Jpeg";
        case ViewerId::Icon: return "Icon";
        case ViewerId::Metafile: return "Metafile";
        case ViewerId::Png: return "Png";
        default: return "Unknown";
    }
}

}  // namespace silink
