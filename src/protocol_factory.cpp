/**
 * @file protocol_factory.cpp
 * @brief Protocol factory implementation
 * @brief 协议工厂实现
 *
 * @copyright Copyright (c) 2024 silink
 */

#include "silink/protocol_factory.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>

#include <fmt/format.h>

#include "silink/file_protocol.hpp"
#include "silink/memory_protocol.hpp"
#include "silink/socket_protocol.hpp"
#include "silink/text_protocol.hpp"

namespace silink {

namespace {

std::string NormalizeName(std::string_view name) {
    const size_t begin = name.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const size_t end = name.find_last_not_of(" \t\r\n");
    std::string result(name.substr(begin, end - begin + 1));
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

struct Registry {
    std::mutex mutex;
    std::map<std::string, ProtocolFactory::Creator> creators;

    Registry() {
        creators["tcp"] = [] { return std::make_shared<TcpProtocol>(); };
        creators["pipe"] = [] { return std::make_shared<PipeProtocol>(); };
        creators["file"] = [] { return std::make_shared<FileProtocol>(); };
        creators["text"] = [] { return std::make_shared<TextProtocol>(); };
        creators["mem"] = [] { return std::make_shared<MemoryProtocol>(); };
    }
};

Registry& GetRegistry() {
    static Registry registry;
    return registry;
}

}  // namespace

std::shared_ptr<Protocol> ProtocolFactory::Create(std::string_view name, std::string_view options) {
    const std::string key = NormalizeName(name);
    Creator creator;
    {
        Registry& registry = GetRegistry();
        std::lock_guard<std::mutex> lock(registry.mutex);
        auto it = registry.creators.find(key);
        if (it != registry.creators.end()) {
            creator = it->second;
        }
    }
    if (!creator) {
        throw Error(ErrorCode::ConfigUnknownProtocol,
                    fmt::format("The requested protocol is unknown: \"{}\"", key));
    }

    std::shared_ptr<Protocol> protocol = creator();
    if (!protocol) {
        throw Error(ErrorCode::InternalError,
                    fmt::format("Protocol creator for \"{}\" returned nothing", key));
    }
    protocol->Initialize(options);
    return protocol;
}

void ProtocolFactory::Register(std::string_view name, Creator creator) {
    const std::string key = NormalizeName(name);
    if (key.empty() || !creator) {
        throw Error(ErrorCode::InvalidArgument, "Protocol name and creator are required");
    }
    Registry& registry = GetRegistry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    registry.creators[key] = std::move(creator);
}

bool ProtocolFactory::IsRegistered(std::string_view name) {
    const std::string key = NormalizeName(name);
    Registry& registry = GetRegistry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    return registry.creators.count(key) != 0;
}

std::vector<std::string> ProtocolFactory::Names() {
    Registry& registry = GetRegistry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    std::vector<std::string> names;
    names.reserve(registry.creators.size());
    for (const auto& entry : registry.creators) {
        names.push_back(entry.first);
    }
    return names;
}

}  // namespace silink
