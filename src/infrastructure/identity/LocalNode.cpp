#include "infrastructure/identity/LocalNode.hpp"

#include "core/Version.hpp"
#include "core/types/Uuid.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace signfleet::infra {

LocalNode::LocalNode(const std::filesystem::path& configDir, std::string addressOverride,
                     uint16_t managementPort, InterfaceSource interfaces)
    : addressOverride_(std::move(addressOverride)), managementPort_(managementPort),
      interfaces_(std::move(interfaces)) {
    std::error_code ec;
    std::filesystem::create_directories(configDir, ec);
    id_ = loadOrCreateId(configDir / IdentityFile);
    spdlog::info("Node id {} ({})", id_, address());
}

std::string LocalNode::loadOrCreateId(const std::filesystem::path& file) {
    {
        std::ifstream in(file);
        std::string existing;
        if (in && std::getline(in, existing) && core::isUuid(existing)) {
            return existing;
        }
    }

    auto id = core::generateUuid();
    std::ofstream out(file, std::ios::trunc);
    if (!out || !(out << id << "\n")) {
        throw std::runtime_error("Cannot write node identity to " + file.string());
    }
    spdlog::info("Generated new node id {}", id);
    return id;
}

std::string LocalNode::hostname() const {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "";
    }
    return buffer;
}

std::string LocalNode::address() const {
    if (!addressOverride_.empty()) {
        return addressOverride_;
    }
    for (const auto& iface : interfaces_()) {
        if (iface.isUp && !iface.isLoopback && core::isValidIpv4(iface.ipAddress)) {
            return iface.ipAddress;
        }
    }
    return "127.0.0.1";
}

core::Host LocalNode::describe() const {
    auto host = core::Host::withDefaults(address(), managementPort_);
    host.id = id_;
    host.hostname = hostname();
    host.nickname = host.hostname;
    host.primary.serviceVersion = core::Version;
    return host;
}

} // namespace signfleet::infra
