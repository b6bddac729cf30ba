#pragma once

#include "core/types/Host.hpp"
#include "core/types/NetworkInterface.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace signfleet::infra {

/**
 * @brief Identity of the node this process runs on.
 *
 * The node id is generated once and persisted in the configuration
 * directory so it survives restarts and address changes.
 */
class LocalNode {
public:
    using InterfaceSource = std::function<std::vector<core::NetworkInterface>()>;

    static constexpr const char* IdentityFile = "identity.id";

    /**
     * @brief Loads or creates the node identity.
     * @param configDir Directory holding identity.id.
     * @param addressOverride Address to report instead of the detected one.
     * @param managementPort Port peers reach this node on.
     * @param interfaces Source of local interfaces for address detection.
     * @throws std::runtime_error if the identity file cannot be written.
     */
    LocalNode(const std::filesystem::path& configDir, std::string addressOverride,
              uint16_t managementPort,
              InterfaceSource interfaces = &core::NetworkInterfaceEnumerator::scannable);

    const std::string& id() const { return id_; }
    uint16_t managementPort() const { return managementPort_; }

    /**
     * @brief Returns the system host name.
     */
    std::string hostname() const;

    /**
     * @brief Returns the address peers should use for this node.
     *
     * The override when set, otherwise the first up, non-loopback IPv4
     * interface address, otherwise 127.0.0.1. Re-evaluated on every call
     * so DHCP changes are picked up.
     */
    std::string address() const;

    /**
     * @brief Builds this node's own host record.
     *
     * The record has never been probed; callers merge in stored state.
     */
    core::Host describe() const;

    /**
     * @brief Reads the id file, creating it with a fresh UUID if missing or invalid.
     */
    static std::string loadOrCreateId(const std::filesystem::path& file);

private:
    std::string id_;
    std::string addressOverride_;
    uint16_t managementPort_;
    InterfaceSource interfaces_;
};

} // namespace signfleet::infra
