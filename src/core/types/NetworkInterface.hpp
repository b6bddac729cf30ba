/**
 * @file NetworkInterface.hpp
 * @brief Local IPv4 interface enumeration.
 */

#pragma once

#include <string>
#include <vector>

namespace signfleet::core {

/**
 * @brief One IPv4 address assigned to a local interface.
 *
 * An interface carrying several addresses is reported once per address.
 */
struct NetworkInterface {
    std::string name;       ///< System name of the interface (e.g., "eth0")
    std::string ipAddress;  ///< IPv4 address assigned to the interface
    std::string netmask;    ///< Dotted netmask (e.g., "255.255.255.0")
    int prefixLength{0};    ///< Netmask as a prefix length (e.g., 24)
    bool isUp{false};       ///< Whether the interface is currently up
    bool isLoopback{false}; ///< Whether this is a loopback interface

    /**
     * @brief Checks for an address in 169.254.0.0/16.
     */
    [[nodiscard]] bool isLinkLocal() const;

    bool operator==(const NetworkInterface& other) const = default;
};

/**
 * @brief Utility class for enumerating network interfaces.
 */
class NetworkInterfaceEnumerator {
public:
    /**
     * @brief Enumerates all IPv4 interface addresses on the system.
     * @return One entry per address, in system order.
     */
    static std::vector<NetworkInterface> enumerate();

    /**
     * @brief Returns the addresses a discovery pass should scan from.
     *
     * Keeps entries that are up, not loopback and not link-local.
     */
    static std::vector<NetworkInterface> scannable();

    /**
     * @brief Converts a dotted netmask to a prefix length.
     * @return Number of leading one bits, or -1 if the mask is not contiguous.
     */
    static int prefixFromNetmask(const std::string& netmask);
};

} // namespace signfleet::core
