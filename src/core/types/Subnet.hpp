#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace signfleet::core {

/**
 * @brief An IPv4 network: network address plus prefix length.
 */
class Subnet {
public:
    /// Prefixes shorter than this are narrowed to the surrounding /24.
    static constexpr int MinScanPrefix = 23;

    Subnet(uint32_t network, int prefixLength);

    /**
     * @brief Builds the network containing an address.
     * @param address Dotted-quad IPv4 address.
     * @param prefixLength Prefix length, 0..32.
     * @throws InvalidAddressError if the address is malformed.
     * @throws std::invalid_argument if the prefix is out of range.
     */
    static Subnet containing(const std::string& address, int prefixLength);

    /**
     * @brief Builds the range a discovery pass scans around an interface address.
     *
     * Same as containing(), except that networks wider than a /23 are
     * clamped to the /24 holding the address.
     */
    static Subnet scanRange(const std::string& address, int prefixLength);

    /**
     * @brief Lists usable host addresses in ascending order.
     *
     * Network and broadcast addresses are never included.
     *
     * @param exclude Address to leave out (normally the scanning host's own).
     */
    [[nodiscard]] std::vector<std::string> hosts(const std::string& exclude = {}) const;

    [[nodiscard]] bool contains(const std::string& address) const;

    [[nodiscard]] std::string networkAddress() const;
    [[nodiscard]] std::string broadcastAddress() const;
    [[nodiscard]] int prefixLength() const { return prefixLength_; }

    /// Number of usable host addresses (excludes network and broadcast).
    [[nodiscard]] uint32_t hostCount() const;

    /// CIDR notation, e.g. "192.168.1.0/24".
    [[nodiscard]] std::string toString() const;

    static uint32_t parseAddress(const std::string& address);
    static std::string formatAddress(uint32_t address);

    bool operator==(const Subnet& other) const = default;

private:
    uint32_t mask() const;

    uint32_t network_;
    int prefixLength_;
};

} // namespace signfleet::core
