/**
 * @file Host.hpp
 * @brief Host record and status types for the fleet roster.
 *
 * This file defines the Host structure which represents one managed signage
 * node, the per-network probe state it carries for its primary and VPN
 * address, and the status enumerations the prober writes.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace signfleet::core {

/**
 * @brief Operational status of a host on one network path.
 */
enum class HostStatus : int {
    Unknown = 0,           ///< Never probed
    Healthy = 1,           ///< Management service answered its health check
    Unhealthy = 2,         ///< TCP reachable but the service check failed
    ConnectionRefused = 3, ///< Host is up but the management port is closed
    Unreachable = 4,       ///< No route, no name resolution or dial timeout
    Stale = 5              ///< Reachable but running an older service version
};

/**
 * @brief Status of the content-management agent running on a host.
 */
enum class CmsStatus : int {
    Unknown = 0, ///< CMS was not probed (host unreachable)
    Online = 1,  ///< CMS asset endpoint answered with 200
    Offline = 2  ///< CMS asset endpoint failed or answered non-200
};

/**
 * @brief Converts a HostStatus to its wire string.
 * @param status The status to convert.
 * @return String representation (e.g., "Healthy", "Connection Refused").
 */
std::string hostStatusToString(HostStatus status);

/**
 * @brief Parses a wire string into a HostStatus.
 * @param str The string to parse.
 * @return The matching status, or HostStatus::Unknown for unrecognised text.
 */
HostStatus hostStatusFromString(const std::string& str);

/**
 * @brief Converts a CmsStatus to its wire string.
 * @param status The status to convert.
 * @return "Online", "Offline" or "Unknown".
 */
std::string cmsStatusToString(CmsStatus status);

/**
 * @brief Parses a wire string into a CmsStatus.
 * @param str The string to parse.
 * @return The matching status, or CmsStatus::Unknown for unrecognised text.
 */
CmsStatus cmsStatusFromString(const std::string& str);

/**
 * @brief Probe outcome for a single network path of a host.
 *
 * A host carries one of these for its primary address and one for its VPN
 * address. Only the prober writes these fields.
 */
struct NetworkState {
    HostStatus status{HostStatus::Unreachable};  ///< Result of the last probe
    std::string serviceStatus{"NSM Offline"};    ///< Management service status text
    std::string serviceVersion{"unknown"};       ///< Management service version
    std::string anthiasVersion;                  ///< CMS player version
    std::string anthiasStatus;                   ///< CMS player status text
    CmsStatus cmsStatus{CmsStatus::Unknown};     ///< CMS availability
    int assetCount{0};                           ///< Number of assets scheduled on the CMS
    std::string dashboardUrl;                    ///< URL of the node's dashboard
    std::optional<std::chrono::system_clock::time_point> lastChecked; ///< Last probe time

    bool operator==(const NetworkState& other) const = default;
};

/**
 * @brief One entry in the fleet roster.
 *
 * The id survives IP changes and is unique across the roster when non-empty.
 * The primary ip address is unique when non-empty.
 */
struct Host {
    std::string id;           ///< Stable opaque identifier
    std::string nickname;     ///< Operator-assigned display name
    std::string hostname;     ///< System hostname reported by the node
    std::string notes;        ///< Free-form operator notes
    std::string ipAddress;    ///< Primary IPv4 address
    std::string vpnIpAddress; ///< Optional secondary (VPN) IPv4 address
    NetworkState primary;     ///< Probe state for ipAddress
    NetworkState vpn;         ///< Probe state for vpnIpAddress

    /**
     * @brief Validates the host addresses.
     * @return True if ipAddress is a valid IPv4 address and vpnIpAddress is
     *         either empty or a valid IPv4 address.
     */
    [[nodiscard]] bool isValid() const;

    /**
     * @brief Returns the key the roster uses to identify this record.
     * @return The id when non-empty, otherwise the primary address.
     */
    [[nodiscard]] const std::string& key() const { return id.empty() ? ipAddress : id; }

    /**
     * @brief Copies every probe-owned field from another record.
     *
     * Descriptive fields (nickname, hostname, notes), addresses and the id
     * are left untouched.
     *
     * @param other Record whose network state is copied.
     */
    void copyNetworkState(const Host& other);

    /**
     * @brief Creates a record with the defaults of a never-probed node.
     * @param ip Primary address of the node.
     * @param managementPort Port used to build the dashboard URL.
     * @return Host with status Unreachable and the dashboard URL set.
     */
    static Host withDefaults(const std::string& ip, uint16_t managementPort = 8080);

    bool operator==(const Host& other) const = default;
};

/**
 * @brief Checks whether a string is a dotted-quad IPv4 address.
 * @param address Text to check.
 * @return True for four decimal octets in the range 0-255.
 */
[[nodiscard]] bool isValidIpv4(const std::string& address);

/**
 * @brief Compares two dot-separated numeric version strings.
 *
 * Non-numeric parts compare as zero and missing parts are treated as zero,
 * so "1.2" equals "1.2.0". A leading "v" is ignored.
 *
 * @return Negative if a < b, zero if equal, positive if a > b.
 */
int compareVersions(const std::string& a, const std::string& b);

} // namespace signfleet::core
