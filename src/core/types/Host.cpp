#include "core/types/Host.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace signfleet::core {

std::string hostStatusToString(HostStatus status) {
    switch (status) {
    case HostStatus::Unknown:
        return "Unknown";
    case HostStatus::Healthy:
        return "Healthy";
    case HostStatus::Unhealthy:
        return "Unhealthy";
    case HostStatus::ConnectionRefused:
        return "Connection Refused";
    case HostStatus::Unreachable:
        return "Unreachable";
    case HostStatus::Stale:
        return "Stale";
    }
    return "Unknown";
}

HostStatus hostStatusFromString(const std::string& str) {
    if (str == "Healthy")
        return HostStatus::Healthy;
    if (str == "Unhealthy")
        return HostStatus::Unhealthy;
    if (str == "Connection Refused")
        return HostStatus::ConnectionRefused;
    if (str == "Unreachable")
        return HostStatus::Unreachable;
    if (str == "Stale")
        return HostStatus::Stale;
    return HostStatus::Unknown;
}

std::string cmsStatusToString(CmsStatus status) {
    switch (status) {
    case CmsStatus::Unknown:
        return "Unknown";
    case CmsStatus::Online:
        return "Online";
    case CmsStatus::Offline:
        return "Offline";
    }
    return "Unknown";
}

CmsStatus cmsStatusFromString(const std::string& str) {
    if (str == "Online")
        return CmsStatus::Online;
    if (str == "Offline")
        return CmsStatus::Offline;
    return CmsStatus::Unknown;
}

bool Host::isValid() const {
    return isValidIpv4(ipAddress) && (vpnIpAddress.empty() || isValidIpv4(vpnIpAddress));
}

void Host::copyNetworkState(const Host& other) {
    primary = other.primary;
    vpn = other.vpn;
}

Host Host::withDefaults(const std::string& ip, uint16_t managementPort) {
    Host host;
    host.ipAddress = ip;
    host.primary.dashboardUrl = "http://" + ip + ":" + std::to_string(managementPort);
    return host;
}

bool isValidIpv4(const std::string& address) {
    int octets = 0;
    size_t pos = 0;

    while (pos <= address.size()) {
        auto end = address.find('.', pos);
        if (end == std::string::npos) {
            end = address.size();
        }

        auto part = address.substr(pos, end - pos);
        if (part.empty() || part.size() > 3) {
            return false;
        }
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        if (std::stoi(part) > 255) {
            return false;
        }

        ++octets;
        pos = end + 1;
        if (end == address.size()) {
            break;
        }
    }

    return octets == 4;
}

namespace {

std::vector<int> versionParts(const std::string& version) {
    std::string trimmed = version;
    if (!trimmed.empty() && (trimmed.front() == 'v' || trimmed.front() == 'V')) {
        trimmed.erase(0, 1);
    }

    std::vector<int> parts;
    std::istringstream iss(trimmed);
    std::string part;
    while (std::getline(iss, part, '.')) {
        int value = 0;
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                break;
            }
            value = value * 10 + (c - '0');
        }
        parts.push_back(value);
    }
    return parts;
}

} // namespace

int compareVersions(const std::string& a, const std::string& b) {
    auto left = versionParts(a);
    auto right = versionParts(b);
    auto count = std::max(left.size(), right.size());

    for (size_t i = 0; i < count; ++i) {
        int l = i < left.size() ? left[i] : 0;
        int r = i < right.size() ? right[i] : 0;
        if (l != r) {
            return l < r ? -1 : 1;
        }
    }
    return 0;
}

} // namespace signfleet::core
